// src/memory.cpp: nibble store, image loading and memory accessors
#include "risc4/internal/memory.hpp"

#include "risc4/cpu_api.h"
#include "risc4/errors.hpp"
#include "risc4/internal/cpu.h"

/* ---- core nibble accessors (used by fetch, LW/SW and the public API) ---- */
r4_u8 r4_mem_load_nibble(const R4Cpu *cpu, r4_u32 addr)
{
  return cpu->mem[addr & R4_PC_MASK];
}

void r4_mem_store_nibble(R4Cpu *cpu, r4_u32 addr, r4_u8 val)
{
  cpu->mem[addr & R4_PC_MASK] = (r4_u8)(val & R4_REG_MASK);
}

r4_u16 r4_mem_fetch16(const R4Cpu *cpu, r4_u32 pc)
{
  return (r4_u16)(((r4_u16)r4_mem_load_nibble(cpu, pc) << 12) |
                  ((r4_u16)r4_mem_load_nibble(cpu, pc + 1) << 8) |
                  ((r4_u16)r4_mem_load_nibble(cpu, pc + 2) << 4) |
                  (r4_u16)r4_mem_load_nibble(cpu, pc + 3));
}

/* ---- public API: image loading ---- */
extern "C" r4_err r4_load_image(struct R4Cpu *cpu, const r4_u8 *image, int len, r4_u16 base)
{
  if (!cpu || len < 0 || (!image && len > 0))
    return R4_ERR(InvalidArg);

  // Check the whole span before writing anything
  if (r4_err e = r4_span_in_mem(base, (uint64_t)len * 2u))
    return e;

  r4_u32 addr = base;
  for (int i = 0; i < len; ++i)
  {
    cpu->mem[addr++] = (r4_u8)((image[i] >> 4) & 0xF);
    cpu->mem[addr++] = (r4_u8)(image[i] & 0xF);
  }
  return R4_ERR(OK);
}

extern "C" r4_err r4_load_words(struct R4Cpu *cpu, const r4_u16 *words, int count,
                                r4_u16 base)
{
  if (!cpu || count < 0 || (!words && count > 0))
    return R4_ERR(InvalidArg);

  if (r4_err e = r4_span_in_mem(base, (uint64_t)count * R4_INSN_NIBBLES))
    return e;

  r4_u32 addr = base;
  for (int i = 0; i < count; ++i)
  {
    const r4_u16 w = words[i];
    cpu->mem[addr++] = (r4_u8)((w >> 12) & 0xF);
    cpu->mem[addr++] = (r4_u8)((w >> 8) & 0xF);
    cpu->mem[addr++] = (r4_u8)((w >> 4) & 0xF);
    cpu->mem[addr++] = (r4_u8)(w & 0xF);
  }
  return R4_ERR(OK);
}

/* ---- public API: read-only memory inspection (for tests/front-ends) ---- */
extern "C" r4_err r4_mem_read(const struct R4Cpu *cpu, r4_u32 addr, r4_u8 *out)
{
  if (!cpu || !out)
    return R4_ERR(InvalidArg);
  if (addr > R4_PC_MASK)
    return R4_ERR(OobMemory);
  *out = cpu->mem[addr];
  return R4_ERR(OK);
}

extern "C" r4_u8 r4_data_read(const struct R4Cpu *cpu, r4_u8 addr8)
{
  if (!cpu)
    return 0;
  return r4_mem_load_nibble(cpu, r4_data_cell(cpu, addr8));
}

extern "C" r4_u16 r4_fetch_word(const struct R4Cpu *cpu, r4_u16 pc)
{
  if (!cpu)
    return 0;
  return r4_mem_fetch16(cpu, pc);
}
