#pragma once
#include "risc4/errors.hpp"
#include "risc4/internal/cpu.h"
#include "risc4/types.h"

/**
 * Nibble-store helpers used by fetch, LW/SW and the public accessors.
 *  - One 4-bit value per cell, 4096 cells
 *  - Instruction words are big-endian: most significant nibble at the
 *    lowest address
 *  - Every address wraps at 0x1000
 */

r4_u8 r4_mem_load_nibble(const R4Cpu *cpu, r4_u32 addr);
void r4_mem_store_nibble(R4Cpu *cpu, r4_u32 addr, r4_u8 val);

r4_u16 r4_mem_fetch16(const R4Cpu *cpu, r4_u32 pc);

/* Nibble cell backing data address addr8. */
static inline r4_u16 r4_data_cell(const R4Cpu *cpu, r4_u8 addr8)
{
  return (r4_u16)(((r4_u32)cpu->cfg.data_base + addr8) & R4_PC_MASK);
}

/* Range check for a span of nibble cells. Takes the span as 64 bits so a
 * caller's count * width cannot wrap. */
static inline r4_err r4_span_in_mem(r4_u32 base, uint64_t nibbles)
{
  if (base > R4_PC_MASK || nibbles > R4_MEM_NIBBLES - base)
    return R4_ERR(ImageOutOfRange);
  return R4_ERR(OK);
}
