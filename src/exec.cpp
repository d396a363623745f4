#include "risc4/internal/exec.h"

#include <string.h>

#include "risc4/bitfield.h"
#include "risc4/errors.hpp"
#include "risc4/internal/cpu.h"
#include "risc4/internal/memory.hpp"
#include "risc4/opcodes.h"

/* =========================== Effect builders ============================= */

static inline void fx_write_reg(R4Effect *fx, r4_u8 idx, r4_i32 val)
{
  fx->reg_idx[fx->reg_count] = (r4_u8)(idx & R4_REG_MASK);
  fx->reg_val[fx->reg_count] = r4_mask_nibble(val);
  fx->reg_count++;
}

static inline void fx_flags(R4Effect *fx, bool c, r4_u8 result)
{
  fx->set_flags = true;
  fx->flag_c = c;
  fx->flag_z = (result & R4_REG_MASK) == 0;
}

/* ALU result: write rd, set C as given and Z from the 4-bit result. */
static inline void fx_alu(R4Effect *fx, r4_u8 rd, r4_i32 wide, bool c)
{
  const r4_u8 result = r4_mask_nibble(wide);
  fx_write_reg(fx, rd, result);
  fx_flags(fx, c, result);
}

/* Register read; the index comes from a caller-supplied record. */
static inline r4_u8 reg_at(const R4Cpu *cpu, r4_u8 idx)
{
  return cpu->reg[idx & R4_REG_MASK];
}

/* Register pair (base, base+1) as an 8-bit address; base+1 wraps to r0. */
static inline r4_u32 pair_value(const R4Cpu *cpu, r4_u8 base)
{
  const r4_u8 hi = reg_at(cpu, base);
  const r4_u8 lo = reg_at(cpu, (r4_u8)(base + 1));
  return ((r4_u32)hi << 4) | lo;
}

static inline r4_u8 effective_addr8(const R4Cpu *cpu, r4_u8 base, r4_u8 offset4)
{
  return r4_mask_addr8((r4_i32)pair_value(cpu, base) + r4_sign_extend_4(offset4));
}

/* Shift with carry = last bit shifted out. imm4 bit 3 selects direction. */
static inline void shift(const R4Cpu *cpu, const R4Insn *insn, R4Effect *fx)
{
  const r4_u32 a = reg_at(cpu, insn->f.i.rs);
  const r4_u32 amount = insn->f.i.imm4 & 0x7u;
  r4_u32 result = a;
  bool c = false;

  if (amount > 0)
  {
    if (insn->mn == R4_MN_SLL)
    {
      const r4_u32 wide = a << amount;
      c = ((wide >> 4) & 1u) != 0;
      result = wide;
    }
    else
    {
      c = amount <= 4 && ((a >> (amount - 1)) & 1u) != 0;
      result = a >> amount;
    }
  }
  fx_alu(fx, insn->f.i.rd, (r4_i32)result, c);
}

/* ============================ Compute phase ============================== */

extern "C" r4_err r4_exec_compute(const R4Cpu *cpu, const R4Insn *insn, r4_u16 pc,
                                  R4Effect *out)
{
  if (!cpu || !insn || !out)
    return R4_ERR(InvalidArg);

  ::memset(out, 0, sizeof(*out));
  R4Effect *fx = out;
  fx->next_pc = r4_mask_pc(pc + R4_INSN_NIBBLES);

  switch (insn->mn)
  {
    /* -------- R-type ALU -------- */
    case R4_MN_ADD:
    {
      const r4_i32 a = reg_at(cpu, insn->f.r.rs), b = reg_at(cpu, insn->f.r.rt);
      const r4_i32 sum = a + b;
      fx_alu(fx, insn->f.r.rd, sum, sum > 0xF);
      break;
    }
    case R4_MN_SUB:
    {
      const r4_i32 a = reg_at(cpu, insn->f.r.rs), b = reg_at(cpu, insn->f.r.rt);
      const r4_i32 diff = a - b;
      fx_alu(fx, insn->f.r.rd, diff, diff < 0);
      break;
    }
    case R4_MN_AND:
      fx_alu(fx, insn->f.r.rd, reg_at(cpu, insn->f.r.rs) & reg_at(cpu, insn->f.r.rt), false);
      break;
    case R4_MN_OR:
      fx_alu(fx, insn->f.r.rd, reg_at(cpu, insn->f.r.rs) | reg_at(cpu, insn->f.r.rt), false);
      break;
    case R4_MN_XOR:
      fx_alu(fx, insn->f.r.rd, reg_at(cpu, insn->f.r.rs) ^ reg_at(cpu, insn->f.r.rt), false);
      break;
    case R4_MN_SLT:
    {
      const r4_i32 a = r4_to_signed4(reg_at(cpu, insn->f.r.rs));
      const r4_i32 b = r4_to_signed4(reg_at(cpu, insn->f.r.rt));
      fx_alu(fx, insn->f.r.rd, a < b ? 1 : 0, false);
      break;
    }

    /* -------- Shifts -------- */
    case R4_MN_SLL:
    case R4_MN_SRL:
      shift(cpu, insn, fx);
      break;

    /* -------- Extended two-operand ops: rd is also a source -------- */
    case R4_MN_ADC:
    {
      const r4_i32 d = reg_at(cpu, insn->f.x.rd), a = reg_at(cpu, insn->f.x.rs);
      const r4_i32 sum = d + a + (cpu->flag_c ? 1 : 0);
      fx_alu(fx, insn->f.x.rd, sum, sum > 0xF);
      break;
    }
    case R4_MN_SBB:
    {
      const r4_i32 d = reg_at(cpu, insn->f.x.rd), a = reg_at(cpu, insn->f.x.rs);
      const r4_i32 diff = d - a - (cpu->flag_c ? 1 : 0);
      fx_alu(fx, insn->f.x.rd, diff, diff < 0);
      break;
    }
    case R4_MN_NEG:
    {
      const r4_i32 a = reg_at(cpu, insn->f.x.rs);
      fx_alu(fx, insn->f.x.rd, -a, a != 0);
      break;
    }
    case R4_MN_JR:
    {
      const r4_u32 target = ((r4_u32)reg_at(cpu, R4_LINK_HI) << 8) |
                            ((r4_u32)reg_at(cpu, R4_LINK_MID) << 4) | reg_at(cpu, R4_LINK_LO);
      fx->next_pc = r4_mask_pc((r4_i32)target);
      break;
    }
    case R4_MN_HALT:
      fx->halt = true;
      fx->next_pc = pc;
      break;

    /* -------- I-type ALU -------- */
    case R4_MN_ADDI:
    {
      // C is the carry (sum > 0xF) or borrow (sum < 0) of the signed add
      const r4_i32 sum = (r4_i32)reg_at(cpu, insn->f.i.rs) + r4_sign_extend_4(insn->f.i.imm4);
      fx_alu(fx, insn->f.i.rd, sum, sum > 0xF || sum < 0);
      break;
    }
    case R4_MN_ANDI:
      fx_alu(fx, insn->f.i.rd, reg_at(cpu, insn->f.i.rs) & insn->f.i.imm4, false);
      break;
    case R4_MN_ORI:
      fx_alu(fx, insn->f.i.rd, reg_at(cpu, insn->f.i.rs) | insn->f.i.imm4, false);
      break;
    case R4_MN_SLTI:
    {
      const r4_i32 a = r4_to_signed4(reg_at(cpu, insn->f.i.rs));
      const r4_i32 imm = r4_sign_extend_4(insn->f.i.imm4);
      fx_alu(fx, insn->f.i.rd, a < imm ? 1 : 0, false);
      break;
    }

    /* -------- Memory -------- */
    case R4_MN_LW:
    {
      const r4_u8 ea = effective_addr8(cpu, insn->f.m.base, insn->f.m.offset4);
      fx_write_reg(fx, insn->f.m.reg, r4_mem_load_nibble(cpu, r4_data_cell(cpu, ea)));
      break;
    }
    case R4_MN_SW:
    {
      const r4_u8 ea = effective_addr8(cpu, insn->f.m.base, insn->f.m.offset4);
      fx->mem_write = true;
      fx->mem_addr = r4_data_cell(cpu, ea);
      fx->mem_val = reg_at(cpu, insn->f.m.reg);
      break;
    }

    /* -------- Branches: offset counts instructions from the branch -------- */
    case R4_MN_BEQ:
    case R4_MN_BNE:
    case R4_MN_BCS:
    case R4_MN_BCC:
    {
      bool taken = false;
      switch (insn->mn)
      {
        case R4_MN_BEQ:
          taken = cpu->flag_z;
          break;
        case R4_MN_BNE:
          taken = !cpu->flag_z;
          break;
        case R4_MN_BCS:
          taken = cpu->flag_c;
          break;
        default:
          taken = !cpu->flag_c;
          break;
      }
      if (taken)
      {
        const r4_i32 off = r4_sign_extend_8(insn->f.b.offset8) * (r4_i32)R4_INSN_NIBBLES;
        fx->next_pc = r4_mask_pc((r4_i32)pc + off);
      }
      break;
    }

    /* -------- Jumps: target is already a nibble address -------- */
    case R4_MN_J:
    case R4_MN_JAL:
    {
      if (r4_field_link(insn->raw))
      {
        const r4_u16 ret = r4_mask_pc(pc + R4_INSN_NIBBLES);
        fx_write_reg(fx, R4_LINK_HI, (ret >> 8) & 0xF);
        fx_write_reg(fx, R4_LINK_MID, (ret >> 4) & 0xF);
        fx_write_reg(fx, R4_LINK_LO, ret & 0xF);
        fx->next_pc = (r4_u16)(insn->f.j.target & R4_JAL_TARGET_MASK);
      }
      else
      {
        fx->next_pc = r4_mask_pc(insn->f.j.target);
      }
      break;
    }

    default:
      ::memset(out, 0, sizeof(*out));
      return R4_ERR(IllegalInstruction);
  }

  return R4_ERR(OK);
}

/* ============================= Commit phase ============================== */

extern "C" void r4_exec_commit(R4Cpu *cpu, const R4Effect *fx)
{
  for (int k = 0; k < fx->reg_count; ++k)
  {
    const r4_u8 idx = fx->reg_idx[k];
    if (idx != 0)
      cpu->reg[idx] = (r4_u8)(fx->reg_val[k] & R4_REG_MASK);
  }

  if (fx->set_flags)
  {
    cpu->flag_c = fx->flag_c;
    cpu->flag_z = fx->flag_z;
  }

  if (fx->mem_write)
    r4_mem_store_nibble(cpu, fx->mem_addr, fx->mem_val);

  cpu->pc = r4_mask_pc(fx->next_pc);
}
