#include "risc4/decode.h"

#include <string.h>

#include "risc4/bitfield.h"
#include "risc4/errors.hpp"
#include "risc4/opcodes.hpp"

using risc4::Format;
using risc4::Op;

/* ---- Sub-opcode resolution ---- */

static r4_u8 ext_mnemonic(r4_u8 funct)
{
  switch (funct)
  {
    case 0x0:
      return R4_MN_ADC;
    case 0x1:
      return R4_MN_SBB;
    case 0x2:
      return R4_MN_NEG;
    case 0x3:
      return R4_MN_JR;
    case 0xF:
      return R4_MN_HALT;
    default:
      return R4_MN_ILLEGAL;
  }
}

static r4_u8 branch_mnemonic(r4_u8 cond)
{
  switch (cond)
  {
    case 0x0:
      return R4_MN_BEQ;
    case 0x1:
      return R4_MN_BNE;
    case 0x2:
      return R4_MN_BCS;
    case 0x3:
      return R4_MN_BCC;
    default:
      return R4_MN_ILLEGAL;
  }
}

static r4_u8 primary_mnemonic(Op op)
{
  switch (op)
  {
    case Op::ADD:
      return R4_MN_ADD;
    case Op::SUB:
      return R4_MN_SUB;
    case Op::AND:
      return R4_MN_AND;
    case Op::OR:
      return R4_MN_OR;
    case Op::XOR:
      return R4_MN_XOR;
    case Op::SLT:
      return R4_MN_SLT;
    case Op::ADDI:
      return R4_MN_ADDI;
    case Op::ANDI:
      return R4_MN_ANDI;
    case Op::ORI:
      return R4_MN_ORI;
    case Op::SLTI:
      return R4_MN_SLTI;
    case Op::LW:
      return R4_MN_LW;
    case Op::SW:
      return R4_MN_SW;
    default:
      return R4_MN_ILLEGAL;
  }
}

extern "C" r4_err r4_decode(r4_u16 word, R4Insn *out)
{
  if (!out)
    return R4_ERR(InvalidArg);

  ::memset(out, 0, sizeof(*out));
  out->raw = word;
  out->opcode = r4_field_op(word);

  const Op op = static_cast<Op>(out->opcode);
  const Format fmt = risc4::kOpFormat[out->opcode];
  r4_u8 mn = R4_MN_ILLEGAL;

  switch (fmt)
  {
    case Format::R:
    {
      const R4RFields r = r4_decode_r_type(word);
      out->f.r.rd = r.rd;
      out->f.r.rs = r.rs;
      out->f.r.rt = r.rt;
      mn = primary_mnemonic(op);
      break;
    }

    case Format::I:
    {
      const R4IFields i = r4_decode_i_type(word);
      out->f.i.rd = i.rd;
      out->f.i.rs = i.rs;
      out->f.i.imm4 = i.imm4;
      if (op == Op::SHF)
        mn = (i.imm4 & 0x8u) ? R4_MN_SRL : R4_MN_SLL;
      else
        mn = primary_mnemonic(op);
      break;
    }

    case Format::X:
    {
      const R4XFields x = r4_decode_x_type(word);
      out->f.x.rd = x.rd;
      out->f.x.rs = x.rs;
      out->f.x.funct = x.funct;
      mn = ext_mnemonic(x.funct);
      break;
    }

    case Format::M:
    {
      const R4MFields m = r4_decode_m_type(word);
      out->f.m.reg = m.reg;
      out->f.m.base = m.base;
      out->f.m.offset4 = m.offset4;
      mn = primary_mnemonic(op);
      break;
    }

    case Format::B:
    {
      const R4BFields b = r4_decode_b_type(word);
      out->f.b.cond = b.cond;
      out->f.b.offset8 = b.offset8;
      mn = branch_mnemonic(b.cond);
      break;
    }

    case Format::J:
    {
      const R4JFields j = r4_decode_j_type(word);
      out->f.j.link = j.link;
      out->f.j.target = j.target;
      mn = j.link ? R4_MN_JAL : R4_MN_J;
      break;
    }

    default:
      break;
  }

  out->mn = mn;
  if (mn == R4_MN_ILLEGAL)
  {
    out->format = R4_FMT_ILLEGAL;
    return R4_ERR(IllegalInstruction);
  }
  out->format = static_cast<r4_u8>(fmt);
  return R4_ERR(OK);
}
