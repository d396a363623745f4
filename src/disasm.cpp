#include "risc4/disasm.h"

#include <stdio.h>

#include "risc4/bitfield.h"
#include "risc4/opcodes.hpp"

using risc4::Format;

extern "C" const char *r4_mnemonic_name(r4_u8 mn)
{
  return risc4::mnemonic_entry(static_cast<risc4::Mn>(mn)).name;
}

extern "C" int r4_disasm(const R4Insn *insn, r4_u16 pc, char *buf, int buf_len)
{
  if (!insn || !buf || buf_len <= 0)
    return -1;

  const risc4::MnemonicEntry &e = risc4::mnemonic_entry(static_cast<risc4::Mn>(insn->mn));
  const size_t n = (size_t)buf_len;

  switch (e.format)
  {
    case Format::R:
      return snprintf(buf, n, "%s r%u, r%u, r%u", e.name, insn->f.r.rd, insn->f.r.rs,
                      insn->f.r.rt);

    case Format::I:
      switch (insn->mn)
      {
        case R4_MN_SLL:
        case R4_MN_SRL:
          return snprintf(buf, n, "%s r%u, r%u, #%u", e.name, insn->f.i.rd, insn->f.i.rs,
                          insn->f.i.imm4 & 0x7u);
        case R4_MN_ADDI:
        case R4_MN_SLTI:
          return snprintf(buf, n, "%s r%u, r%u, #%d", e.name, insn->f.i.rd, insn->f.i.rs,
                          (int)r4_sign_extend_4(insn->f.i.imm4));
        default:
          return snprintf(buf, n, "%s r%u, r%u, #0x%X", e.name, insn->f.i.rd, insn->f.i.rs,
                          insn->f.i.imm4);
      }

    case Format::X:
      if (insn->mn == R4_MN_JR || insn->mn == R4_MN_HALT)
        return snprintf(buf, n, "%s", e.name);
      return snprintf(buf, n, "%s r%u, r%u", e.name, insn->f.x.rd, insn->f.x.rs);

    case Format::M:
      return snprintf(buf, n, "%s r%u, %d(r%u)", e.name, insn->f.m.reg,
                      (int)r4_sign_extend_4(insn->f.m.offset4), insn->f.m.base);

    case Format::B:
    {
      const r4_i32 off = r4_sign_extend_8(insn->f.b.offset8);
      const r4_u16 target = r4_mask_pc((r4_i32)pc + off * (r4_i32)R4_INSN_NIBBLES);
      return snprintf(buf, n, "%s %+d ; -> 0x%03X", e.name, (int)off, target);
    }

    case Format::J:
      return snprintf(buf, n, "%s 0x%03X", e.name, insn->f.j.target);

    default:
      return snprintf(buf, n, ".word 0x%04X", insn->raw);
  }
}
