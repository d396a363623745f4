#pragma once
#include <stdint.h>

#include "risc4/decode.h"
#include "risc4/types.h"

#ifdef __cplusplus
extern "C"
{
#endif

  /**
   * @brief Render a decoded instruction as assembler text.
   *
   * Branches show their resolved target (from @p pc) as a trailing comment;
   * illegal words render as ".word 0xNNNN".
   *
   * @param insn     Decoded instruction.
   * @param pc       Address the instruction was fetched from.
   * @param buf      Output buffer (NUL-terminated, truncated if short).
   * @param buf_len  Size of @p buf in bytes.
   * @return Length of the full text (as snprintf), or negative on bad args.
   *
   * @example
   * R4Insn insn;
   * r4_decode(0x0211, &insn);
   * char text[32];
   * r4_disasm(&insn, 0, text, sizeof(text));  // "ADD r2, r1, r1"
   */
  int r4_disasm(const R4Insn *insn, r4_u16 pc, char *buf, int buf_len);

  /** Bare mnemonic name ("ADD", "JAL", ...), "ILLEGAL" for unknown values. */
  const char *r4_mnemonic_name(r4_u8 mn);

#ifdef __cplusplus
} /* extern "C" */
#endif
