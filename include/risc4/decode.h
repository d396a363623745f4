#pragma once
#include <stdint.h>

#include "risc4/bitfield.h"
#include "risc4/opcodes.h"
#include "risc4/types.h"

#ifdef __cplusplus
extern "C"
{
#endif

  /**
   * @brief A decoded instruction.
   *
   * One union member per format, each with its own field names, so an M-type
   * data register can never be read through an R-type "rd". The raw word is
   * kept alongside: the J-type link flag is taken from it.
   */
  typedef struct R4Insn
  {
    r4_u16 raw;    /**< Instruction word as fetched */
    r4_u8 format;  /**< r4_format_t */
    r4_u8 opcode;  /**< Primary opcode (bits 15..12) */
    r4_u8 mn;      /**< r4_mn_t, R4_MN_ILLEGAL if undecodable */
    union
    {
      struct
      {
        r4_u8 rd, rs, rt;
      } r;
      struct
      {
        r4_u8 rd, rs, imm4;
      } i;
      struct
      {
        r4_u8 rd, rs, funct;
      } x;
      struct
      {
        r4_u8 reg, base, offset4;
      } m;
      struct
      {
        r4_u8 cond, offset8;
      } b;
      struct
      {
        r4_u8 link;
        r4_u16 target;
      } j;
    } f;
  } R4Insn;

  /**
   * @brief Decode a 16-bit instruction word.
   *
   * Always fills @p out. Unknown sub-opcodes (extended funct 0x4..0xE,
   * branch cond 0x4..0xF) yield format R4_FMT_ILLEGAL and mnemonic
   * R4_MN_ILLEGAL.
   *
   * @param word  Instruction word.
   * @param out   Output record (must not be NULL).
   * @return 0 on success, R4_ERR_IllegalInstruction for an illegal word,
   *         R4_ERR_InvalidArg if @p out is NULL.
   */
  r4_err r4_decode(r4_u16 word, R4Insn *out);

#ifdef __cplusplus
} /* extern "C" */
#endif
