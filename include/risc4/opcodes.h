#pragma once
#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

  /** @file
   *  @brief RISC-4 format and mnemonic enumerations for C.
   *
   *  Primary opcodes (bits 15..12, opcodes.def) are risc4::Op on the C++
   *  side. Several fan out into more than one mnemonic through a sub-field
   *  (see mnemonics.def).
   */

  /** Instruction formats. R4_FMT_ILLEGAL marks an undecodable word. */
  typedef enum r4_format_t
  {
    R4_FMT_ILLEGAL = 0,
    R4_FMT_R, /**< op rd rs rt */
    R4_FMT_I, /**< op rd rs imm4 */
    R4_FMT_X, /**< op rd rs funct (extended two-operand ops) */
    R4_FMT_M, /**< op reg base offset4 */
    R4_FMT_B, /**< op cond offset8 */
    R4_FMT_J, /**< op link target11 */
  } r4_format_t;

  /** Resolved mnemonics. Values index the C++ kMnemonicTable. */
  typedef enum r4_mn_t
  {
    R4_MN_ILLEGAL = 0,
#define MN(name, op, sub, fmt) R4_MN_##name,
#include "risc4/mnemonics.def"
#undef MN
    R4_MN_COUNT
  } r4_mn_t;

#ifdef __cplusplus
}  // extern "C"
#endif
