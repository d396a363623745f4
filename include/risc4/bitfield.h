#pragma once
#include <stdint.h>

#include "risc4/types.h"

/**
 * @file bitfield.h
 * @brief Instruction word field extraction, sign extension and width masks.
 *
 * Pure inline helpers with fixed input and output widths. Nothing here
 * validates opcodes; callers mask inputs to the documented domain.
 *
 * Bit layout of an instruction word (bit 15 = MSB):
 *
 *   R : [op:4][rd:4][rs:4][rt:4]
 *   I : [op:4][rd:4][rs:4][imm4:4]
 *   X : [op:4][rd:4][rs:4][funct:4]
 *   M : [op:4][reg:4][base:4][offset4:4]
 *   B : [op:4][cond:4][offset8:8]
 *   J : [op:4][link:1][target:11]
 */

#ifdef __cplusplus
extern "C"
{
#endif

  /* ---- Raw nibble fields ---- */

  static inline r4_u8 r4_field_op(r4_u16 w)
  {
    return (r4_u8)((w >> 12) & 0xFu);
  }
  static inline r4_u8 r4_field_a(r4_u16 w)
  {
    return (r4_u8)((w >> 8) & 0xFu);
  }
  static inline r4_u8 r4_field_b(r4_u16 w)
  {
    return (r4_u8)((w >> 4) & 0xFu);
  }
  static inline r4_u8 r4_field_c(r4_u16 w)
  {
    return (r4_u8)(w & 0xFu);
  }
  static inline r4_u8 r4_field_lo8(r4_u16 w)
  {
    return (r4_u8)(w & 0xFFu);
  }

  /* Link flag lives in the raw word, not in the target field. */
  static inline r4_u8 r4_field_link(r4_u16 w)
  {
    return (r4_u8)((w >> 11) & 1u);
  }
  static inline r4_u16 r4_field_target(r4_u16 w)
  {
    return (r4_u16)(w & R4_JAL_TARGET_MASK);
  }

  /* ---- Sign extension ---- */

  /** Bit 3 is the sign. Domain 0..15, range -8..7. */
  static inline r4_i32 r4_sign_extend_4(r4_u32 v)
  {
    v &= 0xFu;
    return (v & 0x8u) ? (r4_i32)(v | 0xFFFFFFF0u) : (r4_i32)v;
  }

  /** Bit 7 is the sign. Domain 0..255, range -128..127. */
  static inline r4_i32 r4_sign_extend_8(r4_u32 v)
  {
    v &= 0xFFu;
    return (v & 0x80u) ? (r4_i32)(v | 0xFFFFFF00u) : (r4_i32)v;
  }

  /* Two's-complement view of a register value (used by SLT/SLTI). */
  static inline r4_i32 r4_to_signed4(r4_u8 v)
  {
    return r4_sign_extend_4(v);
  }

  /* ---- Width masks ---- */

  static inline r4_u8 r4_mask_nibble(r4_i32 v)
  {
    return (r4_u8)((r4_u32)v & R4_REG_MASK);
  }
  static inline r4_u16 r4_mask_pc(r4_i32 v)
  {
    return (r4_u16)((r4_u32)v & R4_PC_MASK);
  }
  static inline r4_u8 r4_mask_addr8(r4_i32 v)
  {
    return (r4_u8)((r4_u32)v & R4_ADDR8_MASK);
  }

  /* ---- Per-format field tuples ---- */

  typedef struct R4RFields
  {
    r4_u8 op, rd, rs, rt;
  } R4RFields;

  typedef struct R4IFields
  {
    r4_u8 op, rd, rs, imm4;
  } R4IFields;

  typedef struct R4XFields
  {
    r4_u8 op, rd, rs, funct;
  } R4XFields;

  /* reg is the destination for LW and the data source for SW. */
  typedef struct R4MFields
  {
    r4_u8 op, reg, base, offset4;
  } R4MFields;

  typedef struct R4BFields
  {
    r4_u8 op, cond, offset8;
  } R4BFields;

  typedef struct R4JFields
  {
    r4_u8 op, link;
    r4_u16 target;
  } R4JFields;

  static inline R4RFields r4_decode_r_type(r4_u16 w)
  {
    R4RFields f = {r4_field_op(w), r4_field_a(w), r4_field_b(w), r4_field_c(w)};
    return f;
  }

  static inline R4IFields r4_decode_i_type(r4_u16 w)
  {
    R4IFields f = {r4_field_op(w), r4_field_a(w), r4_field_b(w), r4_field_c(w)};
    return f;
  }

  static inline R4XFields r4_decode_x_type(r4_u16 w)
  {
    R4XFields f = {r4_field_op(w), r4_field_a(w), r4_field_b(w), r4_field_c(w)};
    return f;
  }

  static inline R4MFields r4_decode_m_type(r4_u16 w)
  {
    R4MFields f = {r4_field_op(w), r4_field_a(w), r4_field_b(w), r4_field_c(w)};
    return f;
  }

  static inline R4BFields r4_decode_b_type(r4_u16 w)
  {
    R4BFields f = {r4_field_op(w), r4_field_a(w), r4_field_lo8(w)};
    return f;
  }

  static inline R4JFields r4_decode_j_type(r4_u16 w)
  {
    R4JFields f = {r4_field_op(w), r4_field_link(w), r4_field_target(w)};
    return f;
  }

#ifdef __cplusplus
}
#endif
