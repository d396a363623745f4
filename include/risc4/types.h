#pragma once
#include <stdint.h>

/* ------------------------------------------------------------------------- */
/* Basic typedefs shared by the C and C++ headers                            */
/* ------------------------------------------------------------------------- */

/** Signed value used for sign-extended fields and offsets. */
typedef int32_t r4_i32;
/** Unsigned 32-bit counter / wide intermediate. */
typedef uint32_t r4_u32;
/** 16-bit value: instruction words, 12-bit PC, nibble addresses. */
typedef uint16_t r4_u16;
/** 8-bit value: register contents, nibble cells, bytes of an image. */
typedef uint8_t r4_u8;
/** Error code type. 0 = OK, negative = error (see errors.def). */
typedef int r4_err;

/* ------------------------------------------------------------------------- */
/* Architectural constants                                                   */
/* ------------------------------------------------------------------------- */

#define R4_NUM_REGS 16        /**< General-purpose registers r0..r15 */
#define R4_REG_MASK 0xFu      /**< Register width: 4 bits */
#define R4_PC_MASK 0xFFFu     /**< PC width: 12 bits, nibble addressed */
#define R4_ADDR8_MASK 0xFFu   /**< Data address width: 8 bits */
#define R4_MEM_NIBBLES 4096u  /**< Nibble cells in the flat store */
#define R4_INSN_NIBBLES 4u    /**< One instruction = 4 nibbles */
#define R4_JAL_TARGET_MASK 0x7FFu

/** Fixed link registers written by JAL and read by JR (high, mid, low). */
#define R4_LINK_HI 1
#define R4_LINK_MID 2
#define R4_LINK_LO 3
