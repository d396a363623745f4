#pragma once
#include <stdbool.h>
#include <stdint.h>

#include "risc4/decode.h"
#include "risc4/internal/cpu.h"
#include "risc4/types.h"

#ifdef __cplusplus
extern "C"
{
#endif

/** Most register writes one instruction can make (JAL's link triple). */
#define R4_MAX_REG_WRITES 3

  /**
   * @brief Everything one instruction changes, computed before any of it
   *        is applied.
   */
  typedef struct R4Effect
  {
    r4_u16 next_pc; /**< PC after the instruction (already masked) */

    r4_u8 reg_count;
    r4_u8 reg_idx[R4_MAX_REG_WRITES];
    r4_u8 reg_val[R4_MAX_REG_WRITES];

    bool set_flags; /**< false = flags unaffected */
    bool flag_c;
    bool flag_z;

    bool mem_write;
    r4_u16 mem_addr; /**< Nibble cell */
    r4_u8 mem_val;

    bool halt;
  } R4Effect;

  /**
   * @brief Compute the effect of @p insn fetched at @p pc. Reads state only.
   * @return 0, or R4_ERR_IllegalInstruction (effect left empty).
   */
  r4_err r4_exec_compute(const R4Cpu *cpu, const R4Insn *insn, r4_u16 pc, R4Effect *out);

  /**
   * @brief Apply an effect. The only register-write path: writes to r0 are
   *        dropped and values are masked to 4 bits.
   */
  void r4_exec_commit(R4Cpu *cpu, const R4Effect *fx);

#ifdef __cplusplus
} /* extern "C" */
#endif
