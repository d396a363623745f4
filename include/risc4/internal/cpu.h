#pragma once
#include <stdbool.h>
#include <stdint.h>

#include "risc4/cpu_api.h"
#include "risc4/fault.h"
#include "risc4/types.h"

#ifdef __cplusplus
extern "C"
{
#endif

  /**
   * @brief Simulator instance (not part of the public API).
   *        Visible only for unit tests or tightly coupled components.
   *
   * Owns every piece of machine state; instances share nothing.
   */
  typedef struct R4Cpu
  {
    /* Architectural state */
    r4_u8 reg[R4_NUM_REGS];     /**< r0..r15, 4 bits each, reg[0] stays 0 */
    r4_u16 pc;                  /**< 12-bit nibble address */
    bool flag_c;                /**< Carry / borrow */
    bool flag_z;                /**< Zero */
    r4_u8 mem[R4_MEM_NIBBLES];  /**< One nibble per cell */

    /* Execution state */
    r4_u8 state;     /**< r4_state_t */
    r4_err fault;    /**< Last fault code (0 = none) */
    r4_u16 fault_pc; /**< PC of the faulting instruction */
    r4_u16 fault_raw;
    r4_u32 steps; /**< Retired instruction count */

    /* Configuration snapshot */
    R4Config cfg;

    /* Breakpoint table (fixed capacity, linear search) */
    r4_u16 breakpoints[R4_MAX_BREAKPOINTS];
    int bp_count;

    /* Diagnostics */
    R4FaultHandler fault_handler;
    void *fault_user_data;
  } R4Cpu;

#ifdef __cplusplus
} /* extern "C" */
#endif
