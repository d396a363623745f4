#pragma once
#include <stdbool.h>
#include <stdint.h>

#include "risc4/types.h"

#ifdef __cplusplus
extern "C"
{
#endif

  /**
   * @brief Fault diagnostic information
   *
   * Snapshot taken when a step faults. The register and flag values are the
   * pre-fault state, which is also the post-fault state.
   */
  typedef struct R4FaultInfo
  {
    int32_t error_code;         /**< Err enumeration value */
    r4_u16 pc;                  /**< PC of the faulting instruction */
    r4_u16 raw;                 /**< Faulting instruction word */
    r4_u8 regs[R4_NUM_REGS];    /**< Register file */
    bool flag_c;                /**< Carry flag */
    bool flag_z;                /**< Zero flag */
    r4_u32 steps;               /**< Instructions retired before the fault */
  } R4FaultInfo;

  struct R4Cpu;

  /**
   * @brief Fault handler callback type
   *
   * @param user_data  User data pointer passed to r4_set_fault_handler
   * @param info       Fault diagnostic information
   */
  typedef void (*R4FaultHandler)(void *user_data, const R4FaultInfo *info);

  /**
   * @brief Set custom fault handler
   *
   * The handler runs after the diagnostic dump each time a step faults.
   *
   * @param cpu        Simulator instance
   * @param handler    Callback (NULL to disable)
   * @param user_data  User data passed to handler
   */
  void r4_set_fault_handler(struct R4Cpu *cpu, R4FaultHandler handler, void *user_data);

  /**
   * @brief Report a fault: print the diagnostic dump and call the handler.
   *
   * @param cpu         Simulator instance
   * @param error_code  Fault code
   * @param pc          PC of the faulting instruction
   * @param raw         Faulting instruction word
   * @return error_code, for call-site chaining
   */
  r4_err r4_fault_report(struct R4Cpu *cpu, r4_err error_code, r4_u16 pc, r4_u16 raw);

#ifdef __cplusplus
}
#endif
