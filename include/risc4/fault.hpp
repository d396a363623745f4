/**
 * @file fault.hpp
 * @brief RISC-4 fault reporting C++ wrapper
 *
 * SPDX-License-Identifier: MIT OR Apache-2.0
 */

#pragma once

#include "risc4/fault.h"

namespace risc4
{

using FaultInfo = R4FaultInfo;

using FaultHandler = R4FaultHandler;

/**
 * @brief Set fault handler (C++ wrapper)
 *
 * @param cpu        Simulator instance
 * @param handler    Fault handler callback
 * @param user_data  User data passed to handler
 */
inline void set_fault_handler(R4Cpu *cpu, FaultHandler handler, void *user_data = nullptr)
{
  r4_set_fault_handler(cpu, handler, user_data);
}

}  // namespace risc4
