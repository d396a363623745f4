/**
 * @file cpu_api.hpp
 * @brief RISC-4 simulator C++ API wrapper
 *
 * SPDX-License-Identifier: MIT OR Apache-2.0
 */

#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "risc4/cpu_api.h"
#include "risc4/errors.hpp"

namespace risc4
{

enum class Stop : std::uint8_t
{
  None = R4_STOP_NONE,
  Halt = R4_STOP_HALT,
  Fault = R4_STOP_FAULT,
  StepLimit = R4_STOP_STEP_LIMIT,
  Breakpoint = R4_STOP_BREAKPOINT,
};

/**
 * @brief Step/run outcome with the fault as an optional error.
 */
struct StepResult
{
  bool halted = false;
  std::optional<Err> fault;
  Stop stop = Stop::None;
};

inline StepResult to_step_result(const R4StepResult &r)
{
  StepResult out;
  out.halted = r.halted;
  if (r.fault != 0)
    out.fault = static_cast<Err>(r.fault);
  out.stop = static_cast<Stop>(r.stop);
  return out;
}

/**
 * @brief Owning handle for one simulator instance.
 *
 * Non-copyable. Every call forwards to the C API; a Machine whose
 * allocation failed reports InvalidArg from every fallible call.
 */
class Machine
{
public:
  explicit Machine(const R4Config *cfg = nullptr) : cpu_(r4_create(cfg)) {}
  ~Machine()
  {
    r4_destroy(cpu_);
  }

  Machine(const Machine &) = delete;
  Machine &operator=(const Machine &) = delete;

  bool valid() const
  {
    return cpu_ != nullptr;
  }

  /**
   * @brief Reset and load a word image at the configured load base.
   * @param words     Instruction words.
   * @param entry_pc  Initial PC, or R4_ENTRY_DEFAULT.
   * @return Err::OK or the precondition that failed.
   */
  Err reset(const std::vector<r4_u16> &words, r4_u32 entry_pc = R4_ENTRY_DEFAULT)
  {
    return static_cast<Err>(
        r4_reset_words(cpu_, words.data(), static_cast<int>(words.size()), entry_pc));
  }

  StepResult step()
  {
    return to_step_result(r4_step(cpu_));
  }

  StepResult run(r4_u32 max_steps)
  {
    return to_step_result(r4_run(cpu_, max_steps));
  }

  Err add_breakpoint(r4_u16 pc)
  {
    return static_cast<Err>(r4_add_breakpoint(cpu_, pc));
  }

  r4_u8 reg(int idx) const
  {
    return r4_reg(cpu_, idx);
  }
  r4_u16 pc() const
  {
    return r4_pc(cpu_);
  }
  bool flag_c() const
  {
    return r4_flag_c(cpu_);
  }
  bool flag_z() const
  {
    return r4_flag_z(cpu_);
  }
  bool halted() const
  {
    return r4_is_halted(cpu_);
  }
  r4_u32 steps() const
  {
    return r4_steps(cpu_);
  }
  r4_u8 data(r4_u8 addr8) const
  {
    return r4_data_read(cpu_, addr8);
  }

  struct R4Cpu *get()
  {
    return cpu_;
  }

private:
  struct R4Cpu *cpu_;
};

}  // namespace risc4
