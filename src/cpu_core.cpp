#include <inttypes.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include "risc4/cpu_api.h"
#include "risc4/decode.h"
#include "risc4/disasm.h"
#include "risc4/errors.hpp"
#include "risc4/fault.h"
#include "risc4/internal/cpu.h"
#include "risc4/internal/exec.h"
#include "risc4/internal/memory.hpp"

/* ========================================================================= */
/* Lifecycle                                                                 */
/* ========================================================================= */

extern "C" R4Config r4_config_default(void)
{
  R4Config cfg;
  ::memset(&cfg, 0, sizeof(cfg));
  return cfg;
}

static bool config_valid(const R4Config *cfg)
{
  return cfg->entry_pc <= R4_PC_MASK && cfg->load_base <= R4_PC_MASK &&
         cfg->data_base <= R4_PC_MASK;
}

extern "C" r4_err r4_init(R4Cpu *cpu, const R4Config *cfg)
{
  if (!cpu)
    return R4_ERR(InvalidArg);

  const R4Config c = cfg ? *cfg : r4_config_default();
  if (!config_valid(&c))
    return R4_ERR(InvalidArg);

  ::memset(cpu, 0, sizeof(R4Cpu));
  cpu->cfg = c;
  cpu->pc = c.entry_pc;
  cpu->state = R4_STATE_RUNNING;
  return R4_ERR(OK);
}

extern "C" struct R4Cpu *r4_create(const R4Config *cfg)
{
  R4Cpu *cpu = (R4Cpu *)::malloc(sizeof(R4Cpu));
  if (!cpu)
    return nullptr;
  if (r4_init(cpu, cfg) != 0)
  {
    ::free(cpu);
    return nullptr;
  }
  return cpu;
}

extern "C" void r4_destroy(struct R4Cpu *cpu)
{
  if (!cpu)
    return;
  ::free(cpu);
}

/* Clear architectural and execution state; keep config, breakpoints and
 * the fault handler. */
static void clear_machine(R4Cpu *cpu)
{
  ::memset(cpu->reg, 0, sizeof(cpu->reg));
  ::memset(cpu->mem, 0, sizeof(cpu->mem));
  cpu->pc = 0;
  cpu->flag_c = false;
  cpu->flag_z = false;
  cpu->state = R4_STATE_RUNNING;
  cpu->fault = 0;
  cpu->fault_pc = 0;
  cpu->fault_raw = 0;
  cpu->steps = 0;
}

static r4_err resolve_entry(const R4Cpu *cpu, r4_u32 entry_pc, r4_u16 *out)
{
  if (entry_pc == R4_ENTRY_DEFAULT)
    entry_pc = cpu->cfg.entry_pc;
  if (entry_pc > R4_PC_MASK)
    return R4_ERR(EntryOutOfRange);
  *out = (r4_u16)entry_pc;
  return R4_ERR(OK);
}

/* ========================================================================= */
/* Reset                                                                     */
/* ========================================================================= */

extern "C" r4_err r4_reset(struct R4Cpu *cpu, const r4_u8 *image, int len, r4_u32 entry_pc)
{
  if (!cpu || len < 0 || (!image && len > 0))
    return R4_ERR(InvalidArg);

  // Every precondition is checked before the machine is touched
  r4_u16 entry = 0;
  if (r4_err e = resolve_entry(cpu, entry_pc, &entry))
    return e;
  if (r4_err e = r4_span_in_mem(cpu->cfg.load_base, (uint64_t)len * 2u))
    return e;

  clear_machine(cpu);
  if (r4_err e = r4_load_image(cpu, image, len, cpu->cfg.load_base))
    return e;
  cpu->pc = entry;
  return R4_ERR(OK);
}

extern "C" r4_err r4_reset_words(struct R4Cpu *cpu, const r4_u16 *words, int count,
                                 r4_u32 entry_pc)
{
  if (!cpu || count < 0 || (!words && count > 0))
    return R4_ERR(InvalidArg);

  r4_u16 entry = 0;
  if (r4_err e = resolve_entry(cpu, entry_pc, &entry))
    return e;
  if (r4_err e = r4_span_in_mem(cpu->cfg.load_base, (uint64_t)count * R4_INSN_NIBBLES))
    return e;

  clear_machine(cpu);
  if (r4_err e = r4_load_words(cpu, words, count, cpu->cfg.load_base))
    return e;
  cpu->pc = entry;
  return R4_ERR(OK);
}

/* ========================================================================= */
/* Fetch-execute loop                                                        */
/* ========================================================================= */

static R4StepResult current_result(const R4Cpu *cpu)
{
  R4StepResult res;
  res.halted = cpu->state == R4_STATE_HALTED;
  res.fault = cpu->fault;
  if (!res.halted)
    res.stop = R4_STOP_NONE;
  else
    res.stop = cpu->fault ? R4_STOP_FAULT : R4_STOP_HALT;
  return res;
}

static R4StepResult invalid_result(void)
{
  R4StepResult res;
  res.halted = true;
  res.fault = R4_ERR(InvalidArg);
  res.stop = R4_STOP_FAULT;
  return res;
}

static void trace_step(const R4Cpu *cpu, const R4Insn *insn, r4_u16 pc)
{
  char text[48];
  r4_disasm(insn, pc, text, (int)sizeof(text));
  printf("[%4" PRIu32 "] PC=0x%03X %04X  %s\n", cpu->steps, pc, insn->raw, text);
}

extern "C" R4StepResult r4_step(struct R4Cpu *cpu)
{
  if (!cpu)
    return invalid_result();

  if (cpu->state == R4_STATE_HALTED)
    return current_result(cpu);

  const r4_u16 pc = cpu->pc;
  const r4_u16 raw = r4_mem_fetch16(cpu, pc);

  R4Insn insn;
  R4Effect fx;
  r4_err e = r4_decode(raw, &insn);
  if (e == 0)
    e = r4_exec_compute(cpu, &insn, pc, &fx);

  if (e != 0)
  {
    // Nothing was committed: state is exactly as it was before the fetch
    cpu->state = R4_STATE_HALTED;
    cpu->fault = e;
    cpu->fault_pc = pc;
    cpu->fault_raw = raw;
    r4_fault_report(cpu, e, pc, raw);
    return current_result(cpu);
  }

  if (cpu->cfg.trace)
    trace_step(cpu, &insn, pc);

  r4_exec_commit(cpu, &fx);
  cpu->steps++;
  if (fx.halt)
    cpu->state = R4_STATE_HALTED;

  return current_result(cpu);
}

static bool is_breakpoint(const R4Cpu *cpu, r4_u16 pc)
{
  for (int i = 0; i < cpu->bp_count; ++i)
  {
    if (cpu->breakpoints[i] == pc)
      return true;
  }
  return false;
}

extern "C" R4StepResult r4_run(struct R4Cpu *cpu, r4_u32 max_steps)
{
  if (!cpu)
    return invalid_result();

  R4StepResult res = current_result(cpu);
  if (res.halted)
    return res;

  for (r4_u32 n = 0; n < max_steps; ++n)
  {
    // Skipped on the first step so a run can resume from a breakpoint
    if (n > 0 && is_breakpoint(cpu, cpu->pc))
    {
      res.stop = R4_STOP_BREAKPOINT;
      return res;
    }
    res = r4_step(cpu);
    if (res.halted)
      return res;
  }

  res.stop = R4_STOP_STEP_LIMIT;
  return res;
}

extern "C" r4_err r4_execute(struct R4Cpu *cpu, const R4Insn *insn)
{
  if (!cpu || !insn)
    return R4_ERR(InvalidArg);

  R4Effect fx;
  if (r4_err e = r4_exec_compute(cpu, insn, cpu->pc, &fx))
    return e;
  r4_exec_commit(cpu, &fx);
  return R4_ERR(OK);
}

/* ========================================================================= */
/* Breakpoints                                                               */
/* ========================================================================= */

extern "C" r4_err r4_add_breakpoint(struct R4Cpu *cpu, r4_u16 pc)
{
  if (!cpu || pc > R4_PC_MASK)
    return R4_ERR(InvalidArg);
  if (is_breakpoint(cpu, pc))
    return R4_ERR(OK);
  if (cpu->bp_count >= R4_MAX_BREAKPOINTS)
    return R4_ERR(TooManyBreakpoints);
  cpu->breakpoints[cpu->bp_count++] = pc;
  return R4_ERR(OK);
}

extern "C" r4_err r4_remove_breakpoint(struct R4Cpu *cpu, r4_u16 pc)
{
  if (!cpu)
    return R4_ERR(InvalidArg);
  for (int i = 0; i < cpu->bp_count; ++i)
  {
    if (cpu->breakpoints[i] == pc)
    {
      cpu->breakpoints[i] = cpu->breakpoints[--cpu->bp_count];
      return R4_ERR(OK);
    }
  }
  return R4_ERR(NotFound);
}

extern "C" void r4_clear_breakpoints(struct R4Cpu *cpu)
{
  if (!cpu)
    return;
  cpu->bp_count = 0;
}

/* ========================================================================= */
/* Read-only inspection                                                      */
/* ========================================================================= */

extern "C" r4_u8 r4_reg(const struct R4Cpu *cpu, int idx)
{
  if (!cpu || idx < 0 || idx >= R4_NUM_REGS)
    return 0;
  return cpu->reg[idx];
}

extern "C" r4_u16 r4_pc(const struct R4Cpu *cpu)
{
  return cpu ? cpu->pc : 0;
}

extern "C" bool r4_flag_c(const struct R4Cpu *cpu)
{
  return cpu && cpu->flag_c;
}

extern "C" bool r4_flag_z(const struct R4Cpu *cpu)
{
  return cpu && cpu->flag_z;
}

extern "C" bool r4_is_halted(const struct R4Cpu *cpu)
{
  return cpu && cpu->state == R4_STATE_HALTED;
}

extern "C" r4_err r4_last_fault(const struct R4Cpu *cpu)
{
  return cpu ? cpu->fault : R4_ERR(InvalidArg);
}

extern "C" r4_u16 r4_fault_pc(const struct R4Cpu *cpu)
{
  return cpu ? cpu->fault_pc : 0;
}

extern "C" r4_u16 r4_fault_raw(const struct R4Cpu *cpu)
{
  return cpu ? cpu->fault_raw : 0;
}

extern "C" r4_u32 r4_steps(const struct R4Cpu *cpu)
{
  return cpu ? cpu->steps : 0;
}
