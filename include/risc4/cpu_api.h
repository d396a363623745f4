#pragma once
#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#include "risc4/decode.h"
#include "risc4/types.h"

#ifdef __cplusplus
extern "C"
{
#endif

  /* ------------------------------------------------------------------------- */
  /* Configuration                                                             */
  /* ------------------------------------------------------------------------- */

  /**
   * @brief Configuration used when initialising a simulator instance.
   *
   * All addresses are 12-bit nibble addresses. The data window used by LW/SW
   * spans 256 nibble cells starting at data_base (wrapping at 0x1000).
   */
  typedef struct R4Config
  {
    r4_u16 entry_pc;  /**< PC used by reset when R4_ENTRY_DEFAULT is passed */
    r4_u16 load_base; /**< Nibble address where reset loads the image */
    r4_u16 data_base; /**< Nibble address of data address 0x00 */
    bool trace;       /**< Print one line per executed instruction */
  } R4Config;

/** Pass as entry_pc to reset to use R4Config::entry_pc. */
#define R4_ENTRY_DEFAULT ((r4_u32)0xFFFFFFFFu)

/** Capacity of the breakpoint table. */
#define R4_MAX_BREAKPOINTS 16

  /** Machine state. */
  typedef enum r4_state_t
  {
    R4_STATE_RUNNING = 0,
    R4_STATE_HALTED,
  } r4_state_t;

  /** Why a step or run returned. */
  typedef enum r4_stop_t
  {
    R4_STOP_NONE = 0,   /**< One instruction executed, machine still running */
    R4_STOP_HALT,       /**< HALT executed (or machine already halted) */
    R4_STOP_FAULT,      /**< Illegal instruction; machine halted */
    R4_STOP_STEP_LIMIT, /**< run() used up its step budget */
    R4_STOP_BREAKPOINT, /**< run() reached a breakpoint PC */
  } r4_stop_t;

  /**
   * @brief Outcome of r4_step() / r4_run().
   */
  typedef struct R4StepResult
  {
    bool halted;  /**< Machine is in the Halted state */
    r4_err fault; /**< 0 = no fault, otherwise the fault code */
    r4_u8 stop;   /**< r4_stop_t */
  } R4StepResult;

  struct R4Cpu;

  /* ------------------------------------------------------------------------- */
  /* Lifecycle                                                                 */
  /* ------------------------------------------------------------------------- */

  /**
   * @brief Default configuration: everything at address 0, trace off.
   */
  R4Config r4_config_default(void);

  /**
   * @brief Initialise a caller-owned instance.
   *
   * Clears all architectural state and memory. The fault handler and
   * breakpoints are cleared as well.
   *
   * @param cpu  Instance to initialise.
   * @param cfg  Configuration, or NULL for r4_config_default().
   * @return 0 on success, R4_ERR_InvalidArg if @p cpu is NULL or a config
   *         address exceeds 0xFFF.
   */
  r4_err r4_init(struct R4Cpu *cpu, const R4Config *cfg);

  /**
   * @brief Create a heap-allocated instance.
   * @param cfg  Configuration, or NULL for defaults.
   * @return New instance, or NULL on allocation failure or invalid config.
   */
  struct R4Cpu *r4_create(const R4Config *cfg);

  /**
   * @brief Destroy an instance created by r4_create() (NULL-safe).
   */
  void r4_destroy(struct R4Cpu *cpu);

  /* ------------------------------------------------------------------------- */
  /* Program loading                                                           */
  /* ------------------------------------------------------------------------- */

  /**
   * @brief Copy a big-endian byte image into memory.
   *
   * Each byte fills two consecutive nibble cells, high nibble first, so a
   * 16-bit instruction word occupies 4 cells. Nothing is written on failure.
   *
   * @param cpu    Instance.
   * @param image  Image bytes (may be NULL only when len == 0).
   * @param len    Image length in bytes.
   * @param base   Nibble address of the first cell.
   * @return 0 on success, R4_ERR_ImageOutOfRange if the image does not fit
   *         below 0x1000, R4_ERR_InvalidArg for bad pointers or lengths.
   */
  r4_err r4_load_image(struct R4Cpu *cpu, const r4_u8 *image, int len, r4_u16 base);

  /**
   * @brief Copy an image of 16-bit instruction words into memory.
   * @see r4_load_image
   */
  r4_err r4_load_words(struct R4Cpu *cpu, const r4_u16 *words, int count, r4_u16 base);

  /**
   * @brief Reset the machine and load a program.
   *
   * Registers, flags, memory, the retired counter and halt/fault state are
   * cleared, the image is loaded at R4Config::load_base and PC is set to
   * @p entry_pc. All preconditions are checked before anything changes.
   *
   * @param cpu       Instance.
   * @param image     Big-endian image bytes.
   * @param len       Image length in bytes.
   * @param entry_pc  Initial PC, or R4_ENTRY_DEFAULT.
   * @return 0 on success, R4_ERR_EntryOutOfRange, R4_ERR_ImageOutOfRange or
   *         R4_ERR_InvalidArg on a precondition violation.
   */
  r4_err r4_reset(struct R4Cpu *cpu, const r4_u8 *image, int len, r4_u32 entry_pc);

  /** @brief r4_reset() with a word image. */
  r4_err r4_reset_words(struct R4Cpu *cpu, const r4_u16 *words, int count,
                        r4_u32 entry_pc);

  /* ------------------------------------------------------------------------- */
  /* Execution                                                                 */
  /* ------------------------------------------------------------------------- */

  /**
   * @brief Fetch, decode and execute one instruction.
   *
   * A halted machine is left untouched and reports its halt state again.
   * An illegal instruction halts the machine with every register, flag, PC
   * and memory cell as they were before the fetch.
   */
  R4StepResult r4_step(struct R4Cpu *cpu);

  /**
   * @brief Step until halt, fault, breakpoint or @p max_steps instructions.
   *
   * Breakpoints are checked before every step except the first, so a run
   * that starts on a breakpoint moves past it.
   */
  R4StepResult r4_run(struct R4Cpu *cpu, r4_u32 max_steps);

  /**
   * @brief Execute one already-decoded instruction against the current state.
   *
   * The instruction is treated as if fetched at the current PC. Does not
   * touch the halt state or the retired counter.
   *
   * @return 0 on success, R4_ERR_IllegalInstruction (state unchanged).
   */
  r4_err r4_execute(struct R4Cpu *cpu, const R4Insn *insn);

  /* ------------------------------------------------------------------------- */
  /* Breakpoints                                                               */
  /* ------------------------------------------------------------------------- */

  r4_err r4_add_breakpoint(struct R4Cpu *cpu, r4_u16 pc);
  r4_err r4_remove_breakpoint(struct R4Cpu *cpu, r4_u16 pc);
  void r4_clear_breakpoints(struct R4Cpu *cpu);

  /* ------------------------------------------------------------------------- */
  /* Read-only inspection                                                      */
  /* ------------------------------------------------------------------------- */

  /** Register value, 0 for an index outside 0..15. */
  r4_u8 r4_reg(const struct R4Cpu *cpu, int idx);
  r4_u16 r4_pc(const struct R4Cpu *cpu);
  bool r4_flag_c(const struct R4Cpu *cpu);
  bool r4_flag_z(const struct R4Cpu *cpu);
  bool r4_is_halted(const struct R4Cpu *cpu);

  /** Fault recorded by the last faulting step (0 if none since reset). */
  r4_err r4_last_fault(const struct R4Cpu *cpu);
  r4_u16 r4_fault_pc(const struct R4Cpu *cpu);
  r4_u16 r4_fault_raw(const struct R4Cpu *cpu);

  /** Number of instructions retired since reset (HALT counts, faults do not). */
  r4_u32 r4_steps(const struct R4Cpu *cpu);

  /**
   * @brief Read one nibble cell.
   * @return 0 on success, R4_ERR_OobMemory for addr > 0xFFF.
   */
  r4_err r4_mem_read(const struct R4Cpu *cpu, r4_u32 addr, r4_u8 *out);

  /** Nibble at data address @p addr8, as seen by LW. */
  r4_u8 r4_data_read(const struct R4Cpu *cpu, r4_u8 addr8);

  /** Instruction word at @p pc, as the fetch stage would read it. */
  r4_u16 r4_fetch_word(const struct R4Cpu *cpu, r4_u16 pc);

  /* ------------------------------------------------------------------------- */
  /* Error handling notes                                                      */
  /* ------------------------------------------------------------------------- */
  /**
   * All APIs returning r4_err give 0 on success and a negative code on
   * failure (see errors.def). Address and PC arithmetic wraps; it never
   * faults. Exceptions are never thrown.
   */

#ifdef __cplusplus
} /* extern "C" */
#endif
