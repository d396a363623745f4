#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <cstdint>
#include <vector>

#include "asm_helpers.h"
#include "doctest.h"
#include "risc4/cpu_api.h"
#include "risc4/errors.hpp"
#include "risc4/internal/cpu.h"

/* ------------------------------------------------------------------------- */
/* Helpers                                                                   */
/* ------------------------------------------------------------------------- */
static void load(R4Cpu *cpu, const std::vector<r4_u16> &prog)
{
  REQUIRE(r4_reset_words(cpu, prog.data(), (int)prog.size(), R4_ENTRY_DEFAULT) == 0);
}

/* Counted loop: r2 accumulates 9+8+...+1, r3 counts the nibble carries. */
static const std::vector<r4_u16> kSumLoop = {
    ORI(1, 0, 9),   // 0x00
    ORI(2, 0, 0),   // 0x04
    ORI(3, 0, 0),   // 0x08
    ADD(2, 2, 1),   // 0x0C loop:
    BCC(2),         // 0x10 -> 0x18
    ADDI(3, 3, 1),  // 0x14
    ADDI(1, 1, 0xF),  // 0x18
    BNE(0xFC),      // 0x1C -> 0x0C
    HALT(),         // 0x20
};

/* ------------------------------------------------------------------------- */
/* End-to-end programs                                                       */
/* ------------------------------------------------------------------------- */
TEST_CASE("ORI/ADD/HALT")
{
  R4Cpu cpu{};
  REQUIRE(r4_init(&cpu, nullptr) == 0);
  load(&cpu, {0xA105, 0x0211, 0x700F});

  R4StepResult res = r4_run(&cpu, 100);
  CHECK(res.halted == true);
  CHECK(res.fault == 0);
  CHECK(res.stop == R4_STOP_HALT);

  CHECK(r4_reg(&cpu, 1) == 5);
  CHECK(r4_reg(&cpu, 2) == 10);
  CHECK(r4_flag_z(&cpu) == false);
  CHECK(r4_flag_c(&cpu) == false);
  CHECK(r4_pc(&cpu) == 0x008);
  CHECK(r4_steps(&cpu) == 3);
}

TEST_CASE("store then load through a register pair")
{
  R4Cpu cpu{};
  REQUIRE(r4_init(&cpu, nullptr) == 0);
  load(&cpu, {ORI(4, 0, 3), ORI(5, 0, 2), ORI(1, 0, 9), 0xD141, 0xC241, HALT()});

  R4StepResult res = r4_run(&cpu, 100);
  CHECK(res.stop == R4_STOP_HALT);
  CHECK(r4_data_read(&cpu, 0x33) == 9);
  CHECK(r4_reg(&cpu, 2) == 9);
}

TEST_CASE("multi-precision add with ADC")
{
  // 0x2B + 0x17 = 0x42
  R4Cpu cpu{};
  REQUIRE(r4_init(&cpu, nullptr) == 0);
  load(&cpu, {
                 ORI(1, 0, 0x2),
                 ORI(2, 0, 0xB),
                 ORI(3, 0, 0x1),
                 ORI(4, 0, 0x7),
                 ADD(6, 2, 4),  // low nibble, carry out
                 ADC(1, 3),     // high nibble plus carry
                 HALT(),
             });

  r4_run(&cpu, 100);
  CHECK(r4_reg(&cpu, 6) == 0x2);
  CHECK(r4_reg(&cpu, 1) == 0x4);
  CHECK(r4_flag_c(&cpu) == false);
  CHECK(r4_is_halted(&cpu));
}

TEST_CASE("taken BEQ skips two instructions")
{
  R4Cpu cpu{};
  REQUIRE(r4_init(&cpu, nullptr) == 0);
  load(&cpu, {
                 ORI(1, 0, 3),  // 0x00
                 ORI(2, 0, 3),  // 0x04
                 SUB(3, 1, 2),  // 0x08 Z=1
                 BEQ(3),        // 0x0C -> 0x18
                 ORI(4, 0, 1),  // 0x10
                 ORI(5, 0, 1),  // 0x14
                 ORI(6, 0, 7),  // 0x18
                 HALT(),        // 0x1C
             });

  R4StepResult res = r4_run(&cpu, 100);
  CHECK(res.stop == R4_STOP_HALT);
  CHECK(r4_reg(&cpu, 4) == 0);
  CHECK(r4_reg(&cpu, 5) == 0);
  CHECK(r4_reg(&cpu, 6) == 7);
  CHECK(r4_pc(&cpu) == 0x01C);
  CHECK(r4_steps(&cpu) == 6);
}

TEST_CASE("JAL/JR call and return")
{
  R4Cpu cpu{};
  REQUIRE(r4_init(&cpu, nullptr) == 0);
  load(&cpu, {
                 ORI(4, 0, 3),      // 0x00
                 asm_jal(0x010),    // 0x04
                 ORI(5, 0, 9),      // 0x08
                 HALT(),            // 0x0C
                 ADDI(4, 4, 1),     // 0x10 subroutine
                 JR(),              // 0x14
             });

  R4StepResult res = r4_run(&cpu, 100);
  CHECK(res.stop == R4_STOP_HALT);
  CHECK(r4_reg(&cpu, 4) == 4);
  CHECK(r4_reg(&cpu, 5) == 9);
  CHECK(r4_reg(&cpu, 3) == 0x8);
  CHECK(r4_pc(&cpu) == 0x00C);
  CHECK(r4_steps(&cpu) == 6);
}

TEST_CASE("counted loop with carry counting")
{
  R4Cpu cpu{};
  REQUIRE(r4_init(&cpu, nullptr) == 0);
  load(&cpu, kSumLoop);

  R4StepResult res = r4_run(&cpu, 1000);
  CHECK(res.stop == R4_STOP_HALT);
  // 45 = 0x2D: low nibble in r2, two carries in r3
  CHECK(r4_reg(&cpu, 2) == 0xD);
  CHECK(r4_reg(&cpu, 3) == 2);
  CHECK(r4_reg(&cpu, 1) == 0);
  CHECK(r4_pc(&cpu) == 0x020);
  CHECK(r4_steps(&cpu) == 42);
}

/* ------------------------------------------------------------------------- */
/* Halt and fault                                                            */
/* ------------------------------------------------------------------------- */
/*
 * Recursive bubble sort of n nibbles at data 0x40 (pair r4:r5, count r6).
 * One pass bubbles the largest element to the end, then the routine calls
 * itself on n-1. Each call pushes r1-r3 (link) and r10-r11 onto a
 * downward stack addressed by r14:r15; ADDI's borrow and carry move the
 * high half.
 */
static const std::vector<r4_u16> kBubbleSort = {
    ORI(14, 0, 0xF),     // 0x000 sp = 0xFF
    ORI(15, 0, 0xF),     // 0x004
    ORI(4, 0, 4),        // 0x008 array at 0x40
    ORI(5, 0, 0),        // 0x00C
    ORI(6, 0, 5),        // 0x010 n = 5
    asm_jal(0x01C),      // 0x014
    HALT(),              // 0x018
    ADDI(15, 15, 0xB),   // 0x01C sort: sp -= 5
    BCC(2),              // 0x020
    ADDI(14, 14, 0xF),   // 0x024
    SW(1, 0, 14),        // 0x028
    SW(2, 1, 14),        // 0x02C
    SW(3, 2, 14),        // 0x030
    SW(10, 3, 14),       // 0x034
    SW(11, 4, 14),       // 0x038
    SLTI(7, 6, 2),       // 0x03C
    BNE(19),             // 0x040 n < 2 -> 0x08C
    ORI(10, 0, 0),       // 0x044 i = 0
    ADDI(11, 6, 0xF),    // 0x048 last = n - 1
    SUB(7, 10, 11),      // 0x04C loop: borrow while i < last
    BCC(13),             // 0x050 -> 0x084
    ADD(8, 4, 0),        // 0x054 r8:r9 = &a[i]
    ADD(9, 5, 10),       // 0x058
    BCC(2),              // 0x05C
    ADDI(8, 8, 1),       // 0x060
    LW(2, 0, 8),         // 0x064 a[i]
    LW(3, 1, 8),         // 0x068 a[i+1]
    SUB(7, 3, 2),        // 0x06C
    BCC(3),              // 0x070 in order -> 0x07C
    SW(3, 0, 8),         // 0x074 swap
    SW(2, 1, 8),         // 0x078
    ADDI(10, 10, 1),     // 0x07C
    asm_j(0x04C),        // 0x080
    ADDI(6, 6, 0xF),     // 0x084 n - 1
    asm_jal(0x01C),      // 0x088 returns into the epilogue
    LW(1, 0, 14),        // 0x08C epilogue
    LW(2, 1, 14),        // 0x090
    LW(3, 2, 14),        // 0x094
    LW(10, 3, 14),       // 0x098
    LW(11, 4, 14),       // 0x09C
    ADDI(15, 15, 5),     // 0x0A0 sp += 5
    BCC(2),              // 0x0A4
    ADDI(14, 14, 1),     // 0x0A8
    JR(),                // 0x0AC
};

TEST_CASE("recursive bubble sort")
{
  R4Config cfg = r4_config_default();
  cfg.data_base = 0x800;
  R4Cpu cpu{};
  REQUIRE(r4_init(&cpu, &cfg) == 0);
  load(&cpu, kBubbleSort);
  const r4_u8 values[] = {0x72, 0x91, 0x50};  // 7 2 9 1 5
  REQUIRE(r4_load_image(&cpu, values, 3, 0x840) == 0);

  R4StepResult res = r4_run(&cpu, 5000);
  CHECK(res.halted == true);
  CHECK(res.fault == 0);
  CHECK(res.stop == R4_STOP_HALT);
  CHECK(r4_pc(&cpu) == 0x018);

  CHECK(r4_data_read(&cpu, 0x40) == 1);
  CHECK(r4_data_read(&cpu, 0x41) == 2);
  CHECK(r4_data_read(&cpu, 0x42) == 5);
  CHECK(r4_data_read(&cpu, 0x43) == 7);
  CHECK(r4_data_read(&cpu, 0x44) == 9);

  // Every push was matched by a pop
  CHECK(r4_reg(&cpu, 14) == 0xF);
  CHECK(r4_reg(&cpu, 15) == 0xF);
  CHECK(r4_reg(&cpu, 6) == 1);
  // Deepest frame (n = 1) sits at 0xE6
  CHECK(r4_data_read(&cpu, 0xE6) == 0x0);
  CHECK(r4_data_read(&cpu, 0xE8) == 0xC);
}

TEST_CASE("halted machine does not advance")
{
  R4Cpu cpu{};
  REQUIRE(r4_init(&cpu, nullptr) == 0);
  load(&cpu, {HALT()});

  R4StepResult res = r4_step(&cpu);
  CHECK(res.halted == true);
  CHECK(res.stop == R4_STOP_HALT);
  CHECK(r4_steps(&cpu) == 1);
  CHECK(r4_pc(&cpu) == 0);

  res = r4_step(&cpu);
  CHECK(res.halted == true);
  CHECK(res.stop == R4_STOP_HALT);
  CHECK(r4_steps(&cpu) == 1);

  res = r4_run(&cpu, 50);
  CHECK(res.stop == R4_STOP_HALT);
  CHECK(r4_steps(&cpu) == 1);
}

TEST_CASE("illegal instruction faults without side effects")
{
  R4Cpu cpu{};
  REQUIRE(r4_init(&cpu, nullptr) == 0);
  load(&cpu, {ORI(1, 0, 5), asm_ext(1, 1, 0x4), HALT()});

  R4StepResult res = r4_run(&cpu, 100);
  CHECK(res.halted == true);
  CHECK(res.fault == static_cast<r4_err>(Err::IllegalInstruction));
  CHECK(res.stop == R4_STOP_FAULT);

  CHECK(r4_pc(&cpu) == 0x004);
  CHECK(r4_reg(&cpu, 1) == 5);
  CHECK(r4_steps(&cpu) == 1);
  CHECK(r4_last_fault(&cpu) == static_cast<r4_err>(Err::IllegalInstruction));
  CHECK(r4_fault_pc(&cpu) == 0x004);
  CHECK(r4_fault_raw(&cpu) == 0x7114);

  // Further steps report the same fault and change nothing
  res = r4_step(&cpu);
  CHECK(res.stop == R4_STOP_FAULT);
  CHECK(r4_pc(&cpu) == 0x004);
  CHECK(r4_steps(&cpu) == 1);
}

TEST_CASE("illegal branch condition faults")
{
  R4Cpu cpu{};
  REQUIRE(r4_init(&cpu, nullptr) == 0);
  load(&cpu, {asm_branch(0x9, 0x01)});

  R4StepResult res = r4_step(&cpu);
  CHECK(res.stop == R4_STOP_FAULT);
  CHECK(r4_pc(&cpu) == 0);
  CHECK(r4_steps(&cpu) == 0);
}

/* ------------------------------------------------------------------------- */
/* Run limits and breakpoints                                                */
/* ------------------------------------------------------------------------- */
TEST_CASE("step limit leaves the machine running")
{
  R4Cpu cpu{};
  REQUIRE(r4_init(&cpu, nullptr) == 0);
  load(&cpu, {asm_j(0x000)});

  R4StepResult res = r4_run(&cpu, 10);
  CHECK(res.halted == false);
  CHECK(res.fault == 0);
  CHECK(res.stop == R4_STOP_STEP_LIMIT);
  CHECK(r4_steps(&cpu) == 10);

  res = r4_run(&cpu, 5);
  CHECK(res.stop == R4_STOP_STEP_LIMIT);
  CHECK(r4_steps(&cpu) == 15);

  res = r4_run(&cpu, 0);
  CHECK(res.stop == R4_STOP_STEP_LIMIT);
  CHECK(r4_steps(&cpu) == 15);
}

TEST_CASE("single step reports a running machine")
{
  R4Cpu cpu{};
  REQUIRE(r4_init(&cpu, nullptr) == 0);
  load(&cpu, {ORI(1, 0, 1), HALT()});

  R4StepResult res = r4_step(&cpu);
  CHECK(res.halted == false);
  CHECK(res.fault == 0);
  CHECK(res.stop == R4_STOP_NONE);
  CHECK(r4_pc(&cpu) == 0x004);
}

TEST_CASE("run stops at a breakpoint and resumes past it")
{
  R4Cpu cpu{};
  REQUIRE(r4_init(&cpu, nullptr) == 0);
  load(&cpu, kSumLoop);
  REQUIRE(r4_add_breakpoint(&cpu, 0x00C) == 0);

  R4StepResult res = r4_run(&cpu, 1000);
  CHECK(res.halted == false);
  CHECK(res.stop == R4_STOP_BREAKPOINT);
  CHECK(r4_pc(&cpu) == 0x00C);
  CHECK(r4_steps(&cpu) == 3);

  // One loop iteration: ADD, BCC, ADDI r1, BNE
  res = r4_run(&cpu, 1000);
  CHECK(res.stop == R4_STOP_BREAKPOINT);
  CHECK(r4_pc(&cpu) == 0x00C);
  CHECK(r4_steps(&cpu) == 7);
  CHECK(r4_reg(&cpu, 1) == 8);
  CHECK(r4_reg(&cpu, 2) == 9);

  REQUIRE(r4_remove_breakpoint(&cpu, 0x00C) == 0);
  res = r4_run(&cpu, 1000);
  CHECK(res.stop == R4_STOP_HALT);
  CHECK(r4_steps(&cpu) == 42);
}

TEST_CASE("breakpoint table management")
{
  R4Cpu cpu{};
  REQUIRE(r4_init(&cpu, nullptr) == 0);

  CHECK(r4_add_breakpoint(&cpu, 0x010) == 0);
  CHECK(r4_add_breakpoint(&cpu, 0x010) == 0);  // duplicate is a no-op
  CHECK(cpu.bp_count == 1);

  CHECK(r4_remove_breakpoint(&cpu, 0x020) == static_cast<r4_err>(Err::NotFound));
  CHECK(r4_add_breakpoint(&cpu, 0x1000) == static_cast<r4_err>(Err::InvalidArg));

  for (int i = 1; i < R4_MAX_BREAKPOINTS; ++i)
    CHECK(r4_add_breakpoint(&cpu, (r4_u16)(0x400 + i * 4)) == 0);
  CHECK(cpu.bp_count == R4_MAX_BREAKPOINTS);
  CHECK(r4_add_breakpoint(&cpu, 0x800) == static_cast<r4_err>(Err::TooManyBreakpoints));

  r4_clear_breakpoints(&cpu);
  CHECK(cpu.bp_count == 0);
}

/* ------------------------------------------------------------------------- */
/* Reset and configuration                                                   */
/* ------------------------------------------------------------------------- */
TEST_CASE("reset rejects an entry point outside the address space")
{
  R4Cpu cpu{};
  REQUIRE(r4_init(&cpu, nullptr) == 0);
  load(&cpu, {ORI(1, 0, 5), HALT()});
  r4_step(&cpu);

  const r4_u16 prog[] = {HALT()};
  CHECK(r4_reset_words(&cpu, prog, 1, 0x1000) == static_cast<r4_err>(Err::EntryOutOfRange));

  // Nothing was touched
  CHECK(r4_pc(&cpu) == 0x004);
  CHECK(r4_reg(&cpu, 1) == 5);
  CHECK(r4_steps(&cpu) == 1);
}

TEST_CASE("reset rejects an image that does not fit")
{
  R4Cpu cpu{};
  REQUIRE(r4_init(&cpu, nullptr) == 0);
  load(&cpu, {ORI(1, 0, 5), HALT()});

  std::vector<r4_u16> big(1025, HALT());
  CHECK(r4_reset_words(&cpu, big.data(), (int)big.size(), R4_ENTRY_DEFAULT) ==
        static_cast<r4_err>(Err::ImageOutOfRange));
  CHECK(r4_fetch_word(&cpu, 0) == ORI(1, 0, 5));

  // count * 4 wraps to 4 in 32 bits and must still be rejected
  const r4_u16 one[] = {HALT()};
  CHECK(r4_reset_words(&cpu, one, 0x40000001, R4_ENTRY_DEFAULT) ==
        static_cast<r4_err>(Err::ImageOutOfRange));
  CHECK(r4_fetch_word(&cpu, 0) == ORI(1, 0, 5));

  std::vector<r4_u16> full(1024, HALT());
  CHECK(r4_reset_words(&cpu, full.data(), (int)full.size(), R4_ENTRY_DEFAULT) == 0);
  CHECK(r4_fetch_word(&cpu, 0xFFC) == HALT());
}

TEST_CASE("reset argument checks")
{
  R4Cpu cpu{};
  REQUIRE(r4_init(&cpu, nullptr) == 0);
  const r4_u16 prog[] = {HALT()};

  CHECK(r4_reset_words(nullptr, prog, 1, 0) == static_cast<r4_err>(Err::InvalidArg));
  CHECK(r4_reset_words(&cpu, nullptr, 1, 0) == static_cast<r4_err>(Err::InvalidArg));
  CHECK(r4_reset_words(&cpu, prog, -1, 0) == static_cast<r4_err>(Err::InvalidArg));
  CHECK(r4_reset(&cpu, nullptr, 2, 0) == static_cast<r4_err>(Err::InvalidArg));
  CHECK(r4_reset_words(&cpu, nullptr, 0, 0) == 0);  // empty image is fine
}

TEST_CASE("reset clears state from a previous run")
{
  R4Cpu cpu{};
  REQUIRE(r4_init(&cpu, nullptr) == 0);
  load(&cpu, {ORI(1, 0, 5), SUB(2, 0, 1), asm_ext(0, 0, 0x9)});
  r4_run(&cpu, 100);
  REQUIRE(r4_last_fault(&cpu) != 0);
  REQUIRE(r4_flag_c(&cpu) == true);

  load(&cpu, {HALT()});
  CHECK(r4_is_halted(&cpu) == false);
  CHECK(r4_last_fault(&cpu) == 0);
  CHECK(r4_steps(&cpu) == 0);
  CHECK(r4_pc(&cpu) == 0);
  CHECK(r4_reg(&cpu, 1) == 0);
  CHECK(r4_reg(&cpu, 2) == 0);
  CHECK(r4_flag_c(&cpu) == false);
  CHECK(r4_flag_z(&cpu) == false);
  CHECK(r4_fetch_word(&cpu, 4) == 0x0000);
}

TEST_CASE("byte image loads high nibble first")
{
  R4Cpu cpu{};
  REQUIRE(r4_init(&cpu, nullptr) == 0);
  const r4_u8 image[] = {0xA1, 0x05, 0x70, 0x0F};
  REQUIRE(r4_reset(&cpu, image, (int)sizeof(image), R4_ENTRY_DEFAULT) == 0);

  CHECK(r4_fetch_word(&cpu, 0) == 0xA105);
  r4_run(&cpu, 10);
  CHECK(r4_reg(&cpu, 1) == 5);
  CHECK(r4_is_halted(&cpu));
}

TEST_CASE("explicit entry point")
{
  R4Cpu cpu{};
  REQUIRE(r4_init(&cpu, nullptr) == 0);
  const r4_u16 prog[] = {ORI(1, 0, 5), ORI(2, 0, 7), HALT()};
  REQUIRE(r4_reset_words(&cpu, prog, 3, 0x004) == 0);

  r4_run(&cpu, 10);
  CHECK(r4_reg(&cpu, 1) == 0);
  CHECK(r4_reg(&cpu, 2) == 7);
  CHECK(r4_steps(&cpu) == 2);
}

TEST_CASE("load_base and entry_pc from config")
{
  R4Config cfg = r4_config_default();
  cfg.load_base = 0x100;
  cfg.entry_pc = 0x104;

  R4Cpu cpu{};
  REQUIRE(r4_init(&cpu, &cfg) == 0);
  CHECK(r4_pc(&cpu) == 0x104);

  const r4_u16 prog[] = {ORI(1, 0, 5), ORI(2, 0, 7), HALT()};
  REQUIRE(r4_reset_words(&cpu, prog, 3, R4_ENTRY_DEFAULT) == 0);
  CHECK(r4_fetch_word(&cpu, 0x100) == ORI(1, 0, 5));
  CHECK(r4_pc(&cpu) == 0x104);

  r4_run(&cpu, 10);
  CHECK(r4_reg(&cpu, 1) == 0);
  CHECK(r4_reg(&cpu, 2) == 7);
  CHECK(r4_pc(&cpu) == 0x108);
}

TEST_CASE("config validation")
{
  R4Config cfg = r4_config_default();
  CHECK(cfg.entry_pc == 0);
  CHECK(cfg.load_base == 0);
  CHECK(cfg.data_base == 0);
  CHECK(cfg.trace == false);

  R4Cpu cpu{};
  cfg.data_base = 0x1000;
  CHECK(r4_init(&cpu, &cfg) == static_cast<r4_err>(Err::InvalidArg));
  CHECK(r4_create(&cfg) == nullptr);
  CHECK(r4_init(nullptr, nullptr) == static_cast<r4_err>(Err::InvalidArg));
}

TEST_CASE("heap instance lifecycle")
{
  struct R4Cpu *cpu = r4_create(nullptr);
  REQUIRE(cpu != nullptr);
  const r4_u16 prog[] = {ORI(1, 0, 5), HALT()};
  REQUIRE(r4_reset_words(cpu, prog, 2, R4_ENTRY_DEFAULT) == 0);
  r4_run(cpu, 10);
  CHECK(r4_reg(cpu, 1) == 5);
  r4_destroy(cpu);
  r4_destroy(nullptr);
}

TEST_CASE("trace output does not change execution")
{
  R4Config cfg = r4_config_default();
  cfg.trace = true;
  R4Cpu cpu{};
  REQUIRE(r4_init(&cpu, &cfg) == 0);
  load(&cpu, {0xA105, 0x0211, 0x700F});

  r4_run(&cpu, 100);
  CHECK(r4_reg(&cpu, 2) == 10);
  CHECK(r4_steps(&cpu) == 3);
}

TEST_CASE("accessors tolerate NULL")
{
  CHECK(r4_reg(nullptr, 1) == 0);
  CHECK(r4_pc(nullptr) == 0);
  CHECK(r4_is_halted(nullptr) == false);
  CHECK(r4_last_fault(nullptr) == static_cast<r4_err>(Err::InvalidArg));

  R4StepResult res = r4_step(nullptr);
  CHECK(res.halted == true);
  CHECK(res.fault == static_cast<r4_err>(Err::InvalidArg));
}
