#include "risc4/fault.h"

#include <inttypes.h>
#include <stdio.h>

#include "risc4/decode.h"
#include "risc4/disasm.h"
#include "risc4/errors.hpp"
#include "risc4/internal/cpu.h"

extern "C"
{
  void r4_set_fault_handler(struct R4Cpu *cpu, R4FaultHandler handler, void *user_data)
  {
    if (!cpu)
      return;

    cpu->fault_handler = handler;
    cpu->fault_user_data = user_data;
  }

  r4_err r4_fault_report(struct R4Cpu *cpu, r4_err error_code, r4_u16 pc, r4_u16 raw)
  {
    if (!cpu)
      return error_code;

    // Collect fault information
    R4FaultInfo info;
    info.error_code = error_code;
    info.pc = pc;
    info.raw = raw;
    for (int i = 0; i < R4_NUM_REGS; ++i)
    {
      info.regs[i] = cpu->reg[i];
    }
    info.flag_c = cpu->flag_c;
    info.flag_z = cpu->flag_z;
    info.steps = cpu->steps;

    R4Insn insn;
    (void)r4_decode(raw, &insn);  // illegal words still decode to a printable record
    char text[48];
    r4_disasm(&insn, pc, text, (int)sizeof(text));

    // Output diagnostic information
    printf("\n");
    printf("========== RISC-4 FAULT ==========\n");

    Err err = static_cast<Err>(error_code);
    printf("Error: %s (code=%d)\n", err_str(err), error_code);

    printf("PC: 0x%03X  Word: 0x%04X  %s\n", pc, raw, text);
    printf("Flags: C=%d Z=%d  Retired: %" PRIu32 "\n", info.flag_c ? 1 : 0,
           info.flag_z ? 1 : 0, info.steps);

    // Register file, two rows of eight
    for (int row = 0; row < 2; ++row)
    {
      printf("r%-2d..r%-2d:", row * 8, row * 8 + 7);
      for (int i = row * 8; i < row * 8 + 8; i++)
      {
        printf(" %X", info.regs[i]);
      }
      printf("\n");
    }

    printf("==================================\n");
    printf("\n");

    // Call custom fault handler if registered
    if (cpu->fault_handler)
    {
      cpu->fault_handler(cpu->fault_user_data, &info);
    }

    return error_code;
  }

}  // extern "C"
