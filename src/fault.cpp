#include <inttypes.h>
#include <stdio.h>

#include "t91/errors.hpp"
#include "t91/fault.h"
#include "t91/internal/stepper.hpp"

extern "C"
{
  void t91_stepper_set_fault_handler(struct T91Stepper *st, T91FaultHandler handler,
                                     void *user_data)
  {
    if (!st)
      return;

    st->fault_handler = handler;
    st->fault_user_data = user_data;
  }

  t91_err t91_stepper_last_fault(const struct T91Stepper *st, T91FaultInfo *out)
  {
    if (!st || !out || st->state != T91_STEPPER_FAULTED)
      return T91_ERR(InvalidArg);
    *out = st->fault;
    return T91_ERR(OK);
  }

}  // extern "C"

t91_err t91_stepper_fault(struct T91Stepper *st, t91_err error_code, t91_addr pc)
{
  // Collect fault information
  T91FaultInfo info{};
  info.error_code = error_code;
  info.pc = pc;

  t91_word raw = 0;
  if (t91::mem_read_core(&st->machine, pc, &raw) == 0)
    info.instruction = static_cast<uint32_t>(raw);
  if (st->source_map)
    info.line = st->source_map->line_for(pc).value_or(0);
  for (int i = 0; i < T91_REG_COUNT; ++i)
    info.regs[i] = st->machine.r[i];

  st->fault = info;
  st->state = T91_STEPPER_FAULTED;

  // Output diagnostic information
  printf("\n");
  printf("========== T91 FAULT ==========\n");

  Err err = static_cast<Err>(error_code);
  printf("Error: %s (code=%d)\n", err_str(err), error_code);

  printf("PC: 0x%04" PRIX16, info.pc);
  if (info.line)
    printf(" (line %" PRIu32 ")", info.line);
  printf("\n");
  printf("Instruction: 0x%08" PRIX32 "\n", info.instruction);

  printf("Registers:");
  for (int i = 0; i < T91_REG_COUNT; ++i)
  {
    printf(" R%d=%" PRId32, i, info.regs[i]);
  }
  printf("\n");

  printf("===============================\n");
  printf("\n");

  // Call custom fault handler if registered
  if (st->fault_handler)
  {
    st->fault_handler(st->fault_user_data, &info);
  }

  return error_code;
}
