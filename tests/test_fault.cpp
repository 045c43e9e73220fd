#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <cstdint>

#include "doctest.h"
#include "t91/errors.hpp"
#include "t91/fault.h"
#include "t91/t91_api.h"

// Test helper: custom fault handler
static int g_fault_calls = 0;
static T91FaultInfo g_fault_info = {};
static void *g_fault_user_data = nullptr;

static void test_fault_handler(void *user_data, const T91FaultInfo *info)
{
  ++g_fault_calls;
  g_fault_user_data = user_data;
  if (info)
  {
    g_fault_info = *info;
  }
}

static T91Stepper *make(const char *src)
{
  T91Stepper *st = nullptr;
  REQUIRE(t91_stepper_create(src, nullptr, &st, nullptr) == 0);
  return st;
}

TEST_CASE("Fault handler: receives code, PC, line and registers")
{
  g_fault_calls = 0;
  int user_data = 1234;
  T91Stepper *st = make("LOAD R1, =6\nLOAD R2, =0\n\nDIV R1, R2\nSVC SP, =HALT\n");
  t91_stepper_set_fault_handler(st, test_fault_handler, &user_data);

  REQUIRE(t91_stepper_step(st, nullptr) == 0);
  REQUIRE(t91_stepper_step(st, nullptr) == 0);
  CHECK(t91_stepper_step(st, nullptr) == T91_ERR(DivByZero));

  CHECK(g_fault_calls == 1);
  CHECK(g_fault_user_data == &user_data);
  CHECK(g_fault_info.error_code == T91_ERR(DivByZero));
  CHECK(g_fault_info.pc == 2);
  CHECK(g_fault_info.line == 4);
  CHECK(g_fault_info.regs[1] == 6);
  CHECK(g_fault_info.regs[2] == 0);
  CHECK(g_fault_info.instruction != 0);
  // Expected output:
  // ========== T91 FAULT ==========
  // Error: division by zero (code=-23)

  // Re-signalling does not report again.
  CHECK(t91_stepper_step(st, nullptr) == T91_ERR(DivByZero));
  CHECK(g_fault_calls == 1);
  t91_stepper_destroy(st);
}

TEST_CASE("Fault handler: last fault is available after the fact")
{
  T91Stepper *st = make("LOAD R1, 5000\nSVC SP, =HALT\n");
  T91FaultInfo info{};
  CHECK(t91_stepper_last_fault(st, &info) == T91_ERR(InvalidArg));

  CHECK(t91_stepper_step(st, nullptr) == T91_ERR(OobMemory));
  CHECK(t91_stepper_last_fault(st, &info) == 0);
  CHECK(info.error_code == T91_ERR(OobMemory));
  CHECK(info.pc == 0);
  CHECK(info.line == 1);
  t91_stepper_destroy(st);
}

TEST_CASE("Fault handler: works without a handler and with NULL stepper")
{
  T91Stepper *st = make("JUMP 9000\n");
  CHECK(t91_stepper_step(st, nullptr) == T91_ERR(OobMemory));
  CHECK(t91_stepper_state_get(st) == T91_STEPPER_FAULTED);
  t91_stepper_set_fault_handler(nullptr, test_fault_handler, nullptr);
  t91_stepper_destroy(st);
}
