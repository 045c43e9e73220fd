#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <cstring>
#include <string>
#include <vector>

#include "doctest.h"
#include "t91/errors.hpp"
#include "t91/sys_ids.h"
#include "t91/t91_api.h"

/* ------------------------------------------------------------------------- */
/* Programs                                                                  */
/* ------------------------------------------------------------------------- */

static const char *kAnswer =
    "LOAD R1, =42\n"
    "OUT R1, =CRT\n"
    "SVC SP, =HALT\n";

static const char *kEcho =
    "IN R1, =KBD\n"
    "OUT R1, =CRT\n"
    "IN R1, =KBD\n"
    "OUT R1, =CRT\n"
    "SVC SP, =HALT\n";

static const char *kSquares =
    "      LOAD R1, =1\n"
    "LOOP  LOAD R2, R1\n"
    "      MUL R2, R1\n"
    "      OUT R2, =CRT\n"
    "      STORE R2, LAST\n"
    "      ADD R1, =1\n"
    "      COMP R1, =5\n"
    "      JNGRE LOOP\n"
    "      SVC SP, =WRITE\n"
    "      SVC SP, =HALT\n"
    "LAST  DC 0\n";

static T91Stepper *make(const char *src, const T91Config *cfg = nullptr)
{
  T91Stepper *st = nullptr;
  T91Diagnostics *diags = nullptr;
  t91_err err = t91_stepper_create(src, cfg, &st, &diags);
  REQUIRE(err == 0);
  REQUIRE(st != nullptr);
  CHECK(diags == nullptr);
  return st;
}

/* ------------------------------------------------------------------------- */
/* Creation                                                                  */
/* ------------------------------------------------------------------------- */

TEST_CASE("Stepper: creation failure returns diagnostics and no stepper")
{
  T91Stepper *st = reinterpret_cast<T91Stepper *>(1);
  T91Diagnostics *diags = nullptr;
  CHECK(t91_stepper_create("LAOD R1, =1\n", nullptr, &st, &diags) == T91_ERR(ParseFailure));
  CHECK(st == nullptr);
  REQUIRE(diags != nullptr);
  CHECK(t91_diagnostics_count(diags) >= 1);
  CHECK(t91_diagnostics_get(diags, 0)->level == T91_DIAG_ERROR);
  t91_diagnostics_free(diags);
}

TEST_CASE("Stepper: initial machine state")
{
  T91Stepper *st = make(kAnswer);
  CHECK(t91_stepper_state_get(st) == T91_STEPPER_READY);
  CHECK(t91_stepper_pc(st) == 0);
  CHECK(t91_stepper_sp(st) == 2);
  CHECK(t91_stepper_memory_size(st) == 3 + T91_DEFAULT_STACK_WORDS);

  t91_word regs[8];
  CHECK(t91_stepper_registers(st, regs, 8) == 8);
  CHECK(regs[0] == 0);
  CHECK(regs[T91_REG_SP] == 2);
  CHECK(regs[T91_REG_FP] == 2);
  CHECK(t91_stepper_registers(st, regs, 3) == 3);
  t91_stepper_destroy(st);
}

TEST_CASE("Stepper: configured stack reserve")
{
  T91Config cfg{};
  cfg.stack_words = 8;
  T91Stepper *st = make(kAnswer, &cfg);
  CHECK(t91_stepper_memory_size(st) == 11);
  t91_stepper_destroy(st);
}

/* ------------------------------------------------------------------------- */
/* Stepping                                                                  */
/* ------------------------------------------------------------------------- */

TEST_CASE("Stepper: OUT step reports its output and line")
{
  T91Stepper *st = make(kAnswer);
  T91StepReport rep{};

  REQUIRE(t91_stepper_step(st, &rep) == 0);
  CHECK(rep.output_count == 0);
  CHECK(rep.calls_count == 0);
  CHECK(rep.executed_pc == 0);
  CHECK(rep.executed_line == 1);
  CHECK(rep.source_line == 2);
  CHECK_FALSE(rep.halted);

  REQUIRE(t91_stepper_step(st, &rep) == 0);
  REQUIRE(rep.output_count == 1);
  CHECK(rep.output[0] == 42);
  CHECK(rep.calls_count == 0);
  CHECK(rep.executed_line == 2);
  CHECK(rep.source_line == 3);

  REQUIRE(t91_stepper_step(st, &rep) == 0);
  CHECK(rep.output_count == 0);
  REQUIRE(rep.calls_count == 1);
  CHECK(rep.calls[0] == T91_SVC_HALT);
  CHECK(rep.halted);
  CHECK(rep.executed_line == 3);
  CHECK(rep.source_line == 0);  // PC now past the code

  int n = 0;
  const t91_word *out = t91_stepper_output(st, &n);
  REQUIRE(n == 1);
  CHECK(out[0] == 42);
  t91_stepper_destroy(st);
}

TEST_CASE("Stepper: halted stepper makes no progress")
{
  T91Stepper *st = make(kAnswer);
  for (int i = 0; i < 3; ++i)
    REQUIRE(t91_stepper_step(st, nullptr) == 0);

  const t91_addr pc = t91_stepper_pc(st);
  T91StepReport rep{};
  CHECK(t91_stepper_step(st, &rep) == 0);
  CHECK(rep.halted);
  CHECK(rep.output_count == 0);
  CHECK(rep.calls_count == 0);
  CHECK(t91_stepper_pc(st) == pc);

  int n = 0;
  t91_stepper_calls(st, &n);
  CHECK(n == 1);
  t91_stepper_destroy(st);
}

TEST_CASE("Stepper: echo with seeded input then queue underflow")
{
  const t91_word input[] = {7};
  T91Config cfg{};
  cfg.input = input;
  cfg.input_count = 1;
  T91Stepper *st = make(kEcho, &cfg);

  T91StepReport rep{};
  REQUIRE(t91_stepper_step(st, &rep) == 0);
  REQUIRE(t91_stepper_step(st, &rep) == 0);
  REQUIRE(rep.output_count == 1);
  CHECK(rep.output[0] == 7);

  // Second IN finds the queue empty: nothing is committed.
  const t91_addr pc = t91_stepper_pc(st);
  CHECK(t91_stepper_step(st, &rep) == T91_ERR(QueueUnderflow));
  CHECK(t91_stepper_state_get(st) == T91_STEPPER_READY);
  CHECK(t91_stepper_pc(st) == pc);

  // The host supplies input and retries.
  CHECK(t91_stepper_push_input(st, 9) == 0);
  REQUIRE(t91_stepper_step(st, &rep) == 0);
  REQUIRE(t91_stepper_step(st, &rep) == 0);
  REQUIRE(rep.output_count == 1);
  CHECK(rep.output[0] == 9);

  int n = 0;
  const t91_word *out = t91_stepper_output(st, &n);
  REQUIRE(n == 2);
  CHECK(out[0] == 7);
  CHECK(out[1] == 9);
  t91_stepper_destroy(st);
}

TEST_CASE("Stepper: accumulated step output equals one-shot execution")
{
  const char *programs[] = {kAnswer, kSquares};
  for (const char *src : programs)
  {
    T91Stepper *st = make(src);
    std::vector<t91_word> stepped;
    std::vector<t91_code> calls;
    T91StepReport rep{};
    for (int i = 0; i < 1000 && !rep.halted; ++i)
    {
      REQUIRE(t91_stepper_step(st, &rep) == 0);
      stepped.insert(stepped.end(), rep.output, rep.output + rep.output_count);
      calls.insert(calls.end(), rep.calls, rep.calls + rep.calls_count);
    }
    CHECK(rep.halted);

    t91_word executed[64];
    int count = 0;
    REQUIRE(t91_execute(src, nullptr, executed, 64, &count) == 0);
    REQUIRE(static_cast<size_t>(count) == stepped.size());
    for (int i = 0; i < count; ++i)
      CHECK(executed[i] == stepped[static_cast<size_t>(i)]);

    int n = 0;
    const t91_code *all = t91_stepper_calls(st, &n);
    REQUIRE(static_cast<size_t>(n) == calls.size());
    for (int i = 0; i < n; ++i)
      CHECK(all[i] == calls[static_cast<size_t>(i)]);
    t91_stepper_destroy(st);
  }
}

/* ------------------------------------------------------------------------- */
/* Memory and symbols                                                        */
/* ------------------------------------------------------------------------- */

TEST_CASE("Stepper: readAddress agrees with execution and rejects out-of-range")
{
  T91Stepper *st = make(kSquares);
  t91_addr last = 0;
  REQUIRE(t91_stepper_find_symbol(st, "LAST", &last) == 0);

  t91_word a = -1, b = -1;
  CHECK(t91_stepper_read(st, last, &a) == 0);
  CHECK(t91_stepper_read(st, last, &b) == 0);
  CHECK(a == 0);
  CHECK(a == b);

  T91StepReport rep{};
  while (!rep.halted)
    REQUIRE(t91_stepper_step(st, &rep) == 0);

  CHECK(t91_stepper_read(st, last, &a) == 0);
  CHECK(a == 25);

  const uint32_t size = t91_stepper_memory_size(st);
  CHECK(t91_stepper_read(st, static_cast<t91_addr>(size - 1), &a) == 0);
  CHECK(t91_stepper_read(st, static_cast<t91_addr>(size), &a) == T91_ERR(MemoryAccess));
  CHECK(t91_stepper_state_get(st) == T91_STEPPER_READY);
  t91_stepper_destroy(st);
}

TEST_CASE("Stepper: symbol table sorted by name")
{
  T91Stepper *st = make(kSquares);
  REQUIRE(t91_stepper_symbol_count(st) == 2);

  const char *name = nullptr;
  t91_addr addr = 0;
  CHECK(t91_stepper_symbol_at(st, 0, &name, &addr) == 0);
  CHECK(std::strcmp(name, "LAST") == 0);
  CHECK(addr == 10);
  CHECK(t91_stepper_symbol_at(st, 1, &name, &addr) == 0);
  CHECK(std::strcmp(name, "LOOP") == 0);
  CHECK(addr == 1);
  CHECK(t91_stepper_symbol_at(st, 2, &name, &addr) == T91_ERR(InvalidArg));

  CHECK(t91_stepper_find_symbol(st, "LOOP", &addr) == 0);
  CHECK(addr == 1);
  CHECK(t91_stepper_find_symbol(st, "loop", &addr) == T91_ERR(UnknownSymbol));
  CHECK(t91_stepper_find_symbol(st, "HALT", &addr) == T91_ERR(UnknownSymbol));
  t91_stepper_destroy(st);
}

/* ------------------------------------------------------------------------- */
/* Faults                                                                    */
/* ------------------------------------------------------------------------- */

TEST_CASE("Stepper: a fault is re-signalled without executing")
{
  T91Stepper *st = make("LOAD R1, =3\nDIV R1, =0\nSVC SP, =HALT\n");
  REQUIRE(t91_stepper_step(st, nullptr) == 0);

  CHECK(t91_stepper_step(st, nullptr) == T91_ERR(DivByZero));
  CHECK(t91_stepper_state_get(st) == T91_STEPPER_FAULTED);
  const t91_addr pc = t91_stepper_pc(st);
  CHECK(pc == 1);

  CHECK(t91_stepper_step(st, nullptr) == T91_ERR(DivByZero));
  CHECK(t91_stepper_step(st, nullptr) == T91_ERR(DivByZero));
  CHECK(t91_stepper_pc(st) == pc);

  // Input is still accepted; the stepper stays faulted.
  CHECK(t91_stepper_push_input(st, 1) == 0);
  CHECK(t91_stepper_step(st, nullptr) == T91_ERR(DivByZero));
  t91_stepper_destroy(st);
}

/* ------------------------------------------------------------------------- */
/* Listeners                                                                 */
/* ------------------------------------------------------------------------- */

struct Log
{
  std::vector<std::string> entries;
};

static t91_err log_any(void *user, const char *type, const T91Event *ev)
{
  (void)ev;
  static_cast<Log *>(user)->entries.push_back(std::string("any:") + type);
  return 0;
}

static t91_err log_output(void *user, const char *type, const T91Event *ev)
{
  static_cast<Log *>(user)->entries.push_back(std::string("out:") + type + ":" +
                                              std::to_string(ev->u.output.data));
  return 0;
}

static t91_err reject(void *user, const char *type, const T91Event *ev)
{
  (void)user;
  (void)type;
  (void)ev;
  return T91_ERR(DivByZero);  // any non-zero code, even one in the fault range
}

TEST_CASE("Stepper: events reach specific then universal listeners during the step")
{
  T91Stepper *st = make(kAnswer);
  Log log;
  CHECK(t91_stepper_add_listener(st, T91_EVENT_ANY, log_any, &log) == 0);
  CHECK(t91_stepper_add_listener(st, "output", log_output, &log) == 0);

  REQUIRE(t91_stepper_step(st, nullptr) == 0);
  REQUIRE(log.entries.size() == 1);
  CHECK(log.entries[0] == "any:register-change");

  log.entries.clear();
  REQUIRE(t91_stepper_step(st, nullptr) == 0);
  REQUIRE(log.entries.size() == 2);
  CHECK(log.entries[0] == "out:output:42");
  CHECK(log.entries[1] == "any:output");

  log.entries.clear();
  REQUIRE(t91_stepper_step(st, nullptr) == 0);
  REQUIRE(log.entries.size() == 1);
  CHECK(log.entries[0] == "any:supervisor-call");

  // Halted: no further events.
  log.entries.clear();
  REQUIRE(t91_stepper_step(st, nullptr) == 0);
  CHECK(log.entries.empty());
  t91_stepper_destroy(st);
}

TEST_CASE("Stepper: listener failure propagates but the instruction commits")
{
  T91Stepper *st = make(kAnswer);
  CHECK(t91_stepper_add_listener(st, "register-change", reject, nullptr) == 0);

  T91StepReport rep{};
  CHECK(t91_stepper_step(st, &rep) == T91_ERR(DivByZero));
  CHECK(t91_stepper_state_get(st) == T91_STEPPER_READY);
  CHECK(t91_stepper_pc(st) == 1);
  CHECK(rep.executed_pc == 0);

  t91_word regs[8];
  t91_stepper_registers(st, regs, 8);
  CHECK(regs[1] == 42);
  t91_stepper_destroy(st);
}

TEST_CASE("Stepper: invalid listener registrations")
{
  T91Stepper *st = make(kAnswer);
  CHECK(t91_stepper_add_listener(st, nullptr, log_any, nullptr) == T91_ERR(InvalidArg));
  CHECK(t91_stepper_add_listener(st, "", log_any, nullptr) == T91_ERR(InvalidArg));
  CHECK(t91_stepper_add_listener(st, "output", nullptr, nullptr) == T91_ERR(InvalidArg));
  CHECK(t91_stepper_add_listener(nullptr, "output", log_any, nullptr) == T91_ERR(InvalidArg));
  t91_stepper_destroy(st);
}
