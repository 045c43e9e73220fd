#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <string>
#include <utility>
#include <vector>

#include "doctest.h"
#include "t91/errors.hpp"
#include "t91/events.hpp"
#include "t91/sys_ids.h"
#include "t91/t91_api.hpp"

using t91::SourceMapHandle;
using t91::Stepper;

static const std::string kProgram =
    "      LOAD R1, =3\n"
    "LOOP  OUT R1, =CRT\n"
    "      SUB R1, =1\n"
    "      JPOS R1, LOOP\n"
    "      SVC SP, =HALT\n";

static t91_err count_outputs(void *user, const char *type, const T91Event *ev)
{
  (void)type;
  (void)ev;
  ++*static_cast<int *>(user);
  return 0;
}

TEST_CASE("C++ API: create, step and inspect")
{
  Stepper st;
  REQUIRE(Stepper::create(kProgram, nullptr, &st) == 0);
  CHECK(st.get() != nullptr);
  CHECK(st.state() == T91_STEPPER_READY);
  CHECK(st.registers().size() == 8);
  CHECK(st.pc() == 0);
  CHECK(st.sp() == 4);

  int outputs = 0;
  CHECK(st.add_listener("output", count_outputs, &outputs) == 0);

  T91StepReport rep{};
  while (!rep.halted)
    REQUIRE(st.step(&rep) == 0);

  CHECK(outputs == 3);
  const std::vector<t91_word> expected = {3, 2, 1};
  CHECK(st.output() == expected);
  REQUIRE(st.calls().size() == 1);
  CHECK(st.calls()[0] == T91_SVC_HALT);
  CHECK(st.registers()[1] == 0);

  t91_word w = 0;
  CHECK(st.read(0, &w) == 0);
  CHECK(st.read(0xFFFF, &w) == T91_ERR(MemoryAccess));
}

TEST_CASE("C++ API: symbols and source map")
{
  Stepper st;
  REQUIRE(Stepper::create(kProgram, nullptr, &st) == 0);

  auto symbols = st.symbols();
  REQUIRE(symbols.size() == 1);
  CHECK(symbols[0].first == "LOOP");
  CHECK(symbols[0].second == 1);

  SourceMapHandle map = st.source_map();
  REQUIRE(map.valid());
  CHECK(map.line_for(1).value() == 2);
  CHECK_FALSE(map.line_for(5).has_value());
}

TEST_CASE("C++ API: source map outlives a moved-from and destroyed stepper")
{
  SourceMapHandle map;
  {
    Stepper a;
    REQUIRE(Stepper::create(kProgram, nullptr, &a) == 0);
    Stepper b(std::move(a));
    CHECK(a.get() == nullptr);
    map = b.source_map();
  }
  CHECK(map.line_for(4).value() == 5);
}

TEST_CASE("C++ API: parse failure leaves the stepper empty")
{
  Stepper st;
  T91Diagnostics *diags = nullptr;
  CHECK(Stepper::create("JUMP NOWHERE\n", nullptr, &st, &diags) == T91_ERR(ParseFailure));
  CHECK(st.get() == nullptr);
  CHECK(t91_diagnostics_count(diags) == 1);
  t91_diagnostics_free(diags);
}
