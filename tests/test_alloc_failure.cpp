#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <cstdlib>
#include <new>

#include "doctest.h"
#include "t91/diagnostics.h"
#include "t91/errors.hpp"
#include "t91/t91_api.h"

// Global allocator that fails once its budget runs out and counts live blocks.
static long g_live = 0;
static long g_budget = -1;  // -1 never fails

static void *counted_alloc(std::size_t n)
{
  if (g_budget == 0)
    return nullptr;
  if (g_budget > 0)
    --g_budget;
  void *p = std::malloc(n ? n : 1);
  if (p)
    ++g_live;
  return p;
}

static void counted_free(void *p)
{
  if (!p)
    return;
  --g_live;
  std::free(p);
}

void *operator new(std::size_t n)
{
  if (void *p = counted_alloc(n))
    return p;
  throw std::bad_alloc();
}

void *operator new[](std::size_t n)
{
  if (void *p = counted_alloc(n))
    return p;
  throw std::bad_alloc();
}

void *operator new(std::size_t n, const std::nothrow_t &) noexcept
{
  return counted_alloc(n);
}

void *operator new[](std::size_t n, const std::nothrow_t &) noexcept
{
  return counted_alloc(n);
}

void operator delete(void *p) noexcept
{
  counted_free(p);
}

void operator delete[](void *p) noexcept
{
  counted_free(p);
}

void operator delete(void *p, std::size_t) noexcept
{
  counted_free(p);
}

void operator delete[](void *p, std::size_t) noexcept
{
  counted_free(p);
}

void operator delete(void *p, const std::nothrow_t &) noexcept
{
  counted_free(p);
}

void operator delete[](void *p, const std::nothrow_t &) noexcept
{
  counted_free(p);
}

static const char *kProgram =
    "      LOAD R1, =3\n"
    "LOOP  OUT R1, =CRT\n"
    "      SUB R1, =1\n"
    "      JPOS R1, LOOP\n"
    "      SVC SP, =HALT\n"
    "DATA  DC 7\n";

static const char *kBroken =
    "LOAD R9, =1\n"
    "STOER R1, X\n";

// Allocation counts never reach this in the calls below.
static const long kMaxBudget = 100000;

TEST_CASE("Out of memory: stepper creation frees everything it allocated")
{
  int failures = 0;
  for (long budget = 0; budget < kMaxBudget; ++budget)
  {
    T91Stepper *st = nullptr;
    const long live = g_live;
    g_budget = budget;
    t91_err e = t91_stepper_create(kProgram, nullptr, &st, nullptr);
    g_budget = -1;
    const long leaked = g_live - live;

    if (e == 0)
    {
      REQUIRE(st != nullptr);
      t91_stepper_destroy(st);
      CHECK(g_live == live);
      break;
    }
    ++failures;
    REQUIRE(e == T91_ERR(NoMemory));
    CHECK(st == nullptr);
    CHECK(leaked == 0);
  }
  CHECK(failures > 0);
}

TEST_CASE("Out of memory: parsing frees everything it allocated")
{
  int failures = 0;
  for (long budget = 0; budget < kMaxBudget; ++budget)
  {
    T91Program *prog = nullptr;
    const long live = g_live;
    g_budget = budget;
    t91_err e = t91_parse(kProgram, &prog, nullptr);
    g_budget = -1;
    const long leaked = g_live - live;

    if (e == 0)
    {
      REQUIRE(prog != nullptr);
      t91_program_free(prog);
      CHECK(g_live == live);
      break;
    }
    ++failures;
    REQUIRE(e == T91_ERR(NoMemory));
    CHECK(prog == nullptr);
    CHECK(leaked == 0);
  }
  CHECK(failures > 0);
}

TEST_CASE("Out of memory: failing parse with diagnostics leaks nothing")
{
  int failures = 0;
  for (long budget = 0; budget < kMaxBudget; ++budget)
  {
    T91Stepper *st = nullptr;
    T91Diagnostics *diags = nullptr;
    const long live = g_live;
    g_budget = budget;
    t91_err e = t91_stepper_create(kBroken, nullptr, &st, &diags);
    g_budget = -1;

    CHECK(st == nullptr);
    if (e == T91_ERR(ParseFailure))
    {
      REQUIRE(diags != nullptr);
      CHECK(t91_diagnostics_count(diags) > 0);
      t91_diagnostics_free(diags);
      CHECK(g_live == live);
      break;
    }
    const long leaked = g_live - live;
    ++failures;
    REQUIRE(e == T91_ERR(NoMemory));
    CHECK(diags == nullptr);
    CHECK(leaked == 0);
  }
  CHECK(failures > 0);
}
