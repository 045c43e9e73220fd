#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"
#include "t91/errors.hpp"
#include "t91/internal/device_queue.hpp"
#include "t91/sys_ids.h"

using t91::DeviceQueue;

TEST_CASE("DeviceQueue: input is FIFO across devices")
{
  DeviceQueue q;
  q.push_input(1);
  q.push_input(2);
  CHECK(q.input_pending() == 2);

  t91_word v = 0;
  CHECK(q.input(T91_DEV_KBD, &v) == 0);
  CHECK(v == 1);
  CHECK(q.input(T91_DEV_STDIN, &v) == 0);
  CHECK(v == 2);
  CHECK(q.input_pending() == 0);
}

TEST_CASE("DeviceQueue: empty input underflows and leaves the output untouched")
{
  DeviceQueue q;
  t91_word v = 99;
  CHECK(q.input(T91_DEV_KBD, &v) == T91_ERR(QueueUnderflow));
  CHECK(v == 99);

  q.push_input(5);
  CHECK(q.input(T91_DEV_KBD, &v) == 0);
  CHECK(v == 5);
}

TEST_CASE("DeviceQueue: output and supervisor call logs are append-only")
{
  DeviceQueue q;
  q.output(T91_DEV_CRT, 10);
  q.output(T91_DEV_STDOUT, 20);
  q.supervisor_call(T91_SVC_WRITE);
  q.supervisor_call(T91_SVC_HALT);

  REQUIRE(q.output_log().size() == 2);
  CHECK(q.output_log()[0] == 10);
  CHECK(q.output_log()[1] == 20);
  REQUIRE(q.calls_log().size() == 2);
  CHECK(q.calls_log()[0] == T91_SVC_WRITE);
  CHECK(q.calls_log()[1] == T91_SVC_HALT);
}
