#pragma once
#include <cstdint>
#include <vector>

#include "t91/events.h"
#include "t91/internal/device_queue.hpp"
#include "t91/sys_ids.h"
#include "t91/types.h"

namespace t91
{

/**
 * @brief Receives the events of a committed instruction, in order.
 *
 * A non-zero return stops delivery of the remaining events and is returned
 * from machine_step().
 */
typedef t91_err (*EventSink)(void *user, const T91Event &ev);

/* COMP result flags */
enum : uint8_t
{
  FLAG_LESS = 1u << 0,
  FLAG_EQUAL = 1u << 1,
  FLAG_GREATER = 1u << 2,
};

/**
 * @brief TTK-91 machine state.
 *
 * Memory holds the program image followed by the stack reserve. SP and FP
 * start at the last image word; PUSH pre-increments.
 */
struct Machine
{
  t91_word r[T91_REG_COUNT];
  t91_addr pc;
  uint8_t flags;
  bool halted;
  std::vector<t91_word> mem;

  DeviceQueue *io;   // not owned
  EventSink sink;    // NULL = events are discarded
  void *sink_user;
};

/** Largest memory a 16-bit address can reach. */
constexpr size_t kMaxMemoryWords = 0x10000;

/**
 * @brief Reset @p m and load @p image with @p stack_words of reserve.
 * @return 0, or T91_ERR(InvalidArg) if the memory would exceed kMaxMemoryWords.
 */
t91_err machine_init(Machine *m, const std::vector<t91_word> &image, uint32_t stack_words,
                  DeviceQueue *io);

/**
 * @brief Execute one instruction.
 *
 * All register, flag, memory and device effects of the instruction are
 * staged and committed together; on failure nothing changes. Events are
 * delivered to the sink after the commit.
 *
 * @return 0 on success (also when already halted),
 *         T91_ERR(QueueUnderflow) if IN found no input,
 *         an emulation fault code,
 *         or the sink's non-zero return (instruction committed).
 */
t91_err machine_step(Machine *m);

/**
 * @brief Step until halted, failing with T91_ERR(StepLimit) after
 *        @p max_steps instructions.
 */
t91_err machine_run(Machine *m, uint32_t max_steps);

/* ---- memory access (memory.cpp) ---- */

/* Range check. Returns 0 or T91_ERR(OobMemory). */
t91_err mem_check(const Machine *m, int64_t addr);

t91_err mem_read_core(const Machine *m, int64_t addr, t91_word *out);

/**
 * @brief Host read of one memory cell.
 * @return 0 or T91_ERR(MemoryAccess) outside the declared memory size.
 */
t91_err machine_get_data(const Machine *m, int64_t addr, t91_word *out);

}  // namespace t91
