#pragma once
#include <cstddef>
#include <deque>
#include <vector>

#include "t91/types.h"

namespace t91
{

/**
 * @brief I/O back end consumed by the machine.
 *
 * One shared input queue, output log and supervisor call log for every
 * device id. The logs are append-only.
 */
class DeviceQueue
{
public:
  /**
   * @brief Remove and return the front of the input queue.
   * @return 0 on success, T91_ERR(QueueUnderflow) if the queue is empty.
   */
  t91_err input(t91_device device, t91_word *out);

  void output(t91_device device, t91_word data);
  void supervisor_call(t91_code code);

  /** Host side: append a word to the input queue. */
  void push_input(t91_word value);

  size_t input_pending() const
  {
    return input_.size();
  }
  const std::vector<t91_word> &output_log() const
  {
    return output_;
  }
  const std::vector<t91_code> &calls_log() const
  {
    return calls_;
  }

private:
  std::deque<t91_word> input_;
  std::vector<t91_word> output_;
  std::vector<t91_code> calls_;
};

}  // namespace t91
