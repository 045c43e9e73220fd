#include "t91/internal/device_queue.hpp"

#include "t91/errors.hpp"

namespace t91
{

t91_err DeviceQueue::input(t91_device device, t91_word *out)
{
  (void)device;  // all devices share one queue
  if (input_.empty())
    return T91_ERR(QueueUnderflow);
  *out = input_.front();
  input_.pop_front();
  return T91_ERR(OK);
}

void DeviceQueue::output(t91_device device, t91_word data)
{
  (void)device;
  output_.push_back(data);
}

void DeviceQueue::supervisor_call(t91_code code)
{
  calls_.push_back(code);
}

void DeviceQueue::push_input(t91_word value)
{
  input_.push_back(value);
}

}  // namespace t91
