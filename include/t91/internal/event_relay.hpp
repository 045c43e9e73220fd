#pragma once
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "t91/events.h"

namespace t91
{

/**
 * @brief Registry of event listeners keyed by event type name.
 *
 * Listeners registered under T91_EVENT_ANY ("*") receive every event.
 * Registration and dispatch take the same registry lock. Dispatch copies
 * the matching listeners under the lock and invokes them with the lock
 * released, so a listener may register further listeners; those are first
 * invoked by the next dispatch.
 */
class EventRelay
{
public:
  struct Listener
  {
    T91EventListener fn;
    void *user;
  };

  /**
   * @brief Register @p fn for @p type ("*" for every event).
   * @return 0 on success, T91_ERR(InvalidArg) on empty type or NULL callback.
   */
  t91_err add_listener(const std::string &type, T91EventListener fn, void *user);

  /**
   * @brief Invoke every listener for the event's type, then every universal one.
   *
   * Stops at the first listener that returns non-zero and returns that value.
   */
  t91_err dispatch(const T91Event &ev);

  size_t listener_count() const;

private:
  mutable std::mutex mu_;
  std::unordered_map<std::string, std::vector<Listener>> listeners_;
  std::vector<Listener> universal_;
};

}  // namespace t91
