#include "t91/internal/event_relay.hpp"

#include "t91/errors.hpp"

namespace t91
{

t91_err EventRelay::add_listener(const std::string &type, T91EventListener fn, void *user)
{
  if (type.empty() || !fn)
    return T91_ERR(InvalidArg);

  std::lock_guard<std::mutex> lock(mu_);
  if (type == T91_EVENT_ANY)
    universal_.push_back(Listener{fn, user});
  else
    listeners_[type].push_back(Listener{fn, user});
  return T91_ERR(OK);
}

t91_err EventRelay::dispatch(const T91Event &ev)
{
  const char *type = t91_event_type_name(ev.kind);
  if (!type)
    return T91_ERR(InvalidArg);

  // Snapshot: type-specific listeners first, then universal ones.
  std::vector<Listener> pass;
  {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = listeners_.find(type);
    if (it != listeners_.end())
      pass = it->second;
    pass.insert(pass.end(), universal_.begin(), universal_.end());
  }

  for (const Listener &l : pass)
  {
    if (t91_err e = l.fn(l.user, type, &ev))
      return e;
  }
  return T91_ERR(OK);
}

size_t EventRelay::listener_count() const
{
  std::lock_guard<std::mutex> lock(mu_);
  size_t n = universal_.size();
  for (const auto &kv : listeners_)
    n += kv.second.size();
  return n;
}

}  // namespace t91
