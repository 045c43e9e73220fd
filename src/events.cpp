// src/events.cpp: event type names and the versioned payload schema
#include <cstring>
#include <string>

#include "t91/errors.hpp"
#include "t91/events.hpp"

static const char *const kEventTypeNames[] = {
#define EV(name, tag, type_name) type_name,
#include "t91/events.def"
#undef EV
};

extern "C" const char *t91_event_type_name(t91_event_kind kind)
{
  if (kind < 0 || kind >= T91_EV_COUNT)
    return nullptr;
  return kEventTypeNames[kind];
}

extern "C" t91_event_kind t91_event_kind_from_name(const char *type)
{
  if (!type)
    return T91_EV_COUNT;
  for (int i = 0; i < T91_EV_COUNT; ++i)
  {
    if (std::strcmp(kEventTypeNames[i], type) == 0)
      return static_cast<t91_event_kind>(i);
  }
  return T91_EV_COUNT;
}

namespace t91
{

nlohmann::json event_payload(const Event &ev)
{
  switch (ev.kind)
  {
    case T91_EV_SUPERVISOR_CALL:
      return {{"code", ev.u.supervisor_call.code}};
    case T91_EV_MEMORY_CHANGE:
      return {{"address", ev.u.memory_change.address}, {"data", ev.u.memory_change.data}};
    case T91_EV_REGISTER_CHANGE:
      return {{"register", ev.u.register_change.reg}, {"data", ev.u.register_change.data}};
    case T91_EV_OUTPUT:
      return {{"device", ev.u.output.device}, {"data", ev.u.output.data}};
    default:
      return nlohmann::json::object();
  }
}

nlohmann::json event_to_json(const Event &ev)
{
  return {
      {"version", T91_EVENT_SCHEMA_VERSION},
      {"type", event_type_name(ev)},
      {"payload", event_payload(ev)},
  };
}

}  // namespace t91

extern "C" int t91_event_to_json(const T91Event *event, char *buf, int cap)
{
  if (!event || cap < 0 || (cap > 0 && !buf))
    return T91_ERR(InvalidArg);
  if (!t91_event_type_name(event->kind))
    return T91_ERR(InvalidArg);

  const std::string text = t91::event_to_json(*event).dump();
  if (cap > 0)
  {
    size_t n = text.size() < static_cast<size_t>(cap - 1) ? text.size() : static_cast<size_t>(cap - 1);
    std::memcpy(buf, text.data(), n);
    buf[n] = '\0';
  }
  return static_cast<int>(text.size());
}
