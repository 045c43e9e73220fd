/**
 * @file events.hpp
 * @brief T91 execution event C++ wrapper
 *
 * SPDX-License-Identifier: MIT OR Apache-2.0
 */

#pragma once

#include <nlohmann/json.hpp>

#include "t91/events.h"

namespace t91
{

/**
 * @brief C++ wrapper for T91Event
 */
using Event = T91Event;

/**
 * @brief C++ wrapper for T91EventListener
 */
using EventListener = T91EventListener;

/**
 * @brief Type name of an event ("output", "memory-change", ...)
 */
inline const char *event_type_name(const Event &ev)
{
  return t91_event_type_name(ev.kind);
}

/**
 * @brief Variant-specific payload members of an event.
 *
 * supervisor-call {code}, memory-change {address, data},
 * register-change {register, data}, output {device, data}.
 */
nlohmann::json event_payload(const Event &ev);

/**
 * @brief Versioned envelope {"version", "type", "payload"}.
 */
nlohmann::json event_to_json(const Event &ev);

/* Event construction helpers used by the machine and by tests. */
inline Event make_supervisor_call(t91_code code)
{
  Event ev{};
  ev.kind = T91_EV_SUPERVISOR_CALL;
  ev.u.supervisor_call.code = code;
  return ev;
}

inline Event make_memory_change(t91_addr address, t91_word data)
{
  Event ev{};
  ev.kind = T91_EV_MEMORY_CHANGE;
  ev.u.memory_change.address = address;
  ev.u.memory_change.data = data;
  return ev;
}

inline Event make_register_change(uint8_t reg, t91_word data)
{
  Event ev{};
  ev.kind = T91_EV_REGISTER_CHANGE;
  ev.u.register_change.reg = reg;
  ev.u.register_change.data = data;
  return ev;
}

inline Event make_output(t91_device device, t91_word data)
{
  Event ev{};
  ev.kind = T91_EV_OUTPUT;
  ev.u.output.device = device;
  ev.u.output.data = data;
  return ev;
}

}  // namespace t91
