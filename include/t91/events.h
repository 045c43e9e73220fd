#pragma once
#include <stdint.h>

#include "t91/types.h"

#ifdef __cplusplus
extern "C"
{
#endif

/** Version of the serialized event payload produced by t91_event_to_json(). */
#define T91_EVENT_SCHEMA_VERSION 1

/** Listener key that receives every event kind. */
#define T91_EVENT_ANY "*"

  /**
   * @brief Event kind tag (generated from events.def).
   */
  typedef enum
  {
#define EV(name, tag, type_name) T91_EV_##tag,
#include "t91/events.def"
#undef EV
    T91_EV_COUNT
  } t91_event_kind;

  /**
   * @brief One observed side effect of a single executed instruction.
   */
  typedef struct T91Event
  {
    t91_event_kind kind;
    union
    {
      struct
      {
        t91_code code;
      } supervisor_call;
      struct
      {
        t91_addr address;
        t91_word data;
      } memory_change;
      struct
      {
        uint8_t reg; /**< Register index 0..7 */
        t91_word data;
      } register_change;
      struct
      {
        t91_device device;
        t91_word data;
      } output;
    } u;
  } T91Event;

  /**
   * @brief Event listener callback.
   *
   * Invoked synchronously while the step that produced the event is still
   * running. A non-zero return aborts the dispatch and is returned from
   * t91_stepper_step().
   *
   * @param user   User data passed at registration
   * @param type   Event type name ("output", "memory-change", ...)
   * @param event  Event payload
   * @return 0 to continue, negative error code to fail the step
   */
  typedef t91_err (*T91EventListener)(void *user, const char *type, const T91Event *event);

  /**
   * @brief Get the type name of an event kind.
   * @return Static string, or NULL for an invalid kind.
   */
  const char *t91_event_type_name(t91_event_kind kind);

  /**
   * @brief Look up an event kind by type name.
   * @return Kind, or T91_EV_COUNT if @p type is not an event type name.
   */
  t91_event_kind t91_event_kind_from_name(const char *type);

  /**
   * @brief Serialize an event as {"version":1,"type":...,"payload":{...}}.
   *
   * Behaves like snprintf: writes at most @p cap bytes including the
   * terminating NUL and returns the full length of the JSON text.
   *
   * @param event  Event to serialize
   * @param buf    Output buffer (may be NULL when cap == 0)
   * @param cap    Buffer capacity in bytes
   * @return JSON length (excluding NUL), or negative error code
   */
  int t91_event_to_json(const T91Event *event, char *buf, int cap);

#ifdef __cplusplus
} /* extern "C" */
#endif
