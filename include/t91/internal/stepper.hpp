#pragma once
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "t91/fault.h"
#include "t91/internal/assembler.hpp"
#include "t91/internal/device_queue.hpp"
#include "t91/internal/event_relay.hpp"
#include "t91/internal/machine.hpp"
#include "t91/internal/source_map.hpp"
#include "t91/t91_api.h"

/**
 * @brief Parsed program handle.
 */
struct T91Program
{
  t91::Program program;
  std::string source;
};

/**
 * @brief Shared handle to a loaded program's source map.
 */
struct T91SourceMap
{
  std::shared_ptr<const t91::SourceMap> map;
};

/**
 * @brief Internal stepper structure (not part of the public API).
 *        Visible only for unit tests or tightly coupled components.
 */
struct T91Stepper
{
  t91::Machine machine;
  t91::DeviceQueue io;
  t91::EventRelay relay;
  std::shared_ptr<const t91::SourceMap> source_map;

  /* Symbol table sorted by name */
  std::vector<std::pair<std::string, t91_addr>> symbols;

  /* Execution state */
  t91_stepper_state state;
  T91FaultInfo fault; /**< Valid when state == T91_STEPPER_FAULTED */
  bool listener_failed; /**< A listener failed during the current step */

  /* Fault reporting */
  T91FaultHandler fault_handler;
  void *fault_user_data;
};

/**
 * @brief Record a fault, print the fault report and call the host handler.
 *
 * Moves the stepper into T91_STEPPER_FAULTED.
 *
 * @param st          Stepper instance
 * @param error_code  Emulation fault code
 * @param pc          Address of the faulting instruction
 * @return error_code
 */
t91_err t91_stepper_fault(struct T91Stepper *st, t91_err error_code, t91_addr pc);
