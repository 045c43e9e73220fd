#pragma once
#include <stdbool.h>
#include <stdint.h>

#include "t91/types.h"

#ifdef __cplusplus
extern "C"
{
#endif

  /**
   * @brief Emulation fault diagnostic information
   *
   * Collected by the stepper when an instruction faults and used for the
   * fault report.
   */
  typedef struct T91FaultInfo
  {
    int32_t error_code;   /**< Error code (Err enumeration value) */
    t91_addr pc;          /**< Address of the faulting instruction */
    uint32_t instruction; /**< Raw instruction word (0 if not fetchable) */
    uint32_t line;        /**< Source line of the instruction (0 = unknown) */
    t91_word regs[8];     /**< R0..R7 at the time of the fault */
  } T91FaultInfo;

  // Forward declaration
  struct T91Stepper;

  /**
   * @brief Fault handler callback type
   *
   * Called after the fault report has been printed.
   *
   * @param user_data  User data pointer passed to t91_stepper_set_fault_handler
   * @param info       Fault diagnostic information
   */
  typedef void (*T91FaultHandler)(void *user_data, const T91FaultInfo *info);

  /**
   * @brief Set custom fault handler
   *
   * @param st         Stepper instance
   * @param handler    Fault handler callback (NULL to disable)
   * @param user_data  User data passed to handler
   */
  void t91_stepper_set_fault_handler(struct T91Stepper *st, T91FaultHandler handler,
                                     void *user_data);

  /**
   * @brief Get the fault that moved the stepper into the Faulted state.
   *
   * @param st    Stepper instance
   * @param out   Output fault info
   * @return 0 if the stepper is faulted, T91_ERR_InvalidArg otherwise
   */
  t91_err t91_stepper_last_fault(const struct T91Stepper *st, T91FaultInfo *out);

#ifdef __cplusplus
}
#endif
