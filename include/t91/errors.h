#pragma once

/**
 * @file errors.h
 * @brief T91 error codes for C
 *
 * C-compatible error code definitions generated from errors.def
 */

#ifdef __cplusplus
extern "C"
{
#endif

  /* Generate error code constants from errors.def */
#define ERR(name, val, msg) static const int T91_ERR_##name = val;
#include "t91/errors.def"
#undef ERR

  /**
   * @brief Get the message text for an error code.
   * @param err  Error code (0 or negative).
   * @return Static string, never NULL.
   */
  const char *t91_err_str(int err);

#ifdef __cplusplus
}
#endif
