#pragma once
#include "t91/types.h"

// Error code definition using the same pattern as opcodes.def
// Define ERR(name, val, msg) before including this file if you want to extract text or
// mapping.

#ifndef ERR
#define ERR(name, val, msg) name = val,
#endif

enum class Err : int
{
#include "t91/errors.def"
};

#undef ERR

// Macro to reduce code size for error returns
#define T91_ERR(name) static_cast<t91_err>(Err::name)

// Helper to get a string message for each error
inline const char *err_str(Err e)
{
  switch (e)
  {
#define ERR(name, val, msg) \
  case Err::name:           \
    return msg;
#include "t91/errors.def"
#undef ERR
    default:
      return "unknown error";
  }
}

/* Emulation faults occupy -20..-29 (see errors.def). */
inline bool err_is_fault(int e)
{
  return e <= -20 && e >= -29;
}
