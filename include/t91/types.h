#pragma once
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

  /* ------------------------------------------------------------------------- */
  /* Basic typedefs                                                            */
  /* ------------------------------------------------------------------------- */

  /** 32-bit machine word (registers, memory cells, device data). */
  typedef int32_t t91_word;
  /** Memory address / program counter. */
  typedef uint16_t t91_addr;
  /** Supervisor call code. */
  typedef uint16_t t91_code;
  /** Device identifier. */
  typedef uint16_t t91_device;
  /** Error code type. 0 = OK, negative = error. */
  typedef int t91_err;

#ifdef __cplusplus
} /* extern "C" */
#endif
