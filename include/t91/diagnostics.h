#pragma once
#include <stdint.h>

#include "t91/types.h"

#ifdef __cplusplus
extern "C"
{
#endif

  /**
   * @brief Diagnostic severity.
   */
  typedef enum
  {
    T91_DIAG_ERROR = 0,
    T91_DIAG_SUGGESTION = 1,
  } t91_diag_level;

  /**
   * @brief Half-open byte range [start, end) with line/column for both ends.
   *
   * Lines are 1-based, columns count bytes since the last newline. A span
   * for a failure without a location is empty at end-of-text with all
   * line/column fields set to 0.
   */
  typedef struct T91Span
  {
    uint32_t start;
    uint32_t end;
    uint32_t start_line;
    uint32_t start_column;
    uint32_t end_line;
    uint32_t end_column;
  } T91Span;

  typedef struct T91Diagnostic
  {
    t91_diag_level level;
    T91Span span;
    const char *message; /**< Owned by the diagnostics list */
  } T91Diagnostic;

  /* Opaque, ordered list of diagnostics produced by a failed parse. */
  struct T91Diagnostics;

  /**
   * @brief Number of diagnostics in the list.
   * @param diags  List (NULL-safe, counts as empty).
   */
  int t91_diagnostics_count(const struct T91Diagnostics *diags);

  /**
   * @brief Get a diagnostic by index.
   * @return Pointer valid until t91_diagnostics_free(), or NULL if out of range.
   */
  const T91Diagnostic *t91_diagnostics_get(const struct T91Diagnostics *diags, int idx);

  /**
   * @brief Free a diagnostics list (NULL-safe).
   */
  void t91_diagnostics_free(struct T91Diagnostics *diags);

#ifdef __cplusplus
} /* extern "C" */
#endif
