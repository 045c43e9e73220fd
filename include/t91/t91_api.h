#pragma once
#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#include "t91/diagnostics.h"
#include "t91/events.h"
#include "t91/fault.h"
#include "t91/types.h"

#ifdef __cplusplus
extern "C"
{
#endif

  /* ------------------------------------------------------------------------- */
  /* Configuration                                                             */
  /* ------------------------------------------------------------------------- */

  /**
   * @brief Configuration used when loading or executing a program.
   *
   * Every field may be left zero to get the default. Passing a NULL
   * configuration is the same as passing an all-zero one.
   */
  typedef struct T91Config
  {
    const t91_word *input; /**< Words pre-seeded into the device input queue */
    int input_count;       /**< Number of entries in @p input */
    uint32_t stack_words;  /**< Memory words reserved after the image (0 = 256) */
    uint32_t max_steps;    /**< Step budget for t91_execute() (0 = 1000000) */
  } T91Config;

#define T91_DEFAULT_STACK_WORDS 256u
#define T91_DEFAULT_MAX_STEPS 1000000u

  /* Forward declarations for opaque handles. */
  struct T91Program;
  struct T91Stepper;
  struct T91SourceMap;

  /* ------------------------------------------------------------------------- */
  /* Parsing                                                                   */
  /* ------------------------------------------------------------------------- */

  /**
   * @brief Parse a TTK-91 assembly program.
   *
   * Either a program is produced and no diagnostics, or every diagnostic is
   * produced and no program.
   *
   * @param src        NUL-terminated source text.
   * @param out_prog   Receives the parsed program on success.
   * @param out_diags  Receives the diagnostics on T91_ERR_ParseFailure
   *                   (may be NULL if the caller does not want them).
   * @return 0 on success, T91_ERR_ParseFailure, or another negative code.
   */
  t91_err t91_parse(const char *src, struct T91Program **out_prog,
                    struct T91Diagnostics **out_diags);

  /**
   * @brief Number of instruction words in a parsed program.
   */
  int t91_program_code_size(const struct T91Program *prog);

  /**
   * @brief Free a parsed program (NULL-safe).
   */
  void t91_program_free(struct T91Program *prog);

  /* ------------------------------------------------------------------------- */
  /* Stepper lifecycle                                                         */
  /* ------------------------------------------------------------------------- */

  /**
   * @brief Parse, compile and load a program into a new stepper.
   *
   * The stepper owns a fresh device queue (seeded from @p cfg), an event
   * relay with no listeners, the source map and the symbol table.
   *
   * @param src        NUL-terminated source text.
   * @param cfg        Configuration (NULL = defaults).
   * @param out        Receives the stepper.
   * @param out_diags  Receives diagnostics on T91_ERR_ParseFailure (may be NULL).
   * @return 0 on success, negative error code on failure.
   */
  t91_err t91_stepper_create(const char *src, const T91Config *cfg, struct T91Stepper **out,
                             struct T91Diagnostics **out_diags);

  /**
   * @brief Destroy a stepper and everything it owns (NULL-safe).
   *
   * Source map handles obtained from t91_stepper_source_map() stay valid.
   */
  void t91_stepper_destroy(struct T91Stepper *st);

  /* ------------------------------------------------------------------------- */
  /* Stepping                                                                  */
  /* ------------------------------------------------------------------------- */

  /**
   * @brief Externally visible stepper state.
   */
  typedef enum
  {
    T91_STEPPER_READY = 0,
    T91_STEPPER_FAULTED = 1,
  } t91_stepper_state;

  /**
   * @brief Result of one step.
   *
   * @p output and @p calls point into the stepper and stay valid until the
   * next call to t91_stepper_step() or t91_stepper_destroy().
   */
  typedef struct T91StepReport
  {
    const t91_word *output; /**< Output words appended by this step */
    int output_count;
    const t91_code *calls; /**< Supervisor call codes appended by this step */
    int calls_count;
    uint32_t source_line;  /**< Line of the post-step PC (0 = unknown) */
    t91_addr executed_pc;  /**< Address of the instruction that ran */
    uint32_t executed_line; /**< Line of that instruction (0 = unknown) */
    bool halted;           /**< Machine has executed SVC =HALT */
  } T91StepReport;

  /**
   * @brief Execute exactly one instruction.
   *
   * Events produced by the instruction are dispatched to listeners before
   * this function returns.
   *
   * @param st   Stepper instance.
   * @param out  Step report (filled on success, may be NULL).
   * @return 0 on success;
   *         T91_ERR_QueueUnderflow if IN found no input (nothing committed);
   *         an emulation fault code (stepper becomes Faulted, later calls
   *         return the same code);
   *         a listener's non-zero return value.
   */
  t91_err t91_stepper_step(struct T91Stepper *st, T91StepReport *out);

  /**
   * @brief Current stepper state.
   */
  t91_stepper_state t91_stepper_state_get(const struct T91Stepper *st);

  /**
   * @brief Append a word to the device input queue.
   */
  t91_err t91_stepper_push_input(struct T91Stepper *st, t91_word value);

  /**
   * @brief Full accumulated output log.
   * @param count  Receives the number of words.
   * @return Pointer valid until the next step or destroy.
   */
  const t91_word *t91_stepper_output(const struct T91Stepper *st, int *count);

  /**
   * @brief Full accumulated supervisor call log.
   * @param count  Receives the number of codes.
   * @return Pointer valid until the next step or destroy.
   */
  const t91_code *t91_stepper_calls(const struct T91Stepper *st, int *count);

  /* ------------------------------------------------------------------------- */
  /* Machine inspection                                                        */
  /* ------------------------------------------------------------------------- */

  /**
   * @brief Copy the register file (R0..R7) to an array.
   * @param st         Stepper instance.
   * @param out_array  Output array.
   * @param max_count  Capacity of @p out_array.
   * @return Number of registers copied (0 to 8).
   */
  int t91_stepper_registers(const struct T91Stepper *st, t91_word *out_array, int max_count);

  /**
   * @brief Current program counter.
   */
  t91_addr t91_stepper_pc(const struct T91Stepper *st);

  /**
   * @brief Current stack pointer (R6).
   */
  t91_word t91_stepper_sp(const struct T91Stepper *st);

  /**
   * @brief Declared memory size in words (image + stack reserve).
   */
  uint32_t t91_stepper_memory_size(const struct T91Stepper *st);

  /**
   * @brief Read one memory cell.
   * @return 0 on success, T91_ERR_MemoryAccess if @p addr is out of range.
   */
  t91_err t91_stepper_read(const struct T91Stepper *st, t91_addr addr, t91_word *out);

  /* ------------------------------------------------------------------------- */
  /* Symbols and source map                                                    */
  /* ------------------------------------------------------------------------- */

  /**
   * @brief Number of entries in the symbol table.
   */
  int t91_stepper_symbol_count(const struct T91Stepper *st);

  /**
   * @brief Get a symbol table entry by index (entries are sorted by name).
   * @param name  Receives the symbol name (owned by the stepper).
   * @param addr  Receives the resolved address or value.
   * @return 0 on success, T91_ERR_InvalidArg if @p idx is out of range.
   */
  t91_err t91_stepper_symbol_at(const struct T91Stepper *st, int idx, const char **name,
                                t91_addr *addr);

  /**
   * @brief Look up a symbol by name (case-sensitive).
   * @return 0 on success, T91_ERR_UnknownSymbol if not defined.
   */
  t91_err t91_stepper_find_symbol(const struct T91Stepper *st, const char *name,
                                  t91_addr *addr);

  /**
   * @brief Get a shared read-only handle to the program's source map.
   *
   * The handle stays valid after the stepper is destroyed and must be
   * released with t91_source_map_free().
   *
   * @return Handle, or NULL on allocation failure.
   */
  struct T91SourceMap *t91_stepper_source_map(const struct T91Stepper *st);

  /**
   * @brief Resolve an address to its 1-based source line.
   * @return 0 on success, T91_ERR_NoSourceLine if the address is unattributed.
   */
  t91_err t91_source_map_line_for(const struct T91SourceMap *map, t91_addr addr,
                                  uint32_t *out_line);

  /**
   * @brief Release a source map handle (NULL-safe).
   */
  void t91_source_map_free(struct T91SourceMap *map);

  /* ------------------------------------------------------------------------- */
  /* Events                                                                    */
  /* ------------------------------------------------------------------------- */

  /**
   * @brief Register an event listener.
   *
   * @param st        Stepper instance.
   * @param type      Event type name, or "*" for every event.
   * @param listener  Callback.
   * @param user      User data passed to the callback.
   * @return 0 on success, T91_ERR_InvalidArg on NULL/empty arguments.
   */
  t91_err t91_stepper_add_listener(struct T91Stepper *st, const char *type,
                                   T91EventListener listener, void *user);

  /* ------------------------------------------------------------------------- */
  /* One-shot execution                                                        */
  /* ------------------------------------------------------------------------- */

  /**
   * @brief Parse, compile and run a program to completion without events.
   *
   * @param src        NUL-terminated source text.
   * @param cfg        Configuration (NULL = defaults).
   * @param out_array  Receives output words (may be NULL when max_count == 0).
   * @param max_count  Capacity of @p out_array.
   * @param out_count  Receives the total number of output words produced,
   *                   which may exceed @p max_count.
   * @return 0 on success, negative error code on failure.
   */
  t91_err t91_execute(const char *src, const T91Config *cfg, t91_word *out_array,
                      int max_count, int *out_count);

  /* ------------------------------------------------------------------------- */
  /* Version                                                                   */
  /* ------------------------------------------------------------------------- */

  /**
   * @brief Get the current version of the library.
   * @return Version number as an integer.
   */
  int t91_version(void);

  /* ------------------------------------------------------------------------- */
  /* Error handling notes                                                      */
  /* ------------------------------------------------------------------------- */
  /**
   * All public APIs return 0 on success and a negative t91_err on failure.
   * Errors are defined in `errors.def`.
   *
   * Examples:
   *  - -3  = Parse failure (diagnostics returned separately)
   *  - -4  = Device input queue empty
   *  - -23 = Division by zero
   *
   * Exceptions never cross this API. A stepper must not be used from more
   * than one thread at a time.
   */

#ifdef __cplusplus
} /* extern "C" */
#endif
