// src/stepper.cpp: host API for parsing, loading and stepping programs
#include <algorithm>
#include <cstring>
#include <memory>
#include <new>
#include <string_view>

#include "t91/errors.h"
#include "t91/errors.hpp"
#include "t91/internal/diagnostics.hpp"
#include "t91/internal/stepper.hpp"

/* ========================================================================= */
/* Parsing                                                                   */
/* ========================================================================= */

/* Parse @p src; on failure hand every diagnostic to @p out_diags. */
static t91_err parse_source(std::string_view src, t91::Program *prog, T91Diagnostics **out_diags)
{
  std::vector<t91::ParseError> errors;
  t91_err e = t91::parse_program(src, prog, &errors);
  if (e != T91_ERR(ParseFailure))
    return e;

  if (out_diags)
  {
    *out_diags = t91_diagnostics_make(t91::convert_all(src, errors));
    if (!*out_diags)
      return T91_ERR(NoMemory);
  }
  return e;
}

extern "C" t91_err t91_parse(const char *src, struct T91Program **out_prog,
                             struct T91Diagnostics **out_diags)
{
  if (!src || !out_prog)
    return T91_ERR(InvalidArg);
  *out_prog = nullptr;
  if (out_diags)
    *out_diags = nullptr;

  try
  {
    std::unique_ptr<T91Program> p(new T91Program);
    p->source = src;
    if (t91_err e = parse_source(p->source, &p->program, out_diags))
      return e;
    *out_prog = p.release();
    return T91_ERR(OK);
  }
  catch (const std::bad_alloc &)
  {
    return T91_ERR(NoMemory);
  }
}

extern "C" int t91_program_code_size(const struct T91Program *prog)
{
  return prog ? static_cast<int>(prog->program.code_words) : 0;
}

extern "C" void t91_program_free(struct T91Program *prog)
{
  delete prog;
}

/* ========================================================================= */
/* Lifecycle                                                                 */
/* ========================================================================= */

/* Relay every committed event to the stepper's listeners. */
static t91_err relay_sink(void *user, const T91Event &ev)
{
  T91Stepper *st = static_cast<T91Stepper *>(user);
  t91_err e = st->relay.dispatch(ev);
  if (e)
    st->listener_failed = true;
  return e;
}

static t91_err load(T91Stepper *st, const char *src, const T91Config *cfg,
                    T91Diagnostics **out_diags)
{
  const std::string_view text(src);
  t91::Program prog;
  if (t91_err e = parse_source(text, &prog, out_diags))
    return e;

  t91::CompiledProgram compiled = t91::compile_program(prog);
  const uint32_t stack_words = (cfg && cfg->stack_words) ? cfg->stack_words
                                                         : T91_DEFAULT_STACK_WORDS;
  if (t91_err e = t91::machine_init(&st->machine, compiled.image, stack_words, &st->io))
    return e;
  st->machine.sink = relay_sink;
  st->machine.sink_user = st;

  const t91::LineIndex index(text);
  st->source_map = std::make_shared<const t91::SourceMap>(compiled.spans, index);

  // std::map iterates in name order
  st->symbols.assign(compiled.symbols.begin(), compiled.symbols.end());

  if (cfg && cfg->input && cfg->input_count > 0)
  {
    for (int i = 0; i < cfg->input_count; ++i)
      st->io.push_input(cfg->input[i]);
  }
  return T91_ERR(OK);
}

extern "C" t91_err t91_stepper_create(const char *src, const T91Config *cfg,
                                      struct T91Stepper **out, struct T91Diagnostics **out_diags)
{
  if (!src || !out)
    return T91_ERR(InvalidArg);
  *out = nullptr;
  if (out_diags)
    *out_diags = nullptr;

  try
  {
    std::unique_ptr<T91Stepper> st(new T91Stepper);
    st->state = T91_STEPPER_READY;
    st->fault = T91FaultInfo{};
    st->fault_handler = nullptr;
    st->fault_user_data = nullptr;
    st->listener_failed = false;

    if (t91_err e = load(st.get(), src, cfg, out_diags))
      return e;
    *out = st.release();
    return T91_ERR(OK);
  }
  catch (const std::bad_alloc &)
  {
    return T91_ERR(NoMemory);
  }
}

extern "C" void t91_stepper_destroy(struct T91Stepper *st)
{
  delete st;
}

/* ========================================================================= */
/* Stepping                                                                  */
/* ========================================================================= */

static uint32_t line_of(const T91Stepper *st, t91_addr addr)
{
  return st->source_map->line_for(addr).value_or(0);
}

extern "C" t91_err t91_stepper_step(struct T91Stepper *st, T91StepReport *out)
{
  if (!st)
    return T91_ERR(InvalidArg);
  if (st->state == T91_STEPPER_FAULTED)
    return st->fault.error_code;

  const size_t out_mark = st->io.output_log().size();
  const size_t calls_mark = st->io.calls_log().size();
  const t91_addr pc = st->machine.pc;

  st->listener_failed = false;
  t91_err e;
  try
  {
    e = t91::machine_step(&st->machine);
  }
  catch (const std::bad_alloc &)
  {
    return T91_ERR(NoMemory);
  }

  if (e && !st->listener_failed)
  {
    // Nothing was committed.
    if (err_is_fault(e))
      return t91_stepper_fault(st, e, pc);
    return e;
  }

  // Committed (a listener error still leaves the instruction applied).
  if (out)
  {
    const std::vector<t91_word> &output = st->io.output_log();
    const std::vector<t91_code> &calls = st->io.calls_log();
    out->output = output.data() + out_mark;
    out->output_count = static_cast<int>(output.size() - out_mark);
    out->calls = calls.data() + calls_mark;
    out->calls_count = static_cast<int>(calls.size() - calls_mark);
    out->source_line = line_of(st, st->machine.pc);
    out->executed_pc = pc;
    out->executed_line = line_of(st, pc);
    out->halted = st->machine.halted;
  }
  return e;
}

extern "C" t91_stepper_state t91_stepper_state_get(const struct T91Stepper *st)
{
  return st ? st->state : T91_STEPPER_FAULTED;
}

extern "C" t91_err t91_stepper_push_input(struct T91Stepper *st, t91_word value)
{
  if (!st)
    return T91_ERR(InvalidArg);
  try
  {
    st->io.push_input(value);
  }
  catch (const std::bad_alloc &)
  {
    return T91_ERR(NoMemory);
  }
  return T91_ERR(OK);
}

extern "C" const t91_word *t91_stepper_output(const struct T91Stepper *st, int *count)
{
  if (!st)
  {
    if (count)
      *count = 0;
    return nullptr;
  }
  if (count)
    *count = static_cast<int>(st->io.output_log().size());
  return st->io.output_log().data();
}

extern "C" const t91_code *t91_stepper_calls(const struct T91Stepper *st, int *count)
{
  if (!st)
  {
    if (count)
      *count = 0;
    return nullptr;
  }
  if (count)
    *count = static_cast<int>(st->io.calls_log().size());
  return st->io.calls_log().data();
}

/* ========================================================================= */
/* Machine inspection                                                        */
/* ========================================================================= */

extern "C" int t91_stepper_registers(const struct T91Stepper *st, t91_word *out_array,
                                     int max_count)
{
  if (!st || !out_array || max_count <= 0)
    return 0;
  const int n = std::min(max_count, T91_REG_COUNT);
  for (int i = 0; i < n; ++i)
    out_array[i] = st->machine.r[i];
  return n;
}

extern "C" t91_addr t91_stepper_pc(const struct T91Stepper *st)
{
  return st ? st->machine.pc : 0;
}

extern "C" t91_word t91_stepper_sp(const struct T91Stepper *st)
{
  return st ? st->machine.r[T91_REG_SP] : 0;
}

extern "C" uint32_t t91_stepper_memory_size(const struct T91Stepper *st)
{
  return st ? static_cast<uint32_t>(st->machine.mem.size()) : 0;
}

extern "C" t91_err t91_stepper_read(const struct T91Stepper *st, t91_addr addr, t91_word *out)
{
  if (!st || !out)
    return T91_ERR(InvalidArg);
  return t91::machine_get_data(&st->machine, addr, out);
}

/* ========================================================================= */
/* Symbols and source map                                                    */
/* ========================================================================= */

extern "C" int t91_stepper_symbol_count(const struct T91Stepper *st)
{
  return st ? static_cast<int>(st->symbols.size()) : 0;
}

extern "C" t91_err t91_stepper_symbol_at(const struct T91Stepper *st, int idx, const char **name,
                                         t91_addr *addr)
{
  if (!st || idx < 0 || static_cast<size_t>(idx) >= st->symbols.size())
    return T91_ERR(InvalidArg);
  if (name)
    *name = st->symbols[idx].first.c_str();
  if (addr)
    *addr = st->symbols[idx].second;
  return T91_ERR(OK);
}

extern "C" t91_err t91_stepper_find_symbol(const struct T91Stepper *st, const char *name,
                                           t91_addr *addr)
{
  if (!st || !name)
    return T91_ERR(InvalidArg);
  auto it = std::lower_bound(st->symbols.begin(), st->symbols.end(), name,
                             [](const std::pair<std::string, t91_addr> &s, const char *key)
                             { return std::strcmp(s.first.c_str(), key) < 0; });
  if (it == st->symbols.end() || it->first != name)
    return T91_ERR(UnknownSymbol);
  if (addr)
    *addr = it->second;
  return T91_ERR(OK);
}

extern "C" struct T91SourceMap *t91_stepper_source_map(const struct T91Stepper *st)
{
  if (!st)
    return nullptr;
  T91SourceMap *h = new (std::nothrow) T91SourceMap;
  if (!h)
    return nullptr;
  h->map = st->source_map;
  return h;
}

extern "C" t91_err t91_source_map_line_for(const struct T91SourceMap *map, t91_addr addr,
                                           uint32_t *out_line)
{
  if (!map || !map->map || !out_line)
    return T91_ERR(InvalidArg);
  std::optional<uint32_t> line = map->map->line_for(addr);
  if (!line)
    return T91_ERR(NoSourceLine);
  *out_line = *line;
  return T91_ERR(OK);
}

extern "C" void t91_source_map_free(struct T91SourceMap *map)
{
  delete map;
}

/* ========================================================================= */
/* Events                                                                    */
/* ========================================================================= */

extern "C" t91_err t91_stepper_add_listener(struct T91Stepper *st, const char *type,
                                            T91EventListener listener, void *user)
{
  if (!st || !type)
    return T91_ERR(InvalidArg);
  try
  {
    return st->relay.add_listener(type, listener, user);
  }
  catch (const std::bad_alloc &)
  {
    return T91_ERR(NoMemory);
  }
}

/* ========================================================================= */
/* Errors                                                                    */
/* ========================================================================= */

extern "C" const char *t91_err_str(int err)
{
  return err_str(static_cast<Err>(err));
}
