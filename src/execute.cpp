// src/execute.cpp: one-shot execution without an event relay
#include <new>
#include <string_view>
#include <vector>

#include "t91/errors.hpp"
#include "t91/internal/assembler.hpp"
#include "t91/internal/device_queue.hpp"
#include "t91/internal/machine.hpp"
#include "t91/t91_api.h"

extern "C" int t91_version(void)
{
  return 1;
}

extern "C" t91_err t91_execute(const char *src, const T91Config *cfg, t91_word *out_array,
                               int max_count, int *out_count)
{
  if (!src || max_count < 0 || (max_count > 0 && !out_array))
    return T91_ERR(InvalidArg);
  if (out_count)
    *out_count = 0;

  try
  {
    t91::Program prog;
    std::vector<t91::ParseError> errors;
    if (t91_err e = t91::parse_program(std::string_view(src), &prog, &errors))
      return e;

    const t91::CompiledProgram compiled = t91::compile_program(prog);

    t91::DeviceQueue io;
    if (cfg && cfg->input && cfg->input_count > 0)
    {
      for (int i = 0; i < cfg->input_count; ++i)
        io.push_input(cfg->input[i]);
    }

    t91::Machine m;
    const uint32_t stack_words = (cfg && cfg->stack_words) ? cfg->stack_words
                                                           : T91_DEFAULT_STACK_WORDS;
    if (t91_err e = t91::machine_init(&m, compiled.image, stack_words, &io))
      return e;

    const uint32_t max_steps = (cfg && cfg->max_steps) ? cfg->max_steps : T91_DEFAULT_MAX_STEPS;
    t91_err e = t91::machine_run(&m, max_steps);

    // Output produced before a failure is still reported.
    const std::vector<t91_word> &output = io.output_log();
    const size_t n = output.size() < static_cast<size_t>(max_count) ? output.size()
                                                                    : static_cast<size_t>(max_count);
    for (size_t i = 0; i < n; ++i)
      out_array[i] = output[i];
    if (out_count)
      *out_count = static_cast<int>(output.size());
    return e;
  }
  catch (const std::bad_alloc &)
  {
    return T91_ERR(NoMemory);
  }
}
