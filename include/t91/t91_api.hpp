/**
 * @file t91_api.hpp
 * @brief T91 stepper C++ API wrapper
 *
 * SPDX-License-Identifier: MIT OR Apache-2.0
 */

#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "t91/t91_api.h"

namespace t91
{

/**
 * @brief Owning handle to a shared source map
 */
class SourceMapHandle
{
public:
  explicit SourceMapHandle(struct ::T91SourceMap *map = nullptr) : map_(map) {}
  ~SourceMapHandle()
  {
    t91_source_map_free(map_);
  }

  SourceMapHandle(const SourceMapHandle &) = delete;
  SourceMapHandle &operator=(const SourceMapHandle &) = delete;
  SourceMapHandle(SourceMapHandle &&o) noexcept : map_(std::exchange(o.map_, nullptr)) {}
  SourceMapHandle &operator=(SourceMapHandle &&o) noexcept
  {
    std::swap(map_, o.map_);
    return *this;
  }

  /**
   * @brief Source line of an address
   * @return Line, or nothing for unattributed addresses
   */
  std::optional<uint32_t> line_for(t91_addr addr) const
  {
    uint32_t line = 0;
    if (t91_source_map_line_for(map_, addr, &line) != 0)
      return std::nullopt;
    return line;
  }

  bool valid() const
  {
    return map_ != nullptr;
  }

private:
  struct ::T91SourceMap *map_;
};

/**
 * @brief Owning handle to a T91Stepper
 *
 * Create with Stepper::create(); a default-constructed Stepper is empty.
 */
class Stepper
{
public:
  Stepper() = default;
  ~Stepper()
  {
    t91_stepper_destroy(st_);
  }

  Stepper(const Stepper &) = delete;
  Stepper &operator=(const Stepper &) = delete;
  Stepper(Stepper &&o) noexcept : st_(std::exchange(o.st_, nullptr)) {}
  Stepper &operator=(Stepper &&o) noexcept
  {
    std::swap(st_, o.st_);
    return *this;
  }

  /**
   * @brief Parse and load @p src
   *
   * @param src    Source text
   * @param cfg    Configuration (NULL = defaults)
   * @param out    Receives the stepper
   * @param diags  Receives the diagnostics on parse failure (may be NULL)
   * @return 0 on success, negative error code on failure
   */
  static t91_err create(const std::string &src, const T91Config *cfg, Stepper *out,
                        struct ::T91Diagnostics **diags = nullptr)
  {
    struct ::T91Stepper *st = nullptr;
    t91_err e = t91_stepper_create(src.c_str(), cfg, &st, diags);
    if (e == 0)
      *out = Stepper(st);
    return e;
  }

  t91_err step(T91StepReport *report = nullptr)
  {
    return t91_stepper_step(st_, report);
  }

  t91_err push_input(t91_word value)
  {
    return t91_stepper_push_input(st_, value);
  }

  t91_err add_listener(const char *type, T91EventListener listener, void *user = nullptr)
  {
    return t91_stepper_add_listener(st_, type, listener, user);
  }

  std::vector<t91_word> registers() const
  {
    std::vector<t91_word> regs(8);
    regs.resize(static_cast<size_t>(t91_stepper_registers(st_, regs.data(), 8)));
    return regs;
  }

  t91_addr pc() const
  {
    return t91_stepper_pc(st_);
  }

  t91_word sp() const
  {
    return t91_stepper_sp(st_);
  }

  t91_err read(t91_addr addr, t91_word *out) const
  {
    return t91_stepper_read(st_, addr, out);
  }

  std::vector<t91_word> output() const
  {
    int n = 0;
    const t91_word *p = t91_stepper_output(st_, &n);
    return p ? std::vector<t91_word>(p, p + n) : std::vector<t91_word>();
  }

  std::vector<t91_code> calls() const
  {
    int n = 0;
    const t91_code *p = t91_stepper_calls(st_, &n);
    return p ? std::vector<t91_code>(p, p + n) : std::vector<t91_code>();
  }

  /**
   * @brief Symbol table as (name, address) pairs sorted by name
   */
  std::vector<std::pair<std::string, t91_addr>> symbols() const
  {
    std::vector<std::pair<std::string, t91_addr>> out;
    const int n = t91_stepper_symbol_count(st_);
    for (int i = 0; i < n; ++i)
    {
      const char *name = nullptr;
      t91_addr addr = 0;
      if (t91_stepper_symbol_at(st_, i, &name, &addr) == 0)
        out.emplace_back(name, addr);
    }
    return out;
  }

  SourceMapHandle source_map() const
  {
    return SourceMapHandle(t91_stepper_source_map(st_));
  }

  t91_stepper_state state() const
  {
    return t91_stepper_state_get(st_);
  }

  struct ::T91Stepper *get() const
  {
    return st_;
  }

private:
  explicit Stepper(struct ::T91Stepper *st) : st_(st) {}

  struct ::T91Stepper *st_ = nullptr;
};

}  // namespace t91
