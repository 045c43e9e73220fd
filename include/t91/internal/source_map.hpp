#pragma once
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

#include "t91/internal/assembler.hpp"
#include "t91/internal/line_index.hpp"
#include "t91/types.h"

namespace t91
{

/**
 * @brief Address to source line table.
 *
 * Built once when a program is loaded; immutable afterwards and shared
 * between the stepper and any number of host handles.
 */
class SourceMap
{
public:
  SourceMap(const std::vector<std::pair<t91_addr, SourceRange>> &spans, const LineIndex &index);

  /** 1-based line of the statement at @p addr, or nothing if unattributed. */
  std::optional<uint32_t> line_for(t91_addr addr) const
  {
    if (addr >= lines_.size() || lines_[addr] == 0)
      return std::nullopt;
    return lines_[addr];
  }

  size_t size() const
  {
    return lines_.size();
  }

private:
  std::vector<uint32_t> lines_;  // 0 = no line
};

}  // namespace t91
