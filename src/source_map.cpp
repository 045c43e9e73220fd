#include "t91/internal/source_map.hpp"

namespace t91
{

SourceMap::SourceMap(const std::vector<std::pair<t91_addr, SourceRange>> &spans,
                     const LineIndex &index)
{
  size_t extent = 0;
  for (const auto &s : spans)
  {
    if (static_cast<size_t>(s.first) + 1 > extent)
      extent = static_cast<size_t>(s.first) + 1;
  }
  lines_.assign(extent, 0);

  for (const auto &s : spans)
    lines_[s.first] = index.line(s.second.start);
}

}  // namespace t91
