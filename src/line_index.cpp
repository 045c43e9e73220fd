#include "t91/internal/line_index.hpp"

#include <algorithm>

namespace t91
{

Position position_of(std::string_view text, size_t offset)
{
  if (offset > text.size())
    offset = text.size();

  uint32_t line = 1;
  size_t last_start = 0;
  for (size_t i = 0; i < offset; ++i)
  {
    if (text[i] == '\n')
    {
      ++line;
      last_start = i + 1;
    }
  }
  return Position{line, static_cast<uint32_t>(offset - last_start)};
}

LineIndex::LineIndex(std::string_view text) : size_(text.size())
{
  starts_.push_back(0);
  for (size_t i = 0; i < text.size(); ++i)
  {
    if (text[i] == '\n')
      starts_.push_back(i + 1);
  }
}

Position LineIndex::position(size_t offset) const
{
  if (offset > size_)
    offset = size_;

  // Last line start <= offset. A '\n' at offset-1 opens a new line at offset.
  auto it = std::upper_bound(starts_.begin(), starts_.end(), offset);
  size_t idx = static_cast<size_t>(it - starts_.begin()) - 1;
  return Position{static_cast<uint32_t>(idx + 1), static_cast<uint32_t>(offset - starts_[idx])};
}

}  // namespace t91
