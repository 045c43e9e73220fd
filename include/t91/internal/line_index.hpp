#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace t91
{

/**
 * @brief Line/column of a byte offset.
 *
 * line is 1-based, column counts bytes since the last '\n'.
 */
struct Position
{
  uint32_t line;
  uint32_t column;
};

/**
 * @brief Position of @p offset by scanning text[0..offset].
 *
 * Counts the '\n'-separated pieces of the prefix and the length of the last
 * one. O(offset); offsets past the end are clamped to the text size.
 */
Position position_of(std::string_view text, size_t offset);

/**
 * @brief Sorted line-start table built once per source text.
 *
 * Answers the same queries as position_of() in O(log lines).
 */
class LineIndex
{
public:
  explicit LineIndex(std::string_view text);

  Position position(size_t offset) const;
  uint32_t line(size_t offset) const
  {
    return position(offset).line;
  }

  size_t text_size() const
  {
    return size_;
  }
  size_t line_count() const
  {
    return starts_.size();
  }

private:
  std::vector<size_t> starts_;  // starts_[0] == 0
  size_t size_;
};

}  // namespace t91
