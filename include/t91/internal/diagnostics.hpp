#pragma once
#include <string>
#include <string_view>
#include <vector>

#include "t91/diagnostics.h"
#include "t91/internal/assembler.hpp"
#include "t91/internal/line_index.hpp"

namespace t91
{

using Span = T91Span;

struct Diagnostic
{
  t91_diag_level level;
  Span span;
  std::string message;
};

/**
 * @brief Span of [range.start, range.end) with line/column for both ends.
 */
Span make_span(const LineIndex &index, SourceRange range);

/**
 * @brief Empty span at end of text with line/column 0.
 */
Span end_of_text_span(const LineIndex &index);

/**
 * @brief Convert one parse failure: the Error first, then one Suggestion per
 *        attached hint in attachment order. Never fails.
 */
std::vector<Diagnostic> convert(const LineIndex &index, const ParseError &failure);

/**
 * @brief Convert every failure of a parse against one shared line index.
 */
std::vector<Diagnostic> convert_all(std::string_view text, const std::vector<ParseError> &failures);

}  // namespace t91

/* Backing store for the opaque C list. */
struct T91Diagnostics
{
  std::vector<t91::Diagnostic> items;
  std::vector<T91Diagnostic> views;  // message pointers into items
};

/**
 * @brief Wrap converted diagnostics in a C list. Returns NULL or throws
 * std::bad_alloc when memory runs out.
 */
T91Diagnostics *t91_diagnostics_make(std::vector<t91::Diagnostic> items);
