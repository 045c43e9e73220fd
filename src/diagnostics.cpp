// src/diagnostics.cpp: byte-offset parse failures to line/column diagnostics
#include "t91/internal/diagnostics.hpp"

#include <memory>
#include <new>

namespace t91
{

Span make_span(const LineIndex &index, SourceRange range)
{
  Position s = index.position(range.start);
  Position e = index.position(range.end);
  return Span{range.start, range.end, s.line, s.column, e.line, e.column};
}

Span end_of_text_span(const LineIndex &index)
{
  uint32_t end = static_cast<uint32_t>(index.text_size());
  return Span{end, end, 0, 0, 0, 0};
}

std::vector<Diagnostic> convert(const LineIndex &index, const ParseError &failure)
{
  std::vector<Diagnostic> out;
  out.reserve(1 + failure.suggestions.size());

  Span primary = failure.span ? make_span(index, *failure.span) : end_of_text_span(index);
  out.push_back(Diagnostic{T91_DIAG_ERROR, primary, failure.message});

  for (const Suggestion &s : failure.suggestions)
    out.push_back(Diagnostic{T91_DIAG_SUGGESTION, make_span(index, s.span), s.message});
  return out;
}

std::vector<Diagnostic> convert_all(std::string_view text, const std::vector<ParseError> &failures)
{
  const LineIndex index(text);
  std::vector<Diagnostic> out;
  for (const ParseError &f : failures)
  {
    std::vector<Diagnostic> one = convert(index, f);
    out.insert(out.end(), one.begin(), one.end());
  }
  return out;
}

}  // namespace t91

T91Diagnostics *t91_diagnostics_make(std::vector<t91::Diagnostic> items)
{
  std::unique_ptr<T91Diagnostics> d(new (std::nothrow) T91Diagnostics);
  if (!d)
    return nullptr;
  d->items = std::move(items);
  d->views.reserve(d->items.size());
  for (const auto &item : d->items)
    d->views.push_back(T91Diagnostic{item.level, item.span, item.message.c_str()});
  return d.release();
}

extern "C" int t91_diagnostics_count(const T91Diagnostics *diags)
{
  if (!diags)
    return 0;
  return static_cast<int>(diags->views.size());
}

extern "C" const T91Diagnostic *t91_diagnostics_get(const T91Diagnostics *diags, int idx)
{
  if (!diags || idx < 0 || idx >= static_cast<int>(diags->views.size()))
    return nullptr;
  return &diags->views[static_cast<size_t>(idx)];
}

extern "C" void t91_diagnostics_free(T91Diagnostics *diags)
{
  delete diags;
}
