#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "t91/types.h"

namespace t91
{

/* ========================================================================= */
/* Parse failures                                                            */
/* ========================================================================= */

/** Half-open byte range [start, end) into the source text. */
struct SourceRange
{
  uint32_t start;
  uint32_t end;
};

/** Contextual hint attached to a parse failure. */
struct Suggestion
{
  SourceRange span;
  std::string message;
};

/**
 * @brief One parse failure.
 *
 * span is absent for failures that concern the program as a whole.
 */
struct ParseError
{
  std::optional<SourceRange> span;
  std::string message;
  std::vector<Suggestion> suggestions;
};

/* ========================================================================= */
/* Parsed program                                                            */
/* ========================================================================= */

enum class StatementKind : uint8_t
{
  Instruction,
  Dc,  // one initialised data word
  Ds,  // block of zeroed data words
};

/**
 * @brief Numeric operand: a literal or a reference to a symbol.
 */
struct Value
{
  int32_t literal = 0;
  std::string symbol;      // empty = literal
  SourceRange span{0, 0};  // token that produced the value
};

struct Statement
{
  StatementKind kind = StatementKind::Instruction;
  SourceRange span{0, 0};  // whole statement, label through last operand

  /* Instruction fields */
  uint8_t op = 0;
  uint8_t rj = 0;
  uint8_t mode = 0;
  uint8_t ri = 0;
  Value addr;

  /* Dc: value to store, Ds: word count */
  Value data;
};

/**
 * @brief Symbol defined in the source.
 *
 * Labels refer to a statement; EQU symbols carry a constant.
 */
struct SymbolDef
{
  SourceRange span;
  bool is_constant = false;
  int32_t constant = 0;
  size_t statement = 0;
};

/**
 * @brief Result of parsing: statements in source order plus symbol definitions.
 *
 * Every symbol referenced by a statement is defined (either here or as a
 * predefined symbol), so compile() cannot fail.
 */
struct Program
{
  std::vector<Statement> statements;
  std::map<std::string, SymbolDef> symbols;
  size_t code_words = 0;
  size_t data_words = 0;
};

/**
 * @brief Parse TTK-91 assembly.
 *
 * Every line is parsed; all failures are appended to @p errors.
 *
 * @return 0 on success, T91_ERR(ParseFailure) if any failure was found.
 */
t91_err parse_program(std::string_view text, Program *out, std::vector<ParseError> *errors);

/**
 * @brief Value of a predefined symbol (CRT, KBD, HALT, ...).
 */
std::optional<int32_t> predefined_symbol(std::string_view name);

/* ========================================================================= */
/* Compiled program                                                          */
/* ========================================================================= */

struct CompiledProgram
{
  std::vector<t91_word> image;               // code words, then data words
  size_t code_size = 0;
  std::map<std::string, t91_addr> symbols;   // user symbols only
  std::vector<std::pair<t91_addr, SourceRange>> spans;  // attributed addresses
};

/**
 * @brief Lay out and encode a parsed program.
 *
 * Instructions occupy addresses 0..n-1, DC/DS words follow in source order.
 */
CompiledProgram compile_program(const Program &prog);

}  // namespace t91
