// src/assembler.cpp: TTK-91 assembly parser (line oriented, collects every failure)
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <string>
#include <string_view>

#include "t91/errors.hpp"
#include "t91/internal/assembler.hpp"
#include "t91/opcodes.hpp"
#include "t91/sys_ids.h"

namespace t91
{

/* ========================================================================= */
/* Predefined symbols                                                        */
/* ========================================================================= */

struct PredefinedSymbol
{
  const char *name;
  int32_t value;
};

static constexpr PredefinedSymbol kPredefined[] = {
    {"CRT", T91_DEV_CRT},        {"KBD", T91_DEV_KBD},         {"STDIN", T91_DEV_STDIN},
    {"STDOUT", T91_DEV_STDOUT},  {"HALT", T91_SVC_HALT},       {"READ", T91_SVC_READ},
    {"WRITE", T91_SVC_WRITE},    {"TIME", T91_SVC_TIME},       {"DATE", T91_SVC_DATE},
};

std::optional<int32_t> predefined_symbol(std::string_view name)
{
  for (const auto &p : kPredefined)
  {
    if (name == p.name)
      return p.value;
  }
  return std::nullopt;
}

/* ========================================================================= */
/* String helpers                                                            */
/* ========================================================================= */

static std::string upper_copy(std::string_view s)
{
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return out;
}

/* Levenshtein distance, used to pick "did you mean" candidates. */
static size_t edit_distance(std::string_view a, std::string_view b)
{
  std::vector<size_t> prev(b.size() + 1), cur(b.size() + 1);
  for (size_t j = 0; j <= b.size(); ++j)
    prev[j] = j;
  for (size_t i = 1; i <= a.size(); ++i)
  {
    cur[0] = i;
    for (size_t j = 1; j <= b.size(); ++j)
    {
      size_t sub = prev[j - 1] + (a[i - 1] == b[j - 1] ? 0 : 1);
      cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, sub});
    }
    std::swap(prev, cur);
  }
  return prev[b.size()];
}

static constexpr size_t kMaxSuggestDistance = 2;

/* ========================================================================= */
/* Tokenizer                                                                 */
/* ========================================================================= */

enum class TokKind : uint8_t
{
  Ident,
  Number,
  Comma,
  Equals,
  At,
  LParen,
  RParen,
};

struct Token
{
  TokKind kind;
  SourceRange span;
  std::string_view text;
  int64_t number = 0;
};

static bool is_ident_start(char c)
{
  return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

static bool is_ident_char(char c)
{
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

static bool is_digit(char c)
{
  return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

/**
 * Tokenize text[begin, end). Returns false and fills @p err on an
 * unrecognised character or malformed number.
 */
static bool tokenize(std::string_view text, size_t begin, size_t end, std::vector<Token> *out,
                     ParseError *err)
{
  size_t i = begin;
  while (i < end)
  {
    char c = text[i];
    if (c == ' ' || c == '\t' || c == '\r')
    {
      ++i;
      continue;
    }

    Token tok{};
    size_t start = i;
    if (is_ident_start(c))
    {
      while (i < end && is_ident_char(text[i]))
        ++i;
      tok.kind = TokKind::Ident;
    }
    else if (is_digit(c) || ((c == '-' || c == '+') && i + 1 < end && is_digit(text[i + 1])))
    {
      ++i;
      while (i < end && is_ident_char(text[i]))
        ++i;
      std::string lit(text.substr(start, i - start));
      const char *digits = lit.c_str() + ((lit[0] == '-' || lit[0] == '+') ? 1 : 0);
      int base = (digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) ? 16 : 10;
      char *stop = nullptr;
      long long v = std::strtoll(lit.c_str(), &stop, base);
      if (stop == lit.c_str() || *stop != '\0')
      {
        err->span = SourceRange{static_cast<uint32_t>(start), static_cast<uint32_t>(i)};
        err->message = "malformed number '" + lit + "'";
        return false;
      }
      tok.kind = TokKind::Number;
      tok.number = v;
    }
    else
    {
      switch (c)
      {
        case ',':
          tok.kind = TokKind::Comma;
          break;
        case '=':
          tok.kind = TokKind::Equals;
          break;
        case '@':
          tok.kind = TokKind::At;
          break;
        case '(':
          tok.kind = TokKind::LParen;
          break;
        case ')':
          tok.kind = TokKind::RParen;
          break;
        default:
          err->span = SourceRange{static_cast<uint32_t>(i), static_cast<uint32_t>(i + 1)};
          err->message = std::string("unexpected character '") + c + "'";
          return false;
      }
      ++i;
    }
    tok.span = SourceRange{static_cast<uint32_t>(start), static_cast<uint32_t>(i)};
    tok.text = text.substr(start, i - start);
    out->push_back(tok);
  }
  return true;
}

/* ========================================================================= */
/* Mnemonic / register lookup                                                */
/* ========================================================================= */

enum class Directive : uint8_t
{
  None,
  Dc,
  Ds,
  Equ,
};

static Directive find_directive(const std::string &upper)
{
  if (upper == "DC")
    return Directive::Dc;
  if (upper == "DS")
    return Directive::Ds;
  if (upper == "EQU")
    return Directive::Equ;
  return Directive::None;
}

static const InstructionEntry *find_instruction(const std::string &upper)
{
  for (const auto &e : kInstructionTable)
  {
    if (upper == e.name)
      return &e;
  }
  return nullptr;
}

static bool is_keyword(std::string_view word)
{
  std::string u = upper_copy(word);
  return find_instruction(u) || find_directive(u) != Directive::None;
}

/* Closest instruction or directive name, or nullptr if nothing is close. */
static const char *nearest_mnemonic(std::string_view word)
{
  static const char *const kDirectives[] = {"DC", "DS", "EQU"};
  std::string u = upper_copy(word);
  const char *best = nullptr;
  size_t best_d = kMaxSuggestDistance + 1;
  for (const auto &e : kInstructionTable)
  {
    size_t d = edit_distance(u, e.name);
    if (d < best_d)
    {
      best_d = d;
      best = e.name;
    }
  }
  for (const char *name : kDirectives)
  {
    size_t d = edit_distance(u, name);
    if (d < best_d)
    {
      best_d = d;
      best = name;
    }
  }
  return best;
}

/* Register index for R0..R7 / SP / FP, -1 if the word is not a register name. */
static int register_index(std::string_view word)
{
  std::string u = upper_copy(word);
  if (u == "SP")
    return T91_REG_SP;
  if (u == "FP")
    return T91_REG_FP;
  if (u.size() == 2 && u[0] == 'R' && u[1] >= '0' && u[1] <= '7')
    return u[1] - '0';
  return -1;
}

/* Looks like a register (R<digits>) but is out of range. */
static bool looks_like_register(std::string_view word)
{
  if (word.size() < 2 || (word[0] != 'R' && word[0] != 'r'))
    return false;
  for (size_t i = 1; i < word.size(); ++i)
  {
    if (!is_digit(word[i]))
      return false;
  }
  return true;
}

/* ========================================================================= */
/* Statement parser                                                          */
/* ========================================================================= */

namespace
{

class LineParser
{
public:
  LineParser(const std::vector<Token> &toks, size_t pos, uint32_t line_end)
      : toks_(toks), pos_(pos), line_end_(line_end)
  {
  }

  bool at_end() const
  {
    return pos_ >= toks_.size();
  }
  const Token &peek() const
  {
    return toks_[pos_];
  }
  size_t pos() const
  {
    return pos_;
  }
  void seek(size_t pos)
  {
    pos_ = pos;
  }

  /* Empty span where a missing token was expected. */
  SourceRange missing_span() const
  {
    if (!at_end())
      return peek().span;
    return SourceRange{line_end_, line_end_};
  }

  void fail(ParseError *err, SourceRange span, std::string msg) const
  {
    err->span = span;
    err->message = std::move(msg);
  }

  bool expect_register(ParseError *err, uint8_t *out)
  {
    if (at_end())
    {
      fail(err, missing_span(), "expected register");
      return false;
    }
    const Token &t = peek();
    int r = t.kind == TokKind::Ident ? register_index(t.text) : -1;
    if (r < 0)
    {
      if (t.kind == TokKind::Ident && looks_like_register(t.text))
      {
        fail(err, t.span, "unknown register '" + std::string(t.text) + "'");
        err->suggestions.push_back(Suggestion{t.span, "registers are R0..R7, SP and FP"});
      }
      else
      {
        fail(err, t.span, "expected register, found '" + std::string(t.text) + "'");
      }
      return false;
    }
    *out = static_cast<uint8_t>(r);
    ++pos_;
    return true;
  }

  bool expect_comma(ParseError *err)
  {
    if (at_end() || peek().kind != TokKind::Comma)
    {
      fail(err, missing_span(), "expected ','");
      return false;
    }
    ++pos_;
    return true;
  }

  /* Number or symbol. @p limit16 restricts literals to the 16-bit address field. */
  bool expect_value(ParseError *err, bool limit16, Value *out)
  {
    if (at_end())
    {
      fail(err, missing_span(), "expected a value");
      return false;
    }
    const Token &t = peek();
    if (t.kind == TokKind::Number)
    {
      int64_t lo = limit16 ? INT16_MIN : INT32_MIN;
      int64_t hi = limit16 ? INT16_MAX : INT32_MAX;
      if (t.number < lo || t.number > hi)
      {
        fail(err, t.span, "value " + std::string(t.text) + " does not fit in " +
                              (limit16 ? "16" : "32") + " bits");
        if (limit16)
          err->suggestions.push_back(
              Suggestion{t.span, "store large constants with DC and load them by label"});
        return false;
      }
      out->literal = static_cast<int32_t>(t.number);
      out->span = t.span;
      ++pos_;
      return true;
    }
    if (t.kind == TokKind::Ident && register_index(t.text) < 0)
    {
      out->symbol = std::string(t.text);
      out->span = t.span;
      ++pos_;
      return true;
    }
    fail(err, t.span, "expected a value, found '" + std::string(t.text) + "'");
    return false;
  }

  /**
   * Second operand of an instruction. @p address selects address semantics
   * (STORE, jumps, CALL): no '=' and one mode level less.
   */
  bool expect_operand(ParseError *err, bool address, Statement *st)
  {
    if (at_end())
    {
      fail(err, missing_span(), "expected operand");
      return false;
    }

    int prefix = 0;  // 0 none, 1 '=', 2 '@'
    SourceRange prefix_span = peek().span;
    if (peek().kind == TokKind::Equals)
      prefix = 1;
    else if (peek().kind == TokKind::At)
      prefix = 2;
    if (prefix)
      ++pos_;

    if (address && prefix == 1)
    {
      fail(err, prefix_span, "'=' is not allowed on an address operand");
      err->suggestions.push_back(Suggestion{prefix_span, "remove '=' to use the address directly"});
      return false;
    }

    /* Bare register: LOAD R1, R2 / LOAD R1, @R2 */
    if (!at_end() && peek().kind == TokKind::Ident && register_index(peek().text) >= 0)
    {
      const Token &t = peek();
      if (address)
      {
        fail(err, t.span, "expected an address, found register '" + std::string(t.text) + "'");
        err->suggestions.push_back(Suggestion{t.span, "write 0(" + std::string(t.text) +
                                                          ") to use the register as address"});
        return false;
      }
      if (prefix == 1)
      {
        fail(err, prefix_span, "'=' cannot be applied to a register");
        err->suggestions.push_back(Suggestion{prefix_span, "remove '='"});
        return false;
      }
      st->ri = static_cast<uint8_t>(register_index(t.text));
      st->mode = prefix == 2 ? MODE_DIRECT : MODE_IMMEDIATE;
      st->addr = Value{};
      st->addr.span = t.span;
      ++pos_;
      return true;
    }

    if (!expect_value(err, true, &st->addr))
      return false;

    if (!at_end() && peek().kind == TokKind::LParen)
    {
      ++pos_;
      if (!expect_register(err, &st->ri))
        return false;
      if (at_end() || peek().kind != TokKind::RParen)
      {
        fail(err, missing_span(), "expected ')'");
        return false;
      }
      ++pos_;
    }

    if (address)
      st->mode = prefix == 2 ? MODE_DIRECT : MODE_IMMEDIATE;
    else
      st->mode = prefix == 1 ? MODE_IMMEDIATE : (prefix == 2 ? MODE_INDIRECT : MODE_DIRECT);
    return true;
  }

  bool expect_end(ParseError *err)
  {
    if (!at_end())
    {
      fail(err, peek().span, "unexpected '" + std::string(peek().text) + "' after operands");
      return false;
    }
    return true;
  }

private:
  const std::vector<Token> &toks_;
  size_t pos_;
  uint32_t line_end_;
};

struct PendingLabel
{
  std::string name;
  SourceRange span;
};

}  // namespace

static bool parse_instruction(LineParser &lp, const InstructionEntry &e, Statement *st,
                              ParseError *err)
{
  st->kind = StatementKind::Instruction;
  st->op = e.opcode;
  switch (e.form)
  {
    case OperandForm::None:
      break;
    case OperandForm::Reg:
      if (!lp.expect_register(err, &st->rj))
        return false;
      break;
    case OperandForm::RegOper:
      if (!lp.expect_register(err, &st->rj) || !lp.expect_comma(err) ||
          !lp.expect_operand(err, false, st))
        return false;
      break;
    case OperandForm::RegAddr:
      if (!lp.expect_register(err, &st->rj) || !lp.expect_comma(err) ||
          !lp.expect_operand(err, true, st))
        return false;
      break;
    case OperandForm::Addr:
      if (!lp.expect_operand(err, true, st))
        return false;
      break;
    case OperandForm::RegReg:
      if (!lp.expect_register(err, &st->rj) || !lp.expect_comma(err) ||
          !lp.expect_register(err, &st->ri))
        return false;
      st->mode = MODE_IMMEDIATE;
      break;
  }
  return lp.expect_end(err);
}

/* ========================================================================= */
/* Program parser                                                            */
/* ========================================================================= */

static void define_symbol(Program *prog, const PendingLabel &label, SymbolDef def,
                          std::vector<ParseError> *errors)
{
  auto it = prog->symbols.find(label.name);
  if (it != prog->symbols.end())
  {
    ParseError err;
    err.span = label.span;
    err.message = "symbol '" + label.name + "' is already defined";
    err.suggestions.push_back(Suggestion{it->second.span, "first defined here"});
    errors->push_back(std::move(err));
    return;
  }
  def.span = label.span;
  prog->symbols.emplace(label.name, def);
}

/* Largest image whose addresses fit the signed 16-bit address field. */
static constexpr size_t kMaxImageWords = static_cast<size_t>(INT16_MAX) + 1;

static void check_reference(const Program &prog, const Value &v, bool address_field,
                            std::vector<ParseError> *errors)
{
  if (v.symbol.empty())
    return;

  auto found = prog.symbols.find(v.symbol);
  if (found != prog.symbols.end())
  {
    const SymbolDef &def = found->second;
    if (address_field && def.is_constant &&
        (def.constant < INT16_MIN || def.constant > INT16_MAX))
    {
      ParseError err;
      err.span = v.span;
      err.message = "value of '" + v.symbol + "' (" + std::to_string(def.constant) +
                    ") does not fit in 16 bits";
      err.suggestions.push_back(
          Suggestion{v.span, "store large constants with DC and load them by label"});
      errors->push_back(std::move(err));
    }
    return;
  }
  if (predefined_symbol(v.symbol))
    return;

  ParseError err;
  err.span = v.span;
  err.message = "undefined symbol '" + v.symbol + "'";

  for (const auto &kv : prog.symbols)
  {
    if (edit_distance(kv.first, v.symbol) <= kMaxSuggestDistance ||
        upper_copy(kv.first) == upper_copy(v.symbol))
    {
      err.suggestions.push_back(
          Suggestion{kv.second.span, "a symbol named '" + kv.first + "' is defined here"});
    }
  }
  for (const auto &p : kPredefined)
  {
    if (upper_copy(v.symbol) == p.name || edit_distance(v.symbol, p.name) <= 1)
      err.suggestions.push_back(Suggestion{v.span, std::string("did you mean '") + p.name + "'?"});
  }
  errors->push_back(std::move(err));
}

/* First statement, in layout order, that ends past the addressable image. */
static const Statement *first_overflowing(const Program &prog)
{
  size_t code = 0;
  size_t data = prog.code_words;
  const Statement *culprit = nullptr;
  size_t culprit_end = 0;
  for (const Statement &st : prog.statements)
  {
    size_t end;
    if (st.kind == StatementKind::Instruction)
      end = ++code;
    else
      end = data += st.kind == StatementKind::Ds ? static_cast<size_t>(st.data.literal) : 1;
    // Instructions come first in memory, so the earliest end address wins.
    if (end > kMaxImageWords && (!culprit || end < culprit_end))
    {
      culprit = &st;
      culprit_end = end;
    }
  }
  return culprit;
}

/* Parse text[line_start, line_end). Failures are appended to @p errors. */
static void parse_line(std::string_view text, size_t line_start, size_t line_end, Program *prog,
                       std::vector<ParseError> *errors)
{
  size_t content_end = line_end;
  size_t comment = text.substr(line_start, line_end - line_start).find(';');
  if (comment != std::string_view::npos)
    content_end = line_start + comment;
  /* Report missing tokens right after the last non-blank character. */
  size_t trimmed_end = content_end;
  while (trimmed_end > line_start &&
         (text[trimmed_end - 1] == ' ' || text[trimmed_end - 1] == '\t' ||
          text[trimmed_end - 1] == '\r'))
    --trimmed_end;

  std::vector<Token> toks;
  ParseError err;
  if (!tokenize(text, line_start, content_end, &toks, &err))
  {
    errors->push_back(std::move(err));
    return;
  }
  if (toks.empty())
    return;

  LineParser lp(toks, 0, static_cast<uint32_t>(trimmed_end));
  std::optional<PendingLabel> label;

  const Token &first = toks[0];
  if (first.kind != TokKind::Ident)
  {
    lp.fail(&err, first.span, "expected instruction, found '" + std::string(first.text) + "'");
    errors->push_back(std::move(err));
    return;
  }
  if (!is_keyword(first.text))
  {
    if (toks.size() > 1 && toks[1].kind == TokKind::Ident && is_keyword(toks[1].text))
    {
      label = PendingLabel{std::string(first.text), first.span};
      lp.seek(1);
    }
    else
    {
      /* "LABEL LAOD ..." blames the misspelt mnemonic, not the label. */
      const Token *bad = &first;
      if (!nearest_mnemonic(first.text) && toks.size() > 1 && toks[1].kind == TokKind::Ident &&
          nearest_mnemonic(toks[1].text))
        bad = &toks[1];
      lp.fail(&err, bad->span, "unknown instruction '" + std::string(bad->text) + "'");
      if (const char *near = nearest_mnemonic(bad->text))
        err.suggestions.push_back(Suggestion{bad->span, std::string("did you mean '") + near + "'?"});
      errors->push_back(std::move(err));
      return;
    }
  }

  const Token &mn = lp.peek();
  std::string upper = upper_copy(mn.text);
  lp.seek(lp.pos() + 1);

  Statement st;
  st.span = SourceRange{first.span.start, toks.back().span.end};

  Directive dir = find_directive(upper);
  if (dir == Directive::Equ)
  {
    Value v;
    if (!label)
    {
      lp.fail(&err, mn.span, "EQU needs a label");
      errors->push_back(std::move(err));
    }
    else if (!lp.expect_value(&err, false, &v) || !lp.expect_end(&err))
    {
      errors->push_back(std::move(err));
    }
    else if (!v.symbol.empty())
    {
      lp.fail(&err, v.span, "EQU value must be a number");
      errors->push_back(std::move(err));
    }
    else
    {
      SymbolDef def;
      def.is_constant = true;
      def.constant = v.literal;
      define_symbol(prog, *label, def, errors);
    }
    return;
  }

  if (dir == Directive::Dc || dir == Directive::Ds)
  {
    st.kind = dir == Directive::Dc ? StatementKind::Dc : StatementKind::Ds;
    if (!lp.expect_value(&err, false, &st.data) || !lp.expect_end(&err))
    {
      errors->push_back(std::move(err));
      return;
    }
    size_t words = 1;
    if (st.kind == StatementKind::Ds)
    {
      if (!st.data.symbol.empty() || st.data.literal <= 0 || st.data.literal > INT16_MAX)
      {
        lp.fail(&err, st.data.span, "DS size must be a number between 1 and 32767");
        errors->push_back(std::move(err));
        return;
      }
      words = static_cast<size_t>(st.data.literal);
    }
    prog->data_words += words;
  }
  else
  {
    const InstructionEntry *e = find_instruction(upper);
    if (!parse_instruction(lp, *e, &st, &err))
    {
      errors->push_back(std::move(err));
      return;
    }
    prog->code_words++;
  }

  if (label)
  {
    SymbolDef def;
    def.statement = prog->statements.size();
    define_symbol(prog, *label, def, errors);
  }
  prog->statements.push_back(std::move(st));
}

t91_err parse_program(std::string_view text, Program *out, std::vector<ParseError> *errors)
{
  if (!out || !errors)
    return T91_ERR(InvalidArg);

  const size_t errors_before = errors->size();
  Program prog;

  size_t line_start = 0;
  while (line_start <= text.size())
  {
    size_t line_end = text.find('\n', line_start);
    if (line_end == std::string_view::npos)
      line_end = text.size();

    parse_line(text, line_start, line_end, &prog, errors);

    if (line_end >= text.size())
      break;
    line_start = line_end + 1;
  }

  for (const auto &st : prog.statements)
  {
    if (st.kind == StatementKind::Instruction)
      check_reference(prog, st.addr, true, errors);
    else if (st.kind == StatementKind::Dc)
      check_reference(prog, st.data, false, errors);
  }

  if (const Statement *st = first_overflowing(prog))
  {
    ParseError err;
    err.span = st->span;
    err.message = "program needs " + std::to_string(prog.code_words + prog.data_words) +
                  " words, more than the " + std::to_string(kMaxImageWords) +
                  " a 16-bit address can reach";
    errors->push_back(std::move(err));
  }

  if (prog.code_words == 0 && errors->size() == errors_before)
  {
    ParseError err;
    err.message = "program contains no instructions";
    errors->push_back(std::move(err));
  }

  if (errors->size() != errors_before)
    return T91_ERR(ParseFailure);

  *out = std::move(prog);
  return T91_ERR(OK);
}

}  // namespace t91
