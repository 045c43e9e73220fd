// src/compiler.cpp: layout, symbol resolution and instruction encoding
#include "t91/internal/assembler.hpp"
#include "t91/opcodes.hpp"

namespace t91
{

/* Address of every statement: instructions first, data after the code. */
static std::vector<t91_addr> layout(const Program &prog)
{
  std::vector<t91_addr> addrs(prog.statements.size());
  size_t code = 0;
  size_t data = prog.code_words;
  for (size_t i = 0; i < prog.statements.size(); ++i)
  {
    const Statement &st = prog.statements[i];
    if (st.kind == StatementKind::Instruction)
    {
      addrs[i] = static_cast<t91_addr>(code++);
    }
    else
    {
      addrs[i] = static_cast<t91_addr>(data);
      data += st.kind == StatementKind::Ds ? static_cast<size_t>(st.data.literal) : 1;
    }
  }
  return addrs;
}

/* parse_program() guarantees every referenced symbol resolves. */
static int32_t resolve(const Program &prog, const std::vector<t91_addr> &addrs, const Value &v)
{
  if (v.symbol.empty())
    return v.literal;

  auto it = prog.symbols.find(v.symbol);
  if (it != prog.symbols.end())
  {
    const SymbolDef &def = it->second;
    return def.is_constant ? def.constant : addrs[def.statement];
  }
  return predefined_symbol(v.symbol).value_or(0);
}

CompiledProgram compile_program(const Program &prog)
{
  CompiledProgram out;
  const std::vector<t91_addr> addrs = layout(prog);

  out.code_size = prog.code_words;
  out.image.assign(prog.code_words + prog.data_words, 0);

  for (size_t i = 0; i < prog.statements.size(); ++i)
  {
    const Statement &st = prog.statements[i];
    const t91_addr at = addrs[i];
    switch (st.kind)
    {
      case StatementKind::Instruction:
      {
        int32_t addr = resolve(prog, addrs, st.addr);
        out.image[at] = static_cast<t91_word>(encode(st.op, st.rj, st.mode, st.ri, addr));
        out.spans.emplace_back(at, st.span);
        break;
      }
      case StatementKind::Dc:
        out.image[at] = resolve(prog, addrs, st.data);
        out.spans.emplace_back(at, st.span);
        break;
      case StatementKind::Ds:
        // Reserved words stay zero and carry no source attribution.
        break;
    }
  }

  for (const auto &kv : prog.symbols)
  {
    const SymbolDef &def = kv.second;
    int32_t value = def.is_constant ? def.constant : addrs[def.statement];
    // EQU constants keep their low 16 bits.
    out.symbols.emplace(kv.first, static_cast<t91_addr>(value & 0xFFFF));
  }
  return out;
}

}  // namespace t91
