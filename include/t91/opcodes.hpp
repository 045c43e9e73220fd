#pragma once
#include <cstdint>

namespace t91
{

/** TTK-91 opcode set (top byte of an instruction word). */
enum class Op : std::uint8_t
{
#define OP(name, val, _) name = val,
#include <t91/opcodes.def>
#undef OP
};

// -----------------------------------------------------------------------------
// Operand form classification for the assembler's table-driven parsing
// -----------------------------------------------------------------------------
enum class OperandForm : uint8_t
{
  None,     // NOP
  Reg,      // NOT R1
  RegOper,  // LOAD R1, =42
  RegAddr,  // STORE R1, X
  Addr,     // JUMP L
  RegReg,   // POP SP, R1
};

// -----------------------------------------------------------------------------
// Instruction entry definition
// -----------------------------------------------------------------------------
struct InstructionEntry
{
  const char *name;
  uint8_t opcode;
  OperandForm form;
};

// -----------------------------------------------------------------------------
// Helper macro to convert operand form token to OperandForm enum
// -----------------------------------------------------------------------------
#define OPERAND_FORM_NONE OperandForm::None
#define OPERAND_FORM_REG OperandForm::Reg
#define OPERAND_FORM_REG_OPER OperandForm::RegOper
#define OPERAND_FORM_REG_ADDR OperandForm::RegAddr
#define OPERAND_FORM_ADDR OperandForm::Addr
#define OPERAND_FORM_REG_REG OperandForm::RegReg

// -----------------------------------------------------------------------------
// Instruction table (generated from opcodes.def)
// -----------------------------------------------------------------------------
static constexpr InstructionEntry kInstructionTable[] = {
#define OP(name, val, form) {#name, val, OPERAND_FORM_##form},
#include <t91/opcodes.def>
#undef OP
};

// -----------------------------------------------------------------------------
// Addressing modes (2-bit field of an instruction word)
// -----------------------------------------------------------------------------
enum : uint8_t
{
  MODE_IMMEDIATE = 0,
  MODE_DIRECT = 1,
  MODE_INDIRECT = 2,
};

// -----------------------------------------------------------------------------
// Instruction word layout: op(8) | rj(3) | mode(2) | ri(3) | addr(16)
// -----------------------------------------------------------------------------
constexpr uint32_t encode(uint8_t op, uint8_t rj, uint8_t mode, uint8_t ri, int32_t addr)
{
  return (static_cast<uint32_t>(op) << 24) | (static_cast<uint32_t>(rj & 7u) << 21) |
         (static_cast<uint32_t>(mode & 3u) << 19) | (static_cast<uint32_t>(ri & 7u) << 16) |
         (static_cast<uint32_t>(addr) & 0xFFFFu);
}

constexpr uint8_t decode_op(uint32_t w)
{
  return static_cast<uint8_t>(w >> 24);
}
constexpr uint8_t decode_rj(uint32_t w)
{
  return static_cast<uint8_t>((w >> 21) & 7u);
}
constexpr uint8_t decode_mode(uint32_t w)
{
  return static_cast<uint8_t>((w >> 19) & 3u);
}
constexpr uint8_t decode_ri(uint32_t w)
{
  return static_cast<uint8_t>((w >> 16) & 7u);
}
/* Address field is a signed 16-bit quantity. */
constexpr int32_t decode_addr(uint32_t w)
{
  return static_cast<int16_t>(w & 0xFFFFu);
}

}  // namespace t91
