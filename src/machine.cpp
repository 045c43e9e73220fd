#include "t91/internal/machine.hpp"

#include <cstdint>

#include "t91/errors.hpp"
#include "t91/events.hpp"
#include "t91/opcodes.hpp"

namespace t91
{

t91_err machine_init(Machine *m, const std::vector<t91_word> &image, uint32_t stack_words,
                     DeviceQueue *io)
{
  if (!m || image.empty())
    return T91_ERR(InvalidArg);
  if (image.size() + static_cast<size_t>(stack_words) > kMaxMemoryWords)
    return T91_ERR(InvalidArg);

  for (t91_word &reg : m->r)
    reg = 0;
  m->r[T91_REG_SP] = static_cast<t91_word>(image.size()) - 1;
  m->r[T91_REG_FP] = static_cast<t91_word>(image.size()) - 1;
  m->pc = 0;
  m->flags = 0;
  m->halted = false;
  m->mem = image;
  m->mem.resize(image.size() + stack_words, 0);
  m->io = io;
  m->sink = nullptr;
  m->sink_user = nullptr;
  return T91_ERR(OK);
}

/* ========================================================================= */
/* Staged instruction effects                                                */
/* ========================================================================= */

namespace
{

struct MemWrite
{
  t91_addr addr;
  t91_word data;
};

/*
 * Working copy of the state touched by one instruction. Nothing reaches the
 * Machine until commit().
 */
struct Staged
{
  explicit Staged(const Machine *machine) : m(machine), pc(machine->pc), flags(machine->flags)
  {
    for (int i = 0; i < T91_REG_COUNT; ++i)
      r[i] = machine->r[i];
    halted = machine->halted;
  }

  const Machine *m;
  t91_word r[T91_REG_COUNT];
  t91_addr pc;
  uint8_t flags;
  bool halted;
  std::vector<MemWrite> writes;
  std::vector<T91Event> events;
};

/* Two's complement wrap of an intermediate result. */
static inline t91_word wrap(int64_t v)
{
  return static_cast<t91_word>(static_cast<uint32_t>(static_cast<uint64_t>(v)));
}

static t91_err st_read(const Staged &s, int64_t addr, t91_word *out)
{
  if (t91_err e = mem_check(s.m, addr))
    return e;
  // Latest staged write wins.
  for (auto it = s.writes.rbegin(); it != s.writes.rend(); ++it)
  {
    if (it->addr == addr)
    {
      *out = it->data;
      return T91_ERR(OK);
    }
  }
  return mem_read_core(s.m, addr, out);
}

static t91_err st_write(Staged &s, int64_t addr, t91_word val)
{
  if (t91_err e = mem_check(s.m, addr))
    return e;
  s.writes.push_back(MemWrite{static_cast<t91_addr>(addr), val});
  s.events.push_back(make_memory_change(static_cast<t91_addr>(addr), val));
  return T91_ERR(OK);
}

static void st_set_reg(Staged &s, uint8_t reg, t91_word val)
{
  s.r[reg] = val;
  s.events.push_back(make_register_change(reg, val));
}

/*
 * Second operand: addr + Ri (Ri = 0 means no index), then one memory fetch
 * per mode level. Address forms use the result as an address.
 */
static t91_err st_operand(const Staged &s, uint32_t word, t91_word *out)
{
  const uint8_t mode = decode_mode(word);
  if (mode > MODE_INDIRECT)
    return T91_ERR(BadMode);

  const uint8_t ri = decode_ri(word);
  t91_word v = wrap(static_cast<int64_t>(decode_addr(word)) + (ri ? s.r[ri] : 0));
  for (uint8_t i = 0; i < mode; ++i)
  {
    if (t91_err e = st_read(s, v, &v))
      return e;
  }
  *out = v;
  return T91_ERR(OK);
}

static t91_err st_jump(Staged &s, t91_word target)
{
  if (t91_err e = mem_check(s.m, target))
    return e;
  s.pc = static_cast<t91_addr>(target);
  return T91_ERR(OK);
}

static t91_word shift_left(t91_word x, t91_word n)
{
  if (n < 0 || n >= 32)
    return 0;
  return static_cast<t91_word>(static_cast<uint32_t>(x) << n);
}

static t91_word shift_right(t91_word x, t91_word n)
{
  if (n < 0 || n >= 32)
    return 0;
  return static_cast<t91_word>(static_cast<uint32_t>(x) >> n);
}

static t91_word shift_right_arith(t91_word x, t91_word n)
{
  if (n < 0 || n >= 32)
    return x < 0 ? -1 : 0;
  return x >> n;
}

static void commit(Machine *m, const Staged &s)
{
  for (int i = 0; i < T91_REG_COUNT; ++i)
    m->r[i] = s.r[i];
  m->pc = s.pc;
  m->flags = s.flags;
  m->halted = s.halted;
  for (const MemWrite &w : s.writes)
    m->mem[w.addr] = w.data;

  if (!m->io)
    return;
  for (const T91Event &ev : s.events)
  {
    if (ev.kind == T91_EV_OUTPUT)
      m->io->output(ev.u.output.device, ev.u.output.data);
    else if (ev.kind == T91_EV_SUPERVISOR_CALL)
      m->io->supervisor_call(ev.u.supervisor_call.code);
  }
}

}  // namespace

/* ========================================================================= */
/* Interpreter                                                               */
/* ========================================================================= */

t91_err machine_step(Machine *m)
{
  if (!m)
    return T91_ERR(InvalidArg);
  if (m->halted)
    return T91_ERR(OK);

  t91_word raw;
  if (t91_err e = mem_read_core(m, m->pc, &raw))
    return e;
  const uint32_t word = static_cast<uint32_t>(raw);

  Staged s(m);
  if (static_cast<size_t>(m->pc) + 1 >= kMaxMemoryWords)
    return T91_ERR(OobMemory);
  s.pc = static_cast<t91_addr>(m->pc + 1);

  const uint8_t rj = decode_rj(word);
  const Op op = static_cast<Op>(decode_op(word));

  switch (op)
  {
    case Op::NOP:
      break;

    /* -------- Data transfer -------- */
    case Op::LOAD:
    {
      t91_word v;
      if (t91_err e = st_operand(s, word, &v))
        return e;
      st_set_reg(s, rj, v);
      break;
    }

    case Op::STORE:
    {
      t91_word target;
      if (t91_err e = st_operand(s, word, &target))
        return e;
      if (t91_err e = st_write(s, target, s.r[rj]))
        return e;
      break;
    }

    case Op::IN:
    {
      t91_word dev;
      if (t91_err e = st_operand(s, word, &dev))
        return e;
      t91_word v = 0;
      if (!m->io)
        return T91_ERR(QueueUnderflow);
      // Last fallible action of IN: nothing can fail after the queue pops.
      if (t91_err e = m->io->input(static_cast<t91_device>(dev), &v))
        return e;
      st_set_reg(s, rj, v);
      break;
    }

    case Op::OUT:
    {
      t91_word dev;
      if (t91_err e = st_operand(s, word, &dev))
        return e;
      s.events.push_back(make_output(static_cast<t91_device>(dev), s.r[rj]));
      break;
    }

    /* -------- Arithmetic and logic -------- */
    case Op::ADD:
    case Op::SUB:
    case Op::MUL:
    case Op::DIV:
    case Op::MOD:
    case Op::AND:
    case Op::OR:
    case Op::XOR:
    case Op::SHL:
    case Op::SHR:
    case Op::SHRA:
    {
      t91_word b;
      if (t91_err e = st_operand(s, word, &b))
        return e;
      const t91_word a = s.r[rj];
      t91_word res = 0;
      switch (op)
      {
        case Op::ADD:
          res = wrap(static_cast<int64_t>(a) + b);
          break;
        case Op::SUB:
          res = wrap(static_cast<int64_t>(a) - b);
          break;
        case Op::MUL:
          res = wrap(static_cast<int64_t>(a) * b);
          break;
        case Op::DIV:
          if (b == 0)
            return T91_ERR(DivByZero);
          res = (a == INT32_MIN && b == -1) ? INT32_MIN : a / b;
          break;
        case Op::MOD:
          if (b == 0)
            return T91_ERR(DivByZero);
          res = (a == INT32_MIN && b == -1) ? 0 : a % b;
          break;
        case Op::AND:
          res = a & b;
          break;
        case Op::OR:
          res = a | b;
          break;
        case Op::XOR:
          res = a ^ b;
          break;
        case Op::SHL:
          res = shift_left(a, b);
          break;
        case Op::SHR:
          res = shift_right(a, b);
          break;
        default:
          res = shift_right_arith(a, b);
          break;
      }
      st_set_reg(s, rj, res);
      break;
    }

    case Op::NOT:
      st_set_reg(s, rj, ~s.r[rj]);
      break;

    case Op::COMP:
    {
      t91_word b;
      if (t91_err e = st_operand(s, word, &b))
        return e;
      const t91_word a = s.r[rj];
      s.flags = a < b ? FLAG_LESS : (a == b ? FLAG_EQUAL : FLAG_GREATER);
      break;
    }

    /* -------- Control flow -------- */
    case Op::JUMP:
    case Op::JNEG:
    case Op::JZER:
    case Op::JPOS:
    case Op::JNNEG:
    case Op::JNZER:
    case Op::JNPOS:
    case Op::JLES:
    case Op::JEQU:
    case Op::JGRE:
    case Op::JNLES:
    case Op::JNEQU:
    case Op::JNGRE:
    {
      t91_word target;
      if (t91_err e = st_operand(s, word, &target))
        return e;
      const t91_word x = s.r[rj];
      bool taken = false;
      switch (op)
      {
        case Op::JUMP:
          taken = true;
          break;
        case Op::JNEG:
          taken = x < 0;
          break;
        case Op::JZER:
          taken = x == 0;
          break;
        case Op::JPOS:
          taken = x > 0;
          break;
        case Op::JNNEG:
          taken = x >= 0;
          break;
        case Op::JNZER:
          taken = x != 0;
          break;
        case Op::JNPOS:
          taken = x <= 0;
          break;
        case Op::JLES:
          taken = (s.flags & FLAG_LESS) != 0;
          break;
        case Op::JEQU:
          taken = (s.flags & FLAG_EQUAL) != 0;
          break;
        case Op::JGRE:
          taken = (s.flags & FLAG_GREATER) != 0;
          break;
        case Op::JNLES:
          taken = (s.flags & FLAG_LESS) == 0;
          break;
        case Op::JNEQU:
          taken = (s.flags & FLAG_EQUAL) == 0;
          break;
        default:
          taken = (s.flags & FLAG_GREATER) == 0;
          break;
      }
      if (taken)
      {
        if (t91_err e = st_jump(s, target))
          return e;
      }
      break;
    }

    /* -------- Subroutines and stack -------- */
    case Op::CALL:
    {
      // Frame: [return address][saved FP] <- Rj, FP
      t91_word target;
      if (t91_err e = st_operand(s, word, &target))
        return e;
      const int64_t sp = s.r[rj];
      if (t91_err e = st_write(s, sp + 1, s.pc))
        return e;
      if (t91_err e = st_write(s, sp + 2, s.r[T91_REG_FP]))
        return e;
      st_set_reg(s, rj, wrap(sp + 2));
      st_set_reg(s, T91_REG_FP, wrap(sp + 2));
      if (t91_err e = st_jump(s, target))
        return e;
      break;
    }

    case Op::EXIT:
    {
      // Unwind the CALL frame, then drop n parameters.
      t91_word n;
      if (t91_err e = st_operand(s, word, &n))
        return e;
      const int64_t sp = s.r[rj];
      t91_word saved_fp, ret;
      if (t91_err e = st_read(s, sp, &saved_fp))
        return e;
      if (t91_err e = st_read(s, sp - 1, &ret))
        return e;
      st_set_reg(s, T91_REG_FP, saved_fp);
      st_set_reg(s, rj, wrap(sp - 2 - n));
      if (t91_err e = st_jump(s, ret))
        return e;
      break;
    }

    case Op::PUSH:
    {
      t91_word v;
      if (t91_err e = st_operand(s, word, &v))
        return e;
      const int64_t sp = static_cast<int64_t>(s.r[rj]) + 1;
      if (t91_err e = st_write(s, sp, v))
        return e;
      st_set_reg(s, rj, wrap(sp));
      break;
    }

    case Op::POP:
    {
      const uint8_t ri = decode_ri(word);
      const int64_t sp = s.r[rj];
      t91_word v;
      if (t91_err e = st_read(s, sp, &v))
        return e;
      st_set_reg(s, ri, v);
      st_set_reg(s, rj, wrap(sp - 1));
      break;
    }

    case Op::PUSHR:
    {
      // R0..R5 in ascending order
      int64_t sp = s.r[rj];
      for (uint8_t i = 0; i < T91_REG_SP; ++i)
      {
        if (t91_err e = st_write(s, ++sp, s.r[i]))
          return e;
      }
      st_set_reg(s, rj, wrap(sp));
      break;
    }

    case Op::POPR:
    {
      int64_t sp = s.r[rj];
      t91_word vals[T91_REG_SP];
      for (int i = T91_REG_SP - 1; i >= 0; --i)
      {
        if (t91_err e = st_read(s, sp--, &vals[i]))
          return e;
      }
      for (int i = T91_REG_SP - 1; i >= 0; --i)
        st_set_reg(s, static_cast<uint8_t>(i), vals[i]);
      st_set_reg(s, rj, wrap(sp));
      break;
    }

    /* -------- System -------- */
    case Op::SVC:
    {
      t91_word code;
      if (t91_err e = st_operand(s, word, &code))
        return e;
      s.events.push_back(make_supervisor_call(static_cast<t91_code>(code)));
      if (code == T91_SVC_HALT)
        s.halted = true;
      break;
    }

    default:
      return T91_ERR(UnknownOp);
  }

  commit(m, s);

  if (m->sink)
  {
    for (const T91Event &ev : s.events)
    {
      if (t91_err e = m->sink(m->sink_user, ev))
        return e;
    }
  }
  return T91_ERR(OK);
}

t91_err machine_run(Machine *m, uint32_t max_steps)
{
  if (!m)
    return T91_ERR(InvalidArg);
  for (uint32_t n = 0; n < max_steps && !m->halted; ++n)
  {
    if (t91_err e = machine_step(m))
      return e;
  }
  return m->halted ? T91_ERR(OK) : T91_ERR(StepLimit);
}

}  // namespace t91
