// src/memory.cpp: range-checked access to machine memory
#include "t91/errors.hpp"
#include "t91/internal/machine.hpp"

namespace t91
{

t91_err mem_check(const Machine *m, int64_t addr)
{
  return (addr >= 0 && static_cast<uint64_t>(addr) < m->mem.size()) ? T91_ERR(OK)
                                                                     : T91_ERR(OobMemory);
}

t91_err mem_read_core(const Machine *m, int64_t addr, t91_word *out)
{
  if (t91_err e = mem_check(m, addr))
    return e;
  *out = m->mem[static_cast<size_t>(addr)];
  return T91_ERR(OK);
}

/* Host side: out-of-range is a recoverable access error, not a fault. */
t91_err machine_get_data(const Machine *m, int64_t addr, t91_word *out)
{
  if (!m || !out)
    return T91_ERR(InvalidArg);
  if (mem_check(m, addr))
    return T91_ERR(MemoryAccess);
  *out = m->mem[static_cast<size_t>(addr)];
  return T91_ERR(OK);
}

}  // namespace t91
