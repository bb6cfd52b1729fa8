#include "MicroOp.h"

const char*
uopName(uop_t op) noexcept
{
    switch (op) {
        case uop_t::FETCH_IRC:     return "FetchIRC";
        case uop_t::READ_BYTE:     return "ReadByte";
        case uop_t::READ_WORD:     return "ReadWord";
        case uop_t::READ_LONG_HI:  return "ReadLongHi";
        case uop_t::READ_LONG_LO:  return "ReadLongLo";
        case uop_t::WRITE_BYTE:    return "WriteByte";
        case uop_t::WRITE_WORD:    return "WriteWord";
        case uop_t::WRITE_LONG_HI: return "WriteLongHi";
        case uop_t::WRITE_LONG_LO: return "WriteLongLo";
        case uop_t::PUSH_WORD:     return "PushWord";
        case uop_t::PUSH_LONG_HI:  return "PushLongHi";
        case uop_t::PUSH_LONG_LO:  return "PushLongLo";
        case uop_t::POP_WORD:      return "PopWord";
        case uop_t::POP_LONG_HI:   return "PopLongHi";
        case uop_t::POP_LONG_LO:   return "PopLongLo";
        case uop_t::IACK:          return "IntAck";
        case uop_t::INTERNAL:      return "Internal";
        case uop_t::EXECUTE:       return "Execute";
        case uop_t::ASSERT_RESET:  return "AssertReset";
    }
    return "???";
}


bool
MicroOpQueue::push(const MicroOp &u) noexcept
{
    if (m_count >= CAPACITY) {
        return false;
    }
    m_ops[(m_head + m_count) % CAPACITY] = u;
    m_count++;
    return true;
}


bool
MicroOpQueue::pushFront(const MicroOp &u) noexcept
{
    if (m_count >= CAPACITY) {
        return false;
    }
    m_head = (m_head + CAPACITY - 1) % CAPACITY;
    m_ops[m_head] = u;
    m_count++;
    return true;
}


bool
MicroOpQueue::pop() noexcept
{
    if (m_count == 0) {
        return false;
    }
    m_head = (m_head + 1) % CAPACITY;
    m_count--;
    return true;
}


const MicroOp&
MicroOpQueue::front() const noexcept
{
    assert(m_count > 0);
    return m_ops[m_head];
}


const MicroOp&
MicroOpQueue::at(int n) const noexcept
{
    assert(n >= 0 && n < m_count);
    return m_ops[(m_head + n) % CAPACITY];
}

// vim: ts=8:et:sw=4:smarttab
