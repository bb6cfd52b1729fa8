// The cpu breaks every instruction into a sequence of micro-ops.  Each one
// is either a bus cycle (4 clocks plus any wait states), an internal delay
// of some number of clocks, or an instant action that takes no time.
//
// Decode never touches the bus itself; it only queues micro-ops that will.
// Write and push ops carry the address and data they put on the bus, so a
// queued write never depends on scratch state that might change before it
// runs.  Read and pop ops deliver their data to the cpu's read latch.

#ifndef _INCLUDE_MICROOP_H_
#define _INCLUDE_MICROOP_H_

#include "m68kemu.h"

enum class uop_t : uint8 {
    FETCH_IRC,          // refill IRC from PC, PC += 2
    READ_BYTE,
    READ_WORD,
    READ_LONG_HI,       // latch[31:16]
    READ_LONG_LO,       // latch[15:0]
    WRITE_BYTE,
    WRITE_WORD,
    WRITE_LONG_HI,
    WRITE_LONG_LO,
    PUSH_WORD,          // SP -= 2, write at SP
    PUSH_LONG_HI,       // SP -= 4, write high word at SP
    PUSH_LONG_LO,       // write low word at SP+2
    POP_WORD,           // read at SP, SP += 2
    POP_LONG_HI,        // read high word at SP
    POP_LONG_LO,        // read low word at SP+2, SP += 4
    IACK,               // interrupt acknowledge cycle
    INTERNAL,           // internal delay of 'cycles' clocks
    EXECUTE,            // run the next step of the instruction (instant)
    ASSERT_RESET        // pulse the reset line (instant)
};

// flag bits in MicroOp::flags
enum : uint8 {
    UOP_PROGRAM = 0x01  // access program space rather than data space
};

struct MicroOp {
    uop_t  op;
    uint8  cycles;      // INTERNAL only
    uint8  flags;       // UOP_* bits
    uint32 addr;        // bus address, for reads and writes
    uint32 data;        // write data; IACK level
};

// ---- constructors ----

inline MicroOp
uop(uop_t op, uint32 data = 0) noexcept
{
    return { op, 0, 0, 0, data };
}

inline MicroOp
uopInternal(int cycles) noexcept
{
    assert(cycles >= 0 && cycles < 256);
    return { uop_t::INTERNAL, static_cast<uint8>(cycles), 0, 0, 0 };
}

inline MicroOp
uopRead(uop_t op, uint32 addr, bool program = false) noexcept
{
    return { op, 0, static_cast<uint8>((program) ? UOP_PROGRAM : 0), addr, 0 };
}

inline MicroOp
uopWrite(uop_t op, uint32 addr, uint32 data) noexcept
{
    return { op, 0, 0, addr, data };
}

// ---- properties ----

// instant ops run without consuming a clock
inline bool
uopIsInstant(const MicroOp &u) noexcept
{
    return (u.op == uop_t::EXECUTE)
        || (u.op == uop_t::ASSERT_RESET)
        || (u.op == uop_t::INTERNAL && u.cycles == 0);
}

// bus ops are the ones subject to address checks and bus arbitration
inline bool
uopIsBusCycle(const MicroOp &u) noexcept
{
    return (u.op != uop_t::INTERNAL)
        && (u.op != uop_t::EXECUTE)
        && (u.op != uop_t::ASSERT_RESET);
}

// number of clocks a timed op takes, not counting wait states
inline int
uopCycles(const MicroOp &u) noexcept
{
    if (u.op == uop_t::INTERNAL) {
        return u.cycles;
    }
    return (uopIsBusCycle(u)) ? 4 : 0;
}

// mnemonic, for the debug log
const char* uopName(uop_t op) noexcept;

// ======================================================================
// fixed capacity double-ended queue of micro-ops.  it never allocates.

class MicroOpQueue
{
public:
    static const int CAPACITY = 32;

    MicroOpQueue() = default;

    // these return false if the queue is full
    bool push(const MicroOp &u) noexcept;
    bool pushFront(const MicroOp &u) noexcept;

    // returns false if the queue is empty
    bool pop() noexcept;

    const MicroOp& front() const noexcept;
    const MicroOp& at(int n) const noexcept;  // n=0 is the front

    void clear() noexcept { m_head = 0; m_count = 0; }
    bool empty() const noexcept { return (m_count == 0); }
    int  size() const noexcept { return m_count; }

private:
    std::array<MicroOp, CAPACITY> m_ops;
    int m_head  = 0;    // index of the front op
    int m_count = 0;    // number of queued ops
};

#endif // _INCLUDE_MICROOP_H_

// vim: ts=8:et:sw=4:smarttab
