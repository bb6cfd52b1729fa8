// Pure functions for the 68000 arithmetic and logic unit.
//
// Every operation takes the current condition code byte and returns the
// result along with the new condition codes, so the cpu just has to copy
// the ccr back.  Flags an operation doesn't touch are passed through.
// Operand sizes are in bytes: 1, 2 or 4.

#ifndef _INCLUDE_ALU68K_H_
#define _INCLUDE_ALU68K_H_

#include "m68kemu.h"

namespace alu
{
    struct result_t {
        uint32 value;   // result, truncated to the operand size
        uint8  ccr;     // new XNZVC
    };

    // ---- size helpers ----
    inline uint32 sizeMask(int size) noexcept
        { return (size == 1) ? 0xFFu : (size == 2) ? 0xFFFFu : 0xFFFFFFFFu; }
    inline uint32 sizeMsb(int size) noexcept
        { return (size == 1) ? 0x80u : (size == 2) ? 0x8000u : 0x80000000u; }
    inline uint32 truncate(uint32 v, int size) noexcept
        { return v & sizeMask(size); }
    inline int32  signExtend(uint32 v, int size) noexcept
    {
        return (size == 1) ? static_cast<int32>(static_cast<int8>(v & 0xFF))
             : (size == 2) ? static_cast<int32>(static_cast<int16>(v & 0xFFFF))
                           : static_cast<int32>(v);
    }

    // ---- binary arithmetic ----

    // dst + src; all five flags
    result_t add(uint32 src, uint32 dst, int size, uint8 ccr) noexcept;

    // dst + src + X; Z is only ever cleared
    result_t addx(uint32 src, uint32 dst, int size, uint8 ccr) noexcept;

    // dst - src; all five flags
    result_t sub(uint32 src, uint32 dst, int size, uint8 ccr) noexcept;

    // dst - src - X; Z is only ever cleared
    result_t subx(uint32 src, uint32 dst, int size, uint8 ccr) noexcept;

    // dst - src; NZVC, X untouched
    result_t cmp(uint32 src, uint32 dst, int size, uint8 ccr) noexcept;

    // 0 - dst, 0 - dst - X
    result_t neg(uint32 dst, int size, uint8 ccr) noexcept;
    result_t negx(uint32 dst, int size, uint8 ccr) noexcept;

    // N and Z from the value, V and C cleared, X untouched.  this covers
    // AND, OR, EOR, NOT, MOVE, CLR, TST, SWAP, EXT
    result_t logic(uint32 value, int size, uint8 ccr) noexcept;

    // ---- shifts and rotates ----

    // the kinds, encoded as in the opcode
    enum shift_t { SHIFT_AS=0, SHIFT_LS=1, SHIFT_ROX=2, SHIFT_RO=3 };

    // count is 0..63
    result_t shift(shift_t kind, bool left, uint32 value, int count,
                   int size, uint8 ccr) noexcept;

    // ---- decimal ----

    // dst + src + X
    result_t abcd(uint8 src, uint8 dst, uint8 ccr) noexcept;

    // dst - src - X
    result_t sbcd(uint8 src, uint8 dst, uint8 ccr) noexcept;

    // 0 - src - X
    result_t nbcd(uint8 src, uint8 ccr) noexcept;

    // ---- multiply and divide ----

    result_t mulu(uint16 src, uint16 dst, uint8 ccr) noexcept;
    result_t muls(uint16 src, uint16 dst, uint8 ccr) noexcept;

    // divisor must be non-zero.  on overflow the value is the unchanged
    // dividend and V and N are set.
    result_t divu(uint32 dividend, uint16 divisor, uint8 ccr) noexcept;
    result_t divs(uint32 dividend, uint16 divisor, uint8 ccr) noexcept;

    // clocks taken by the whole instruction with a register operand
    int muluCycles(uint16 src) noexcept;
    int mulsCycles(uint16 src) noexcept;
    int divuCycles(uint32 dividend, uint16 divisor) noexcept;
    int divsCycles(int32 dividend, int16 divisor) noexcept;

    // ---- conditions ----

    // evaluate one of the 16 condition codes
    bool testCond(int cond, uint8 ccr) noexcept;

} // namespace alu

#endif // _INCLUDE_ALU68K_H_

// vim: ts=8:et:sw=4:smarttab
