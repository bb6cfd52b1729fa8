// 68000 ALU operations and the data-dependent instruction timings.

#include "Alu68k.h"
#include "Registers68k.h"       // for the SR_* flag bits

// assemble a ccr from the individual flags
static inline uint8
flags(bool x, bool n, bool z, bool v, bool c) noexcept
{
    return static_cast<uint8>( ((x) ? SR_X : 0)
                             | ((n) ? SR_N : 0)
                             | ((z) ? SR_Z : 0)
                             | ((v) ? SR_V : 0)
                             | ((c) ? SR_C : 0) );
}

static inline bool
xBit(uint8 ccr) noexcept
{
    return (ccr & SR_X) != 0;
}

// ============================================================================
// binary arithmetic
// ============================================================================

alu::result_t
alu::add(uint32 src, uint32 dst, int size, uint8 ccr) noexcept
{
    (void)ccr;
    const uint32 m   = sizeMask(size);
    const uint32 msb = sizeMsb(size);
    const uint64 sum = static_cast<uint64>(src & m) + (dst & m);
    const uint32 res = static_cast<uint32>(sum) & m;
    const bool   c   = (sum > m);
    const bool   v   = ((src ^ res) & (dst ^ res) & msb) != 0;
    return { res, flags(c, (res & msb) != 0, res == 0, v, c) };
}


alu::result_t
alu::addx(uint32 src, uint32 dst, int size, uint8 ccr) noexcept
{
    const uint32 m   = sizeMask(size);
    const uint32 msb = sizeMsb(size);
    const uint64 sum = static_cast<uint64>(src & m) + (dst & m) + (xBit(ccr) ? 1 : 0);
    const uint32 res = static_cast<uint32>(sum) & m;
    const bool   c   = (sum > m);
    const bool   v   = ((src ^ res) & (dst ^ res) & msb) != 0;
    const bool   z   = (res == 0) && ((ccr & SR_Z) != 0);
    return { res, flags(c, (res & msb) != 0, z, v, c) };
}


alu::result_t
alu::sub(uint32 src, uint32 dst, int size, uint8 ccr) noexcept
{
    (void)ccr;
    const uint32 m   = sizeMask(size);
    const uint32 msb = sizeMsb(size);
    const uint32 res = (dst - src) & m;
    const bool   c   = (src & m) > (dst & m);
    const bool   v   = ((src ^ dst) & (res ^ dst) & msb) != 0;
    return { res, flags(c, (res & msb) != 0, res == 0, v, c) };
}


alu::result_t
alu::subx(uint32 src, uint32 dst, int size, uint8 ccr) noexcept
{
    const uint32 m   = sizeMask(size);
    const uint32 msb = sizeMsb(size);
    const uint32 x   = (xBit(ccr)) ? 1 : 0;
    const uint32 res = (dst - src - x) & m;
    const bool   c   = (static_cast<uint64>(src & m) + x) > (dst & m);
    const bool   v   = ((src ^ dst) & (res ^ dst) & msb) != 0;
    const bool   z   = (res == 0) && ((ccr & SR_Z) != 0);
    return { res, flags(c, (res & msb) != 0, z, v, c) };
}


alu::result_t
alu::cmp(uint32 src, uint32 dst, int size, uint8 ccr) noexcept
{
    result_t r = sub(src, dst, size, ccr);
    r.ccr = static_cast<uint8>((r.ccr & ~SR_X) | (ccr & SR_X));
    return r;
}


alu::result_t
alu::neg(uint32 dst, int size, uint8 ccr) noexcept
{
    return sub(dst, 0, size, ccr);
}


alu::result_t
alu::negx(uint32 dst, int size, uint8 ccr) noexcept
{
    return subx(dst, 0, size, ccr);
}


alu::result_t
alu::logic(uint32 value, int size, uint8 ccr) noexcept
{
    const uint32 res = truncate(value, size);
    return { res, flags(xBit(ccr), (res & sizeMsb(size)) != 0, res == 0,
                        false, false) };
}

// ============================================================================
// shifts and rotates
// ============================================================================

// count 0 never changes the value or X.  the carry is cleared, except
// for ROXL/ROXR, where it reflects X.
alu::result_t
alu::shift(shift_t kind, bool left, uint32 value, int count,
           int size, uint8 ccr) noexcept
{
    assert(count >= 0 && count < 64);

    const int    bits = 8*size;
    const uint32 m    = sizeMask(size);
    const uint32 msb  = sizeMsb(size);
    value &= m;

    uint32 res = value;
    bool   c   = false;
    bool   v   = false;
    bool   x   = xBit(ccr);

    switch (kind) {

    case SHIFT_AS:
    case SHIFT_LS:
        if (count == 0) {
            break;
        }
        if (left) {
            if (count >= bits) {
                res = 0;
                c   = (count == bits) && ((value & 1) != 0);
            } else {
                res = (value << count) & m;
                c   = ((value >> (bits - count)) & 1) != 0;
            }
            if (kind == SHIFT_AS) {
                if (count >= bits) {
                    // every bit passes through the msb
                    v = (value != 0);
                } else {
                    // the top count+1 bits must all match for V to be clear
                    const uint32 top  = value >> (bits - count - 1);
                    const uint32 ones = static_cast<uint32>((1ULL << (count + 1)) - 1);
                    v = (top != 0) && (top != ones);
                }
            }
        } else if (kind == SHIFT_AS) {
            const bool sign = (value & msb) != 0;
            if (count >= bits) {
                res = (sign) ? m : 0;
                c   = sign;
            } else {
                res = static_cast<uint32>(signExtend(value, size) >> count) & m;
                c   = ((value >> (count - 1)) & 1) != 0;
            }
        } else {
            if (count >= bits) {
                res = 0;
                c   = (count == bits) && ((value & msb) != 0);
            } else {
                res = value >> count;
                c   = ((value >> (count - 1)) & 1) != 0;
            }
        }
        x = c;
        break;

    case SHIFT_ROX:
        {
            // X is bit 'bits' of a (bits+1)-wide rotation
            const int eff = count % (bits + 1);
            for (int i=0; i < eff; i++) {
                bool out;
                if (left) {
                    out = (res & msb) != 0;
                    res = ((res << 1) | ((x) ? 1 : 0)) & m;
                } else {
                    out = (res & 1) != 0;
                    res = (res >> 1) | ((x) ? msb : 0);
                }
                x = out;
            }
            c = x;
        }
        break;

    case SHIFT_RO:
        if (count == 0) {
            break;
        }
        {
            const int eff = count % bits;
            if (eff != 0) {
                res = (left) ? (((value << eff) | (value >> (bits - eff))) & m)
                             : (((value >> eff) | (value << (bits - eff))) & m);
            }
            // the last bit rotated around lands in C
            c = (left) ? ((res & 1) != 0) : ((res & msb) != 0);
        }
        break;

    default:
        assert(false);
        break;
    }

    return { res, flags(x, (res & msb) != 0, res == 0, v, c) };
}

// ============================================================================
// binary coded decimal
// ============================================================================

alu::result_t
alu::abcd(uint8 src, uint8 dst, uint8 ccr) noexcept
{
    const int x = (xBit(ccr)) ? 1 : 0;

    // low digit: binary add, then decimal correction
    const int low_sum = (dst & 0x0F) + (src & 0x0F) + x;
    const int corf    = (low_sum > 9) ? 6 : 0;

    const int uncorrected = dst + src + x;

    const int low_carry = (low_sum + corf) >> 4;
    const int high_sum  = (dst >> 4) + (src >> 4) + low_carry;
    const bool carry    = (high_sum > 9);

    const int  result = uncorrected + corf + ((carry) ? 0x60 : 0);
    const bool v      = (~uncorrected & result & 0x80) != 0;
    const uint32 res  = static_cast<uint32>(result) & 0xFF;

    const bool z = (res == 0) && ((ccr & SR_Z) != 0);
    return { res, flags(carry, (res & 0x80) != 0, z, v, carry) };
}


alu::result_t
alu::sbcd(uint8 src, uint8 dst, uint8 ccr) noexcept
{
    const int x = (xBit(ccr)) ? 1 : 0;

    const uint8 uncorrected = static_cast<uint8>(dst - src - x);
    uint8 result = uncorrected;

    const bool low_borrow = (dst & 0x0F) < ((src & 0x0F) + x);
    if (low_borrow) {
        result = static_cast<uint8>(result - 6);
    }

    const bool high_borrow = (dst >> 4) < ((src >> 4) + ((low_borrow) ? 1 : 0));
    if (high_borrow) {
        result = static_cast<uint8>(result - 0x60);
    }

    // the low digit correction can also wrap the whole byte
    const bool borrow = high_borrow || (low_borrow && (uncorrected < 6));
    const bool v      = (uncorrected & ~result & 0x80) != 0;

    const bool z = (result == 0) && ((ccr & SR_Z) != 0);
    return { result, flags(borrow, (result & 0x80) != 0, z, v, borrow) };
}


alu::result_t
alu::nbcd(uint8 src, uint8 ccr) noexcept
{
    return sbcd(src, 0, ccr);
}

// ============================================================================
// multiply and divide
// ============================================================================

alu::result_t
alu::mulu(uint16 src, uint16 dst, uint8 ccr) noexcept
{
    const uint32 res = static_cast<uint32>(src) * dst;
    return logic(res, 4, ccr);
}


alu::result_t
alu::muls(uint16 src, uint16 dst, uint8 ccr) noexcept
{
    const int32 res = static_cast<int32>(static_cast<int16>(src))
                    * static_cast<int32>(static_cast<int16>(dst));
    return logic(static_cast<uint32>(res), 4, ccr);
}


// on overflow the 68000 leaves the register alone and sets N and V
static alu::result_t
divOverflow(uint32 dividend, uint8 ccr) noexcept
{
    return { dividend, static_cast<uint8>((ccr & SR_X) | SR_N | SR_V) };
}


alu::result_t
alu::divu(uint32 dividend, uint16 divisor, uint8 ccr) noexcept
{
    assert(divisor != 0);
    const uint32 quotient  = dividend / divisor;
    const uint32 remainder = dividend % divisor;
    if (quotient > 0xFFFF) {
        return divOverflow(dividend, ccr);
    }
    const uint32 res = (remainder << 16) | quotient;
    return { res, flags(xBit(ccr), (quotient & 0x8000) != 0, quotient == 0,
                        false, false) };
}


alu::result_t
alu::divs(uint32 dividend, uint16 divisor, uint8 ccr) noexcept
{
    assert(divisor != 0);
    const int64 num = static_cast<int32>(dividend);
    const int64 den = static_cast<int16>(divisor);
    const int64 quotient  = num / den;     // truncates toward zero
    const int64 remainder = num % den;     // takes the sign of the dividend
    if (quotient > 32767 || quotient < -32768) {
        return divOverflow(dividend, ccr);
    }
    const uint32 q16 = static_cast<uint32>(quotient)  & 0xFFFF;
    const uint32 r16 = static_cast<uint32>(remainder) & 0xFFFF;
    return { (r16 << 16) | q16,
             flags(xBit(ccr), (q16 & 0x8000) != 0, q16 == 0, false, false) };
}


static int
popcount16(uint32 v) noexcept
{
    int n = 0;
    for (v &= 0xFFFF; v != 0; v &= (v - 1)) {
        n++;
    }
    return n;
}


// 38 + 2n, where n is the number of ones in the source
int
alu::muluCycles(uint16 src) noexcept
{
    return 38 + 2*popcount16(src);
}


// 38 + 2n, where n counts the 01 and 10 patterns in the source with
// a zero appended below bit 0
int
alu::mulsCycles(uint16 src) noexcept
{
    const uint32 v = src;
    return 38 + 2*popcount16(v ^ (v << 1));
}


// exact DIVU timing, after Jorge Cwik's analysis of the divide microcode
int
alu::divuCycles(uint32 dividend, uint16 divisor) noexcept
{
    if ((dividend >> 16) >= divisor) {
        return 10;  // overflow is detected up front
    }

    int mcycles = 38;
    const uint32 hdivisor = static_cast<uint32>(divisor) << 16;

    for (int i=0; i < 15; i++) {
        const uint32 temp = dividend;
        dividend <<= 1;
        if ((temp & 0x80000000) != 0) {
            dividend -= hdivisor;
        } else {
            mcycles += 2;
            if (dividend >= hdivisor) {
                dividend -= hdivisor;
                mcycles--;
            }
        }
    }

    return mcycles*2;
}


// exact DIVS timing, after Jorge Cwik's analysis of the divide microcode
int
alu::divsCycles(int32 dividend, int16 divisor) noexcept
{
    int mcycles = 6;
    if (dividend < 0) {
        mcycles++;
    }

    const uint32 abs_dividend = (dividend < 0) ? (0u - static_cast<uint32>(dividend))
                                               : static_cast<uint32>(dividend);
    const uint32 abs_divisor  = (divisor < 0) ? static_cast<uint32>(-static_cast<int32>(divisor))
                                              : static_cast<uint32>(divisor);

    if ((abs_dividend >> 16) >= abs_divisor) {
        return (mcycles + 2)*2;
    }

    uint32 aquot = abs_dividend / abs_divisor;

    mcycles += 55;

    if (divisor >= 0) {
        if (dividend >= 0) {
            mcycles--;
        } else {
            mcycles++;
        }
    }

    // each zero in the top 15 bits of the quotient costs a cycle
    for (int i=0; i < 15; i++) {
        if (static_cast<int16>(aquot & 0xFFFF) >= 0) {
            mcycles++;
        }
        aquot <<= 1;
    }

    return mcycles*2;
}

// ============================================================================
// conditions
// ============================================================================

bool
alu::testCond(int cond, uint8 ccr) noexcept
{
    const bool c = (ccr & SR_C) != 0;
    const bool v = (ccr & SR_V) != 0;
    const bool z = (ccr & SR_Z) != 0;
    const bool n = (ccr & SR_N) != 0;

    switch (cond & 0xF) {
        case  0: return true;                   // T
        case  1: return false;                  // F
        case  2: return !c && !z;               // HI
        case  3: return c || z;                 // LS
        case  4: return !c;                     // CC
        case  5: return c;                      // CS
        case  6: return !z;                     // NE
        case  7: return z;                      // EQ
        case  8: return !v;                     // VC
        case  9: return v;                      // VS
        case 10: return !n;                     // PL
        case 11: return n;                      // MI
        case 12: return n == v;                 // GE
        case 13: return n != v;                 // LT
        case 14: return !z && (n == v);         // GT
        case 15: return z || (n != v);          // LE
        default: break;
    }
    return false;
}

// vim: ts=8:et:sw=4:smarttab
