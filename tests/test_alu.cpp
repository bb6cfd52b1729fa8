// ALU checks.  The shifter is compared against a model that moves one
// bit at a time, for every kind, direction and size, and for counts up
// to twice the operand width.

#include "Alu68k.h"
#include "Registers68k.h"
#include "test_util.h"

#include <vector>

// one bit at a time, the way the data sheet describes the operations
static alu::result_t
slowShift(alu::shift_t kind, bool left, uint32 value, int count, int size, uint8 ccr)
{
    const uint32 m   = alu::sizeMask(size);
    const uint32 msb = alu::sizeMsb(size);
    uint32 v = value & m;
    bool x = (ccr & SR_X) != 0;
    bool c = false;
    bool v_flag = false;

    for (int i=0; i < count; i++) {
        const bool out = (left) ? ((v & msb) != 0) : ((v & 1) != 0);
        const uint32 before = v;
        if (left) {
            v = (v << 1) & m;
        } else {
            v >>= 1;
        }
        switch (kind) {
        case alu::SHIFT_AS:
            if (left) {
                if (((before ^ v) & msb) != 0) {
                    v_flag = true;
                }
            } else if ((before & msb) != 0) {
                v |= msb;
            }
            x = out;
            break;
        case alu::SHIFT_LS:
            x = out;
            break;
        case alu::SHIFT_ROX:
            if (x) {
                v |= (left) ? 1 : msb;
            }
            x = out;
            break;
        case alu::SHIFT_RO:
            if (out) {
                v |= (left) ? 1 : msb;
            }
            break;
        }
        c = out;
    }

    if (kind == alu::SHIFT_ROX) {
        c = x;
    }

    uint8 rv = 0;
    if (x)              { rv |= SR_X; }
    if (v & msb)        { rv |= SR_N; }
    if (v == 0)         { rv |= SR_Z; }
    if (v_flag)         { rv |= SR_V; }
    if (c)              { rv |= SR_C; }
    return { v, rv };
}


static void
testShiftModel(TestCtx &t)
{
    std::vector<uint32> values = {
        0x00000000, 0x00000001, 0x80000000, 0xFFFFFFFF, 0xAAAAAAAA,
        0x55555555, 0x12345678, 0x7FFFFFFF, 0x000000FF, 0x00008001,
        0xC0000000, 0x3FFF4000
    };
    // every single bit, so each one reaches the carry and the sign
    for (int i=0; i < 32; i++) {
        values.push_back(1u << i);
    }
    static const int sizes[] = { 1, 2, 4 };

    int mismatches = 0;
    for (int k=0; k < 4; k++) {
        const auto kind = static_cast<alu::shift_t>(k);
        for (int dir=0; dir < 2; dir++) {
            for (int size : sizes) {
                for (int count=0; count <= 2*8*size && count < 64; count++) {
                    for (uint32 value : values) {
                        for (uint8 xin=0; xin < 2; xin++) {
                            const uint8 ccr = static_cast<uint8>((xin) ? (SR_X | SR_V | SR_C) : SR_Z);
                            const alu::result_t got  = alu::shift(kind, dir != 0, value, count, size, ccr);
                            const alu::result_t want = slowShift(kind, dir != 0, value, count, size, ccr);
                            if ((got.value != want.value) || (got.ccr != want.ccr)) {
                                if (mismatches++ < 10) {
                                    std::printf("    kind %d %s size %d count %d value %08X x %d: "
                                                "got %08X/%02X want %08X/%02X\n",
                                                k, (dir) ? "left" : "right", size, count,
                                                value, xin, got.value, got.ccr,
                                                want.value, want.ccr);
                                }
                            }
                        }
                    }
                }
            }
        }
    }
    t.eq(mismatches, 0, "shifter disagrees with the bit serial model");
}


static void
testShiftCases(TestCtx &t)
{
    // ROL.b #1 of 0xAA: the top bit comes around into bit 0 and C
    alu::result_t r = alu::shift(alu::SHIFT_RO, true, 0xAA, 1, 1, 0);
    t.eq(r.value, 0x55, "ROL.b 0xAA by 1");
    t.ok((r.ccr & SR_C) != 0, "ROL.b 0xAA by 1 sets C");
    t.ok((r.ccr & SR_X) == 0, "ROL leaves X alone");

    // ROXL.b #1 of 0xAA with X clear: X goes in at the bottom
    r = alu::shift(alu::SHIFT_ROX, true, 0xAA, 1, 1, 0);
    t.eq(r.value, 0x54, "ROXL.b 0xAA by 1");
    t.eq(r.ccr & (SR_X | SR_C), SR_X | SR_C, "ROXL.b 0xAA by 1 sets X and C");

    // ASR.b by 9 of a negative byte saturates to all ones
    r = alu::shift(alu::SHIFT_AS, false, 0xAA, 9, 1, 0);
    t.eq(r.value, 0xFF, "ASR.b 0xAA by 9");
    t.ok((r.ccr & SR_C) != 0, "ASR.b by 9 puts the sign in C");
    t.ok((r.ccr & SR_V) == 0, "ASR never sets V");

    // LSL.w by exactly the width: C is the old bit 0
    r = alu::shift(alu::SHIFT_LS, true, 0x0001, 16, 2, 0);
    t.eq(r.value, 0, "LSL.w by 16");
    t.ok((r.ccr & SR_C) != 0, "LSL.w by 16 carries out bit 0");

    // a zero count clears C but keeps X, except ROX which copies X to C
    r = alu::shift(alu::SHIFT_LS, true, 0x80, 0, 1, SR_X | SR_C);
    t.eq(r.ccr & (SR_X | SR_C | SR_N), SR_X | SR_N, "LSL by 0");
    r = alu::shift(alu::SHIFT_ROX, true, 0x80, 0, 1, SR_X);
    t.eq(r.ccr & (SR_X | SR_C), SR_X | SR_C, "ROXL by 0 copies X to C");

    // ASL sets V if the sign changed at any point
    r = alu::shift(alu::SHIFT_AS, true, 0x40, 1, 1, 0);
    t.ok((r.ccr & SR_V) != 0, "ASL.b 0x40 by 1 overflows");
    r = alu::shift(alu::SHIFT_AS, true, 0xC0, 1, 1, 0);
    t.ok((r.ccr & SR_V) == 0, "ASL.b 0xC0 by 1 keeps its sign");
}


static void
testArith(TestCtx &t)
{
    alu::result_t r = alu::add(0x01, 0x7F, 1, 0);
    t.eq(r.value, 0x80, "ADD.b 0x7F+1");
    t.eq(r.ccr, SR_N | SR_V, "ADD.b 0x7F+1 flags");

    r = alu::add(0x00000001, 0xFFFFFFFF, 4, 0);
    t.eq(r.value, 0, "ADD.l carry out");
    t.eq(r.ccr, SR_X | SR_Z | SR_C, "ADD.l carry out flags");

    r = alu::sub(0x01, 0x00, 1, 0);
    t.eq(r.value, 0xFF, "SUB.b 0-1");
    t.eq(r.ccr, SR_X | SR_N | SR_C, "SUB.b 0-1 flags");

    // CMP leaves X alone
    r = alu::cmp(0x01, 0x00, 2, SR_X);
    t.eq(r.ccr, SR_X | SR_N | SR_C, "CMP.w keeps X");
    r = alu::cmp(0x01, 0x00, 2, 0);
    t.eq(r.ccr, SR_N | SR_C, "CMP.w doesn't set X");

    // ADDX only ever clears Z, so multiprecision zero tests work
    r = alu::addx(0, 0, 2, SR_Z);
    t.ok((r.ccr & SR_Z) != 0, "ADDX zero keeps Z");
    r = alu::addx(1, 0, 2, SR_Z);
    t.ok((r.ccr & SR_Z) == 0, "ADDX nonzero clears Z");

    r = alu::neg(0x80, 1, 0);
    t.eq(r.value, 0x80, "NEG.b 0x80");
    t.ok((r.ccr & SR_V) != 0, "NEG.b 0x80 overflows");

    r = alu::logic(0x8000, 2, SR_X | SR_V | SR_C);
    t.eq(r.ccr, SR_X | SR_N, "logic clears V and C");
}


static void
testDecimal(TestCtx &t)
{
    alu::result_t r = alu::abcd(0x38, 0x45, 0);
    t.eq(r.value, 0x83, "ABCD 45+38");
    t.ok((r.ccr & SR_C) == 0, "ABCD 45+38 no carry");

    r = alu::abcd(0x01, 0x99, SR_Z);
    t.eq(r.value, 0x00, "ABCD 99+1");
    t.eq(r.ccr & (SR_X | SR_Z | SR_C), SR_X | SR_Z | SR_C, "ABCD 99+1 carries, Z kept");

    r = alu::sbcd(0x01, 0x00, 0);
    t.eq(r.value, 0x99, "SBCD 0-1");
    t.ok((r.ccr & SR_C) != 0, "SBCD 0-1 borrows");

    r = alu::nbcd(0x01, 0);
    t.eq(r.value, 0x99, "NBCD 1");
}


static void
testMulDiv(TestCtx &t)
{
    alu::result_t r = alu::mulu(0xFFFF, 0xFFFF, 0);
    t.eq(r.value, 0xFFFE0001, "MULU ffff*ffff");

    r = alu::muls(0xFFFF, 0x0002, 0);
    t.eq(r.value, 0xFFFFFFFE, "MULS -1*2");
    t.ok((r.ccr & SR_N) != 0, "MULS -1*2 negative");

    r = alu::divu(100, 7, 0);
    t.eq(r.value, 0x0002000E, "DIVU 100/7");

    r = alu::divu(0x00010000, 1, SR_X);
    t.eq(r.value, 0x00010000, "DIVU overflow leaves the dividend");
    t.eq(r.ccr, SR_X | SR_N | SR_V, "DIVU overflow flags");

    r = alu::divs(static_cast<uint32>(-7), 2, 0);
    t.eq(r.value, 0xFFFFFFFD, "DIVS -7/2 truncates toward zero");

    t.eq(alu::muluCycles(0x0000), 38, "MULU time, no ones");
    t.eq(alu::muluCycles(0xFFFF), 70, "MULU time, all ones");
    t.eq(alu::mulsCycles(0x5555), 70, "MULS time, alternating bits");
    t.eq(alu::divuCycles(0x00010000, 1), 10, "DIVU overflow time");
}


static void
testConditions(TestCtx &t)
{
    t.ok( alu::testCond(0, 0),              "T");
    t.ok(!alu::testCond(1, SR_CCR),         "F");
    t.ok( alu::testCond(2, 0),              "HI");
    t.ok(!alu::testCond(2, SR_Z),           "HI with Z");
    t.ok( alu::testCond(7, SR_Z),           "EQ");
    t.ok( alu::testCond(12, SR_N | SR_V),   "GE with N and V");
    t.ok( alu::testCond(13, SR_N),          "LT with N");
    t.ok(!alu::testCond(14, SR_Z),          "GT with Z");
    t.ok( alu::testCond(15, SR_V),          "LE with V");
}


// rotating left then right by the same count gives back the operand,
// and C is the last bit carried around
static void
testRotateRoundTrip(TestCtx &t)
{
    static const uint32 values[] = {
        0x00000000, 0x00000001, 0x80000000, 0xFFFFFFFF, 0x12345678,
        0x0000A5C3, 0x8000007F
    };
    static const int sizes[] = { 1, 2, 4 };

    int bad_value = 0;
    int bad_carry = 0;
    for (int size : sizes) {
        const int    bits = 8*size;
        const uint32 m    = alu::sizeMask(size);
        const uint32 msb  = alu::sizeMsb(size);
        for (int k=0; k <= 2*bits && k < 64; k++) {
            for (uint32 value : values) {
                const alu::result_t l = alu::shift(alu::SHIFT_RO, true,  value, k, size, SR_X);
                const alu::result_t r = alu::shift(alu::SHIFT_RO, false, l.value, k, size, SR_X);
                if (r.value != (value & m)) {
                    bad_value++;
                }

                const bool lc = (l.ccr & SR_C) != 0;
                const bool rc = (r.ccr & SR_C) != 0;
                const bool want_lc = (k > 0) && (l.value & 1);
                const bool want_rc = (k > 0) && (r.value & msb);
                if (lc != want_lc || rc != want_rc
                                  || !(l.ccr & SR_X) || !(r.ccr & SR_X)) {
                    bad_carry++;
                }
            }
        }
    }
    t.eq(bad_value, 0, "ROL then ROR restores the operand");
    t.eq(bad_carry, 0, "rotate carry is the last bit moved, X untouched");
}


int
main()
{
    TestCtx t("test_alu");
    testShiftModel(t);
    testShiftCases(t);
    testRotateRoundTrip(t);
    testArith(t);
    testDecimal(t);
    testMulDiv(t);
    testConditions(t);
    return t.summary();
}

// vim: ts=8:et:sw=4:smarttab
