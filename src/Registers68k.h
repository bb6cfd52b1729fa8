// The 68000 programmer's model: eight data registers, eight address
// registers, a user and a supervisor stack pointer, the program counter
// and the status register.
//
// a[7] is always the *active* stack pointer.  The inactive one lives in a
// shadow; changing the S bit through setSr() swaps them, so code that
// pushes or pops through a[7] always uses the right stack.

#ifndef _INCLUDE_REGISTERS68K_H_
#define _INCLUDE_REGISTERS68K_H_

#include "m68kemu.h"

// status register bits
enum : uint16 {
    SR_C        = 0x0001,   // carry
    SR_V        = 0x0002,   // overflow
    SR_Z        = 0x0004,   // zero
    SR_N        = 0x0008,   // negative
    SR_X        = 0x0010,   // extend
    SR_CCR      = 0x001F,   // all condition codes
    SR_INT_MASK = 0x0700,   // interrupt priority mask
    SR_S        = 0x2000,   // supervisor
    SR_T        = 0x8000,   // trace
    SR_MASK     = 0xA71F    // bits that exist on the 68000
};

class Registers68k
{
public:
    Registers68k() { clear(); }

    // everything zero, supervisor mode, all interrupts masked
    void clear() noexcept;

    uint32 d[8];    // data registers
    uint32 a[8];    // address registers; a[7] is the active stack pointer
    uint32 pc;      // address of the next prefetch

    // ---- status register ----
    uint16 sr() const noexcept { return m_sr; }
    void   setSr(uint16 value) noexcept;        // may swap stacks
    uint8  ccr() const noexcept { return static_cast<uint8>(m_sr & SR_CCR); }
    void   setCcr(uint8 value) noexcept;

    bool flag(uint16 bit) const noexcept { return (m_sr & bit) != 0; }
    void setFlag(uint16 bit, bool value) noexcept;

    bool supervisor() const noexcept { return (m_sr & SR_S) != 0; }
    bool trace() const noexcept      { return (m_sr & SR_T) != 0; }
    int  intMask() const noexcept    { return (m_sr >> 8) & 7; }
    void setIntMask(int level) noexcept;

    // ---- stack pointers, live values whichever one is active ----
    uint32 usp() const noexcept { return (supervisor()) ? m_usp : a[7]; }
    uint32 ssp() const noexcept { return (supervisor()) ? a[7] : m_ssp; }
    void   setUsp(uint32 value) noexcept;
    void   setSsp(uint32 value) noexcept;

    // ---- sized register access ----

    // replace the low 'size' bytes of Dn
    void setDn(int n, int size, uint32 value) noexcept;

    // address registers are always written as 32b; word values sign extend
    void setAn(int n, int size, uint32 value) noexcept;

private:
    uint16 m_sr;    // status register
    uint32 m_usp;   // user stack pointer, when in supervisor mode
    uint32 m_ssp;   // supervisor stack pointer, when in user mode
};

#endif // _INCLUDE_REGISTERS68K_H_

// vim: ts=8:et:sw=4:smarttab
