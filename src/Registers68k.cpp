#include "Registers68k.h"

void
Registers68k::clear() noexcept
{
    for (int i=0; i<8; i++) {
        d[i] = 0;
        a[i] = 0;
    }
    pc    = 0;
    m_sr  = SR_S | SR_INT_MASK;
    m_usp = 0;
    m_ssp = 0;
}


// write the status register.  if S changes, the active stack pointer
// is saved to its shadow and the other one is brought in.
void
Registers68k::setSr(uint16 value) noexcept
{
    value &= SR_MASK;
    const bool was_super = supervisor();
    const bool now_super = (value & SR_S) != 0;

    if (was_super && !now_super) {
        m_ssp = a[7];
        a[7]  = m_usp;
    } else if (!was_super && now_super) {
        m_usp = a[7];
        a[7]  = m_ssp;
    }

    m_sr = value;
}


void
Registers68k::setCcr(uint8 value) noexcept
{
    m_sr = static_cast<uint16>((m_sr & ~SR_CCR) | (value & SR_CCR));
}


void
Registers68k::setFlag(uint16 bit, bool value) noexcept
{
    assert((bit & ~SR_CCR) == 0);   // only condition codes
    m_sr = static_cast<uint16>((value) ? (m_sr | bit) : (m_sr & ~bit));
}


void
Registers68k::setIntMask(int level) noexcept
{
    assert(level >= 0 && level <= 7);
    m_sr = static_cast<uint16>((m_sr & ~SR_INT_MASK) | (level << 8));
}


void
Registers68k::setUsp(uint32 value) noexcept
{
    if (supervisor()) {
        m_usp = value;
    } else {
        a[7] = value;
    }
}


void
Registers68k::setSsp(uint32 value) noexcept
{
    if (supervisor()) {
        a[7] = value;
    } else {
        m_ssp = value;
    }
}


void
Registers68k::setDn(int n, int size, uint32 value) noexcept
{
    assert(n >= 0 && n < 8);
    switch (size) {
        case 1: d[n] = (d[n] & 0xFFFFFF00) | (value & 0x000000FF); break;
        case 2: d[n] = (d[n] & 0xFFFF0000) | (value & 0x0000FFFF); break;
        case 4: d[n] = value; break;
        default: assert(false); break;
    }
}


void
Registers68k::setAn(int n, int size, uint32 value) noexcept
{
    assert(n >= 0 && n < 8);
    assert(size == 2 || size == 4);
    a[n] = (size == 2) ? static_cast<uint32>(static_cast<int16>(value & 0xFFFF))
                       : value;
}

// vim: ts=8:et:sw=4:smarttab
