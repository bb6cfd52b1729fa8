// flat RAM implementation of the 68000 bus

#include "RamBus.h"

#include <algorithm>      // for std::fill

RamBus::RamBus(int ram_kb) :
    m_ram(static_cast<size_t>(ram_kb) * 1024, 0x00)
{
    assert(ram_kb > 0 && ram_kb <= MAX_RAM_KB);
}


// ---- direct access ----

// anything past the end of RAM floats high
uint8
RamBus::peek(uint32 addr) const noexcept
{
    addr &= ADDR_MASK;
    return (addr < m_ram.size()) ? m_ram[addr] : 0xFF;
}


void
RamBus::poke(uint32 addr, uint8 value) noexcept
{
    addr &= ADDR_MASK;
    if (addr < m_ram.size()) {
        m_ram[addr] = value;
    }
}


uint16
RamBus::peekWord(uint32 addr) const noexcept
{
    return static_cast<uint16>((peek(addr) << 8) | peek(addr+1));
}


void
RamBus::pokeWord(uint32 addr, uint16 value) noexcept
{
    poke(addr,   static_cast<uint8>(value >> 8));
    poke(addr+1, static_cast<uint8>(value));
}


void
RamBus::pokeLong(uint32 addr, uint32 value) noexcept
{
    pokeWord(addr,   static_cast<uint16>(value >> 16));
    pokeWord(addr+2, static_cast<uint16>(value));
}


void
RamBus::load(uint32 addr, const std::vector<uint8> &image) noexcept
{
    for (const uint8 byte : image) {
        poke(addr++, byte);
    }
}


void
RamBus::fill(uint8 value) noexcept
{
    std::fill(m_ram.begin(), m_ram.end(), value);
}


// ---- bus cycles ----

void
RamBus::logCycle(int kind, fc_t fc, uint32 addr, uint16 data, bool word)
{
    if (m_log_enabled) {
        m_log.push_back({ kind, fc, addr & ADDR_MASK, data, word, m_stamp });
    }
}


void
RamBus::setBusErrorWindow(uint32 lo, uint32 hi) noexcept
{
    assert(lo <= hi);
    m_berr_enabled = true;
    m_berr_lo      = lo & ADDR_MASK;
    m_berr_hi      = hi & ADDR_MASK;
}


bool
RamBus::inBusErrorWindow(uint32 addr) const noexcept
{
    addr &= ADDR_MASK;
    return m_berr_enabled && (addr >= m_berr_lo) && (addr <= m_berr_hi);
}


bus_result_t
RamBus::readByte(uint32 addr, fc_t fc)
{
    if (inBusErrorWindow(addr)) {
        return busFault();
    }
    const uint8 data = peek(addr);
    logCycle(XACT_READ, fc, addr, data, false);
    return busOk(data, m_wait_cycles);
}


bus_result_t
RamBus::readWord(uint32 addr, fc_t fc)
{
    assert((addr & 1) == 0);
    if (inBusErrorWindow(addr)) {
        return busFault();
    }
    const uint16 data = peekWord(addr);
    logCycle(XACT_READ, fc, addr, data, true);
    return busOk(data, m_wait_cycles);
}


bus_result_t
RamBus::writeByte(uint32 addr, uint8 data, fc_t fc)
{
    if (inBusErrorWindow(addr)) {
        return busFault();
    }
    poke(addr, data);
    logCycle(XACT_WRITE, fc, addr, data, false);
    return busOk(0, m_wait_cycles);
}


bus_result_t
RamBus::writeWord(uint32 addr, uint16 data, fc_t fc)
{
    assert((addr & 1) == 0);
    if (inBusErrorWindow(addr)) {
        return busFault();
    }
    pokeWord(addr, data);
    logCycle(XACT_WRITE, fc, addr, data, true);
    return busOk(0, m_wait_cycles);
}


int
RamBus::pollIpl()
{
    return m_ipl;
}


void
RamBus::setIpl(int level) noexcept
{
    assert(level >= 0 && level <= 7);
    m_ipl = level;
}


bus_result_t
RamBus::interruptAck(int level)
{
    const int vector = (m_iack_vector < 0) ? (24 + level) : m_iack_vector;
    logCycle(XACT_IACK, FC_INTERRUPT_ACK, 0xFFFFF0 | (level << 1),
             static_cast<uint16>(vector), false);
    if (m_iack_cb) {
        m_iack_cb(level);
    }
    return busOk(static_cast<uint16>(vector), m_wait_cycles);
}


void
RamBus::reset()
{
    m_reset_count++;
}


bool
RamBus::cpuOwnsBus()
{
    return m_cpu_owns_bus;
}

// vim: ts=8:et:sw=4:smarttab
