// Small helpers shared by the test programs.  Each test is a plain
// executable; it returns zero if every check passed.

#ifndef _INCLUDE_TEST_UTIL_H_
#define _INCLUDE_TEST_UTIL_H_

#include "Cpu68k.h"
#include "RamBus.h"

#include <cstdio>
#include <initializer_list>

// counts checks and reports the failing ones
class TestCtx
{
public:
    explicit TestCtx(const char *name) : m_name(name) { }

    // record one check
    bool ok(bool cond, const char *msg)
    {
        if (cond) {
            m_passed++;
        } else {
            m_failed++;
            std::printf("[FAIL] %s: %s\n", m_name, msg);
        }
        return cond;
    }

    // compare two values, printing both on a mismatch
    bool eq(uint64 got, uint64 expected, const char *msg)
    {
        if (got == expected) {
            m_passed++;
            return true;
        }
        m_failed++;
        std::printf("[FAIL] %s: %s: got 0x%llX, expected 0x%llX\n", m_name, msg,
                    static_cast<unsigned long long>(got),
                    static_cast<unsigned long long>(expected));
        return false;
    }

    // print the totals; the result is the process exit code
    int summary() const
    {
        std::printf("%s: %d passed, %d failed\n", m_name, m_passed, m_failed);
        return (m_failed == 0) ? 0 : 1;
    }

private:
    const char *m_name;
    int         m_passed = 0;
    int         m_failed = 0;
};


// a cpu wired to a flat RAM bus, ready to run short programs
class TestRig
{
public:
    CANT_ASSIGN_OR_COPY_CLASS(TestRig);

    explicit TestRig(int ram_kb = 64) :
        m_bus(ram_kb),
        m_cpu(m_bus, cpu_cfg_t{ false, false })
    {
        m_bus.enableLog(true);
    }

    RamBus&   bus() noexcept { return m_bus; }
    Cpu68000& cpu() noexcept { return m_cpu; }
    Registers68k& regs() noexcept { return m_cpu.regs(); }

    // store program words starting at addr
    void load(uint32 addr, std::initializer_list<uint16> words)
    {
        for (auto w : words) {
            m_bus.pokeWord(addr, w);
            addr += 2;
        }
    }

    // point an exception vector at a handler
    void setVector(int vector, uint32 handler)
    {
        m_bus.pokeLong(static_cast<uint32>(vector) * 4, handler);
    }

    // start executing at addr as if the previous instruction had just
    // finished and filled the prefetch pipeline
    void start(uint32 addr)
    {
        regs().pc = addr + 4;
        m_cpu.setupPrefetch(m_bus.peekWord(addr), m_bus.peekWord(addr + 2));
    }

    // advance one clock, keeping the bus log stamped
    void tick()
    {
        m_bus.setCycleStamp(m_cpu.totalCycles());
        m_cpu.tick();
    }

    void tick(int n)
    {
        for (int i=0; i < n; i++) {
            tick();
        }
    }

    // run the current instruction to completion.  returns the number of
    // clocks from the end of its opcode fetch to the end of the opcode
    // fetch of whatever runs next, which is the documented instruction
    // time.  exceptions and interrupts it triggers count toward it.
    // returns -1 if nothing new started within the limit.
    int step(int limit = 2000)
    {
        const uint64 c0  = m_cpu.totalCycles();
        const uint32 pc0 = m_cpu.instrStartPc();
        int n = 0;
        while (m_cpu.instrStartPc() == pc0) {
            if (++n > limit) {
                return -1;
            }
            tick();
        }
        const uint32 fetch_pc = regs().pc;
        while (regs().pc == fetch_pc) {
            if (++n > limit) {
                return -1;
            }
            tick();
        }
        return static_cast<int>(m_cpu.totalCycles() - c0);
    }

    // read a long word as the cpu would see it
    uint32 peekLong(uint32 addr) const
    {
        return (static_cast<uint32>(m_bus.peekWord(addr)) << 16)
             | m_bus.peekWord(addr + 2);
    }

private:
    RamBus   m_bus;
    Cpu68000 m_cpu;
};

#endif // _INCLUDE_TEST_UTIL_H_

// vim: ts=8:et:sw=4:smarttab
