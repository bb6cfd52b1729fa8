// This class manages the system configuration state:
//    + set the state to some reasonable default
//    + read the state from the ini file
//    + save the state to the ini file
//    + copy state
//    + compare two sets of state for (in)equality
//    + report if the state is valid
//    + report if the transition between two sets of state requires the
//      emulated system to be rebuilt, or just a soft state change
//
// The state covers the size of RAM, the cpu clock rate, the bus ownership
// override and instruction tracing, the periodic interrupt source, and
// whether to tell the user when the cpu halts on a double fault.

#ifndef _INCLUDE_SYS_CONFIG_STATE_H_
#define _INCLUDE_SYS_CONFIG_STATE_H_

#include "m68kemu.h"

class SysCfgState
{
public:
    SysCfgState() = default;
    ~SysCfgState() = default;

    SysCfgState(const SysCfgState &obj);              // copy
    SysCfgState &operator=(const SysCfgState &rhs);   // assign

    // compare to configurations for equality
    bool operator==(const SysCfgState &rhs) const;
    bool operator!=(const SysCfgState &rhs) const;

    // returns true if the state has changed in a way that requires the
    // cpu and memory to be rebuilt
    bool needsReboot(const SysCfgState &other) const;

    // initialized with a reasonable default state
    void setDefaults();

    // load/save a configuration from/to the .ini file
    void loadIni();
    void saveIni() const;

    // set/get amount of RAM, in KB, starting at address 0
    void setRamKB(int kb) noexcept;
    int  getRamKB() const noexcept;

    // set/get the cpu clock rate, used to convert clocks to simulated time
    void setClockKHz(int khz) noexcept;
    int  getClockKHz() const noexcept;

    // run bus cycles even when the bus reports another master owns it
    void setForceCpu(bool force) noexcept;
    bool getForceCpu() const noexcept;

    // log every instruction to the debug log
    void setTrace(bool trace) noexcept;
    bool getTrace() const noexcept;

    // periodic interrupt source: level 0 disables it
    void setIrqLevel(int level) noexcept;
    int  getIrqLevel() const noexcept;
    void setIrqPeriodUs(int us) noexcept;
    int  getIrqPeriodUs() const noexcept;

    // warn the user when the cpu halts on a double bus fault
    void setWarnHalt(bool warn) noexcept;
    bool getWarnHalt() const noexcept;

    // returns true if the current configuration is valid and consistent.
    // if warn is true, errors produce a UI_error() explanation
    bool configOk(bool warn) const;

    // limits
    static const int MIN_RAM_KB     = 64;
    static const int MIN_CLOCK_KHZ  = 1000;
    static const int MAX_CLOCK_KHZ  = 50000;
    static const int MIN_IRQ_PERIOD = 10;           // us
    static const int MAX_IRQ_PERIOD = 10000000;     // us

private:
    // just for debugging -- make sure we don't attempt to use such a config
    bool m_initialized = false;

    // -------------- cpu --------------
    int  m_ram_kb        = MAX_RAM_KB;  // amount of memory
    int  m_clock_khz     = 7093;        // PAL Amiga clock
    bool m_force_cpu     = false;       // ignore bus ownership
    bool m_trace         = false;       // log each instruction

    // -------------- irq --------------
    int  m_irq_level     = 0;           // 0=no periodic interrupt
    int  m_irq_period_us = 20000;       // 50 Hz

    // -------------- misc --------------
    bool m_warn_halt     = true;        // tell the user about a double fault
};

#endif // _INCLUDE_SYS_CONFIG_STATE_H_

// vim: ts=8:et:sw=4:smarttab
