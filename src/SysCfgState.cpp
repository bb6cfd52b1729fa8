// ----------------------------------------------------------------------------
// headers
// ----------------------------------------------------------------------------

#include "SysCfgState.h"
#include "Ui.h"                 // for UI_error, UI_warn
#include "host.h"

// ------------------------------------------------------------------------
// public members
// ------------------------------------------------------------------------

// assignment
SysCfgState&
SysCfgState::operator=(const SysCfgState &rhs)
{
    // don't copy something that hasn't been initialized
    assert(rhs.m_initialized);

    // check for self-assignment
    if (this == &rhs) {
        return *this;
    }

    setRamKB(rhs.getRamKB());
    setClockKHz(rhs.getClockKHz());
    setForceCpu(rhs.getForceCpu());
    setTrace(rhs.getTrace());
    setIrqLevel(rhs.getIrqLevel());
    setIrqPeriodUs(rhs.getIrqPeriodUs());
    setWarnHalt(rhs.getWarnHalt());

    return *this;
}


// copy constructor
SysCfgState::SysCfgState(const SysCfgState &obj)
{
    assert(obj.m_initialized);

    m_ram_kb        = obj.m_ram_kb;
    m_clock_khz     = obj.m_clock_khz;
    m_force_cpu     = obj.m_force_cpu;
    m_trace         = obj.m_trace;
    m_irq_level     = obj.m_irq_level;
    m_irq_period_us = obj.m_irq_period_us;
    m_warn_halt     = obj.m_warn_halt;
    m_initialized   = true;
}


// equality comparison
bool
SysCfgState::operator==(const SysCfgState &rhs) const
{
    assert(    m_initialized);
    assert(rhs.m_initialized);

    return (m_ram_kb        == rhs.m_ram_kb)        &&
           (m_clock_khz     == rhs.m_clock_khz)     &&
           (m_force_cpu     == rhs.m_force_cpu)     &&
           (m_trace         == rhs.m_trace)         &&
           (m_irq_level     == rhs.m_irq_level)     &&
           (m_irq_period_us == rhs.m_irq_period_us) &&
           (m_warn_halt     == rhs.m_warn_halt)     ;
}


bool
SysCfgState::operator!=(const SysCfgState &rhs) const
{
    return !(*this == rhs);
}


// establish a reasonable default state
void
SysCfgState::setDefaults()
{
    setRamKB(MAX_RAM_KB);
    setClockKHz(7093);
    setForceCpu(false);
    setTrace(false);
    setIrqLevel(0);
    setIrqPeriodUs(20000);
    setWarnHalt(true);

    m_initialized = true;
}


// read from configuration file.  anything out of range is pulled back to
// a legal value, with a warning.
void
SysCfgState::loadIni()
{
    setDefaults();

    // cpu attributes
    {
        const std::string subgroup("cpu");
        int  ival;
        bool bval;

        host::configReadInt(subgroup, "memsize", &ival, MAX_RAM_KB);
        if ((ival < MIN_RAM_KB) || (ival > MAX_RAM_KB)) {
            UI_warn("The ini memsize of %d KB is out of range; using %d KB",
                    ival, MAX_RAM_KB);
            ival = MAX_RAM_KB;
        }
        setRamKB(ival);

        host::configReadInt(subgroup, "clock_khz", &ival, 7093);
        if ((ival < MIN_CLOCK_KHZ) || (ival > MAX_CLOCK_KHZ)) {
            UI_warn("The ini clock_khz of %d is out of range; using 7093", ival);
            ival = 7093;
        }
        setClockKHz(ival);

        host::configReadBool(subgroup, "force_cpu", &bval, false);
        setForceCpu(bval);

        host::configReadBool(subgroup, "trace", &bval, false);
        setTrace(bval);
    }

    // periodic interrupt source
    {
        const std::string subgroup("irq");
        int ival;

        host::configReadInt(subgroup, "level", &ival, 0);
        if ((ival < 0) || (ival > 7)) {
            UI_warn("The ini irq level %d is out of range; disabling it", ival);
            ival = 0;
        }
        setIrqLevel(ival);

        host::configReadInt(subgroup, "period_us", &ival, 20000);
        if ((ival < MIN_IRQ_PERIOD) || (ival > MAX_IRQ_PERIOD)) {
            UI_warn("The ini irq period of %d us is out of range; using 20000", ival);
            ival = 20000;
        }
        setIrqPeriodUs(ival);
    }

    // get misc other config bits
    {
        const std::string subgroup("misc");
        bool bval;

        host::configReadBool(subgroup, "warn_halt", &bval, true);
        setWarnHalt(bval);
    }

    m_initialized = true;
}


// save to configuration file
void
SysCfgState::saveIni() const
{
    assert(m_initialized);

    {
        const std::string subgroup("cpu");
        host::configWriteInt(subgroup,  "memsize",   getRamKB());
        host::configWriteInt(subgroup,  "clock_khz", getClockKHz());
        host::configWriteBool(subgroup, "force_cpu", getForceCpu());
        host::configWriteBool(subgroup, "trace",     getTrace());
    }

    {
        const std::string subgroup("irq");
        host::configWriteInt(subgroup, "level",     getIrqLevel());
        host::configWriteInt(subgroup, "period_us", getIrqPeriodUs());
    }

    {
        const std::string subgroup("misc");
        host::configWriteBool(subgroup, "warn_halt", getWarnHalt());
    }
}


void
SysCfgState::setRamKB(int kb) noexcept
{
    m_ram_kb = kb;
    m_initialized = true;
}


void
SysCfgState::setClockKHz(int khz) noexcept
{
    m_clock_khz = khz;
    m_initialized = true;
}


void
SysCfgState::setForceCpu(bool force) noexcept
{
    m_force_cpu = force;
    m_initialized = true;
}


void
SysCfgState::setTrace(bool trace) noexcept
{
    m_trace = trace;
    m_initialized = true;
}


void
SysCfgState::setIrqLevel(int level) noexcept
{
    m_irq_level = level;
    m_initialized = true;
}


void
SysCfgState::setIrqPeriodUs(int us) noexcept
{
    m_irq_period_us = us;
    m_initialized = true;
}


void
SysCfgState::setWarnHalt(bool warn) noexcept
{
    m_warn_halt = warn;
    m_initialized = true;
}


int
SysCfgState::getRamKB() const noexcept
{
    return m_ram_kb;
}


int
SysCfgState::getClockKHz() const noexcept
{
    return m_clock_khz;
}


bool
SysCfgState::getForceCpu() const noexcept
{
    return m_force_cpu;
}


bool
SysCfgState::getTrace() const noexcept
{
    return m_trace;
}


int
SysCfgState::getIrqLevel() const noexcept
{
    return m_irq_level;
}


int
SysCfgState::getIrqPeriodUs() const noexcept
{
    return m_irq_period_us;
}


bool
SysCfgState::getWarnHalt() const noexcept
{
    return m_warn_halt;
}


// returns true if the current configuration is reasonable, and false if not.
// if returning false, this routine first calls UI_error() describing what
// is wrong.
bool
SysCfgState::configOk(bool warn) const
{
    if (!m_initialized) {
        return false;
    }

    if ((m_ram_kb < MIN_RAM_KB) || (m_ram_kb > MAX_RAM_KB)) {
        if (warn) {
            UI_error("Configuration problem: RAM must be between %d and %d KB",
                     MIN_RAM_KB, MAX_RAM_KB);
        }
        return false;
    }

    if ((m_clock_khz < MIN_CLOCK_KHZ) || (m_clock_khz > MAX_CLOCK_KHZ)) {
        if (warn) {
            UI_error("Configuration problem: the clock must be between %d and %d KHz",
                     MIN_CLOCK_KHZ, MAX_CLOCK_KHZ);
        }
        return false;
    }

    if ((m_irq_level < 0) || (m_irq_level > 7)) {
        if (warn) {
            UI_error("Configuration problem: the interrupt level must be 0 to 7");
        }
        return false;
    }

    if ((m_irq_period_us < MIN_IRQ_PERIOD) || (m_irq_period_us > MAX_IRQ_PERIOD)) {
        if (warn) {
            UI_error("Configuration problem: the interrupt period must be between %d and %d us",
                     MIN_IRQ_PERIOD, MAX_IRQ_PERIOD);
        }
        return false;
    }

    return true;
}


// returns true if the state has changed in a way that requires a rebuild.
// the trace, interrupt and warning settings can change on the fly.
bool
SysCfgState::needsReboot(const SysCfgState &other) const
{
    if (!m_initialized) {
        return true;
    }

    return (m_ram_kb    != other.m_ram_kb)
        || (m_clock_khz != other.m_clock_khz)
        || (m_force_cpu != other.m_force_cpu)
        || (m_trace     != other.m_trace);
}

// vim: ts=8:et:sw=4:smarttab
