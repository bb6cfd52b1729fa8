// this encapsulates the system under emulation.

#include "Cpu68k.h"
#include "RamBus.h"
#include "Scheduler.h"
#include "SysCfgState.h"
#include "Ui.h"
#include "host.h"
#include "system68k.h"

// ----------------------------------------------------------------------------
// this is the "private" state of the system68k namespace,
// invisible to anyone importing system68k.h
// ----------------------------------------------------------------------------

// for coordinating events in the emulator
static std::shared_ptr<Scheduler> scheduler = nullptr;

// everything the cpu can address
static std::shared_ptr<RamBus> bus = nullptr;

// the central processing unit
static std::shared_ptr<Cpu68000> cpu = nullptr;

// active system configuration
static std::shared_ptr<SysCfgState> current_cfg = nullptr;

// the periodic interrupt source re-arms this on every expiration
static std::shared_ptr<Timer> irq_timer = nullptr;

// each clock is 1e6/clock_khz ns; the fraction is carried here so
// simulated time doesn't drift
static int clock_ns_frac = 0;

// ----------------------------- speed regulation -----------------------------

static bool   first_slice    = false; // has realtime_start been initialized?
static int64  realtime_start = 0;     // relative wall time of when sim started
static int    real_seconds   = 0;     // real time elapsed
static uint32 sim_seconds    = 0;     // number of actual seconds simulated time
static bool   regulated      = true;  // keep to realtime

// amount of actual simulated time elapsed, in ms
static int64 sim_time_ms;

// amount of adjusted simulated time elapsed, in ms.  pauses in the host
// loop interrupt sim time and we don't want to catch up afterwards.
// sim_time_ms is the actual number of simulated slices, while this var
// has been fudged to account for those violations of realtime.
static int64 adjust_sim_time;

// keep a rolling average of how fast we are running in case it is reported.
static const int perf_hist_size = 100;  // # of timeslices to track
static       int perf_hist_len  = 0;    // number of entries written
static       int perf_hist_ptr  = 0;    // next entry to write
static     int64 perf_real_ms[100];     // realtime at start of each slice

// help ensure an orderly shutdown
enum term_state_t {
    RUNNING,
    TERMINATING,
    TERMINATED
};
static term_state_t m_termination_state = RUNNING;

static void
setTerminationState(term_state_t newstate) noexcept
{
    m_termination_state = newstate;
}

static term_state_t
getTerminationState() noexcept
{
    return m_termination_state;
}

// ----------------------------------------------------------------------------
// periodic interrupt source
// ----------------------------------------------------------------------------

static void armIrqTimer();

// raise the configured level and wait for the next period.  the level
// stays up until the cpu acknowledges it.
static void
irqExpired()
{
    irq_timer = nullptr;
    bus->setIpl(current_cfg->getIrqLevel());
    armIrqTimer();
}


static void
armIrqTimer()
{
    irq_timer = nullptr;
    if (current_cfg->getIrqLevel() == 0) {
        return;
    }
    irq_timer = scheduler->createTimer(TIMER_US(current_cfg->getIrqPeriodUs()),
                                       &irqExpired);
}


// the cpu took the interrupt: drop the request line
static void
irqAcknowledged(int level)
{
    if (level == bus->getIpl()) {
        bus->setIpl(0);
    }
}

// ----------------------------------------------------------------------------
// the clock
// ----------------------------------------------------------------------------

static inline void
clockCpu()
{
    bus->setCycleStamp(cpu->totalCycles());
    cpu->tick();

    const int khz = current_cfg->getClockKHz();
    clock_ns_frac += 1000000;
    const int ns = clock_ns_frac / khz;
    clock_ns_frac -= ns * khz;
    scheduler->timerTick(ns);
}


// the cpu has stopped dead on a double bus fault.  nothing short of a
// reset brings it back, and there's no one to press the button.
static void
reportHalt()
{
    cpu->dumpState(true);
    if (current_cfg->getWarnHalt()) {
        UI_warn("CPU halted by a double bus fault at PC=%06X -- must reset",
                cpu->instrStartPc());
    }
    system68k::terminate();
}

// ------------------------------------------------------------------------
// "public" members
// ------------------------------------------------------------------------

// build the world
void
system68k::initialize()
{
    // CPU speed regulation
    first_slice = true;
    sim_time_ms = adjust_sim_time = host::getTimeMs();
    sim_seconds = 0;

    realtime_start = 0;  // wall time of when sim started
    real_seconds   = 0;  // real time elapsed

    setTerminationState(RUNNING);

    ::scheduler = std::make_shared<Scheduler>();

    // attempt to load configuration from saved state
    SysCfgState ini_cfg;
    ini_cfg.loadIni();
    if (!ini_cfg.configOk(false)) {
        UI_warn(".ini file wasn't usable -- using a default configuration");
        ini_cfg.setDefaults();
    }
    setConfig(ini_cfg);
}


// because everything is static, the destructor does nothing, so we
// need this function to know when the real Armageddon has arrived.
void
system68k::cleanup()
{
    irq_timer = nullptr;
    ::cpu       = nullptr;
    ::bus       = nullptr;
    ::scheduler = nullptr;

    if (current_cfg) {
        current_cfg->saveIni();  // save state to ini file
        current_cfg = nullptr;
    }
}


void
system68k::terminate() noexcept
{
    setTerminationState(TERMINATING);
}


bool
system68k::isTerminating() noexcept
{
    return getTerminationState() != RUNNING;
}


// build a system according to the configuration.
// if a system already exists, tear it down and rebuild it.
void
system68k::setConfig(const SysCfgState &new_cfg)
{
    if (!current_cfg) {
        // first time we don't need to tear anything down
        current_cfg = std::make_shared<SysCfgState>();
    } else {
        // check if the change is minor, not requiring a teardown
        const bool rebuild_required = current_cfg->needsReboot(new_cfg);
        if (!rebuild_required) {
            const bool irq_changed =
                   (current_cfg->getIrqLevel()    != new_cfg.getIrqLevel())
                || (current_cfg->getIrqPeriodUs() != new_cfg.getIrqPeriodUs());
            *current_cfg = new_cfg;  // make new config permanent
            if (irq_changed) {
                ::bus->setIpl(0);
                armIrqTimer();
            }
            return;
        }

        // the change was major, so delete existing resources
        irq_timer = nullptr;
        ::cpu = nullptr;
        ::bus = nullptr;
    }

    // save the new system configuration state
    *current_cfg = new_cfg;

    // (re)build the memory and the cpu
    ::bus = std::make_shared<RamBus>(current_cfg->getRamKB());
    ::bus->setIackCallback(&irqAcknowledged);

    const cpu_cfg_t cpu_cfg = { current_cfg->getForceCpu(),
                                current_cfg->getTrace() };
    ::cpu = std::make_shared<Cpu68000>(*::bus, cpu_cfg);
    assert(::cpu);

    clock_ns_frac = 0;
    armIrqTimer();
}


// give access to components
const SysCfgState&
system68k::config() noexcept
{
    return *current_cfg;
}


Cpu68000&
system68k::cpu() noexcept
{
    assert(::cpu);
    return *::cpu;
}


// reset the cpu; pending interrupts go away with it
void
system68k::reset()
{
    ::bus->setIpl(0);
    ::cpu->reset();
    armIrqTimer();
}


bool
system68k::loadImage(const std::string &filename)
{
    std::vector<uint8> image;
    if (!host::readBinaryFile(filename, &image)) {
        return false;
    }

    if (image.size() < 8) {
        UI_error("'%s' is too small to hold the reset vectors", filename.c_str());
        return false;
    }
    if (image.size() > static_cast<size_t>(::bus->sizeBytes())) {
        UI_error("'%s' is %d bytes, but only %d KB of RAM is configured",
                 filename.c_str(), static_cast<int>(image.size()),
                 current_cfg->getRamKB());
        return false;
    }

    ::bus->load(0, image);
    reset();
    return true;
}


// turn cpu speed regulation on (true) or off (false)
void
system68k::regulateCpuSpeed(bool regulate) noexcept
{
    regulated = regulate;

    // reset the performance monitor history
    perf_hist_len = 0;
    perf_hist_ptr = 0;
}


// called whenever there is free time
bool
system68k::onIdle()
{
    static const int slice_duration = 30;   // in ms

    switch (getTerminationState()) {
        case RUNNING:
            // this is the normal case during emulation
            emulateTimeslice(slice_duration);
            return true;        // want more idle events
        case TERMINATING:
            // the cpu stopped for good.  it stays alive so the caller can
            // still query it; the app's OnExit() tears everything down.
            setTerminationState(TERMINATED);
            break;
        case TERMINATED:
            break;
        default:
            assert(false);
            break;
    }

    return false;        // don't want any more idle events
}


// simulate a few ms worth of clocks
void
system68k::emulateTimeslice(int ts_ms)
{
    // try to stay realtime within this window
    const int64 adj_window = 10LL*ts_ms;  // look at the last 10 timeslices

    if (::cpu->status() == Cpu68k::CPU_HALTED) {
        return;
    }

    const int64 now_ms = host::getTimeMs();

    if (first_slice) {
        first_slice = false;
        realtime_start = now_ms;
    }
    const int64 realtime_elapsed = now_ms - realtime_start;
    int64 offset = adjust_sim_time - realtime_elapsed;

    if (offset > adj_window) {
        // we're way ahead (probably because we are running unregulated)
        adjust_sim_time = realtime_elapsed + adj_window;
        offset = adj_window;
    } else if (offset < -adj_window) {
        // we've fallen way behind; catch up so we don't
        // run like mad after any substantial pause
        adjust_sim_time = realtime_elapsed - adj_window;
        offset = -adj_window;
    }

    if ((offset > 0) && regulated) {

        // we are running ahead of schedule; kill some time.
        // we don't kill the full amount because the sleep function is
        // allowed to, and very well might, sleep longer than we asked.
        const unsigned int ioffset = static_cast<unsigned int>(offset & 0xFFFLL);
        host::sleep(ioffset/2);
        return;
    }

    // keep track of when each slice started
    perf_real_ms[perf_hist_ptr++] = now_ms;
    if (perf_hist_ptr >= perf_hist_size) {
        perf_hist_ptr -= perf_hist_size;
    }
    if (perf_hist_len < perf_hist_size) {
        perf_hist_len++;
    }

    // simulate one timeslice's worth of clocks
    const int64 slice_end = ::scheduler->nowNs() + TIMER_MS(ts_ms);
    while (::scheduler->nowNs() < slice_end) {
        clockCpu();
        if (::cpu->status() == Cpu68k::CPU_HALTED) {
            break;
        }
    }

    sim_time_ms     += ts_ms;
    adjust_sim_time += ts_ms;

    if (::cpu->status() == Cpu68k::CPU_HALTED) {
        reportHalt();
        return;
    }

    sim_seconds = static_cast<uint32>(::scheduler->nowNs() / 1000000000LL);

    const int real_seconds_now = static_cast<int>(realtime_elapsed/1000);
    if (real_seconds != real_seconds_now) {
        real_seconds = real_seconds_now;
        if (perf_hist_len > 10) {
            // compute running performance average over the
            // last real second or so
            const int n1 = (perf_hist_ptr - 1 + perf_hist_size)
                         % perf_hist_size;
            int64 ms_diff = 0;
            int slices = 0;
            for (int n=1; n<perf_hist_len; n+=10) {
                const int n0 = (n1 - n + perf_hist_size) % perf_hist_size;
                slices = n;
                ms_diff = (perf_real_ms[n1] - perf_real_ms[n0]);
                if (ms_diff > 1000) {
                    break;
                }
            }
            if (ms_diff > 0) {
                const float relative_speed = static_cast<float>(slices*ts_ms)
                                           / static_cast<float>(ms_diff);
                UI_setSimSeconds(sim_seconds, relative_speed);
            }
        }
    }

    // at least yield so we don't hog the whole machine
    host::sleep(0);
}


void
system68k::runCycles(uint64 cycles)
{
    for (uint64 n=0; n < cycles; n++) {
        clockCpu();
    }
    if (::cpu->status() == Cpu68k::CPU_HALTED) {
        reportHalt();
    }
}

// vim: ts=8:et:sw=4:smarttab
