// A simple event scheduler for the machine around the cpu.  Time is kept
// in nanoseconds of simulated time, advanced once per cpu clock.  Callers
// ask to be called back some time in the future; the returned Timer handle
// is how they cancel the request early.

#ifndef _INCLUDE_SCHEDULER_H_
#define _INCLUDE_SCHEDULER_H_

#include "m68kemu.h"

// when a timer expires, we invoke the callback function
using sched_callback_t = std::function<void()>;

// ======================================================================
// A Timer is just a handle that Scheduler passes back on timer creation.
// Dropping the last reference to it cancels the timer.

class Scheduler;

class Timer
{
    CANT_ASSIGN_OR_COPY_CLASS(Timer);

    friend class Scheduler;

public:
    // time_ns is the absolute time at which to invoke the callback
    Timer(int64 time_ns, sched_callback_t cb) :
            m_expires_ns(time_ns), m_callback(cb) { };

    int64 expiresNs() const noexcept { return m_expires_ns; }

private:
    int64             m_expires_ns; // absolute expiration time
    sched_callback_t  m_callback;   // registered callback function
};


// ======================================================================
// time advances every cpu clock, and callers can request to be called
// back after some amount of simulated time.  timers are one-shots; a
// periodic source such as the interrupt timer re-arms itself from its
// callback.
//
//   auto tmr = scheduler.createTimer(TIMER_US(100),
//                                    std::bind(&Foo::expired, &foo, 3));
//
// After 100 us of simulated time, foo.expired(3) is called.

class Scheduler
{
public:
    Scheduler() = default;

    // create a new timer which fires 'ns' nanoseconds from now
    std::shared_ptr<Timer> createTimer(int64 ns, const sched_callback_t &fcn);

    // let 'ns' nanoseconds of simulated time go past
    inline void timerTick(int ns)
    {
        m_time_ns += ns;
        if (m_time_ns >= m_trigger_ns) {
            creditTimer();
        }
    }

    // simulated time since creation
    int64 nowNs() const noexcept { return m_time_ns; }

    // number of timers not yet retired, canceled ones included
    int activeTimers() const noexcept { return static_cast<int>(m_timer.size()); }

private:
    // not strictly necessary to place a limit, but it is useful to
    // detect runaway conditions
    static const int MAX_TIMERS = 30;

    static const int64 MAX_TIME = (1LL << 62);

    // fire all expired timers
    void creditTimer();

    // returns, in absolute ns, the time of the soonest event on the timer list
    int64 firstEvent() const noexcept;

    int64 m_time_ns    = 0LL;       // simulated absolute time (in ns)
    int64 m_trigger_ns = MAX_TIME;  // time next event expires

    // timers waiting on m_time_ns to reach their expiration time
    std::vector<std::shared_ptr<Timer>> m_timer;
};

// scale us/ms to ns, which is what createTimer() expects
constexpr int64 TIMER_US(double f) { return static_cast<int64>(   1000.0*f+0.5); }
constexpr int64 TIMER_MS(double f) { return static_cast<int64>(1000000.0*f+0.5); }

#endif // _INCLUDE_SCHEDULER_H_

// vim: ts=8:et:sw=4:smarttab
