// A routine desiring later notification at some specific time calls
//
//     auto tmr = createTimer(ns, std::bind(&obj::fcn, &obj, arg));
//
// which causes 'fcn' to be called back with parameter arg after 'ns'
// nanoseconds of simulated time.  The event is then removed from the
// active list.  A timer can be canceled early by setting its handle to
// nullptr.
//
// When m_time_ns passes the earliest expiration time, all timers are
// checked since more than one might expire on the same clock.  Expired
// timers move to a retirement list and are called back in expiration
// order only after the active list has been rebuilt, since a callback may
// create a new timer.

#include "Scheduler.h"
#include "Ui.h"         // needed for UI_warn()

#include <algorithm>    // for std::sort

std::shared_ptr<Timer>
Scheduler::createTimer(int64 ns, const sched_callback_t &fcn)
{
    assert(ns >= 1);
    assert(ns <= 60E9);      // a minute

    // a leak here means somebody is re-arming without dropping the handle
    static unsigned int max_timers = MAX_TIMERS;
    if (m_timer.size() > max_timers) {
        max_timers = m_timer.size();
        UI_warn("now at %d timers", max_timers);
    }

    const int64 event_ns = m_time_ns + ns;
    auto tmr = std::make_shared<Timer>(event_ns, fcn);

    m_timer.push_back(tmr);
    m_trigger_ns = firstEvent();

    return tmr;
}


int64
Scheduler::firstEvent() const noexcept
{
    int64 rv = MAX_TIME;
    for (auto &t : m_timer) {
        if (t->m_expires_ns < rv) {
            rv = t->m_expires_ns;
        }
    }
    return rv;
}


void
Scheduler::creditTimer()
{
    if (m_timer.empty()) {
        m_trigger_ns = MAX_TIME;
        return;
    }

    std::vector<std::shared_ptr<Timer>> retired;
    std::vector<std::shared_ptr<Timer>> active;
    for (auto &t : m_timer) {
        if (t.use_count() == 1) {
            // canceled: the scheduler holds the only reference to it
            continue;
        }
        if (t->m_expires_ns <= m_time_ns) {
            retired.push_back(t);
        } else {
            active.push_back(t);
        }
    }
    m_timer.swap(active);
    active.clear();

    m_trigger_ns = firstEvent();

    std::stable_sort(begin(retired), end(retired),
                     [](const std::shared_ptr<Timer> &a,
                        const std::shared_ptr<Timer> &b) {
                         return (a->m_expires_ns < b->m_expires_ns);
                     });

    for (auto &t : retired) {
        (t->m_callback)();
    }
}

// vim: ts=8:et:sw=4:smarttab
