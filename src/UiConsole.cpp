// The emulator runs headless: user notification goes through the wx
// logging layer, which writes to stderr for a console application.

#include "Ui.h"

#include "wx/log.h"

#include <cstdarg>      // for var args

// ============================================================================
// alert messages
// ============================================================================

enum alert_t { ALERT_ERROR, ALERT_WARN };

static void
UI_AlertMsg(alert_t kind, const char *fmt, va_list &args)
{
    char buff[1000];
    vsnprintf(&buff[0], sizeof(buff), fmt, args);

    wxString info(&buff[0]);
    switch (kind) {
        case ALERT_ERROR: wxLogError("%s", info);   break;
        case ALERT_WARN:  wxLogWarning("%s", info); break;
        default: assert(false); break;
    }
}


void
UI_error(const char *fmt, ...)
{
    va_list args;
    va_start(args, fmt);
    UI_AlertMsg(ALERT_ERROR, fmt, args);
    va_end(args);
}


void
UI_warn(const char *fmt, ...)
{
    va_list args;
    va_start(args, fmt);
    UI_AlertMsg(ALERT_WARN, fmt, args);
    va_end(args);
}


// ========================================================================
// interface between core and UI routines
// ========================================================================

// inform the UI how far along the simulation is in emulated time.
// with no status bar to update, it only shows up in verbose mode.
void
UI_setSimSeconds(unsigned long seconds, float relative_speed)
{
    wxLogVerbose("simulated %lu seconds, %.2fx realtime", seconds, relative_speed);
}

// vim: ts=8:et:sw=4:smarttab
