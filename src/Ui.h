// we don't want any of the core emulator to directly touch any of the
// wx includes or functions.
//
// in the cases where the core needs to talk to the user, we have a
// non-member function that the core can call, and that function is
// just a thunk into the wx logging machinery.

#ifndef _INCLUDE_UI_H_
#define _INCLUDE_UI_H_

#include "m68kemu.h"

// =============================================================
// exported by UI
// =============================================================

// inform the UI how far along the simulation is in emulated time
void UI_setSimSeconds(unsigned long seconds, float relative_speed);

// ---- general status notification ----

// send an error/warning to the user
void UI_error(const char *fmt, ...);
void UI_warn(const char *fmt, ...);

#endif // _INCLUDE_UI_H_

// vim: ts=8:et:sw=4:smarttab
