#ifndef _INCLUDE_COMPILE_OPTIONS_H_
#define _INCLUDE_COMPILE_OPTIONS_H_

// define these switches below to turn various features on and off.
// these should be fairly safe to enable or disable.

// ========================================================================
//  Cpu68000 options
// ========================================================================

// define to 1 to have the cpu check the micro-op queue and exception
// stage bookkeeping on every tick.  it is slow, but it catches
// sequencing bugs close to where they happen.
#define CHECK_UOP_QUEUE 0

// the safety limit on the number of zero-cycle micro-ops drained in
// a single tick.  a well formed instruction never gets close.
#define MAX_INSTANT_OPS 16

// ========================================================================
// miscellaneous
// ========================================================================

// the 68000 drives 24 address lines
#define ADDR_MASK 0x00FFFFFF

// size of the flat memory the fixture runner and command line tool use
#define MAX_RAM_KB 16384

#endif // _INCLUDE_COMPILE_OPTIONS_H_

// vim: ts=8:et:sw=4:smarttab
