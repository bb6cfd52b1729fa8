// ======================================================================
// system68k contains the various components of the system:
//    scheduler
//    memory bus
//    cpu
//    config state
//    periodic interrupt source
//
// It is responsible for connecting the various pieces together --
// making sure the world gets built in proper order on start up, that
// configuration changes cause the tear down and rebuild of the world,
// and that things get torn down at the end of the world cleanly.
// ======================================================================

#ifndef _INCLUDE_SYSTEM68K_H_
#define _INCLUDE_SYSTEM68K_H_

#include "m68kemu.h"

class Cpu68000;
class SysCfgState;

// fixed services related to the overall simulation
namespace system68k
{
    // because everything is static, we have to be told when
    // the sim is really starting and ending.
    void initialize();  // Time=0
    void cleanup();     // Armageddon

    // shut down the emulation loop
    void terminate() noexcept;

    // true once terminate() has been called
    bool isTerminating() noexcept;

    // set current system configuration -- may cause a rebuild
    void setConfig(const SysCfgState &new_cfg);

    // give access to components
    const SysCfgState& config() noexcept;
    Cpu68000&  cpu() noexcept;

    // run the hardware reset sequence
    void reset();

    // copy a raw memory image to address 0 and reset the cpu.
    // the image supplies the reset vectors.  returns false on error.
    bool loadImage(const std::string &filename);

    // change the simulation speed
    void regulateCpuSpeed(bool regulated) noexcept;

    // called whenever there is free time.  it returns true
    // if it wants to be called back later when idle again
    bool onIdle();

    // simulate a few ms worth of clocks
    void emulateTimeslice(int ts_ms);  // timeslice in ms

    // run exactly this many cpu clocks, as fast as possible
    void runCycles(uint64 cycles);

};  // namespace system68k

#endif // _INCLUDE_SYSTEM68K_H_

// vim: ts=8:et:sw=4:smarttab
