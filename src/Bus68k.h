// This is the interface between the 68000 core and the machine around it.
//
// The cpu never touches memory directly.  Every access is a call through
// this interface, tagged with the function code the real chip drives on
// FC2..FC0 during that bus cycle.  Each access returns the data (for reads),
// the number of extra clocks the bus wants to stretch the cycle by, and
// whether the cycle was terminated by BERR.
//
// The machine also supplies the interrupt priority inputs (IPL2..IPL0),
// answers interrupt acknowledge cycles, and is told when the RESET
// instruction pulses the reset line.

#ifndef _INCLUDE_BUS68K_H_
#define _INCLUDE_BUS68K_H_

#include "m68kemu.h"

// function codes, as driven on FC2..FC0
enum fc_t : uint8 {
    FC_USER_DATA          = 1,
    FC_USER_PROGRAM       = 2,
    FC_SUPERVISOR_DATA    = 5,
    FC_SUPERVISOR_PROGRAM = 6,
    FC_INTERRUPT_ACK      = 7
};

// pick the function code for an access given the S bit and address space
inline fc_t
makeFc(bool supervisor, bool program) noexcept
{
    if (supervisor) {
        return (program) ? FC_SUPERVISOR_PROGRAM : FC_SUPERVISOR_DATA;
    }
    return (program) ? FC_USER_PROGRAM : FC_USER_DATA;
}

// what comes back from one bus cycle
struct bus_result_t {
    uint16 data;        // read data; don't care for writes
    uint8  wait_cycles; // extra clocks before the cycle completes
    bool   bus_error;   // BERR terminated the cycle
};

inline bus_result_t
busOk(uint16 data = 0, int wait_cycles = 0) noexcept
{
    return { data, static_cast<uint8>(wait_cycles), false };
}

inline bus_result_t
busFault() noexcept
{
    return { 0xFFFF, 0, true };
}

class Bus68k
{
public:
    Bus68k() = default;
    virtual ~Bus68k() = default;

    // addresses are 24b; word accesses are always even
    virtual bus_result_t readByte(uint32 addr, fc_t fc) = 0;
    virtual bus_result_t readWord(uint32 addr, fc_t fc) = 0;
    virtual bus_result_t writeByte(uint32 addr, uint8 data, fc_t fc) = 0;
    virtual bus_result_t writeWord(uint32 addr, uint16 data, fc_t fc) = 0;

    // current interrupt priority level, 0=none, 7=non-maskable
    virtual int pollIpl() { return 0; }

    // interrupt acknowledge cycle for the given level.  returns the vector
    // number.  the default acts like VPA was asserted (autovector).
    virtual bus_result_t interruptAck(int level)
        { return busOk(static_cast<uint16>(24 + level)); }

    // the RESET instruction asserts the reset line for the peripherals
    virtual void reset() { }

    // false while some other master (eg, DMA) owns the bus.  the cpu
    // stalls its bus cycles until it gets the bus back.
    virtual bool cpuOwnsBus() { return true; }
};

#endif // _INCLUDE_BUS68K_H_

// vim: ts=8:et:sw=4:smarttab
