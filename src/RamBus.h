// RamBus is a flat memory implementation of the 68000 bus interface.
// It is what the verification fixtures, the tests and the command line
// tool run against.  Besides plain RAM, it can
//    + log every bus cycle, stamped with the cycle it completed on
//    + stretch every cycle by a fixed number of wait states
//    + terminate cycles in an address window with BERR
//    + drive the interrupt priority inputs
//    + refuse the bus to the cpu, as if a DMA master had it

#ifndef _INCLUDE_RAMBUS_H_
#define _INCLUDE_RAMBUS_H_

#include "Bus68k.h"

class RamBus : public Bus68k
{
public:
    CANT_ASSIGN_OR_COPY_CLASS(RamBus);

    // size of RAM, starting at address 0, in KB
    explicit RamBus(int ram_kb);
    ~RamBus() override = default;

    // ---- see base class for description of these members: ----
    bus_result_t readByte(uint32 addr, fc_t fc) override;
    bus_result_t readWord(uint32 addr, fc_t fc) override;
    bus_result_t writeByte(uint32 addr, uint8 data, fc_t fc) override;
    bus_result_t writeWord(uint32 addr, uint16 data, fc_t fc) override;
    int          pollIpl() override;
    bus_result_t interruptAck(int level) override;
    void         reset() override;
    bool         cpuOwnsBus() override;

    // ---- direct access, no bus cycle ----
    int   sizeBytes() const noexcept { return static_cast<int>(m_ram.size()); }
    uint8 peek(uint32 addr) const noexcept;
    void  poke(uint32 addr, uint8 value) noexcept;
    uint16 peekWord(uint32 addr) const noexcept;
    void  pokeWord(uint32 addr, uint16 value) noexcept;
    void  pokeLong(uint32 addr, uint32 value) noexcept;
    void  load(uint32 addr, const std::vector<uint8> &image) noexcept;
    void  fill(uint8 value) noexcept;

    // ---- bus cycle log ----
    enum { XACT_READ=1, XACT_WRITE=2, XACT_IACK=3 };
    struct xact_t {
        int    kind;    // XACT_*
        fc_t   fc;      // function code of the cycle
        uint32 addr;    // 24b address
        uint16 data;    // data read or written
        bool   word;    // word cycle (else byte)
        uint64 stamp;   // value of the cycle stamp when the cycle completed
    };
    void enableLog(bool enable) noexcept { m_log_enabled = enable; }
    void clearLog() noexcept { m_log.clear(); }
    const std::vector<xact_t>& log() const noexcept { return m_log; }

    // the owner advances this so logged cycles carry a time
    void setCycleStamp(uint64 stamp) noexcept { m_stamp = stamp; }

    // ---- fault and contention injection ----
    void setWaitCycles(int n) noexcept { m_wait_cycles = n; }
    void setBusErrorWindow(uint32 lo, uint32 hi) noexcept;
    void clearBusErrorWindow() noexcept { m_berr_enabled = false; }
    void setCpuOwnsBus(bool owns) noexcept { m_cpu_owns_bus = owns; }

    // ---- interrupts ----
    void setIpl(int level) noexcept;
    int  getIpl() const noexcept { return m_ipl; }

    // vector returned on IACK; -1 means autovector
    void setIackVector(int vector) noexcept { m_iack_vector = vector; }

    // called with the level whenever the cpu acknowledges an interrupt
    using iack_callback_t = std::function<void(int)>;
    void setIackCallback(const iack_callback_t &cb) { m_iack_cb = cb; }

    // number of times the RESET instruction has pulsed the reset line
    int resetCount() const noexcept { return m_reset_count; }

private:
    bool inBusErrorWindow(uint32 addr) const noexcept;
    void logCycle(int kind, fc_t fc, uint32 addr, uint16 data, bool word);

    std::vector<uint8>   m_ram;            // memory contents
    std::vector<xact_t>  m_log;            // record of bus cycles
    bool                 m_log_enabled  = false;
    uint64               m_stamp        = 0;
    int                  m_wait_cycles  = 0;
    bool                 m_berr_enabled = false;
    uint32               m_berr_lo      = 0;
    uint32               m_berr_hi      = 0;
    bool                 m_cpu_owns_bus = true;
    int                  m_ipl          = 0;
    int                  m_iack_vector  = -1;
    iack_callback_t      m_iack_cb;
    int                  m_reset_count  = 0;
};

#endif // _INCLUDE_RAMBUS_H_

// vim: ts=8:et:sw=4:smarttab
