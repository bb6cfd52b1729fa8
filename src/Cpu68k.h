// this is class interface for the 68000 CPU

#ifndef _INCLUDE_CPU68K_H_
#define _INCLUDE_CPU68K_H_

#include "m68kemu.h"
#include "Bus68k.h"
#include "Decode68k.h"
#include "MicroOp.h"
#include "Registers68k.h"

// ============================= base class =============================
class Cpu68k
{
public:
    // constructor
    Cpu68k() : m_status(CPU_HALTED) { };

    // destructor
    virtual ~Cpu68k() { };

    // report which type of CPU is in use
    enum { CPUTYPE_68000 };
    virtual int getCpuType() const noexcept = 0;

    // run the hardware reset sequence: the supervisor stack pointer and
    // the program counter are fetched from the first two vectors
    virtual void reset() = 0;

    // indicates if cpu is running, halted by a double fault, or
    // waiting for an interrupt after STOP
    enum { CPU_RUNNING=0, CPU_HALTED=1, CPU_STOPPED=2 };
    int status() const noexcept { return m_status; }

    // advance exactly one clock
    virtual void tick() = 0;

    // number of clocks since the cpu was created
    virtual uint64 totalCycles() const noexcept = 0;

    // read a piece of cpu state by name, eg "d3" or "flags.z".
    // returns false if the name isn't known.
    virtual bool query(const std::string &path, uint64 *val) const = 0;

    // the list of names query() understands
    virtual std::vector<std::string> queryPaths() const = 0;

protected:
    int m_status;  // one of CPU_*
};


// ============================= 68000 cpu =============================

// options copied from the system configuration at construction
struct cpu_cfg_t {
    bool force_cpu;     // run bus cycles even if the bus says it is busy
    bool trace;         // log every instruction to the debug log
};

class Cpu68000: public Cpu68k
{
public:
    CANT_ASSIGN_OR_COPY_CLASS(Cpu68000);
    // ---- see base class for description of these members: ----
    Cpu68000(Bus68k &bus, const cpu_cfg_t &cfg);
    ~Cpu68000() override;
    int    getCpuType() const noexcept override;
    void   reset() override;
    void   tick() override;
    uint64 totalCycles() const noexcept override { return m_cpu.total_cycles; }
    bool   query(const std::string &path, uint64 *val) const override;
    std::vector<std::string> queryPaths() const override;

    // ---- class-specific members: ----

    // direct register access, for tests and loaders
    Registers68k&       regs() noexcept       { return m_regs; }
    const Registers68k& regs() const noexcept { return m_regs; }

    // set a register by query name; only d0-d7, a0-a7, usp, ssp, pc
    // and sr are writable.  returns false if the name isn't writable.
    bool setReg(const std::string &path, uint32 value);

    // write the whole status register, swapping stacks if S changes
    void setSr(uint16 value) noexcept { m_regs.setSr(value); }

    // load the prefetch pipeline directly, as if the previous instruction
    // had just finished.  'ir' is the next opcode to run, 'irc' the word
    // after it; the program counter must already point past both of them.
    void setupPrefetch(uint16 ir, uint16 irc);

    // the opcode in execution
    uint16 ir() const noexcept { return m_cpu.ir; }

    // address of the opcode in execution
    uint32 instrStartPc() const noexcept { return m_cpu.instr_start_pc; }

    // true if the cpu is between instructions, with nothing queued
    bool atBoundary() const noexcept;

    // dump the most important contents of the cpu state to the log
    void dumpState(bool full_dump) const;

private:
    // ---- types ----

    // progress of an operand through its addressing mode
    enum opnd_step_t : uint8 {
        OPND_IDLE = 0,  // nothing done yet
        OPND_HI,        // first of two extension words taken
        OPND_ADDR,      // effective address computed
        OPND_READING,   // read queued, waiting on the data latch
        OPND_LOADED,    // value available
        OPND_STORED     // result write queued
    };

    // an address register modification to back out on an address error
    struct undo_t {
        bool   valid;
        uint8  reg;     // 0-7: An; 8-15: Dn (low word only)
        uint32 value;
    };

    struct operand_t {
        opnd_step_t step;
        uint32      addr;   // effective address
        uint32      value;  // fetched value, or partial extension words
        undo_t      undo;   // (An)+ or -(An) side effect
    };

    // everything one instruction needs while it is in flight
    struct instr_ctx_t {
        instr_t   ins;          // decoded ir
        operand_t src;
        operand_t dst;
        int       stage;        // handler specific sequencing
        uint32    data;         // read latch
        uint32    addr;         // handler scratch address
        uint32    scratch;      // handler scratch value
        int       count;        // handler scratch counter
        int       ext_words;    // extension words consumed so far
        undo_t    sp_undo;      // UNLK, JSR and BSR stack pointer changes
        undo_t    dn_undo;      // DBcc counter
        uint8     move_restore; // MOVE.l flags a write fault takes back
        uint8     move_ccr;
    };

    // how much of MOVE.l's flag update a faulting write undoes
    enum { MOVE_KEEP = 0, MOVE_RESTORE_ALL, MOVE_RESTORE_VC };

    enum exc_stage_t : uint8 {
        EXC_NONE = 0,   // not processing an exception
        EXC_IACK,       // interrupt acknowledge done; build the frame
        EXC_VECTOR,     // vector read; jump to the handler
        EXC_PREFETCH,   // first handler word fetched; start it
        EXC_RESET_SSP,  // reset: initial ssp read
        EXC_RESET_PC    // reset: initial pc read
    };

    struct exc_state_t {
        exc_stage_t stage;
        uint16      old_sr;             // SR before the exception
        uint32      return_pc;          // PC to stack
        int         vector;             // vector number
        uint16      frame_ir;           // group 0 frame words
        uint32      fault_addr;
        uint16      access_info;
        bool        processing_group0;  // a second group 0 fault halts
    };

    // flags for the operand helpers
    enum { EA_NO_PD_DELAY = 0x01 };     // -(An) without its 2 clock penalty

    // ---- member functions ----

    // ---- Cpu68000.cpp: sequencing ----
    void queue(const MicroOp &u);
    void queueFront(const MicroOp &u);
    bool drainInstants();
    void runInstant(const MicroOp &u);
    void advanceTimedOp();
    bool busAddress(const MicroOp &u, uint32 *addr) const noexcept;
    void completeTimedOp(const MicroOp &u);
    void startNextInstruction();
    void beginInstruction();
    void resetContext() noexcept;
    void invariantFailure(const char *what) const;
#if CHECK_UOP_QUEUE
    void checkState() const;
#endif

    // ---- Cpu68000.cpp: prefetch ----
    uint16 consumeIrc();
    uint16 consumeIrcDeferred() noexcept;
    bool   extWordReady();
    void   jumpTo(uint32 target);
    uint32 nextInstrPc() const noexcept;

    // ---- Cpu68000_ea.cpp ----
    uint32 indexAddress(uint32 base, uint16 ext) const noexcept;
    bool   computeAddress(operand_t &o, const ea_t &ea, int size, int flags = 0);
    bool   loadOperand(operand_t &o, const ea_t &ea, int size, uint32 *val, int flags = 0);
    bool   storeOperand(operand_t &o, const ea_t &ea, int size, uint32 val, int flags = 0);
    bool   controlTarget(uint32 *target);
    void   queueRead(uint32 addr, int size, bool program = false);
    void   queueWrite(uint32 addr, int size, uint32 value);
    uint32 regByIndex(int n) const noexcept;

    // ---- Cpu68000_exec.cpp ----
    void execute();
    bool privileged();
    void execImmToSr();
    void execImmediate();
    void execBitOp();
    void execMovep();
    void execMove();
    void saveMoveFlags(uint32 v, int size) noexcept;
    void execMoveSr();
    void execMovem();
    void execSingle();
    void execProgramControl();
    void execJump();
    void execBranch();
    void execCondition();
    void execQuick();
    void execArith();
    void execAddress();
    void execExtended();
    void execMulDiv();
    void execShift();

    // ---- Cpu68000_except.cpp ----
    void exception(int vector, uint32 return_pc, int extra_internal = 0);
    void group0(int vector, uop_t op, uint32 addr, bool read, bool program);
    uint32 group0FramePc(uop_t op, uint32 addr, bool read, bool program) const noexcept;
    void interrupt(int level);
    void exceptionStep();
    void queueVectorFetch(int vector);
    void applyUndo(const undo_t &u) noexcept;

    // ---- data members ----

    Bus68k          &m_bus;     // everything outside the cpu
    const cpu_cfg_t  m_cfg;     // configuration options
    Registers68k     m_regs;    // programmer visible registers
    MicroOpQueue     m_queue;   // pending micro-ops
    instr_ctx_t      m_ctx;     // instruction in flight
    exc_state_t      m_exc;     // exception in flight

    // pipeline and sequencing state
    struct cpu68000_t {
        uint16  ir;             // opcode in execution
        uint16  irc;            // prefetched word following ir
        uint32  irc_addr;       // address irc was fetched from
        uint32  instr_start_pc; // address of the opcode in ir
        bool    irc_pending;    // irc has been consumed but not refilled
        bool    trace_pending;  // current instruction started with T set
        int     op_cycles;      // clocks spent on the front timed op
        int     wait_debt;      // wait states still owed to the bus
        uint64  total_cycles;   // clocks since creation
    } m_cpu;
};

#endif // _INCLUDE_CPU68K_H_

// vim: ts=8:et:sw=4:smarttab
