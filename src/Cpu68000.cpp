// emulate the Motorola 68000, one clock at a time
//
// Every instruction is broken into micro-ops (see MicroOp.h).  tick() runs
// any zero-time ops at the head of the queue, then advances the first timed
// op by one clock.  When the queue runs dry the next instruction starts.
//
// An instruction starts by copying IRC to IR and queuing a refill of IRC
// followed by an EXECUTE.  The EXECUTE runs the handler for the decoded
// operation, which queues more bus cycles and, if it needs their results,
// another EXECUTE.  Handlers are re-entrant: each time an EXECUTE comes up
// the handler runs again from the top, and the operand helpers return the
// results of steps that have already completed.
//
// The refill of IRC at the start of an instruction is really the last
// prefetch of the one before it, so the cycle counts reported by the
// manual are the distance between consecutive instruction starts.

#include "Cpu68k.h"
#include "Ui.h"
#include "host.h"       // for dbglog()

// ------------------------------------------------------------------------
//  construction and reset
// ------------------------------------------------------------------------

Cpu68000::Cpu68000(Bus68k &bus, const cpu_cfg_t &cfg) :
    m_bus(bus),
    m_cfg(cfg)
{
    m_cpu.ir             = 0x4E71;      // NOP
    m_cpu.irc            = 0x4E71;
    m_cpu.irc_addr       = 0;
    m_cpu.instr_start_pc = 0;
    m_cpu.irc_pending    = false;
    m_cpu.trace_pending  = false;
    m_cpu.op_cycles      = 0;
    m_cpu.wait_debt      = 0;
    m_cpu.total_cycles   = 0;

    m_exc = exc_state_t();
    m_exc.stage = EXC_NONE;
    resetContext();
}


Cpu68000::~Cpu68000()
{
}


int
Cpu68000::getCpuType() const noexcept
{
    return CPUTYPE_68000;
}


// the reset sequence reads the initial ssp from vector 0 and the initial
// pc from vector 1, then fills the prefetch pipeline.  the data registers
// and the other address registers keep whatever they held.
void
Cpu68000::reset()
{
    m_queue.clear();
    resetContext();
    m_exc = exc_state_t();

    m_cpu.op_cycles     = 0;
    m_cpu.wait_debt     = 0;
    m_cpu.irc_pending   = true;
    m_cpu.trace_pending = false;

    m_regs.setSr(SR_S | SR_INT_MASK);
    m_status = CPU_RUNNING;

    queue(uopRead(uop_t::READ_LONG_HI, 0, true));
    queue(uopRead(uop_t::READ_LONG_LO, 2, true));
    queue(uop(uop_t::EXECUTE));
    queue(uopRead(uop_t::READ_LONG_HI, 4, true));
    queue(uopRead(uop_t::READ_LONG_LO, 6, true));
    queue(uop(uop_t::EXECUTE));
    m_exc.stage = EXC_RESET_SSP;
}


void
Cpu68000::setupPrefetch(uint16 ir, uint16 irc)
{
    m_queue.clear();
    m_exc = exc_state_t();

    m_cpu.ir             = ir;
    m_cpu.irc            = irc;
    m_cpu.irc_addr       = m_regs.pc - 2;
    m_cpu.instr_start_pc = m_regs.pc - 4;
    m_cpu.irc_pending    = false;
    m_cpu.trace_pending  = m_regs.trace();
    m_cpu.op_cycles      = 0;
    m_cpu.wait_debt      = 0;

    resetContext();
    queue(uop(uop_t::EXECUTE));
    m_status = CPU_RUNNING;
}


void
Cpu68000::resetContext() noexcept
{
    m_ctx = instr_ctx_t();
    m_ctx.ins = decode(m_cpu.ir);
}


bool
Cpu68000::atBoundary() const noexcept
{
    return m_queue.empty() && (m_exc.stage == EXC_NONE);
}

// ------------------------------------------------------------------------
//  queue management
// ------------------------------------------------------------------------

void
Cpu68000::queue(const MicroOp &u)
{
    if (!m_queue.push(u)) {
        invariantFailure("micro-op queue overflow");
    }
}


void
Cpu68000::queueFront(const MicroOp &u)
{
    if (!m_queue.pushFront(u)) {
        invariantFailure("micro-op queue overflow");
    }
}


// these can't happen from any opcode sequence; they mean the sequencing
// logic itself is broken, and there is no sane way to carry on.
void
Cpu68000::invariantFailure(const char *what) const
{
    dumpState(true);
    UI_error("Cpu68000 internal error: %s\n"
             "opcode=%04X at PC=%06X, cycle %llu",
             what, m_cpu.ir, m_cpu.instr_start_pc,
             static_cast<unsigned long long>(m_cpu.total_cycles));
    exit(-1);
}


#if CHECK_UOP_QUEUE
void
Cpu68000::checkState() const
{
    if (m_queue.size() > MicroOpQueue::CAPACITY) {
        invariantFailure("micro-op queue count out of range");
    }
    if (!m_queue.empty() && m_cpu.op_cycles >= uopCycles(m_queue.front())
                         && m_cpu.op_cycles > 0) {
        invariantFailure("timed op ran past its cost");
    }
    if (m_exc.stage > EXC_RESET_PC) {
        invariantFailure("corrupt exception stage");
    }
}
#endif

// ------------------------------------------------------------------------
//  the clock
// ------------------------------------------------------------------------

void
Cpu68000::tick()
{
    // a halted chip does nothing at all until reset
    if (m_status == CPU_HALTED) {
        return;
    }

    m_cpu.total_cycles++;

#if CHECK_UOP_QUEUE
    checkState();
#endif

    if (m_status == CPU_STOPPED) {
        const int ipl = m_bus.pollIpl();
        if ((ipl > m_regs.intMask()) || (ipl == 7)) {
            m_status = CPU_RUNNING;
        } else {
            return;
        }
    }

    if (m_cpu.wait_debt > 0) {
        m_cpu.wait_debt--;
        return;
    }

    if (!drainInstants()) {
        return;
    }

    if (m_queue.empty()) {
        startNextInstruction();
        if (!drainInstants()) {
            return;
        }
    }

    if (!m_queue.empty()) {
        advanceTimedOp();
    }
}


// run zero-time ops at the head of the queue.
// returns false if the cpu stopped running.
bool
Cpu68000::drainInstants()
{
    int n = 0;
    while (!m_queue.empty() && uopIsInstant(m_queue.front())) {
        if (++n > MAX_INSTANT_OPS) {
            invariantFailure("runaway zero-time micro-ops");
        }
        const MicroOp u = m_queue.front();
        (void)m_queue.pop();
        runInstant(u);
        if (m_status != CPU_RUNNING) {
            return false;
        }
    }
    return true;
}


void
Cpu68000::runInstant(const MicroOp &u)
{
    switch (u.op) {
        case uop_t::EXECUTE:
            if (m_exc.stage != EXC_NONE) {
                exceptionStep();
            } else {
                execute();
            }
            break;
        case uop_t::ASSERT_RESET:
            m_bus.reset();
            break;
        case uop_t::INTERNAL:
            break;      // zero length delay
        default:
            invariantFailure("timed micro-op run as instant");
            break;
    }
}


// the address a bus op will drive, for the odd address check.
// returns false for ops that can't take an address error.
bool
Cpu68000::busAddress(const MicroOp &u, uint32 *addr) const noexcept
{
    const uint32 sp = m_regs.a[7];
    switch (u.op) {
        case uop_t::FETCH_IRC:     *addr = m_regs.pc; return true;
        case uop_t::READ_WORD:
        case uop_t::READ_LONG_HI:
        case uop_t::READ_LONG_LO:
        case uop_t::WRITE_WORD:
        case uop_t::WRITE_LONG_HI:
        case uop_t::WRITE_LONG_LO: *addr = u.addr;   return true;
        case uop_t::PUSH_WORD:     *addr = sp - 2;   return true;
        case uop_t::PUSH_LONG_HI:  *addr = sp - 4;   return true;
        case uop_t::PUSH_LONG_LO:  *addr = sp + 2;   return true;
        case uop_t::POP_WORD:
        case uop_t::POP_LONG_HI:   *addr = sp;       return true;
        case uop_t::POP_LONG_LO:   *addr = sp + 2;   return true;
        default:                   break;
    }
    return false;
}


void
Cpu68000::advanceTimedOp()
{
    const MicroOp &front = m_queue.front();

    if (uopIsBusCycle(front)) {
        if (!m_cfg.force_cpu && !m_bus.cpuOwnsBus()) {
            return;     // some other master has the bus
        }
        uint32 addr = 0;
        if ((m_cpu.op_cycles == 0) && busAddress(front, &addr) && (addr & 1)) {
            const bool read = (front.op == uop_t::FETCH_IRC)
                           || (front.op == uop_t::READ_WORD)
                           || (front.op == uop_t::READ_LONG_HI)
                           || (front.op == uop_t::READ_LONG_LO)
                           || (front.op == uop_t::POP_WORD)
                           || (front.op == uop_t::POP_LONG_HI)
                           || (front.op == uop_t::POP_LONG_LO);
            const bool program = (front.op == uop_t::FETCH_IRC)
                              || ((front.flags & UOP_PROGRAM) != 0);
            group0(3, front.op, addr, read, program);
            return;
        }
    }

    m_cpu.op_cycles++;
    if (m_cpu.op_cycles < uopCycles(front)) {
        return;
    }

    const MicroOp done = front;
    (void)m_queue.pop();
    m_cpu.op_cycles = 0;
    completeTimedOp(done);

    // exception and reset sequences chain straight into their next stage
    if ((m_status == CPU_RUNNING) && (m_exc.stage != EXC_NONE)) {
        (void)drainInstants();
    }
}


// perform the side effect of a timed op on its final clock
void
Cpu68000::completeTimedOp(const MicroOp &u)
{
    const bool super   = m_regs.supervisor();
    const fc_t data_fc = makeFc(super, (u.flags & UOP_PROGRAM) != 0);
    bus_result_t r     = busOk();
    uint32 fault_addr  = u.addr;
    bool   read        = true;

    switch (u.op) {

    case uop_t::FETCH_IRC:
        fault_addr = m_regs.pc;
        r = m_bus.readWord(m_regs.pc & ADDR_MASK, makeFc(super, true));
        if (!r.bus_error) {
            m_cpu.irc         = r.data;
            m_cpu.irc_addr    = m_regs.pc;
            m_cpu.irc_pending = false;
            m_regs.pc += 2;
        }
        break;

    case uop_t::READ_BYTE:
        r = m_bus.readByte(u.addr & ADDR_MASK, data_fc);
        m_ctx.data = r.data & 0xFF;
        break;

    case uop_t::READ_WORD:
        r = m_bus.readWord(u.addr & ADDR_MASK, data_fc);
        m_ctx.data = r.data;
        break;

    case uop_t::READ_LONG_HI:
        r = m_bus.readWord(u.addr & ADDR_MASK, data_fc);
        m_ctx.data = (static_cast<uint32>(r.data) << 16) | (m_ctx.data & 0xFFFF);
        break;

    case uop_t::READ_LONG_LO:
        r = m_bus.readWord(u.addr & ADDR_MASK, data_fc);
        m_ctx.data = (m_ctx.data & 0xFFFF0000) | r.data;
        break;

    case uop_t::WRITE_BYTE:
        read = false;
        r = m_bus.writeByte(u.addr & ADDR_MASK, static_cast<uint8>(u.data), data_fc);
        break;

    case uop_t::WRITE_WORD:
        read = false;
        r = m_bus.writeWord(u.addr & ADDR_MASK, static_cast<uint16>(u.data), data_fc);
        break;

    case uop_t::WRITE_LONG_HI:
        read = false;
        r = m_bus.writeWord(u.addr & ADDR_MASK, static_cast<uint16>(u.data >> 16), data_fc);
        break;

    case uop_t::WRITE_LONG_LO:
        read = false;
        r = m_bus.writeWord(u.addr & ADDR_MASK, static_cast<uint16>(u.data), data_fc);
        break;

    case uop_t::PUSH_WORD:
        read = false;
        m_regs.a[7] -= 2;
        fault_addr = m_regs.a[7];
        r = m_bus.writeWord(m_regs.a[7] & ADDR_MASK, static_cast<uint16>(u.data), data_fc);
        break;

    case uop_t::PUSH_LONG_HI:
        read = false;
        m_regs.a[7] -= 4;
        fault_addr = m_regs.a[7];
        r = m_bus.writeWord(m_regs.a[7] & ADDR_MASK, static_cast<uint16>(u.data >> 16), data_fc);
        break;

    case uop_t::PUSH_LONG_LO:
        read = false;
        fault_addr = m_regs.a[7] + 2;
        r = m_bus.writeWord(fault_addr & ADDR_MASK, static_cast<uint16>(u.data), data_fc);
        break;

    case uop_t::POP_WORD:
        fault_addr = m_regs.a[7];
        r = m_bus.readWord(m_regs.a[7] & ADDR_MASK, data_fc);
        m_ctx.data = r.data;
        m_regs.a[7] += 2;
        break;

    case uop_t::POP_LONG_HI:
        fault_addr = m_regs.a[7];
        r = m_bus.readWord(m_regs.a[7] & ADDR_MASK, data_fc);
        m_ctx.data = (static_cast<uint32>(r.data) << 16) | (m_ctx.data & 0xFFFF);
        break;

    case uop_t::POP_LONG_LO:
        fault_addr = m_regs.a[7] + 2;
        r = m_bus.readWord(fault_addr & ADDR_MASK, data_fc);
        m_ctx.data = (m_ctx.data & 0xFFFF0000) | r.data;
        m_regs.a[7] += 4;
        break;

    case uop_t::IACK:
        r = m_bus.interruptAck(static_cast<int>(u.data));
        if (r.bus_error) {
            // nobody answered: spurious interrupt
            r.bus_error = false;
            r.data = 24;
        }
        m_ctx.data = r.data & 0xFF;
        break;

    case uop_t::INTERNAL:
        return;

    default:
        invariantFailure("instant micro-op reached the bus");
        return;
    }

    if (r.bus_error) {
        const bool program = (u.op == uop_t::FETCH_IRC)
                          || ((u.flags & UOP_PROGRAM) != 0);
        group0(2, u.op, fault_addr, read, program);
        return;
    }

    m_cpu.wait_debt = r.wait_cycles;
}

// ------------------------------------------------------------------------
//  instruction boundaries
// ------------------------------------------------------------------------

// the queue is empty: take a pending trace, then a pending interrupt,
// and otherwise start the instruction sitting in irc
void
Cpu68000::startNextInstruction()
{
    if (m_cpu.trace_pending) {
        m_cpu.trace_pending = false;
        exception(9, m_cpu.irc_addr);
        return;
    }

    const int ipl = m_bus.pollIpl();
    if ((ipl > m_regs.intMask()) || (ipl == 7)) {
        interrupt(ipl);
        return;
    }

    beginInstruction();
}


void
Cpu68000::beginInstruction()
{
    m_cpu.ir             = m_cpu.irc;
    m_cpu.instr_start_pc = m_cpu.irc_addr;
    m_cpu.irc_pending    = true;
    m_cpu.trace_pending  = m_regs.trace();
    resetContext();

    if (m_cfg.trace) {
        dbglog("%10llu: %06X %04X  %s\n",
               static_cast<unsigned long long>(m_cpu.total_cycles),
               m_cpu.instr_start_pc, m_cpu.ir, opName(m_ctx.ins.op));
    }

    queue(uop(uop_t::FETCH_IRC));
    queue(uop(uop_t::EXECUTE));
}

// ------------------------------------------------------------------------
//  prefetch
// ------------------------------------------------------------------------

// take the extension word in irc and queue its refill ahead of anything
// else.  the caller must have checked extWordReady().
uint16
Cpu68000::consumeIrc()
{
    assert(!m_cpu.irc_pending);
    const uint16 w = m_cpu.irc;
    m_ctx.ext_words++;
    m_cpu.irc_pending = true;
    queueFront(uop(uop_t::FETCH_IRC));
    return w;
}


// take the extension word without a refill; the instruction is about to
// reload the pipeline from a new address anyway
uint16
Cpu68000::consumeIrcDeferred() noexcept
{
    assert(!m_cpu.irc_pending);
    m_ctx.ext_words++;
    m_cpu.irc_pending = true;
    return m_cpu.irc;
}


// if irc still waits on its refill, queue a continuation and return false
bool
Cpu68000::extWordReady()
{
    if (!m_cpu.irc_pending) {
        return true;
    }
    queue(uop(uop_t::EXECUTE));
    return false;
}


void
Cpu68000::jumpTo(uint32 target)
{
    m_regs.pc = target;
    m_cpu.irc_pending = true;
    queue(uop(uop_t::FETCH_IRC));
}


// address of the instruction following the current one
uint32
Cpu68000::nextInstrPc() const noexcept
{
    return m_cpu.instr_start_pc + 2 + 2*m_ctx.ext_words;
}

// ------------------------------------------------------------------------
//  debug access
// ------------------------------------------------------------------------

static const char * const query_names[] = {
    "d0", "d1", "d2", "d3", "d4", "d5", "d6", "d7",
    "a0", "a1", "a2", "a3", "a4", "a5", "a6", "a7",
    "usp", "ssp", "pc", "sr", "ccr",
    "flags.x", "flags.n", "flags.z", "flags.v", "flags.c",
    "flags.s", "flags.t",
    "int_mask", "halted", "stopped", "cycles", "opcode"
};


std::vector<std::string>
Cpu68000::queryPaths() const
{
    std::vector<std::string> rv;
    for (auto name : query_names) {
        rv.push_back(name);
    }
    return rv;
}


// "pc" is the prefetch address, which runs four bytes ahead of the
// opcode in execution between instructions
bool
Cpu68000::query(const std::string &path, uint64 *val) const
{
    assert(val != nullptr);

    if (path.size() == 2 && (path[0] == 'd' || path[0] == 'a')
                         && path[1] >= '0' && path[1] <= '7') {
        const int n = path[1] - '0';
        *val = (path[0] == 'd') ? m_regs.d[n] : m_regs.a[n];
        return true;
    }

    if (path == "usp")      { *val = m_regs.usp();                    return true; }
    if (path == "ssp")      { *val = m_regs.ssp();                    return true; }
    if (path == "pc")       { *val = m_regs.pc;                       return true; }
    if (path == "sr")       { *val = m_regs.sr();                     return true; }
    if (path == "ccr")      { *val = m_regs.ccr();                    return true; }
    if (path == "flags.x")  { *val = m_regs.flag(SR_X) ? 1 : 0;       return true; }
    if (path == "flags.n")  { *val = m_regs.flag(SR_N) ? 1 : 0;       return true; }
    if (path == "flags.z")  { *val = m_regs.flag(SR_Z) ? 1 : 0;       return true; }
    if (path == "flags.v")  { *val = m_regs.flag(SR_V) ? 1 : 0;       return true; }
    if (path == "flags.c")  { *val = m_regs.flag(SR_C) ? 1 : 0;       return true; }
    if (path == "flags.s")  { *val = m_regs.supervisor() ? 1 : 0;     return true; }
    if (path == "flags.t")  { *val = m_regs.trace() ? 1 : 0;          return true; }
    if (path == "int_mask") { *val = m_regs.intMask();                return true; }
    if (path == "halted")   { *val = (m_status == CPU_HALTED)  ? 1 : 0; return true; }
    if (path == "stopped")  { *val = (m_status == CPU_STOPPED) ? 1 : 0; return true; }
    if (path == "cycles")   { *val = m_cpu.total_cycles;              return true; }
    if (path == "opcode")   { *val = m_cpu.ir;                        return true; }

    return false;
}


bool
Cpu68000::setReg(const std::string &path, uint32 value)
{
    if (path.size() == 2 && (path[0] == 'd' || path[0] == 'a')
                         && path[1] >= '0' && path[1] <= '7') {
        const int n = path[1] - '0';
        if (path[0] == 'd') {
            m_regs.d[n] = value;
        } else {
            m_regs.a[n] = value;
        }
        return true;
    }

    if (path == "usp") { m_regs.setUsp(value);                       return true; }
    if (path == "ssp") { m_regs.setSsp(value);                       return true; }
    if (path == "pc")  { m_regs.pc = value;                          return true; }
    if (path == "sr")  { m_regs.setSr(static_cast<uint16>(value));   return true; }

    return false;
}


void
Cpu68000::dumpState(bool full_dump) const
{
    if (full_dump) {
        dbglog("---------------------------------------------\n");
    }

    dbglog("pc=%06X, ir=%04X, irc=%04X, sr=%04X, status=%d, cycle=%llu\n",
           m_regs.pc, m_cpu.ir, m_cpu.irc, m_regs.sr(), m_status,
           static_cast<unsigned long long>(m_cpu.total_cycles));
    if (!full_dump) {
        return;
    }

    dbglog("D0=%08X, D1=%08X, D2=%08X, D3=%08X\n",
            m_regs.d[0], m_regs.d[1], m_regs.d[2], m_regs.d[3]);
    dbglog("D4=%08X, D5=%08X, D6=%08X, D7=%08X\n",
            m_regs.d[4], m_regs.d[5], m_regs.d[6], m_regs.d[7]);
    dbglog("A0=%08X, A1=%08X, A2=%08X, A3=%08X\n",
            m_regs.a[0], m_regs.a[1], m_regs.a[2], m_regs.a[3]);
    dbglog("A4=%08X, A5=%08X, A6=%08X, A7=%08X\n",
            m_regs.a[4], m_regs.a[5], m_regs.a[6], m_regs.a[7]);
    dbglog("USP=%08X, SSP=%08X, instr start=%06X, irc addr=%06X\n",
            m_regs.usp(), m_regs.ssp(), m_cpu.instr_start_pc, m_cpu.irc_addr);
    dbglog("op=%s, stage=%d, exc stage=%d, wait=%d\n",
            opName(m_ctx.ins.op), m_ctx.stage, m_exc.stage, m_cpu.wait_debt);
    dbglog("queue depth=%d\n", m_queue.size());
    if (!m_queue.empty()) {
        const int todo = (m_queue.size() > 8) ? 8 : m_queue.size();
        dbglog("    next: ");
        for (int i=0; i < todo; i++) {
            dbglog("%s ", uopName(m_queue.at(i).op));
        }
        dbglog("\n");
    }
    dbglog("---------------------------------------------\n");
}

// vim: ts=8:et:sw=4:smarttab
