// exception processing for the 68000
//
// Group 1 and 2 exceptions (traps, illegal opcodes, privilege violations,
// trace, interrupts) stack a six byte frame: the return PC and the SR.
// Group 0 exceptions (bus and address errors) stack a fourteen byte frame
// which adds the opcode, the faulting address and an access information
// word.  Either way the handler address comes from the vector table in
// supervisor data space.
//
// A frame is pushed in one go since the push micro-ops carry their data.
// After that, exceptionStep() walks m_exc.stage through the vector fetch
// and the first prefetch of the handler.

#include "Cpu68k.h"
#include "host.h"       // for dbglog()

#include <algorithm>

void
Cpu68000::exception(int vector, uint32 return_pc, int extra_internal)
{
    assert(vector >= 2 && vector < 256);

    const uint16 old_sr = m_regs.sr();
    m_regs.setSr((old_sr | SR_S) & ~SR_T);
    m_cpu.trace_pending = false;

    m_queue.clear();
    m_cpu.op_cycles = 0;

    m_exc.old_sr    = old_sr;
    m_exc.return_pc = return_pc;

    // zero divide and CHK spend longer before stacking
    const int delay = ((vector == 5 || vector == 6) ? 10 : 6) + extra_internal;
    queue(uopInternal(delay));
    queue(uop(uop_t::PUSH_LONG_HI, return_pc));
    queue(uop(uop_t::PUSH_LONG_LO, return_pc));
    queue(uop(uop_t::PUSH_WORD, old_sr));
    queueVectorFetch(vector);
}


// extension words following the opcode for an addressing mode
static int
extWords(const ea_t &ea, int size) noexcept
{
    switch (ea.mode) {
        case EA_D16:
        case EA_IDX:
        case EA_ABS_W:
        case EA_PC_D16:
        case EA_PC_IDX:
            return 1;
        case EA_ABS_L:
            return 2;
        case EA_IMM:
            return (size == 4) ? 2 : 1;
        default:
            return 0;
    }
}


// same, from the raw mode/reg fields of a control or MOVEM operand
static int
extWords(int mode, int reg) noexcept
{
    if (mode == 5 || mode == 6) {
        return 1;
    }
    if (mode == 7) {
        if (reg == 1) {
            return 2;
        }
        return (reg == 0 || reg == 2 || reg == 3) ? 1 : 0;
    }
    return 0;
}


// size of the data access an opcode makes
static int
accessSize(uint16 ir) noexcept
{
    const int top = ir >> 12;
    const int opmode = (ir >> 6) & 7;
    auto std_size = [ir]() {
        switch ((ir >> 6) & 3) {
            case 0:  return 1;
            case 2:  return 4;
            default: return 2;
        }
    };

    switch (top) {
        case 0x0: case 0x5: case 0xE:
            return std_size();
        case 0x4:
            if ((ir & 0xFB80) == 0x4880) {
                return (ir & 0x0040) ? 4 : 2;   // MOVEM
            }
            if (opmode == 6) {
                return 2;                       // CHK
            }
            return std_size();
        case 0x8: case 0x9: case 0xB: case 0xC: case 0xD:
            switch (opmode) {
                case 0: case 4: return 1;
                case 2: case 6: return 4;
                case 7:         return (top == 0x8 || top == 0xC) ? 2 : 4;
                default:        return 2;
            }
        default:
            return 2;
    }
}


// the PC stacked by an address or bus error depends on how far the
// prefetch pipeline got before the faulting cycle
uint32
Cpu68000::group0FramePc(uop_t op, uint32 addr, bool read, bool program) const noexcept
{
    const uint16 ir  = m_cpu.ir;
    const uint32 isp = m_cpu.instr_start_pc;
    const int    top = ir >> 12;
    const instr_t &ins = m_ctx.ins;

    if (top >= 1 && top <= 3) {
        const int src_ext = extWords(ins.src, ins.size);
        if (read) {
            if (ins.src.mode == EA_ABS_W || ins.src.mode == EA_ABS_L) {
                return isp + 2 + 2*src_ext;
            }
            if (ins.src.mode == EA_PD) {
                return isp + ((ins.size == 4) ? 2 : 4);
            }
            return isp + 2;
        }
        const bool src_reg = (ins.src.mode == EA_DN) || (ins.src.mode == EA_AN)
                          || (ins.src.mode == EA_IMM);
        if (src_reg) {
            const int dst_ext = extWords(ins.dst, ins.size);
            return isp + 4 + 2*(src_ext + std::max(dst_ext - 1, 0));
        }
        return isp + 4 + 2*src_ext;
    }

    const int  ea_mode = (ir >> 3) & 7;
    const int  ea_reg  = ir & 7;
    const bool movem   = (ir & 0xFB80) == 0x4880;

    // a branch to an odd target; BSR alone reports the target
    if (op == uop_t::FETCH_IRC && top == 0x6) {
        return (((ir >> 8) & 0xF) == 1) ? addr : isp + 2;
    }

    if (program && !movem) {
        switch (top) {
            case 0x5:
                return isp + ((ea_mode == 1) ? 4 : 2);          // DBcc
            case 0x6:
                return isp + (((ir & 0xFF) == 0) ? 4 : 2);
            default:
                if ((ir & 0xFFC0) == 0x4E80) {                  // JSR
                    return isp + 2 + 2*extWords(ea_mode, ea_reg);
                }
                return isp + 2;
        }
    }

    // ADDX, SUBX, CMPM memory forms
    if (top == 0x9 || top == 0xB || top == 0xD) {
        const int opmode = (ir >> 6) & 7;
        if (opmode >= 4 && opmode <= 6 && ea_mode == 1) {
            return isp + 4;
        }
    }

    if ((ir & 0xFFF8) == 0x4E58) {                              // UNLK
        return isp + 4;
    }

    if (movem) {
        return isp + 6 + 2*extWords(ea_mode, ea_reg);
    }

    uint32 pc = isp + 2;
    if (ea_mode == 4 && accessSize(ir) == 2) {
        pc += 2;
    }
    if (ea_mode == 7 && ea_reg == 0) {
        pc += 2;
    } else if (ea_mode == 7 && ea_reg == 1) {
        pc += 4;
    }
    if (top == 0x0) {
        // immediate data, or the bit number of a static bit op
        const bool long_imm = (((ir >> 8) & 0xF) != 8) && (((ir >> 6) & 3) == 2);
        pc += (long_imm) ? 4 : 2;
    }
    return pc;
}


// 'op' is the micro-op whose bus cycle failed; 'read' and 'program'
// describe that access
void
Cpu68000::group0(int vector, uop_t op, uint32 addr, bool read, bool program)
{
    if (m_exc.processing_group0) {
        // double fault: the real chip stops dead until reset
        m_queue.clear();
        m_cpu.op_cycles = 0;
        m_status = CPU_HALTED;
        dbglog("Cpu68000: double bus fault at %06X, cpu halted\n", addr & ADDR_MASK);
        return;
    }

    const bool in_instruction = (m_exc.stage == EXC_NONE);
    const instr_t &ins = m_ctx.ins;

    // outside an instruction only the handler fetch can fault
    uint32 frame_pc = (op == uop_t::FETCH_IRC) ? addr : m_exc.return_pc;
    if (in_instruction) {
        // back out register side effects of the aborted instruction.
        // CHK keeps its predecrement.
        if (ins.op != op_t::CHK) {
            applyUndo(m_ctx.src.undo);
        }
        applyUndo(m_ctx.dst.undo);
        applyUndo(m_ctx.sp_undo);
        if (read) {
            applyUndo(m_ctx.dn_undo);
        }

        // MOVE.l updates the flags in steps; an aborted write stacks
        // whatever part of the update had happened
        if (!read && ins.op == op_t::MOVE) {
            if (m_ctx.move_restore == MOVE_RESTORE_ALL) {
                m_regs.setCcr(m_ctx.move_ccr);
            } else if (m_ctx.move_restore == MOVE_RESTORE_VC) {
                m_regs.setCcr(static_cast<uint8>((m_regs.ccr() & ~(SR_V | SR_C))
                                               | (m_ctx.move_ccr & (SR_V | SR_C))));
            }
        }

        // a long -(An) access starts with the low word, so that is the
        // address reported
        const bool move_pd_long = ins.op == op_t::MOVE && ins.size == 4
                               && ins.dst.mode == EA_PD && op == uop_t::WRITE_LONG_HI;
        const bool addx_long    = (ins.op == op_t::ADDX || ins.op == op_t::SUBX)
                               && ins.dir && ins.size == 4 && op == uop_t::READ_LONG_HI;
        if (move_pd_long || addx_long) {
            addr += 2;
        }

        frame_pc = group0FramePc(op, addr, read, program);
    }

    // MOVE.w to -(An) has already advanced the pipeline when it writes
    const bool move_pd = (m_cpu.ir >> 12) >= 1 && (m_cpu.ir >> 12) <= 3
                      && ((m_cpu.ir >> 6) & 7) == 4;
    const uint16 frame_ir = (!read && move_pd && ((m_cpu.ir >> 12) == 3))
                          ? m_cpu.irc : m_cpu.ir;

    const uint16 old_sr = m_regs.sr();
    const uint16 access = (frame_ir & 0xFFE0)
                        | ((read) ? 0x10 : 0x00)
                        | makeFc((old_sr & SR_S) != 0, program);

    m_regs.setSr((old_sr | SR_S) & ~SR_T);
    m_cpu.trace_pending = false;

    m_exc.processing_group0 = true;
    m_exc.old_sr      = old_sr;
    m_exc.return_pc   = frame_pc;
    m_exc.frame_ir    = frame_ir;
    m_exc.fault_addr  = addr;
    m_exc.access_info = access;

    m_queue.clear();
    m_cpu.op_cycles = 0;

    queue(uopInternal((!read && move_pd) ? 17 : 13));
    queue(uop(uop_t::PUSH_LONG_HI, frame_pc));
    queue(uop(uop_t::PUSH_LONG_LO, frame_pc));
    queue(uop(uop_t::PUSH_WORD, old_sr));
    queue(uop(uop_t::PUSH_WORD, frame_ir));
    queue(uop(uop_t::PUSH_LONG_HI, addr));
    queue(uop(uop_t::PUSH_LONG_LO, addr));
    queue(uop(uop_t::PUSH_WORD, access));
    queueVectorFetch(vector);
}


// start an interrupt at the given level.  the vector number comes from
// the acknowledge cycle.
void
Cpu68000::interrupt(int level)
{
    assert(level >= 1 && level <= 7);

    const uint16 old_sr = m_regs.sr();
    m_regs.setSr((old_sr | SR_S) & ~SR_T);
    m_regs.setIntMask(level);
    m_cpu.trace_pending = false;

    m_exc.old_sr    = old_sr;
    m_exc.return_pc = m_cpu.irc_addr;
    m_exc.stage     = EXC_IACK;

    m_queue.clear();
    m_cpu.op_cycles = 0;
    queue(uopInternal(6));
    queue(uop(uop_t::IACK, static_cast<uint32>(level)));
    queue(uop(uop_t::EXECUTE));
}


void
Cpu68000::queueVectorFetch(int vector)
{
    const uint32 va = static_cast<uint32>(vector) * 4;
    m_exc.vector = vector;
    m_exc.stage  = EXC_VECTOR;
    queue(uopRead(uop_t::READ_LONG_HI, va));
    queue(uopRead(uop_t::READ_LONG_LO, va + 2));
    queue(uop(uop_t::EXECUTE));
}


// an EXECUTE came up while an exception or reset sequence is in progress
void
Cpu68000::exceptionStep()
{
    switch (m_exc.stage) {

    case EXC_IACK:
        m_exc.vector = static_cast<int>(m_ctx.data & 0xFF);
        queue(uopInternal(6));
        queue(uop(uop_t::PUSH_LONG_HI, m_exc.return_pc));
        queue(uop(uop_t::PUSH_LONG_LO, m_exc.return_pc));
        queue(uop(uop_t::PUSH_WORD, m_exc.old_sr));
        queueVectorFetch(m_exc.vector);
        break;

    case EXC_VECTOR:
        m_regs.pc = m_ctx.data;
        m_cpu.irc_pending = true;
        m_exc.stage = EXC_PREFETCH;
        queue(uop(uop_t::FETCH_IRC));
        queue(uop(uop_t::EXECUTE));
        break;

    case EXC_PREFETCH:
        m_exc.stage = EXC_NONE;
        m_exc.processing_group0 = false;
        beginInstruction();
        break;

    case EXC_RESET_SSP:
        m_regs.setSsp(m_ctx.data);
        m_exc.stage = EXC_RESET_PC;
        break;

    case EXC_RESET_PC:
        m_regs.pc = m_ctx.data;
        m_cpu.irc_pending = true;
        m_exc.stage = EXC_PREFETCH;
        queue(uop(uop_t::FETCH_IRC));
        queue(uop(uop_t::EXECUTE));
        break;

    default:
        invariantFailure("corrupt exception stage");
        break;
    }
}


// reg 0-7 restores An, 8-15 restores the low word of Dn
void
Cpu68000::applyUndo(const undo_t &u) noexcept
{
    if (!u.valid) {
        return;
    }
    if (u.reg < 8) {
        m_regs.a[u.reg] = u.value;
    } else {
        m_regs.setDn(u.reg - 8, 2, u.value);
    }
}

// vim: ts=8:et:sw=4:smarttab
