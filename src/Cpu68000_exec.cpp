// instruction handlers for the 68000
//
// execute() is called each time an EXECUTE micro-op comes up.  The first
// call for an instruction happens right after its opcode has been copied
// to IR and the refill of IRC has completed.  Handlers that need bus data
// queue the cycles plus another EXECUTE and return; they are then called
// again from the top, and the operand helpers hand back what they already
// have.  m_ctx.stage is used where an instruction has more than one phase
// that isn't tied to an operand.

#include "Cpu68k.h"
#include "Alu68k.h"

#include <utility>     // for std::swap

static inline uint32
sext16(uint32 v) noexcept
{
    return static_cast<uint32>(static_cast<int32>(static_cast<int16>(v & 0xFFFF)));
}


void
Cpu68000::execute()
{
    switch (m_ctx.ins.op) {

    case op_t::ILLEGAL:
        exception(4, m_cpu.instr_start_pc);
        break;
    case op_t::LINE_A:
        exception(10, m_cpu.instr_start_pc);
        break;
    case op_t::LINE_F:
        exception(11, m_cpu.instr_start_pc);
        break;

    case op_t::ORI_CCR:  case op_t::ORI_SR:
    case op_t::ANDI_CCR: case op_t::ANDI_SR:
    case op_t::EORI_CCR: case op_t::EORI_SR:
        execImmToSr();
        break;

    case op_t::ORI:  case op_t::ANDI: case op_t::SUBI:
    case op_t::ADDI: case op_t::EORI: case op_t::CMPI:
        execImmediate();
        break;

    case op_t::BTST: case op_t::BCHG: case op_t::BCLR: case op_t::BSET:
        execBitOp();
        break;

    case op_t::MOVEP:
        execMovep();
        break;

    case op_t::MOVE: case op_t::MOVEA: case op_t::MOVEQ:
        execMove();
        break;

    case op_t::MOVE_FROM_SR: case op_t::MOVE_TO_CCR: case op_t::MOVE_TO_SR:
    case op_t::MOVE_TO_USP:  case op_t::MOVE_FROM_USP:
        execMoveSr();
        break;

    case op_t::MOVEM:
        execMovem();
        break;

    case op_t::NEGX: case op_t::CLR: case op_t::NEG: case op_t::NOT:
    case op_t::NBCD: case op_t::TST: case op_t::TAS:
    case op_t::EXT:  case op_t::SWAP:
        execSingle();
        break;

    case op_t::TRAP: case op_t::LINK:  case op_t::UNLK: case op_t::RESET:
    case op_t::NOP:  case op_t::STOP:  case op_t::RTE:  case op_t::RTS:
    case op_t::TRAPV: case op_t::RTR:  case op_t::CHK:
        execProgramControl();
        break;

    case op_t::JSR: case op_t::JMP:
        execJump();
        break;

    case op_t::BRA: case op_t::BSR: case op_t::BCC:
        execBranch();
        break;

    case op_t::SCC: case op_t::DBCC:
        execCondition();
        break;

    case op_t::ADDQ: case op_t::SUBQ:
        execQuick();
        break;

    case op_t::OR:  case op_t::AND: case op_t::EOR:
    case op_t::SUB: case op_t::ADD: case op_t::CMP:
        execArith();
        break;

    case op_t::LEA:  case op_t::PEA:
    case op_t::SUBA: case op_t::ADDA: case op_t::CMPA:
    case op_t::EXG:
        execAddress();
        break;

    case op_t::SUBX: case op_t::ADDX: case op_t::CMPM:
    case op_t::SBCD: case op_t::ABCD:
        execExtended();
        break;

    case op_t::MULU: case op_t::MULS: case op_t::DIVU: case op_t::DIVS:
        execMulDiv();
        break;

    case op_t::SHIFT_REG: case op_t::SHIFT_MEM:
        execShift();
        break;
    }
}


// raise a privilege violation if in user mode
bool
Cpu68000::privileged()
{
    if (m_regs.supervisor()) {
        return true;
    }
    exception(8, m_cpu.instr_start_pc);
    return false;
}

// ------------------------------------------------------------------------
//  0000: immediates, bit operations, MOVEP
// ------------------------------------------------------------------------

void
Cpu68000::execImmToSr()
{
    const instr_t &ins = m_ctx.ins;
    const bool to_sr = (ins.op == op_t::ORI_SR)
                    || (ins.op == op_t::ANDI_SR)
                    || (ins.op == op_t::EORI_SR);

    if (to_sr && (m_ctx.src.step == OPND_IDLE) && !privileged()) {
        return;
    }

    uint32 imm;
    if (!loadOperand(m_ctx.src, ins.src, ins.size, &imm)) {
        return;
    }

    if (to_sr) {
        uint16 sr = m_regs.sr();
        switch (ins.op) {
            case op_t::ORI_SR:  sr |= imm; break;
            case op_t::ANDI_SR: sr &= imm; break;
            default:            sr ^= imm; break;
        }
        m_regs.setSr(sr);
    } else {
        uint8 ccr = m_regs.ccr();
        switch (ins.op) {
            case op_t::ORI_CCR:  ccr |= imm; break;
            case op_t::ANDI_CCR: ccr &= imm; break;
            default:             ccr ^= imm; break;
        }
        m_regs.setCcr(ccr);
    }
    queue(uopInternal(12));
}


void
Cpu68000::execImmediate()
{
    const instr_t &ins = m_ctx.ins;
    const int size = ins.size;

    uint32 imm, dst;
    if (!loadOperand(m_ctx.src, ins.src, size, &imm)) {
        return;
    }
    if (!loadOperand(m_ctx.dst, ins.dst, size, &dst)) {
        return;
    }

    const uint8 ccr = m_regs.ccr();
    alu::result_t r;
    switch (ins.op) {
        case op_t::ORI:  r = alu::logic(dst | imm, size, ccr); break;
        case op_t::ANDI: r = alu::logic(dst & imm, size, ccr); break;
        case op_t::EORI: r = alu::logic(dst ^ imm, size, ccr); break;
        case op_t::SUBI: r = alu::sub(imm, dst, size, ccr);    break;
        case op_t::ADDI: r = alu::add(imm, dst, size, ccr);    break;
        default:         r = alu::cmp(imm, dst, size, ccr);    break;
    }
    m_regs.setCcr(r.ccr);

    const bool dn_long = (ins.dst.mode == EA_DN) && (size == 4);
    if (ins.op == op_t::CMPI) {
        if (dn_long) {
            queue(uopInternal(2));
        }
        return;
    }

    if (!storeOperand(m_ctx.dst, ins.dst, size, r.value)) {
        return;
    }
    if (dn_long) {
        queue(uopInternal(4));
    }
}


// BTST, BCHG, BCLR, BSET.  the bit number is modulo 32 for a data register
// and modulo 8 for a memory byte.
void
Cpu68000::execBitOp()
{
    const instr_t &ins = m_ctx.ins;
    const bool reg = (ins.dst.mode == EA_DN);

    uint32 bit;
    if (!loadOperand(m_ctx.src, ins.src, (ins.dir) ? 1 : 4, &bit)) {
        return;
    }
    bit &= (reg) ? 31 : 7;

    uint32 v;
    if (!loadOperand(m_ctx.dst, ins.dst, ins.size, &v)) {
        return;
    }

    const uint32 mask = 1u << bit;
    m_regs.setFlag(SR_Z, (v & mask) == 0);

    uint32 nv = v;
    int extra = 2;
    switch (ins.op) {
        case op_t::BTST:
            if (reg) {
                queue(uopInternal(2));
            }
            return;
        case op_t::BCHG:
            nv = v ^ mask;
            extra = (bit < 16) ? 2 : 4;
            break;
        case op_t::BCLR:
            nv = v & ~mask;
            extra = (bit < 16) ? 4 : 6;
            break;
        default:
            nv = v | mask;
            extra = (bit < 16) ? 2 : 4;
            break;
    }

    if (reg) {
        m_regs.d[ins.dst.reg] = nv;
        queue(uopInternal(extra));
        return;
    }
    (void)storeOperand(m_ctx.dst, ins.dst, 1, nv);
}


// MOVEP moves a word or long between a data register and alternate bytes
// of memory, high order byte first
void
Cpu68000::execMovep()
{
    const instr_t &ins = m_ctx.ins;
    const int nbytes = ins.size;

    if (m_ctx.stage == 0) {
        if (!extWordReady()) {
            return;
        }
        const int ar = (ins.dir) ? ins.dst.reg : ins.src.reg;
        m_ctx.addr  = m_regs.a[ar] + sext16(consumeIrc());
        m_ctx.stage = 1;

        if (ins.dir) {
            const uint32 v = m_regs.d[ins.src.reg];
            for (int i=0; i < nbytes; i++) {
                const int shift = 8*(nbytes - 1 - i);
                queue(uopWrite(uop_t::WRITE_BYTE, m_ctx.addr + 2*i, (v >> shift) & 0xFF));
            }
            return;
        }

        m_ctx.count   = 0;
        m_ctx.scratch = 0;
        for (int i=0; i < nbytes; i++) {
            queue(uopRead(uop_t::READ_BYTE, m_ctx.addr + 2*i));
            queue(uop(uop_t::EXECUTE));
        }
        return;
    }

    // one byte has arrived
    m_ctx.scratch = (m_ctx.scratch << 8) | (m_ctx.data & 0xFF);
    if (++m_ctx.count == nbytes) {
        m_regs.setDn(ins.dst.reg, nbytes, m_ctx.scratch);
    }
}

// ------------------------------------------------------------------------
//  moves
// ------------------------------------------------------------------------

void
Cpu68000::execMove()
{
    const instr_t &ins = m_ctx.ins;
    const int size = ins.size;

    if (ins.op == op_t::MOVEQ) {
        const uint32 v = static_cast<uint32>(ins.quick);
        m_regs.d[ins.dst.reg] = v;
        m_regs.setCcr(alu::logic(v, 4, m_regs.ccr()).ccr);
        return;
    }

    uint32 v;
    if (!loadOperand(m_ctx.src, ins.src, size, &v)) {
        return;
    }

    if (ins.op == op_t::MOVEA) {
        m_regs.setAn(ins.dst.reg, size, v);
        return;
    }

    if (m_ctx.stage == 0) {
        m_ctx.stage = 1;
        saveMoveFlags(v, size);
    }
    m_regs.setCcr(alu::logic(v, size, m_regs.ccr()).ccr);
    // MOVE's -(An) destination has no extra delay
    (void)storeOperand(m_ctx.dst, ins.dst, size, v, EA_NO_PD_DELAY);
}


// a long write that faults before its flags are settled stacks the
// flags as they stood at that point
void
Cpu68000::saveMoveFlags(uint32 v, int size) noexcept
{
    const instr_t &ins = m_ctx.ins;
    m_ctx.move_restore = MOVE_KEEP;
    if (size != 4) {
        return;
    }

    const uint8 pre = m_regs.ccr();
    const bool src_reg = (ins.src.mode == EA_DN) || (ins.src.mode == EA_AN)
                      || (ins.src.mode == EA_IMM);
    if (src_reg) {
        if (ins.dst.mode == EA_AI || ins.dst.mode == EA_PI) {
            m_ctx.move_restore = MOVE_RESTORE_ALL;
            m_ctx.move_ccr = pre;
        } else if (ins.dst.mode == EA_D16 || ins.dst.mode == EA_IDX) {
            m_ctx.move_restore = MOVE_RESTORE_VC;
            m_ctx.move_ccr = pre;
        }
        return;
    }

    // from memory the flags come from the last word read
    if (ins.dst.mode == EA_AI || ins.dst.mode == EA_PI || ins.dst.mode == EA_ABS_L) {
        uint8 ccr = static_cast<uint8>(pre & ~(SR_N | SR_Z | SR_V | SR_C));
        if ((v & 0xFFFF) == 0) {
            ccr |= SR_Z;
        }
        if (v & 0x8000) {
            ccr |= SR_N;
        }
        m_ctx.move_restore = MOVE_RESTORE_ALL;
        m_ctx.move_ccr = ccr;
    }
}


void
Cpu68000::execMoveSr()
{
    const instr_t &ins = m_ctx.ins;
    uint32 v;

    switch (ins.op) {

    case op_t::MOVE_FROM_SR:
        if (ins.dst.mode == EA_DN) {
            m_regs.setDn(ins.dst.reg, 2, m_regs.sr());
            queue(uopInternal(2));
            return;
        }
        // the 68000 reads the destination before writing it
        if (!loadOperand(m_ctx.dst, ins.dst, 2, &v)) {
            return;
        }
        (void)storeOperand(m_ctx.dst, ins.dst, 2, m_regs.sr());
        return;

    case op_t::MOVE_TO_CCR:
        if (!loadOperand(m_ctx.src, ins.src, 2, &v)) {
            return;
        }
        m_regs.setCcr(static_cast<uint8>(v & SR_CCR));
        queue(uopInternal(8));
        return;

    case op_t::MOVE_TO_SR:
        if ((m_ctx.src.step == OPND_IDLE) && !privileged()) {
            return;
        }
        if (!loadOperand(m_ctx.src, ins.src, 2, &v)) {
            return;
        }
        m_regs.setSr(static_cast<uint16>(v));
        queue(uopInternal(8));
        return;

    case op_t::MOVE_TO_USP:
        if (privileged()) {
            m_regs.setUsp(m_regs.a[ins.src.reg]);
        }
        return;

    case op_t::MOVE_FROM_USP:
        if (privileged()) {
            m_regs.a[ins.dst.reg] = m_regs.usp();
        }
        return;

    default:
        assert(false);
        return;
    }
}


// MOVEM.  stage 1 walks the register mask; m_ctx.count is the next mask bit
// to look at and m_ctx.addr the next transfer address.  writes are queued a
// few registers at a time to keep the micro-op queue short.  stage 2 means
// a register load is in flight for register m_ctx.scratch.
void
Cpu68000::execMovem()
{
    const instr_t &ins = m_ctx.ins;
    const ea_t    &ea  = ins.dst;
    const int     size = ins.size;
    const bool program = (ea.mode == EA_PC_D16) || (ea.mode == EA_PC_IDX);

    uint32 mask;
    if (!loadOperand(m_ctx.src, ins.src, 2, &mask)) {
        return;
    }

    if (m_ctx.stage == 0) {
        if ((ea.mode == EA_PI) || (ea.mode == EA_PD)) {
            m_ctx.addr = m_regs.a[ea.reg];
        } else {
            if (!computeAddress(m_ctx.dst, ea, size)) {
                return;
            }
            m_ctx.addr = m_ctx.dst.addr;
        }
        m_ctx.count = 0;
        m_ctx.stage = 1;
    }

    if (!ins.dir) {
        // registers to memory
        int queued = 0;
        while ((m_ctx.count < 16) && (queued < 4)) {
            const int bit = m_ctx.count++;
            if (!(mask & (1u << bit))) {
                continue;
            }
            if (ea.mode == EA_PD) {
                // the mask is reversed, and words go out high address first
                const uint32 v = regByIndex(15 - bit);
                m_ctx.addr -= size;
                if (size == 4) {
                    queue(uopWrite(uop_t::WRITE_LONG_LO, m_ctx.addr + 2, v));
                    queue(uopWrite(uop_t::WRITE_LONG_HI, m_ctx.addr, v));
                } else {
                    queueWrite(m_ctx.addr, size, v);
                }
            } else {
                queueWrite(m_ctx.addr, size, regByIndex(bit));
                m_ctx.addr += size;
            }
            queued++;
        }
        if (m_ctx.count < 16) {
            queue(uop(uop_t::EXECUTE));
            return;
        }
        if (ea.mode == EA_PD) {
            m_regs.a[ea.reg] = m_ctx.addr;
        }
        return;
    }

    // memory to registers
    if (m_ctx.stage == 2) {
        const int reg = static_cast<int>(m_ctx.scratch);
        const uint32 v = (size == 2) ? sext16(m_ctx.data) : m_ctx.data;
        if (reg < 8) {
            m_regs.d[reg] = v;
        } else {
            m_regs.a[reg - 8] = v;
        }
        m_ctx.stage = 1;
    }

    while ((m_ctx.count < 16) && !(mask & (1u << m_ctx.count))) {
        m_ctx.count++;
    }

    if (m_ctx.count < 16) {
        m_ctx.scratch = static_cast<uint32>(m_ctx.count++);
        queueRead(m_ctx.addr, size, program);
        queue(uop(uop_t::EXECUTE));
        m_ctx.addr += size;
        m_ctx.stage = 2;
        return;
    }

    if (ea.mode == EA_PI) {
        m_regs.a[ea.reg] = m_ctx.addr;
    }
    // the 68000 always reads one extra word past the last register
    queueRead(m_ctx.addr, 2, program);
}

// ------------------------------------------------------------------------
//  single operand
// ------------------------------------------------------------------------

void
Cpu68000::execSingle()
{
    const instr_t &ins = m_ctx.ins;
    const ea_t    &ea  = ins.dst;
    const int     size = ins.size;
    const uint8   ccr  = m_regs.ccr();

    switch (ins.op) {

    case op_t::EXT:
        {
            const uint32 v = m_regs.d[ea.reg];
            const uint32 nv = (size == 2)
                            ? static_cast<uint32>(alu::signExtend(v, 1)) & 0xFFFF
                            : static_cast<uint32>(alu::signExtend(v, 2));
            m_regs.setDn(ea.reg, size, nv);
            m_regs.setCcr(alu::logic(nv, size, ccr).ccr);
        }
        return;

    case op_t::SWAP:
        {
            const uint32 v = m_regs.d[ea.reg];
            const uint32 nv = (v << 16) | (v >> 16);
            m_regs.d[ea.reg] = nv;
            m_regs.setCcr(alu::logic(nv, 4, ccr).ccr);
        }
        return;

    case op_t::TST:
        {
            uint32 v;
            if (!loadOperand(m_ctx.dst, ea, size, &v)) {
                return;
            }
            m_regs.setCcr(alu::logic(v, size, ccr).ccr);
        }
        return;

    case op_t::TAS:
        {
            uint32 v;
            if (!loadOperand(m_ctx.dst, ea, 1, &v)) {
                return;
            }
            m_regs.setCcr(alu::logic(v, 1, ccr).ccr);
            if (ea.mode == EA_DN) {
                m_regs.setDn(ea.reg, 1, v | 0x80);
                return;
            }
            // read-modify-write cycle
            queue(uopInternal(2));
            (void)storeOperand(m_ctx.dst, ea, 1, v | 0x80);
        }
        return;

    default:
        break;
    }

    // NEGX, CLR, NEG, NOT, NBCD: read, modify, write.
    // CLR reads its destination too.
    uint32 v;
    if (!loadOperand(m_ctx.dst, ea, size, &v)) {
        return;
    }

    alu::result_t r;
    switch (ins.op) {
        case op_t::NEGX: r = alu::negx(v, size, ccr);                       break;
        case op_t::CLR:  r = alu::logic(0, size, ccr);                      break;
        case op_t::NEG:  r = alu::neg(v, size, ccr);                        break;
        case op_t::NOT:  r = alu::logic(~v & alu::sizeMask(size), size, ccr); break;
        default:         r = alu::nbcd(static_cast<uint8>(v), ccr);         break;
    }
    m_regs.setCcr(r.ccr);

    if (!storeOperand(m_ctx.dst, ea, size, r.value)) {
        return;
    }
    if ((ea.mode == EA_DN) && ((size == 4) || (ins.op == op_t::NBCD))) {
        queue(uopInternal(2));
    }
}

// ------------------------------------------------------------------------
//  program control
// ------------------------------------------------------------------------

void
Cpu68000::execProgramControl()
{
    const instr_t &ins = m_ctx.ins;

    switch (ins.op) {

    case op_t::NOP:
        return;

    case op_t::TRAP:
        exception(32 + ins.quick, nextInstrPc());
        return;

    case op_t::TRAPV:
        if (m_regs.flag(SR_V)) {
            exception(7, nextInstrPc());
        }
        return;

    case op_t::RESET:
        if (privileged()) {
            queue(uop(uop_t::ASSERT_RESET));
            queue(uopInternal(128));
        }
        return;

    case op_t::STOP:
        {
            if ((m_ctx.stage == 0) && (m_ctx.src.step == OPND_IDLE) && !privileged()) {
                return;
            }
            uint32 imm;
            if (!loadOperand(m_ctx.src, ins.src, 2, &imm)) {
                return;
            }
            if (m_ctx.stage == 0) {
                // wait for the refill of the prefetch before stopping
                m_ctx.stage = 1;
                queue(uop(uop_t::EXECUTE));
                return;
            }
            m_regs.setSr(static_cast<uint16>(imm));
            m_status = CPU_STOPPED;
        }
        return;

    case op_t::LINK:
        {
            uint32 disp;
            if (!loadOperand(m_ctx.src, ins.src, 2, &disp)) {
                return;
            }
            const int r = ins.dst.reg;
            if (m_ctx.stage == 0) {
                m_ctx.stage = 1;
                // LINK A7 stacks the already decremented stack pointer
                const uint32 v = (r == 7) ? m_regs.a[7] - 4 : m_regs.a[r];
                queue(uop(uop_t::PUSH_LONG_HI, v));
                queue(uop(uop_t::PUSH_LONG_LO, v));
                queue(uop(uop_t::EXECUTE));
                return;
            }
            m_regs.a[r] = m_regs.a[7];
            m_regs.a[7] += sext16(disp);
        }
        return;

    case op_t::UNLK:
        {
            const int r = ins.dst.reg;
            if (m_ctx.stage == 0) {
                m_ctx.stage = 1;
                m_ctx.sp_undo = { true, 7, m_regs.a[7] };
                m_regs.a[7] = m_regs.a[r];
                queue(uop(uop_t::POP_LONG_HI));
                queue(uop(uop_t::POP_LONG_LO));
                queue(uop(uop_t::EXECUTE));
                return;
            }
            m_ctx.sp_undo.valid = false;
            m_regs.a[r] = m_ctx.data;
        }
        return;

    case op_t::RTE:
        switch (m_ctx.stage) {
            case 0:
                if (!privileged()) {
                    return;
                }
                m_ctx.stage = 1;
                queue(uop(uop_t::POP_WORD));
                queue(uop(uop_t::EXECUTE));
                return;
            case 1:
                m_ctx.stage   = 2;
                m_ctx.scratch = m_ctx.data & 0xFFFF;
                queue(uop(uop_t::POP_LONG_HI));
                queue(uop(uop_t::POP_LONG_LO));
                queue(uop(uop_t::EXECUTE));
                return;
            default:
                // the new SR may switch to the user stack
                m_regs.setSr(static_cast<uint16>(m_ctx.scratch));
                jumpTo(m_ctx.data);
                return;
        }

    case op_t::RTS:
        if (m_ctx.stage == 0) {
            m_ctx.stage = 1;
            queue(uop(uop_t::POP_LONG_HI));
            queue(uop(uop_t::POP_LONG_LO));
            queue(uop(uop_t::EXECUTE));
            return;
        }
        jumpTo(m_ctx.data);
        return;

    case op_t::RTR:
        switch (m_ctx.stage) {
            case 0:
                m_ctx.stage = 1;
                queue(uop(uop_t::POP_WORD));
                queue(uop(uop_t::EXECUTE));
                return;
            case 1:
                m_ctx.stage = 2;
                m_regs.setCcr(static_cast<uint8>(m_ctx.data & SR_CCR));
                queue(uop(uop_t::POP_LONG_HI));
                queue(uop(uop_t::POP_LONG_LO));
                queue(uop(uop_t::EXECUTE));
                return;
            default:
                jumpTo(m_ctx.data);
                return;
        }

    case op_t::CHK:
        {
            uint32 bound;
            if (!loadOperand(m_ctx.src, ins.src, 2, &bound)) {
                return;
            }
            const uint32 dv = m_regs.d[ins.dst.reg] & 0xFFFF;
            const int32  dn = alu::signExtend(dv, 2);
            const int32  ub = alu::signExtend(bound, 2);
            const uint16 sr = m_regs.sr() & ~(SR_N | SR_Z | SR_V | SR_C);

            if (dn < 0) {
                // the comparison against the bound takes two more clocks
                // when it comes out less or equal without overflow
                const alu::result_t cmp = alu::cmp(bound, dv, 2, 0);
                const bool le = (cmp.ccr & (SR_N | SR_Z)) && !(cmp.ccr & SR_V);
                m_regs.setSr(sr | SR_N);
                exception(6, nextInstrPc(), (le) ? 2 : 0);
            } else if (dn > ub) {
                m_regs.setSr(sr);
                exception(6, nextInstrPc());
            } else {
                m_regs.setSr(sr);
                queue(uopInternal(6));
            }
        }
        return;

    default:
        assert(false);
        return;
    }
}


// JMP and JSR
void
Cpu68000::execJump()
{
    uint32 target;
    if (!controlTarget(&target)) {
        return;
    }

    if (m_ctx.ins.op == op_t::JMP) {
        jumpTo(target);
        return;
    }

    const uint32 ret = nextInstrPc();
    m_ctx.sp_undo = { true, 7, m_regs.a[7] };
    jumpTo(target);
    queue(uop(uop_t::PUSH_LONG_HI, ret));
    queue(uop(uop_t::PUSH_LONG_LO, ret));
}


// BRA, BSR, Bcc.  an 8b displacement of zero means a 16b displacement
// follows the opcode.  displacements are relative to the opcode + 2.
void
Cpu68000::execBranch()
{
    const instr_t &ins = m_ctx.ins;
    const bool word  = (ins.quick == 0);
    const bool taken = (ins.op != op_t::BCC) || alu::testCond(ins.cond, m_regs.ccr());

    if (!taken) {
        queue(uopInternal(4));
        if (word) {
            // skip the displacement
            (void)consumeIrcDeferred();
            queue(uop(uop_t::FETCH_IRC));
        }
        return;
    }

    int32 disp = ins.quick;
    if (word) {
        disp = static_cast<int16>(consumeIrcDeferred());
    }
    const uint32 target = m_cpu.instr_start_pc + 2 + static_cast<uint32>(disp);

    queue(uopInternal(2));
    if (ins.op == op_t::BSR) {
        const uint32 ret = m_cpu.instr_start_pc + ((word) ? 4 : 2);
        m_ctx.sp_undo = { true, 7, m_regs.a[7] };
        queue(uop(uop_t::PUSH_LONG_HI, ret));
        queue(uop(uop_t::PUSH_LONG_LO, ret));
    }
    jumpTo(target);
}


// Scc and DBcc
void
Cpu68000::execCondition()
{
    const instr_t &ins = m_ctx.ins;
    const bool cond = alu::testCond(ins.cond, m_regs.ccr());

    if (ins.op == op_t::SCC) {
        const uint32 v = (cond) ? 0xFF : 0x00;
        if (ins.dst.mode == EA_DN) {
            m_regs.setDn(ins.dst.reg, 1, v);
            if (cond) {
                queue(uopInternal(2));
            }
            return;
        }
        uint32 old;
        if (!loadOperand(m_ctx.dst, ins.dst, 1, &old)) {
            return;
        }
        (void)storeOperand(m_ctx.dst, ins.dst, 1, v);
        return;
    }

    // DBcc: if the condition is false, decrement Dn.w and branch unless
    // it has run out to -1
    const int r = ins.dst.reg;
    if (cond) {
        queue(uopInternal(4));
        (void)consumeIrcDeferred();
        queue(uop(uop_t::FETCH_IRC));
        return;
    }

    m_ctx.dn_undo = { true, static_cast<uint8>(8 + r), m_regs.d[r] };
    const uint32 count = (m_regs.d[r] - 1) & 0xFFFF;
    m_regs.setDn(r, 2, count);

    if (count != 0xFFFF) {
        const int32 disp = static_cast<int16>(consumeIrcDeferred());
        queue(uopInternal(2));
        jumpTo(m_cpu.instr_start_pc + 2 + static_cast<uint32>(disp));
        return;
    }

    m_ctx.dn_undo.valid = false;
    queue(uopInternal(6));
    (void)consumeIrcDeferred();
    queue(uop(uop_t::FETCH_IRC));
}

// ------------------------------------------------------------------------
//  arithmetic and logic
// ------------------------------------------------------------------------

// ADDQ and SUBQ
void
Cpu68000::execQuick()
{
    const instr_t &ins = m_ctx.ins;
    const uint32 q = static_cast<uint32>(ins.quick);
    const int size = ins.size;

    if (ins.dst.mode == EA_AN) {
        // whole register, no flags
        if (ins.op == op_t::ADDQ) {
            m_regs.a[ins.dst.reg] += q;
        } else {
            m_regs.a[ins.dst.reg] -= q;
        }
        queue(uopInternal(4));
        return;
    }

    uint32 v;
    if (!loadOperand(m_ctx.dst, ins.dst, size, &v)) {
        return;
    }
    const alu::result_t r = (ins.op == op_t::ADDQ)
                          ? alu::add(q, v, size, m_regs.ccr())
                          : alu::sub(q, v, size, m_regs.ccr());
    m_regs.setCcr(r.ccr);

    if (!storeOperand(m_ctx.dst, ins.dst, size, r.value)) {
        return;
    }
    if ((ins.dst.mode == EA_DN) && (size == 4)) {
        queue(uopInternal(4));
    }
}


// OR, AND, EOR, SUB, ADD, CMP
void
Cpu68000::execArith()
{
    const instr_t &ins = m_ctx.ins;
    const int size = ins.size;

    uint32 s, d;
    if (!loadOperand(m_ctx.src, ins.src, size, &s)) {
        return;
    }
    if (!loadOperand(m_ctx.dst, ins.dst, size, &d)) {
        return;
    }

    const uint8 ccr = m_regs.ccr();
    alu::result_t r;
    switch (ins.op) {
        case op_t::OR:  r = alu::logic(d | s, size, ccr); break;
        case op_t::AND: r = alu::logic(d & s, size, ccr); break;
        case op_t::EOR: r = alu::logic(d ^ s, size, ccr); break;
        case op_t::SUB: r = alu::sub(s, d, size, ccr);    break;
        case op_t::ADD: r = alu::add(s, d, size, ccr);    break;
        default:        r = alu::cmp(s, d, size, ccr);    break;
    }
    m_regs.setCcr(r.ccr);

    const bool dn_long = (ins.dst.mode == EA_DN) && (size == 4);
    if (ins.op == op_t::CMP) {
        if (dn_long) {
            queue(uopInternal(2));
        }
        return;
    }

    if (!storeOperand(m_ctx.dst, ins.dst, size, r.value)) {
        return;
    }
    if (dn_long) {
        const bool fast_src = (ins.src.mode == EA_DN)
                           || (ins.src.mode == EA_AN)
                           || (ins.src.mode == EA_IMM);
        queue(uopInternal((fast_src) ? 4 : 2));
    }
}


// LEA, PEA, ADDA, SUBA, CMPA, EXG
void
Cpu68000::execAddress()
{
    const instr_t &ins = m_ctx.ins;
    const bool indexed = (ins.src.mode == EA_IDX) || (ins.src.mode == EA_PC_IDX);

    switch (ins.op) {

    case op_t::LEA:
        if (!computeAddress(m_ctx.src, ins.src, 4)) {
            return;
        }
        m_regs.a[ins.dst.reg] = m_ctx.src.addr;
        if (indexed) {
            queue(uopInternal(2));
        }
        return;

    case op_t::PEA:
        if (!computeAddress(m_ctx.src, ins.src, 4)) {
            return;
        }
        if (indexed) {
            queue(uopInternal(2));
        }
        queue(uop(uop_t::PUSH_LONG_HI, m_ctx.src.addr));
        queue(uop(uop_t::PUSH_LONG_LO, m_ctx.src.addr));
        return;

    case op_t::EXG:
        {
            uint32 &x = (ins.src.mode == EA_DN) ? m_regs.d[ins.src.reg]
                                                : m_regs.a[ins.src.reg];
            uint32 &y = (ins.dst.mode == EA_DN) ? m_regs.d[ins.dst.reg]
                                                : m_regs.a[ins.dst.reg];
            std::swap(x, y);
            queue(uopInternal(2));
        }
        return;

    default:
        break;
    }

    // ADDA, SUBA, CMPA: word sources are sign extended to 32b
    uint32 v;
    if (!loadOperand(m_ctx.src, ins.src, ins.size, &v)) {
        return;
    }
    const uint32 s = (ins.size == 2) ? sext16(v) : v;
    uint32 &an = m_regs.a[ins.dst.reg];

    if (ins.op == op_t::CMPA) {
        m_regs.setCcr(alu::cmp(s, an, 4, m_regs.ccr()).ccr);
        queue(uopInternal(2));
        return;
    }

    an = (ins.op == op_t::ADDA) ? (an + s) : (an - s);

    const bool fast_src = (ins.src.mode == EA_DN)
                       || (ins.src.mode == EA_AN)
                       || (ins.src.mode == EA_IMM);
    queue(uopInternal((ins.size == 2 || fast_src) ? 4 : 2));
}


// ADDX, SUBX, ABCD, SBCD in both forms, and CMPM
void
Cpu68000::execExtended()
{
    const instr_t &ins = m_ctx.ins;
    const int size = ins.size;

    if (ins.dir && (m_ctx.stage == 0)) {
        // -(Ay),-(Ax): one predecrement delay covers both operands
        m_ctx.stage = 1;
        queue(uopInternal(2));
    }

    uint32 s, d;
    if (!loadOperand(m_ctx.src, ins.src, size, &s, EA_NO_PD_DELAY)) {
        return;
    }
    if (!loadOperand(m_ctx.dst, ins.dst, size, &d, EA_NO_PD_DELAY)) {
        return;
    }

    const uint8 ccr = m_regs.ccr();
    alu::result_t r;
    switch (ins.op) {
        case op_t::ADDX: r = alu::addx(s, d, size, ccr); break;
        case op_t::SUBX: r = alu::subx(s, d, size, ccr); break;
        case op_t::ABCD: r = alu::abcd(static_cast<uint8>(s), static_cast<uint8>(d), ccr); break;
        case op_t::SBCD: r = alu::sbcd(static_cast<uint8>(s), static_cast<uint8>(d), ccr); break;
        default:         r = alu::cmp(s, d, size, ccr); break;
    }
    m_regs.setCcr(r.ccr);

    if (ins.op == op_t::CMPM) {
        return;
    }

    if (!storeOperand(m_ctx.dst, ins.dst, size, r.value, EA_NO_PD_DELAY)) {
        return;
    }
    if (!ins.dir) {
        if ((ins.op == op_t::ABCD) || (ins.op == op_t::SBCD)) {
            queue(uopInternal(2));
        } else if (size == 4) {
            queue(uopInternal(4));
        }
    }
}

// ------------------------------------------------------------------------
//  multiply, divide
// ------------------------------------------------------------------------

// the time taken depends on the operands; the whole cost less the opcode
// fetch is taken as one internal delay
void
Cpu68000::execMulDiv()
{
    const instr_t &ins = m_ctx.ins;
    const int r = ins.dst.reg;

    uint32 v;
    if (!loadOperand(m_ctx.src, ins.src, 2, &v)) {
        return;
    }
    const uint16 src = static_cast<uint16>(v);
    const uint8  ccr = m_regs.ccr();
    alu::result_t res;
    int clocks;

    switch (ins.op) {

    case op_t::MULU:
        res    = alu::mulu(src, static_cast<uint16>(m_regs.d[r]), ccr);
        clocks = alu::muluCycles(src);
        break;

    case op_t::MULS:
        res    = alu::muls(src, static_cast<uint16>(m_regs.d[r]), ccr);
        clocks = alu::mulsCycles(src);
        break;

    default:
        if (src == 0) {
            m_regs.setFlag(SR_C, false);
            exception(5, nextInstrPc());
            return;
        }
        if (ins.op == op_t::DIVU) {
            res    = alu::divu(m_regs.d[r], src, ccr);
            clocks = alu::divuCycles(m_regs.d[r], src);
        } else {
            res    = alu::divs(m_regs.d[r], src, ccr);
            clocks = alu::divsCycles(static_cast<int32>(m_regs.d[r]),
                                     static_cast<int16>(src));
        }
        break;
    }

    m_regs.d[r] = res.value;
    m_regs.setCcr(res.ccr);
    queue(uopInternal(clocks - 4));
}

// ------------------------------------------------------------------------
//  shifts and rotates
// ------------------------------------------------------------------------

void
Cpu68000::execShift()
{
    const instr_t &ins = m_ctx.ins;
    const alu::shift_t kind = static_cast<alu::shift_t>(ins.kind);

    if (ins.op == op_t::SHIFT_REG) {
        const int size  = ins.size;
        const int r     = ins.dst.reg;
        const int count = (ins.src.mode == EA_DN) ? static_cast<int>(m_regs.d[ins.src.reg] & 63)
                                                  : ins.quick;
        const alu::result_t res = alu::shift(kind, ins.dir,
                                             alu::truncate(m_regs.d[r], size),
                                             count, size, m_regs.ccr());
        m_regs.setDn(r, size, res.value);
        m_regs.setCcr(res.ccr);
        queue(uopInternal(((size == 4) ? 4 : 2) + 2*count));
        return;
    }

    // memory form: one bit, word sized
    uint32 v;
    if (!loadOperand(m_ctx.dst, ins.dst, 2, &v)) {
        return;
    }
    const alu::result_t res = alu::shift(kind, ins.dir, v, 1, 2, m_regs.ccr());
    m_regs.setCcr(res.ccr);
    (void)storeOperand(m_ctx.dst, ins.dst, 2, res.value);
}

// vim: ts=8:et:sw=4:smarttab
