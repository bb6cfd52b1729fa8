// effective address calculation and operand access for the 68000
//
// The helpers here are called from instruction handlers, possibly several
// times for the same operand as the handler is re-entered.  Each operand
// remembers how far it got in its operand_t, so work is never repeated:
// the extension words are taken once, (An)+ and -(An) adjust the register
// once, and the read is queued once.  When a helper has to wait for the
// bus it queues an EXECUTE and returns false, and the handler must return
// immediately.

#include "Cpu68k.h"
#include "Alu68k.h"

static inline uint32
sext16(uint32 v) noexcept
{
    return static_cast<uint32>(static_cast<int32>(static_cast<int16>(v & 0xFFFF)));
}


static inline uint32
sext8(uint32 v) noexcept
{
    return static_cast<uint32>(static_cast<int32>(static_cast<int8>(v & 0xFF)));
}


// registers numbered the way MOVEM masks number them: D0-D7, A0-A7
uint32
Cpu68000::regByIndex(int n) const noexcept
{
    assert(n >= 0 && n < 16);
    return (n < 8) ? m_regs.d[n] : m_regs.a[n - 8];
}


// the brief extension word format:
//    15    D/A of the index register
//    14:12 index register number
//    11    W/L: index is the sign extended low word, or the whole register
//    7:0   signed displacement
uint32
Cpu68000::indexAddress(uint32 base, uint16 ext) const noexcept
{
    const int xr = (ext >> 12) & 7;
    uint32 x = (ext & 0x8000) ? m_regs.a[xr] : m_regs.d[xr];
    if (!(ext & 0x0800)) {
        x = sext16(x);
    }
    return base + sext8(ext) + x;
}


bool
Cpu68000::computeAddress(operand_t &o, const ea_t &ea, int size, int flags)
{
    if (o.step >= OPND_ADDR) {
        return true;
    }

    const int r = ea.reg;
    // byte accesses through A7 keep the stack word aligned
    const uint32 step = (size == 1 && r == 7) ? 2 : static_cast<uint32>(size);

    switch (ea.mode) {

    case EA_AI:
        o.addr = m_regs.a[r];
        break;

    case EA_PI:
        o.undo = { true, static_cast<uint8>(r), m_regs.a[r] };
        o.addr = m_regs.a[r];
        m_regs.a[r] += step;
        break;

    case EA_PD:
        o.undo = { true, static_cast<uint8>(r), m_regs.a[r] };
        m_regs.a[r] -= step;
        o.addr = m_regs.a[r];
        if (!(flags & EA_NO_PD_DELAY)) {
            queue(uopInternal(2));
        }
        break;

    case EA_D16:
        if (!extWordReady()) {
            return false;
        }
        o.addr = m_regs.a[r] + sext16(consumeIrc());
        break;

    case EA_IDX:
        if (!extWordReady()) {
            return false;
        }
        o.addr = indexAddress(m_regs.a[r], consumeIrc());
        queueFront(uopInternal(2));
        break;

    case EA_ABS_W:
        if (!extWordReady()) {
            return false;
        }
        o.addr = sext16(consumeIrc());
        break;

    case EA_ABS_L:
        if (o.step == OPND_IDLE) {
            if (!extWordReady()) {
                return false;
            }
            o.addr = static_cast<uint32>(consumeIrc()) << 16;
            o.step = OPND_HI;
        }
        if (!extWordReady()) {
            return false;
        }
        o.addr |= consumeIrc();
        break;

    case EA_PC_D16:
        if (!extWordReady()) {
            return false;
        }
        {
            const uint32 base = m_cpu.irc_addr;
            o.addr = base + sext16(consumeIrc());
        }
        break;

    case EA_PC_IDX:
        if (!extWordReady()) {
            return false;
        }
        {
            const uint32 base = m_cpu.irc_addr;
            o.addr = indexAddress(base, consumeIrc());
        }
        queueFront(uopInternal(2));
        break;

    default:
        invariantFailure("no address for register or immediate operand");
        return true;
    }

    o.step = OPND_ADDR;
    return true;
}


bool
Cpu68000::loadOperand(operand_t &o, const ea_t &ea, int size, uint32 *val, int flags)
{
    assert(val != nullptr);

    switch (ea.mode) {

    case EA_DN:
        *val = alu::truncate(m_regs.d[ea.reg], size);
        return true;

    case EA_AN:
        *val = alu::truncate(m_regs.a[ea.reg], size);
        return true;

    case EA_IMM:
        if (o.step < OPND_LOADED) {
            if (size == 4) {
                if (o.step == OPND_IDLE) {
                    if (!extWordReady()) {
                        return false;
                    }
                    o.value = static_cast<uint32>(consumeIrc()) << 16;
                    o.step  = OPND_HI;
                }
                if (!extWordReady()) {
                    return false;
                }
                o.value |= consumeIrc();
            } else {
                if (!extWordReady()) {
                    return false;
                }
                o.value = alu::truncate(consumeIrc(), size);
            }
            o.step = OPND_LOADED;
        }
        *val = o.value;
        return true;

    default:
        break;
    }

    // memory operand
    switch (o.step) {
        case OPND_LOADED:
        case OPND_STORED:
            *val = o.value;
            return true;
        case OPND_READING:
            o.value = alu::truncate(m_ctx.data, size);
            o.step  = OPND_LOADED;
            o.undo.valid = false;       // the access went through
            *val = o.value;
            return true;
        default:
            break;
    }

    if (!computeAddress(o, ea, size, flags)) {
        return false;
    }

    const bool program = (ea.mode == EA_PC_D16) || (ea.mode == EA_PC_IDX);
    queueRead(o.addr, size, program);
    queue(uop(uop_t::EXECUTE));
    o.step = OPND_READING;
    return false;
}


bool
Cpu68000::storeOperand(operand_t &o, const ea_t &ea, int size, uint32 val, int flags)
{
    switch (ea.mode) {

    case EA_DN:
        m_regs.setDn(ea.reg, size, val);
        return true;

    case EA_AN:
        m_regs.a[ea.reg] = val;
        return true;

    case EA_IMM:
    case EA_PC_D16:
    case EA_PC_IDX:
        invariantFailure("store to a non-alterable operand");
        return true;

    default:
        break;
    }

    if (o.step == OPND_STORED) {
        return true;
    }
    if (!computeAddress(o, ea, size, flags)) {
        return false;
    }
    queueWrite(o.addr, size, val);
    o.step = OPND_STORED;
    return true;
}


// the target of JMP and JSR.  the pipeline is about to be reloaded, so
// the last extension word is taken without a refill.
bool
Cpu68000::controlTarget(uint32 *target)
{
    operand_t &o  = m_ctx.src;
    const ea_t &ea = m_ctx.ins.src;
    const int  r  = ea.reg;

    if (o.step >= OPND_ADDR) {
        *target = o.addr;
        return true;
    }

    switch (ea.mode) {

    case EA_AI:
        o.addr = m_regs.a[r];
        break;

    case EA_D16:
        if (!extWordReady()) {
            return false;
        }
        o.addr = m_regs.a[r] + sext16(consumeIrcDeferred());
        queue(uopInternal(2));
        break;

    case EA_IDX:
        if (!extWordReady()) {
            return false;
        }
        o.addr = indexAddress(m_regs.a[r], consumeIrcDeferred());
        queue(uopInternal(6));
        break;

    case EA_ABS_W:
        if (!extWordReady()) {
            return false;
        }
        o.addr = sext16(consumeIrcDeferred());
        queue(uopInternal(2));
        break;

    case EA_ABS_L:
        if (o.step == OPND_IDLE) {
            if (!extWordReady()) {
                return false;
            }
            o.addr = static_cast<uint32>(consumeIrc()) << 16;
            o.step = OPND_HI;
        }
        if (!extWordReady()) {
            return false;
        }
        o.addr |= consumeIrcDeferred();
        break;

    case EA_PC_D16:
        if (!extWordReady()) {
            return false;
        }
        {
            const uint32 base = m_cpu.irc_addr;
            o.addr = base + sext16(consumeIrcDeferred());
        }
        queue(uopInternal(2));
        break;

    case EA_PC_IDX:
        if (!extWordReady()) {
            return false;
        }
        {
            const uint32 base = m_cpu.irc_addr;
            o.addr = indexAddress(base, consumeIrcDeferred());
        }
        queue(uopInternal(6));
        break;

    default:
        invariantFailure("jump through a non-control address mode");
        return true;
    }

    o.step = OPND_ADDR;
    *target = o.addr;
    return true;
}


void
Cpu68000::queueRead(uint32 addr, int size, bool program)
{
    switch (size) {
        case 1:
            queue(uopRead(uop_t::READ_BYTE, addr, program));
            break;
        case 2:
            queue(uopRead(uop_t::READ_WORD, addr, program));
            break;
        case 4:
            queue(uopRead(uop_t::READ_LONG_HI, addr, program));
            queue(uopRead(uop_t::READ_LONG_LO, addr + 2, program));
            break;
        default:
            assert(false);
            break;
    }
}


void
Cpu68000::queueWrite(uint32 addr, int size, uint32 value)
{
    switch (size) {
        case 1:
            queue(uopWrite(uop_t::WRITE_BYTE, addr, value & 0xFF));
            break;
        case 2:
            queue(uopWrite(uop_t::WRITE_WORD, addr, value & 0xFFFF));
            break;
        case 4:
            queue(uopWrite(uop_t::WRITE_LONG_HI, addr, value));
            queue(uopWrite(uop_t::WRITE_LONG_LO, addr + 2, value));
            break;
        default:
            assert(false);
            break;
    }
}

// vim: ts=8:et:sw=4:smarttab
