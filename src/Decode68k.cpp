// Predecode of 68000 opcodes.
//
// The 'dir' flag of instr_t is overloaded; its meaning by operation:
//    OR, AND, EOR, ADD, SUB : set for the Dn,<ea> form (result to <ea>)
//    BTST..BSET             : set when the bit number is immediate
//    MOVEP                  : set for register to memory
//    MOVEM                  : set for memory to registers
//    ADDX..ABCD             : set for the -(Ay),-(Ax) form
//    SHIFT_REG, SHIFT_MEM   : set for left shifts
// MOVEM keeps its memory operand in 'dst' in both directions.

#include "Decode68k.h"

// ------------------------------------------------------------------------
//  helpers
// ------------------------------------------------------------------------

static const ea_t no_ea = { EA_NONE, 0 };

static inline ea_t
dn(int reg) noexcept
{
    return { EA_DN, static_cast<uint8>(reg) };
}

static inline ea_t
an(int reg) noexcept
{
    return { EA_AN, static_cast<uint8>(reg) };
}

static inline ea_t
imm() noexcept
{
    return { EA_IMM, 0 };
}

static instr_t
mk(op_t op, int size = 0, ea_t src = no_ea, ea_t dst = no_ea) noexcept
{
    instr_t ins;
    ins.op    = op;
    ins.size  = static_cast<uint8>(size);
    ins.src   = src;
    ins.dst   = dst;
    ins.cond  = 0;
    ins.dir   = false;
    ins.kind  = 0;
    ins.quick = 0;
    return ins;
}

static inline instr_t
illegal() noexcept
{
    return mk(op_t::ILLEGAL);
}

// the two bit size field used by most groups: 00=b, 01=w, 10=l, 11=none
static inline int
size2(uint16 opcode) noexcept
{
    switch ((opcode >> 6) & 3) {
        case 0:  return 1;
        case 1:  return 2;
        case 2:  return 4;
        default: return 0;
    }
}

// the effective address field in bits 5:0
static inline ea_t
eaLow(uint16 opcode) noexcept
{
    return decodeEa((opcode >> 3) & 7, opcode & 7);
}

ea_t
decodeEa(int mode, int reg) noexcept
{
    const uint8 r = static_cast<uint8>(reg & 7);
    switch (mode & 7) {
        case 0: return { EA_DN,  r };
        case 1: return { EA_AN,  r };
        case 2: return { EA_AI,  r };
        case 3: return { EA_PI,  r };
        case 4: return { EA_PD,  r };
        case 5: return { EA_D16, r };
        case 6: return { EA_IDX, r };
        default:
            switch (r) {
                case 0: return { EA_ABS_W,  0 };
                case 1: return { EA_ABS_L,  0 };
                case 2: return { EA_PC_D16, 0 };
                case 3: return { EA_PC_IDX, 0 };
                case 4: return { EA_IMM,    0 };
                default: break;
            }
            break;
    }
    return no_ea;
}

// ------------------------------------------------------------------------
//  one decoder per opcode line
// ------------------------------------------------------------------------

// 0000: bit ops, MOVEP, immediates
static instr_t
decodeLine0(uint16 opcode) noexcept
{
    const ea_t ea = eaLow(opcode);

    if (opcode & 0x0100) {
        const int rx = (opcode >> 9) & 7;
        if (((opcode >> 3) & 7) == 1) {
            // MOVEP
            const bool to_mem = (opcode & 0x0080) != 0;
            const int  size   = (opcode & 0x0040) ? 4 : 2;
            const ea_t mem    = { EA_D16, static_cast<uint8>(opcode & 7) };
            instr_t ins = (to_mem) ? mk(op_t::MOVEP, size, dn(rx), mem)
                                   : mk(op_t::MOVEP, size, mem, dn(rx));
            ins.dir = to_mem;
            return ins;
        }
        // dynamic bit number
        static const op_t bitop[4] = { op_t::BTST, op_t::BCHG, op_t::BCLR, op_t::BSET };
        const int type = (opcode >> 6) & 3;
        const uint16 legal = (type == 0) ? EAM_DATA : EAM_DATA_ALT;
        if (!eaIn(ea, legal)) {
            return illegal();
        }
        return mk(bitop[type], (ea.mode == EA_DN) ? 4 : 1, dn(rx), ea);
    }

    switch (opcode) {
        case 0x003C: return mk(op_t::ORI_CCR,  1, imm());
        case 0x007C: return mk(op_t::ORI_SR,   2, imm());
        case 0x023C: return mk(op_t::ANDI_CCR, 1, imm());
        case 0x027C: return mk(op_t::ANDI_SR,  2, imm());
        case 0x0A3C: return mk(op_t::EORI_CCR, 1, imm());
        case 0x0A7C: return mk(op_t::EORI_SR,  2, imm());
        default: break;
    }

    const int group = (opcode >> 9) & 7;
    if (group == 4) {
        // static bit number
        static const op_t bitop[4] = { op_t::BTST, op_t::BCHG, op_t::BCLR, op_t::BSET };
        const int type = (opcode >> 6) & 3;
        const uint16 legal = (type == 0) ? (EAM_DATA & ~EAM_IMM) : EAM_DATA_ALT;
        if (!eaIn(ea, legal)) {
            return illegal();
        }
        instr_t ins = mk(bitop[type], (ea.mode == EA_DN) ? 4 : 1, imm(), ea);
        ins.dir = true;
        return ins;
    }

    static const op_t immop[8] = {
        op_t::ORI, op_t::ANDI, op_t::SUBI, op_t::ADDI,
        op_t::ILLEGAL, op_t::EORI, op_t::CMPI, op_t::ILLEGAL
    };
    const op_t op   = immop[group];
    const int  size = size2(opcode);
    if (op == op_t::ILLEGAL || size == 0 || !eaIn(ea, EAM_DATA_ALT)) {
        return illegal();
    }
    return mk(op, size, imm(), ea);
}


// 0001, 0010, 0011: MOVE and MOVEA
static instr_t
decodeMove(uint16 opcode) noexcept
{
    static const int sizes[4] = { 0, 1, 4, 2 };
    const int  size = sizes[(opcode >> 12) & 3];
    const ea_t src  = eaLow(opcode);
    const ea_t dst  = decodeEa((opcode >> 6) & 7, (opcode >> 9) & 7);

    if (!eaIn(src, EAM_ALL) || (size == 1 && src.mode == EA_AN)) {
        return illegal();
    }
    if (dst.mode == EA_AN) {
        return (size == 1) ? illegal() : mk(op_t::MOVEA, size, src, dst);
    }
    if (!eaIn(dst, EAM_DATA_ALT)) {
        return illegal();
    }
    return mk(op_t::MOVE, size, src, dst);
}


// 0100: miscellaneous
static instr_t
decodeLine4(uint16 opcode) noexcept
{
    const ea_t ea = eaLow(opcode);
    const int  rx = (opcode >> 9) & 7;

    switch (opcode) {
        case 0x4AFC: return illegal();      // the official ILLEGAL
        case 0x4E70: return mk(op_t::RESET);
        case 0x4E71: return mk(op_t::NOP);
        case 0x4E72: return mk(op_t::STOP, 2, imm());
        case 0x4E73: return mk(op_t::RTE);
        case 0x4E75: return mk(op_t::RTS);
        case 0x4E76: return mk(op_t::TRAPV);
        case 0x4E77: return mk(op_t::RTR);
        default: break;
    }

    if ((opcode & 0xFFF0) == 0x4E40) {
        instr_t ins = mk(op_t::TRAP);
        ins.quick = opcode & 0xF;
        return ins;
    }
    switch (opcode & 0xFFF8) {
        case 0x4E50: return mk(op_t::LINK, 4, imm(), an(opcode & 7));
        case 0x4E58: return mk(op_t::UNLK, 4, no_ea, an(opcode & 7));
        case 0x4E60: return mk(op_t::MOVE_TO_USP,   4, an(opcode & 7));
        case 0x4E68: return mk(op_t::MOVE_FROM_USP, 4, no_ea, an(opcode & 7));
        case 0x4840: return mk(op_t::SWAP, 4, no_ea, dn(opcode & 7));
        case 0x4880: return mk(op_t::EXT,  2, no_ea, dn(opcode & 7));
        case 0x48C0: return mk(op_t::EXT,  4, no_ea, dn(opcode & 7));
        default: break;
    }

    switch (opcode & 0xFFC0) {
        case 0x4E80:
            return (eaIn(ea, EAM_CONTROL)) ? mk(op_t::JSR, 0, ea) : illegal();
        case 0x4EC0:
            return (eaIn(ea, EAM_CONTROL)) ? mk(op_t::JMP, 0, ea) : illegal();
        case 0x40C0:
            return (eaIn(ea, EAM_DATA_ALT)) ? mk(op_t::MOVE_FROM_SR, 2, no_ea, ea) : illegal();
        case 0x44C0:
            return (eaIn(ea, EAM_DATA)) ? mk(op_t::MOVE_TO_CCR, 2, ea) : illegal();
        case 0x46C0:
            return (eaIn(ea, EAM_DATA)) ? mk(op_t::MOVE_TO_SR, 2, ea) : illegal();
        case 0x4800:
            return (eaIn(ea, EAM_DATA_ALT)) ? mk(op_t::NBCD, 1, no_ea, ea) : illegal();
        case 0x4840:
            return (eaIn(ea, EAM_CONTROL)) ? mk(op_t::PEA, 4, ea) : illegal();
        case 0x4AC0:
            return (eaIn(ea, EAM_DATA_ALT)) ? mk(op_t::TAS, 1, no_ea, ea) : illegal();
        default: break;
    }

    if ((opcode & 0xFB80) == 0x4880) {
        // MOVEM; EXT was caught above
        const bool to_regs = (opcode & 0x0400) != 0;
        const int  size    = (opcode & 0x0040) ? 4 : 2;
        const uint16 legal = (to_regs) ? (EAM_CONTROL | (1 << EA_PI))
                                       : (EAM_CTRL_ALT | (1 << EA_PD));
        if (!eaIn(ea, legal)) {
            return illegal();
        }
        instr_t ins = mk(op_t::MOVEM, size, imm(), ea);
        ins.dir = to_regs;
        return ins;
    }

    if (opcode & 0x0100) {
        switch ((opcode >> 6) & 3) {
            case 3:
                return (eaIn(ea, EAM_CONTROL)) ? mk(op_t::LEA, 4, ea, an(rx)) : illegal();
            case 2:
                return (eaIn(ea, EAM_DATA)) ? mk(op_t::CHK, 2, ea, dn(rx)) : illegal();
            default:
                return illegal();
        }
    }

    // single operand group
    const int size = size2(opcode);
    if (size == 0) {
        return illegal();
    }
    op_t op;
    switch ((opcode >> 8) & 0xF) {
        case 0x0: op = op_t::NEGX; break;
        case 0x2: op = op_t::CLR;  break;
        case 0x4: op = op_t::NEG;  break;
        case 0x6: op = op_t::NOT;  break;
        case 0xA: op = op_t::TST;  break;
        default:  return illegal();
    }
    if (!eaIn(ea, EAM_DATA_ALT)) {
        return illegal();
    }
    return mk(op, size, no_ea, ea);
}


// 0101: ADDQ, SUBQ, Scc, DBcc
static instr_t
decodeLine5(uint16 opcode) noexcept
{
    const ea_t ea = eaLow(opcode);

    if (((opcode >> 6) & 3) == 3) {
        instr_t ins;
        if (ea.mode == EA_AN) {
            ins = mk(op_t::DBCC, 2, no_ea, dn(opcode & 7));
        } else if (eaIn(ea, EAM_DATA_ALT)) {
            ins = mk(op_t::SCC, 1, no_ea, ea);
        } else {
            return illegal();
        }
        ins.cond = static_cast<uint8>((opcode >> 8) & 0xF);
        return ins;
    }

    const int size = size2(opcode);
    if (!eaIn(ea, EAM_ALTERABLE) || (size == 1 && ea.mode == EA_AN)) {
        return illegal();
    }
    instr_t ins = mk((opcode & 0x0100) ? op_t::SUBQ : op_t::ADDQ, size, no_ea, ea);
    ins.quick = (opcode >> 9) & 7;
    if (ins.quick == 0) {
        ins.quick = 8;
    }
    return ins;
}


// 0110: BRA, BSR, Bcc
static instr_t
decodeLine6(uint16 opcode) noexcept
{
    const int cond = (opcode >> 8) & 0xF;
    instr_t ins = mk((cond == 0) ? op_t::BRA :
                     (cond == 1) ? op_t::BSR : op_t::BCC);
    ins.cond  = static_cast<uint8>(cond);
    ins.quick = static_cast<int8>(opcode & 0xFF);
    return ins;
}


// 1000 and 1100 share a layout: DIVx/MULx, SBCD/ABCD, OR/AND, and EXG
static instr_t
decodeLine8C(uint16 opcode, bool line_c) noexcept
{
    const ea_t ea = eaLow(opcode);
    const int  rx = (opcode >> 9) & 7;
    const int  ry = opcode & 7;

    switch ((opcode >> 6) & 7) {
        case 3:
            if (!eaIn(ea, EAM_DATA)) {
                return illegal();
            }
            return mk((line_c) ? op_t::MULU : op_t::DIVU, 2, ea, dn(rx));
        case 7:
            if (!eaIn(ea, EAM_DATA)) {
                return illegal();
            }
            return mk((line_c) ? op_t::MULS : op_t::DIVS, 2, ea, dn(rx));
        default:
            break;
    }

    if ((opcode & 0x01F0) == 0x0100) {
        const bool mem = (opcode & 0x0008) != 0;
        const ea_t src = (mem) ? ea_t{ EA_PD, static_cast<uint8>(ry) } : dn(ry);
        const ea_t dst = (mem) ? ea_t{ EA_PD, static_cast<uint8>(rx) } : dn(rx);
        instr_t ins = mk((line_c) ? op_t::ABCD : op_t::SBCD, 1, src, dst);
        ins.dir = mem;
        return ins;
    }

    if (line_c) {
        instr_t ins;
        switch (opcode & 0x01F8) {
            case 0x0140: ins = mk(op_t::EXG, 4, dn(rx), dn(ry)); break;
            case 0x0148: ins = mk(op_t::EXG, 4, an(rx), an(ry)); break;
            case 0x0188: ins = mk(op_t::EXG, 4, dn(rx), an(ry)); break;
            default:     ins = illegal(); break;
        }
        if (ins.op == op_t::EXG) {
            ins.kind = static_cast<uint8>((opcode >> 3) & 0x1F);
            return ins;
        }
    }

    const int size = size2(opcode);
    if (opcode & 0x0100) {
        if (!eaIn(ea, EAM_MEM_ALT)) {
            return illegal();
        }
        instr_t ins = mk((line_c) ? op_t::AND : op_t::OR, size, dn(rx), ea);
        ins.dir = true;
        return ins;
    }
    if (!eaIn(ea, EAM_DATA)) {
        return illegal();
    }
    return mk((line_c) ? op_t::AND : op_t::OR, size, ea, dn(rx));
}


// 1001 and 1101: SUB/ADD, SUBA/ADDA, SUBX/ADDX
static instr_t
decodeLine9D(uint16 opcode, bool add) noexcept
{
    const ea_t ea = eaLow(opcode);
    const int  rx = (opcode >> 9) & 7;
    const int  ry = opcode & 7;

    if (((opcode >> 6) & 3) == 3) {
        if (!eaIn(ea, EAM_ALL)) {
            return illegal();
        }
        const int size = (opcode & 0x0100) ? 4 : 2;
        return mk((add) ? op_t::ADDA : op_t::SUBA, size, ea, an(rx));
    }

    const int size = size2(opcode);
    if (opcode & 0x0100) {
        if ((opcode & 0x0030) == 0) {
            const bool mem = (opcode & 0x0008) != 0;
            const ea_t src = (mem) ? ea_t{ EA_PD, static_cast<uint8>(ry) } : dn(ry);
            const ea_t dst = (mem) ? ea_t{ EA_PD, static_cast<uint8>(rx) } : dn(rx);
            instr_t ins = mk((add) ? op_t::ADDX : op_t::SUBX, size, src, dst);
            ins.dir = mem;
            return ins;
        }
        if (!eaIn(ea, EAM_MEM_ALT)) {
            return illegal();
        }
        instr_t ins = mk((add) ? op_t::ADD : op_t::SUB, size, dn(rx), ea);
        ins.dir = true;
        return ins;
    }

    if (!eaIn(ea, EAM_ALL) || (size == 1 && ea.mode == EA_AN)) {
        return illegal();
    }
    return mk((add) ? op_t::ADD : op_t::SUB, size, ea, dn(rx));
}


// 1011: CMP, CMPA, CMPM, EOR
static instr_t
decodeLineB(uint16 opcode) noexcept
{
    const ea_t ea = eaLow(opcode);
    const int  rx = (opcode >> 9) & 7;

    if (((opcode >> 6) & 3) == 3) {
        if (!eaIn(ea, EAM_ALL)) {
            return illegal();
        }
        const int size = (opcode & 0x0100) ? 4 : 2;
        return mk(op_t::CMPA, size, ea, an(rx));
    }

    const int size = size2(opcode);
    if (opcode & 0x0100) {
        if (ea.mode == EA_AN) {
            return mk(op_t::CMPM, size,
                      ea_t{ EA_PI, static_cast<uint8>(opcode & 7) },
                      ea_t{ EA_PI, static_cast<uint8>(rx) });
        }
        if (!eaIn(ea, EAM_DATA_ALT)) {
            return illegal();
        }
        return mk(op_t::EOR, size, dn(rx), ea);
    }

    if (!eaIn(ea, EAM_ALL) || (size == 1 && ea.mode == EA_AN)) {
        return illegal();
    }
    return mk(op_t::CMP, size, ea, dn(rx));
}


// 1110: shifts and rotates
static instr_t
decodeLineE(uint16 opcode) noexcept
{
    const bool left = (opcode & 0x0100) != 0;

    if (((opcode >> 6) & 3) == 3) {
        const ea_t ea = eaLow(opcode);
        if ((opcode & 0x0800) || !eaIn(ea, EAM_MEM_ALT)) {
            return illegal();
        }
        instr_t ins = mk(op_t::SHIFT_MEM, 2, no_ea, ea);
        ins.dir   = left;
        ins.kind  = static_cast<uint8>((opcode >> 9) & 3);
        ins.quick = 1;
        return ins;
    }

    const int count_field = (opcode >> 9) & 7;
    instr_t ins = mk(op_t::SHIFT_REG, size2(opcode), no_ea, dn(opcode & 7));
    ins.dir  = left;
    ins.kind = static_cast<uint8>((opcode >> 3) & 3);
    if (opcode & 0x0020) {
        ins.src = dn(count_field);          // count modulo 64 from a register
    } else {
        ins.quick = (count_field == 0) ? 8 : count_field;
    }
    return ins;
}

// ------------------------------------------------------------------------
//  public interface
// ------------------------------------------------------------------------

instr_t
decode(uint16 opcode) noexcept
{
    switch (opcode >> 12) {
        case 0x0: return decodeLine0(opcode);
        case 0x1:
        case 0x2:
        case 0x3: return decodeMove(opcode);
        case 0x4: return decodeLine4(opcode);
        case 0x5: return decodeLine5(opcode);
        case 0x6: return decodeLine6(opcode);
        case 0x7:
            if (opcode & 0x0100) {
                return illegal();
            } else {
                instr_t ins = mk(op_t::MOVEQ, 4, no_ea, dn((opcode >> 9) & 7));
                ins.quick = static_cast<int8>(opcode & 0xFF);
                return ins;
            }
        case 0x8: return decodeLine8C(opcode, false);
        case 0x9: return decodeLine9D(opcode, false);
        case 0xA: return mk(op_t::LINE_A);
        case 0xB: return decodeLineB(opcode);
        case 0xC: return decodeLine8C(opcode, true);
        case 0xD: return decodeLine9D(opcode, true);
        case 0xE: return decodeLineE(opcode);
        case 0xF: return mk(op_t::LINE_F);
        default:  break;
    }
    return illegal();
}


const char*
opName(op_t op) noexcept
{
    switch (op) {
        case op_t::ILLEGAL:       return "ILLEGAL";
        case op_t::LINE_A:        return "LINE-A";
        case op_t::LINE_F:        return "LINE-F";
        case op_t::ORI_CCR:       return "ORI to CCR";
        case op_t::ORI_SR:        return "ORI to SR";
        case op_t::ANDI_CCR:      return "ANDI to CCR";
        case op_t::ANDI_SR:       return "ANDI to SR";
        case op_t::EORI_CCR:      return "EORI to CCR";
        case op_t::EORI_SR:       return "EORI to SR";
        case op_t::ORI:           return "ORI";
        case op_t::ANDI:          return "ANDI";
        case op_t::SUBI:          return "SUBI";
        case op_t::ADDI:          return "ADDI";
        case op_t::EORI:          return "EORI";
        case op_t::CMPI:          return "CMPI";
        case op_t::BTST:          return "BTST";
        case op_t::BCHG:          return "BCHG";
        case op_t::BCLR:          return "BCLR";
        case op_t::BSET:          return "BSET";
        case op_t::MOVEP:         return "MOVEP";
        case op_t::MOVE:          return "MOVE";
        case op_t::MOVEA:         return "MOVEA";
        case op_t::MOVEQ:         return "MOVEQ";
        case op_t::MOVE_FROM_SR:  return "MOVE from SR";
        case op_t::MOVE_TO_CCR:   return "MOVE to CCR";
        case op_t::MOVE_TO_SR:    return "MOVE to SR";
        case op_t::MOVE_TO_USP:   return "MOVE to USP";
        case op_t::MOVE_FROM_USP: return "MOVE from USP";
        case op_t::MOVEM:         return "MOVEM";
        case op_t::LEA:           return "LEA";
        case op_t::PEA:           return "PEA";
        case op_t::NEGX:          return "NEGX";
        case op_t::CLR:           return "CLR";
        case op_t::NEG:           return "NEG";
        case op_t::NOT:           return "NOT";
        case op_t::NBCD:          return "NBCD";
        case op_t::TST:           return "TST";
        case op_t::TAS:           return "TAS";
        case op_t::EXT:           return "EXT";
        case op_t::SWAP:          return "SWAP";
        case op_t::TRAP:          return "TRAP";
        case op_t::LINK:          return "LINK";
        case op_t::UNLK:          return "UNLK";
        case op_t::RESET:         return "RESET";
        case op_t::NOP:           return "NOP";
        case op_t::STOP:          return "STOP";
        case op_t::RTE:           return "RTE";
        case op_t::RTS:           return "RTS";
        case op_t::TRAPV:         return "TRAPV";
        case op_t::RTR:           return "RTR";
        case op_t::JSR:           return "JSR";
        case op_t::JMP:           return "JMP";
        case op_t::CHK:           return "CHK";
        case op_t::SCC:           return "Scc";
        case op_t::DBCC:          return "DBcc";
        case op_t::BRA:           return "BRA";
        case op_t::BSR:           return "BSR";
        case op_t::BCC:           return "Bcc";
        case op_t::ADDQ:          return "ADDQ";
        case op_t::SUBQ:          return "SUBQ";
        case op_t::OR:            return "OR";
        case op_t::AND:           return "AND";
        case op_t::EOR:           return "EOR";
        case op_t::SUB:           return "SUB";
        case op_t::ADD:           return "ADD";
        case op_t::CMP:           return "CMP";
        case op_t::SUBA:          return "SUBA";
        case op_t::ADDA:          return "ADDA";
        case op_t::CMPA:          return "CMPA";
        case op_t::SUBX:          return "SUBX";
        case op_t::ADDX:          return "ADDX";
        case op_t::CMPM:          return "CMPM";
        case op_t::SBCD:          return "SBCD";
        case op_t::ABCD:          return "ABCD";
        case op_t::MULU:          return "MULU";
        case op_t::MULS:          return "MULS";
        case op_t::DIVU:          return "DIVU";
        case op_t::DIVS:          return "DIVS";
        case op_t::EXG:           return "EXG";
        case op_t::SHIFT_REG:     return "shift";
        case op_t::SHIFT_MEM:     return "shift mem";
    }
    return "???";
}

// vim: ts=8:et:sw=4:smarttab
