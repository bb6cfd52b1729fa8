// Predecode of 68000 opcodes.
//
// decode() turns a 16b opcode into an instr_t: the operation, operand size,
// source and destination addressing modes, and whatever small constants are
// packed into the opcode itself.  All the addressing mode and size rules of
// the programmer's reference manual are applied here, so by the time an
// instruction reaches the execution engine it is known to be legal.
// Anything that doesn't match becomes ILLEGAL, LINE_A or LINE_F.

#ifndef _INCLUDE_DECODE68K_H_
#define _INCLUDE_DECODE68K_H_

#include "m68kemu.h"

enum class op_t : uint8 {
    // patterns that take an exception
    ILLEGAL, LINE_A, LINE_F,

    // immediate group
    ORI_CCR, ORI_SR, ANDI_CCR, ANDI_SR, EORI_CCR, EORI_SR,
    ORI, ANDI, SUBI, ADDI, EORI, CMPI,

    // bit operations; 'dir' set means the bit number is immediate
    BTST, BCHG, BCLR, BSET,
    MOVEP,

    // moves
    MOVE, MOVEA, MOVEQ,
    MOVE_FROM_SR, MOVE_TO_CCR, MOVE_TO_SR,
    MOVE_TO_USP, MOVE_FROM_USP,
    MOVEM, LEA, PEA,

    // single operand
    NEGX, CLR, NEG, NOT, NBCD, TST, TAS, EXT, SWAP,

    // program control
    TRAP, LINK, UNLK, RESET, NOP, STOP, RTE, RTS, TRAPV, RTR,
    JSR, JMP, CHK, SCC, DBCC, BRA, BSR, BCC,

    // two operand arithmetic and logic
    ADDQ, SUBQ,
    OR, AND, EOR, SUB, ADD, CMP,
    SUBA, ADDA, CMPA,
    SUBX, ADDX, CMPM,
    SBCD, ABCD,
    MULU, MULS, DIVU, DIVS,
    EXG,

    // shifts and rotates
    SHIFT_REG, SHIFT_MEM
};

// addressing modes, after folding mode 7 into its sub-modes
enum ea_mode_t : uint8 {
    EA_NONE = 0,
    EA_DN,      // Dn
    EA_AN,      // An
    EA_AI,      // (An)
    EA_PI,      // (An)+
    EA_PD,      // -(An)
    EA_D16,     // d16(An)
    EA_IDX,     // d8(An,Xn)
    EA_ABS_W,   // xxx.w
    EA_ABS_L,   // xxx.l
    EA_PC_D16,  // d16(PC)
    EA_PC_IDX,  // d8(PC,Xn)
    EA_IMM      // #<data>
};

// sets of addressing modes, as named in the programmer's reference
enum : uint16 {
    EAM_DN        = (1 << EA_DN),
    EAM_AN        = (1 << EA_AN),
    EAM_MEM_ALT   = (1 << EA_AI) | (1 << EA_PI) | (1 << EA_PD)
                  | (1 << EA_D16) | (1 << EA_IDX)
                  | (1 << EA_ABS_W) | (1 << EA_ABS_L),
    EAM_PC_REL    = (1 << EA_PC_D16) | (1 << EA_PC_IDX),
    EAM_IMM       = (1 << EA_IMM),
    EAM_MEMORY    = EAM_MEM_ALT | EAM_PC_REL | EAM_IMM,
    EAM_DATA      = EAM_DN | EAM_MEMORY,
    EAM_ALL       = EAM_DATA | EAM_AN,
    EAM_DATA_ALT  = EAM_DN | EAM_MEM_ALT,
    EAM_ALTERABLE = EAM_DATA_ALT | EAM_AN,
    EAM_CONTROL   = (1 << EA_AI) | (1 << EA_D16) | (1 << EA_IDX)
                  | (1 << EA_ABS_W) | (1 << EA_ABS_L) | EAM_PC_REL,
    EAM_CTRL_ALT  = EAM_CONTROL & ~EAM_PC_REL
};

struct ea_t {
    ea_mode_t mode;
    uint8     reg;
};

struct instr_t {
    op_t   op;
    uint8  size;    // operand size in bytes: 1, 2, 4; 0 if none
    ea_t   src;
    ea_t   dst;
    uint8  cond;    // condition code field for Bcc, DBcc, Scc
    bool   dir;     // per-operation direction flag, see decode()
    uint8  kind;    // shift kind for shifts, opmode for EXG
    int32  quick;   // data packed in the opcode (ADDQ, MOVEQ, TRAP, shift count)
};

// decode one opcode
instr_t decode(uint16 opcode) noexcept;

// true if the addressing mode is in the set
inline bool
eaIn(const ea_t &ea, uint16 set) noexcept
{
    return (ea.mode != EA_NONE) && ((set >> ea.mode) & 1);
}

// map the mode/reg fields of an opcode to a decoded mode
ea_t decodeEa(int mode, int reg) noexcept;

// mnemonic, for the debug log
const char* opName(op_t op) noexcept;

#endif // _INCLUDE_DECODE68K_H_

// vim: ts=8:et:sw=4:smarttab
