// Reset, traps, interrupts, and bus and address errors.

#include "test_util.h"

static const uint32 PROG    = 0x1000;
static const uint32 STACK   = 0x8000;
static const uint32 HANDLER = 0x5000;

static const uint16 NOP = 0x4E71;

// program at PROG, a NOP pair at HANDLER, and the vector pointed at it
static void
prime(TestRig &rig, int vector, std::initializer_list<uint16> words)
{
    rig.load(PROG, words);
    rig.load(HANDLER, { NOP, NOP, NOP });
    rig.setVector(vector, HANDLER);
    rig.regs().a[7] = STACK;
    rig.start(PROG);
}


// check the six byte frame on top of the supervisor stack
static void
checkFrame(TestCtx &t, TestRig &rig, uint16 sr, uint32 pc, const char *what)
{
    const uint32 sp = rig.regs().ssp();
    std::string msg(what);
    t.eq(sp, STACK - 6, (msg + ": frame size").c_str());
    t.eq(rig.bus().peekWord(sp), sr, (msg + ": stacked SR").c_str());
    t.eq(rig.peekLong(sp + 2), pc, (msg + ": stacked PC").c_str());
}


// check the fourteen byte group 0 frame: access word, fault address,
// opcode, SR and PC
static void
checkGroup0Frame(TestCtx &t, TestRig &rig, uint16 access, uint32 fault,
                 uint16 sr, uint32 pc, const char *what)
{
    const uint32 sp = rig.regs().ssp();
    std::string msg(what);
    t.eq(rig.cpu().instrStartPc(), HANDLER, (msg + ": handler").c_str());
    t.eq(sp, STACK - 14, (msg + ": frame size").c_str());
    t.eq(rig.bus().peekWord(sp), access, (msg + ": access word").c_str());
    t.eq(rig.peekLong(sp + 2), fault, (msg + ": fault address").c_str());
    t.eq(rig.bus().peekWord(sp + 8), sr, (msg + ": stacked SR").c_str());
    t.eq(rig.peekLong(sp + 10), pc, (msg + ": stacked PC").c_str());
}


static void
testReset(TestCtx &t)
{
    TestRig rig(16384);
    rig.bus().pokeLong(0, 0x00080000);
    rig.bus().pokeLong(4, 0x00F80008);
    rig.load(0xF80008, { NOP, NOP, NOP });
    rig.regs().d[3] = 0x33333333;

    rig.cpu().reset();
    for (int n=0; n < 100 && rig.cpu().instrStartPc() != 0xF80008; n++) {
        rig.tick();
    }
    t.eq(rig.cpu().instrStartPc(), 0xF80008, "reset starts at the vector 1 pc");
    t.eq(rig.regs().ssp(), 0x00080000, "reset loads ssp from vector 0");
    t.eq(rig.regs().a[7], 0x00080000, "a7 is the supervisor stack");
    t.eq(rig.regs().sr(), 0x2700, "reset SR");
    t.eq(rig.regs().d[3], 0x33333333, "reset leaves data registers alone");
    t.eq(rig.cpu().status(), Cpu68k::CPU_RUNNING, "running after reset");

    // the fetches of the vectors were program space reads
    const auto &log = rig.bus().log();
    t.ok(!log.empty() && log[0].addr == 0 && log[0].fc == FC_SUPERVISOR_PROGRAM,
         "vector fetch in supervisor program space");
}


static void
testTraps(TestCtx &t)
{
    {
        TestRig rig;
        prime(rig, 35, { 0x4E43, NOP, NOP });  // TRAP #3
        t.eq(rig.step(), 34, "TRAP time");
        t.eq(rig.cpu().instrStartPc(), HANDLER, "TRAP vector");
        checkFrame(t, rig, 0x2700, PROG + 2, "TRAP");
    }
    {
        TestRig rig;
        prime(rig, 4, { 0x4AFC, NOP, NOP });   // ILLEGAL
        rig.cpu().setSr(0x2015);
        t.eq(rig.step(), 34, "illegal instruction time");
        t.eq(rig.cpu().instrStartPc(), HANDLER, "illegal instruction vector");
        checkFrame(t, rig, 0x2015, PROG, "illegal");
        t.eq(rig.regs().sr(), 0x2015, "flags survive the exception");
    }
    {
        TestRig rig;
        prime(rig, 10, { 0xA123, NOP, NOP });  // line A
        t.eq(rig.step(), 34, "line A time");
        checkFrame(t, rig, 0x2700, PROG, "line A");
    }
    {
        TestRig rig;
        prime(rig, 11, { 0xF123, NOP, NOP });  // line F
        (void)rig.step();
        t.eq(rig.cpu().instrStartPc(), HANDLER, "line F vector");
    }
    {
        TestRig rig;
        prime(rig, 7, { 0x4E76, NOP, NOP });   // TRAPV with V set
        rig.cpu().setSr(0x2700 | SR_V);
        t.eq(rig.step(), 34, "TRAPV trap time");
        checkFrame(t, rig, 0x2700 | SR_V, PROG + 2, "TRAPV");
    }
    {
        TestRig rig;
        prime(rig, 7, { 0x4E76, NOP, NOP });   // TRAPV with V clear
        t.eq(rig.step(), 4, "TRAPV no trap time");
        t.eq(rig.cpu().instrStartPc(), PROG + 2, "TRAPV falls through");
    }
}


static void
testPrivilege(TestCtx &t)
{
    {
        TestRig rig;
        prime(rig, 8, { 0x4E70, NOP, NOP });   // RESET in user mode
        rig.cpu().setSr(0x0000);
        rig.regs().setSsp(STACK);
        rig.regs().a[7] = 0x6000;
        t.eq(rig.step(), 34, "privilege violation time");
        t.eq(rig.cpu().instrStartPc(), HANDLER, "privilege violation vector");
        t.ok(rig.regs().supervisor(), "handler runs in supervisor mode");
        t.eq(rig.regs().usp(), 0x6000, "user stack untouched");
        checkFrame(t, rig, 0x0000, PROG, "privilege");
        t.eq(rig.bus().resetCount(), 0, "no reset pulse");
    }
    {
        TestRig rig;
        prime(rig, 8, { 0x4E70, NOP, NOP });   // RESET in supervisor mode
        t.eq(rig.step(), 132, "RESET time");
        t.eq(rig.bus().resetCount(), 1, "RESET pulses the reset line");
        t.eq(rig.cpu().instrStartPc(), PROG + 2, "RESET falls through");
    }
}


static void
testDivChk(TestCtx &t)
{
    {
        TestRig rig;
        prime(rig, 5, { 0x80C1, NOP, NOP });   // DIVU D1,D0 by zero
        rig.regs().d[0] = 1234;
        rig.regs().d[1] = 0;
        rig.cpu().setSr(0x2700 | SR_C);
        t.eq(rig.step(), 38, "zero divide time");
        t.eq(rig.cpu().instrStartPc(), HANDLER, "zero divide vector");
        checkFrame(t, rig, 0x2700, PROG + 2, "zero divide");
        t.eq(rig.regs().d[0], 1234, "zero divide leaves the dividend");
    }
    {
        TestRig rig;
        prime(rig, 6, { 0x4181, NOP, NOP });   // CHK.W D1,D0, below zero
        rig.regs().d[0] = 0x0000FFFF;
        rig.regs().d[1] = 10;
        t.eq(rig.step(), 40, "CHK trap time");
        t.eq(rig.cpu().instrStartPc(), HANDLER, "CHK vector");
        t.ok(rig.regs().flag(SR_N), "CHK below zero sets N");
        checkFrame(t, rig, 0x2700 | SR_N, PROG + 2, "CHK");
    }
    {
        TestRig rig;
        prime(rig, 6, { 0x4181, NOP, NOP });   // above the bound
        rig.regs().d[0] = 20;
        rig.regs().d[1] = 10;
        rig.cpu().setSr(0x2700 | SR_N);
        (void)rig.step();
        t.eq(rig.cpu().instrStartPc(), HANDLER, "CHK above bound traps");
        t.ok(!rig.regs().flag(SR_N), "CHK above bound clears N");
    }
    {
        TestRig rig;
        prime(rig, 6, { 0x4181, NOP, NOP });   // in range
        rig.regs().d[0] = 5;
        rig.regs().d[1] = 10;
        t.eq(rig.step(), 10, "CHK in range time");
        t.eq(rig.cpu().instrStartPc(), PROG + 2, "CHK in range falls through");
    }
}


static void
testTrace(TestCtx &t)
{
    TestRig rig;
    prime(rig, 9, { NOP, NOP, NOP });
    rig.cpu().setSr(0xA700);
    rig.start(PROG);        // T has to be set when the instruction starts
    t.eq(rig.step(), 34, "NOP then trace exception time");
    t.eq(rig.cpu().instrStartPc(), HANDLER, "trace vector");
    t.ok(!rig.regs().trace(), "handler runs without trace");
    checkFrame(t, rig, 0xA700, PROG + 2, "trace");
}


static void
testInterrupts(TestCtx &t)
{
    {
        TestRig rig;
        prime(rig, 27, { NOP, NOP, NOP });     // level 3 autovector
        rig.cpu().setSr(0x2200);
        rig.bus().setIpl(3);
        int acked = 0;
        rig.bus().setIackCallback([&](int level) {
            acked = level;
            rig.bus().setIpl(0);
        });
        t.eq(rig.step(), 44, "interrupt time");
        t.eq(rig.cpu().instrStartPc(), HANDLER, "autovector 27");
        t.eq(acked, 3, "acknowledged at level 3");
        t.eq(rig.regs().intMask(), 3, "mask raised to the level");
        checkFrame(t, rig, 0x2200, PROG + 2, "interrupt");

        bool iack = false;
        for (auto &x : rig.bus().log()) {
            if (x.kind == RamBus::XACT_IACK) {
                iack = (x.fc == FC_INTERRUPT_ACK);
            }
        }
        t.ok(iack, "IACK cycle in the bus log");
    }
    {
        TestRig rig;
        prime(rig, 27, { NOP, NOP, NOP });
        rig.cpu().setSr(0x2500);
        rig.bus().setIpl(3);
        t.eq(rig.step(), 4, "masked interrupt ignored");
        t.eq(rig.cpu().instrStartPc(), PROG + 2, "masked interrupt ignored pc");
    }
    {
        TestRig rig;
        prime(rig, 31, { NOP, NOP, NOP });     // level 7 can't be masked
        rig.bus().setIpl(7);
        rig.bus().setIackCallback([&](int) { rig.bus().setIpl(0); });
        (void)rig.step();
        t.eq(rig.cpu().instrStartPc(), HANDLER, "level 7 taken at mask 7");
    }
    {
        TestRig rig;
        prime(rig, 64, { NOP, NOP, NOP });     // vectored
        rig.cpu().setSr(0x2000);
        rig.bus().setIackVector(64);
        rig.bus().setIpl(5);
        rig.bus().setIackCallback([&](int) { rig.bus().setIpl(0); });
        (void)rig.step();
        t.eq(rig.cpu().instrStartPc(), HANDLER, "vector from the acknowledge cycle");
    }
    {
        TestRig rig;
        prime(rig, 26, { 0x4E72, 0x2000, NOP, NOP });  // STOP #$2000
        rig.tick(40);
        t.eq(rig.cpu().status(), Cpu68k::CPU_STOPPED, "STOP stops");
        t.eq(rig.regs().sr(), 0x2000, "STOP loads SR");
        const uint64 c = rig.cpu().totalCycles();
        rig.tick(10);
        t.eq(rig.cpu().totalCycles(), c + 10, "clocks still count while stopped");

        rig.bus().setIpl(2);
        rig.bus().setIackCallback([&](int) { rig.bus().setIpl(0); });
        for (int n=0; n < 100 && rig.cpu().instrStartPc() != HANDLER; n++) {
            rig.tick();
        }
        t.eq(rig.cpu().instrStartPc(), HANDLER, "interrupt wakes STOP");
        t.eq(rig.peekLong(rig.regs().ssp() + 2), PROG + 4, "returns past STOP");
    }
}


static void
testGroup0(TestCtx &t)
{
    {
        TestRig rig;
        prime(rig, 3, { 0x3010, NOP, NOP });   // MOVE.W (A0),D0, odd address
        rig.regs().a[0] = 0x2001;
        (void)rig.step();
        t.eq(rig.cpu().instrStartPc(), HANDLER, "address error vector");
        const uint32 sp = rig.regs().ssp();
        t.eq(sp, STACK - 14, "address error frame size");
        t.eq(rig.bus().peekWord(sp), 0x3015, "access word: read, supervisor data");
        t.eq(rig.peekLong(sp + 2), 0x2001, "fault address");
        t.eq(rig.bus().peekWord(sp + 6), 0x3010, "opcode");
        t.eq(rig.bus().peekWord(sp + 8), 0x2700, "stacked SR");
        t.eq(rig.peekLong(sp + 10), PROG + 2, "stacked PC");
    }
    {
        TestRig rig;
        prime(rig, 2, { 0x3010, NOP, NOP });   // bus error
        rig.regs().a[0] = 0x4000;
        rig.bus().setBusErrorWindow(0x4000, 0x4FFF);
        (void)rig.step();
        t.eq(rig.cpu().instrStartPc(), HANDLER, "bus error vector");
        const uint32 sp = rig.regs().ssp();
        t.eq(sp, STACK - 14, "bus error frame size");
        t.eq(rig.peekLong(sp + 2), 0x4000, "bus error address");
    }
    {
        TestRig rig;
        prime(rig, 3, { 0x3018, NOP, NOP });   // MOVE.W (A0)+,D0
        rig.regs().a[0] = 0x2001;
        (void)rig.step();
        t.eq(rig.regs().a[0], 0x2001, "postincrement undone on address error");
    }
    {
        TestRig rig;
        prime(rig, 4, { 0x4AFC, NOP, NOP });   // illegal with an odd stack
        rig.regs().a[7] = 0x7001;
        rig.tick(200);
        t.eq(rig.cpu().status(), Cpu68k::CPU_HALTED, "double fault halts");
        uint64 halted = 0;
        t.ok(rig.cpu().query("halted", &halted) && halted == 1, "halted query");
        const uint32 pc = rig.regs().pc;
        const uint64 c  = rig.cpu().totalCycles();
        rig.tick(50);
        t.eq(rig.regs().pc, pc, "nothing runs after a double fault");
        t.eq(rig.cpu().totalCycles(), c, "clocks stop when halted");
        uint64 cycles = 0;
        t.ok(rig.cpu().query("cycles", &cycles) && cycles == c, "cycles query frozen");
    }
}


// the stacked PC, SR and fault address follow how far the instruction
// got before the faulting cycle
static void
testAddressErrorFrames(TestCtx &t)
{
    {
        TestRig rig;
        prime(rig, 3, { 0x2080, NOP, NOP });   // MOVE.L D0,(A0)
        rig.regs().a[0] = 0x4001;
        rig.regs().d[0] = 0x80000000;
        rig.cpu().setSr(0x2703);
        (void)rig.step();
        checkGroup0Frame(t, rig, 0x2085, 0x4001, 0x2703, PROG + 4,
                         "MOVE.L Dn,(An) write");
    }
    {
        TestRig rig;
        prime(rig, 3, { 0x2091, NOP, NOP });   // MOVE.L (A1),(A0)
        rig.regs().a[0] = 0x4001;
        rig.regs().a[1] = 0x3000;
        rig.bus().pokeLong(0x3000, 0x00018000);
        rig.cpu().setSr(0x2713);
        (void)rig.step();
        checkGroup0Frame(t, rig, 0x2085, 0x4001, 0x2718, PROG + 4,
                         "MOVE.L (An),(An) flags from the low word");
    }
    {
        TestRig rig;
        prime(rig, 3, { 0x2100, NOP, NOP });   // MOVE.L D0,-(A0)
        rig.regs().a[0] = 0x4005;
        (void)rig.step();
        checkGroup0Frame(t, rig, 0x2105, 0x4003, 0x2700, PROG + 4,
                         "MOVE.L Dn,-(An) reports the low word");
        t.eq(rig.regs().a[0], 0x4005, "predecrement undone on a write fault");
    }
    {
        TestRig rig;
        prime(rig, 3, { 0x3020, NOP, NOP });   // MOVE.W -(A0),D0
        rig.regs().a[0] = 0x2003;
        (void)rig.step();
        checkGroup0Frame(t, rig, 0x3035, 0x2001, 0x2700, PROG + 4,
                         "MOVE.W -(An),Dn read");
        t.eq(rig.regs().a[0], 0x2003, "predecrement undone on a read fault");
    }
    {
        TestRig rig;
        prime(rig, 3, { 0x4ED0, NOP, NOP });   // JMP (A0)
        rig.regs().a[0] = 0x4001;
        (void)rig.step();
        checkGroup0Frame(t, rig, 0x4ED6, 0x4001, 0x2700, PROG + 2,
                         "JMP to an odd address");
    }
    {
        TestRig rig;
        prime(rig, 3, { 0x6103, NOP, NOP });   // BSR.S *+5
        (void)rig.step();
        checkGroup0Frame(t, rig, 0x6116, PROG + 5, 0x2700, PROG + 5,
                         "BSR stacks its target");
    }
    {
        TestRig rig;
        prime(rig, 3, { 0x6003, NOP, NOP });   // BRA.S *+5
        (void)rig.step();
        checkGroup0Frame(t, rig, 0x6016, PROG + 5, 0x2700, PROG + 2,
                         "BRA to an odd address");
    }
}


int
main()
{
    TestCtx t("test_exceptions");
    testReset(t);
    testTraps(t);
    testPrivilege(t);
    testDivChk(t);
    testTrace(t);
    testInterrupts(t);
    testGroup0(t);
    testAddressErrorFrames(t);
    return t.summary();
}

// vim: ts=8:et:sw=4:smarttab
