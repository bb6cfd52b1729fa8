// flat memory bus checks, plus a few cpu odds and ends that only need
// the bus and the register file

#include "test_util.h"

static void
testMemory(TestCtx &t)
{
    RamBus bus(64);
    t.eq(bus.sizeBytes(), 64*1024, "size");

    bus.fill(0xA5);
    t.eq(bus.peek(0x0000), 0xA5, "fill start");
    t.eq(bus.peek(0xFFFF), 0xA5, "fill end");
    t.eq(bus.peek(0x10000), 0xFF, "past the end floats high");
    bus.poke(0x10000, 0x12);
    t.eq(bus.peek(0x10000), 0xFF, "writes past the end are lost");

    bus.load(0x100, { 0x12, 0x34, 0x56, 0x78 });
    t.eq(bus.peekWord(0x100), 0x1234, "load is big endian");
    bus.pokeLong(0x200, 0xDEADBEEF);
    t.eq(bus.peekWord(0x202), 0xBEEF, "pokeLong low word");

    // only 24 address lines
    t.eq(bus.peekWord(0xFF000100), 0x1234, "upper address byte ignored");
}


static void
testCycles(TestCtx &t)
{
    RamBus bus(64);
    bus.enableLog(true);
    bus.setCycleStamp(17);

    bus.pokeWord(0x400, 0x55AA);
    bus_result_t r = bus.readWord(0x400, FC_USER_DATA);
    t.ok(!r.bus_error && r.data == 0x55AA, "word read");
    r = bus.readByte(0x401, FC_USER_DATA);
    t.eq(r.data, 0xAA, "odd byte read");
    (void)bus.writeByte(0x402, 0x77, FC_SUPERVISOR_DATA);
    t.eq(bus.peek(0x402), 0x77, "byte write");

    t.eq(bus.log().size(), 3, "three cycles logged");
    if (bus.log().size() == 3) {
        t.eq(bus.log()[0].stamp, 17, "stamp");
        t.ok(bus.log()[0].word && !bus.log()[1].word, "word and byte cycles");
        t.eq(bus.log()[2].kind, RamBus::XACT_WRITE, "write logged");
        t.eq(bus.log()[2].fc, FC_SUPERVISOR_DATA, "function code logged");
    }
    bus.clearLog();
    t.ok(bus.log().empty(), "log cleared");

    bus.setWaitCycles(3);
    r = bus.readWord(0x400, FC_USER_PROGRAM);
    t.eq(r.wait_cycles, 3, "wait states reported");
    bus.setWaitCycles(0);

    bus.setBusErrorWindow(0x800, 0x8FF);
    t.ok(bus.readWord(0x800, FC_USER_DATA).bus_error, "bus error in the window");
    t.ok(bus.writeByte(0x8FF, 0, FC_USER_DATA).bus_error, "window is inclusive");
    t.ok(!bus.readWord(0x900, FC_USER_DATA).bus_error, "no bus error past the window");
    bus.clearBusErrorWindow();
    t.ok(!bus.readWord(0x800, FC_USER_DATA).bus_error, "window cleared");
}


static void
testInterruptLines(TestCtx &t)
{
    RamBus bus(64);
    bus.enableLog(true);
    t.eq(bus.pollIpl(), 0, "no interrupt at power up");
    bus.setIpl(4);
    t.eq(bus.pollIpl(), 4, "level driven");

    bus_result_t r = bus.interruptAck(4);
    t.eq(r.data, 28, "autovector for level 4");
    t.eq(bus.log().back().kind, RamBus::XACT_IACK, "acknowledge logged");
    t.eq(bus.log().back().fc, FC_INTERRUPT_ACK, "acknowledge function code");

    bus.setIackVector(70);
    r = bus.interruptAck(4);
    t.eq(r.data, 70, "device supplied vector");

    bus.reset();
    bus.reset();
    t.eq(bus.resetCount(), 2, "reset pulses counted");
}


static void
testCpuAccess(TestCtx &t)
{
    TestRig rig;
    Cpu68000 &cpu = rig.cpu();
    t.eq(cpu.getCpuType(), Cpu68k::CPUTYPE_68000, "cpu type");

    t.ok(cpu.setReg("d3", 0x12345678), "d3 is writable");
    t.ok(cpu.setReg("sr", 0x0015), "sr is writable");
    t.ok(!cpu.setReg("flags.z", 1), "flags aren't writable by name");

    uint64 v = 0;
    t.ok(cpu.query("d3", &v) && v == 0x12345678, "query d3");
    t.ok(cpu.query("flags.x", &v) && v == 1, "query flags.x");
    t.ok(cpu.query("flags.s", &v) && v == 0, "query flags.s");
    t.ok(!cpu.query("d8", &v), "unknown query");

    bool all_known = true;
    for (auto &path : cpu.queryPaths()) {
        all_known = all_known && cpu.query(path, &v);
    }
    t.ok(all_known, "every listed path answers");

    // a user mode write of sr swaps a7 to the user stack
    t.ok(cpu.setReg("ssp", 0x8000), "ssp is writable");
    t.ok(cpu.setReg("usp", 0x6000), "usp is writable");
    t.eq(rig.regs().a[7], 0x6000, "user mode a7");
    cpu.setSr(0x2000);
    t.eq(rig.regs().a[7], 0x8000, "supervisor mode a7");

    t.ok(cpu.atBoundary(), "nothing queued at power up");
    rig.load(0x1000, { 0x4E71, 0x4E71, 0x4E71 });
    rig.start(0x1000);
    t.ok(!cpu.atBoundary(), "an instruction is queued");
    t.eq(cpu.ir(), 0x4E71, "opcode in execution");
    t.eq(cpu.instrStartPc(), 0x1000, "its address");
}


int
main()
{
    TestCtx t("test_rambus");
    testMemory(t);
    testCycles(t);
    testInterruptLines(t);
    testCpuAccess(t);
    return t.summary();
}

// vim: ts=8:et:sw=4:smarttab
