// configuration state checks.  the ini file isn't touched.

#include "SysCfgState.h"
#include "test_util.h"

static void
testDefaults(TestCtx &t)
{
    SysCfgState cfg;
    t.ok(!cfg.configOk(false), "never initialized is not ok");

    cfg.setDefaults();
    t.ok(cfg.configOk(false), "defaults are ok");
    t.eq(cfg.getRamKB(), MAX_RAM_KB, "default RAM");
    t.eq(cfg.getClockKHz(), 7093, "default clock");
    t.eq(cfg.getIrqLevel(), 0, "periodic interrupt off by default");
    t.ok(cfg.getWarnHalt(), "halt warning on by default");
}


static void
testLimits(TestCtx &t)
{
    SysCfgState cfg;
    cfg.setDefaults();

    cfg.setRamKB(SysCfgState::MIN_RAM_KB - 1);
    t.ok(!cfg.configOk(false), "too little RAM");
    cfg.setRamKB(MAX_RAM_KB + 1);
    t.ok(!cfg.configOk(false), "too much RAM");
    cfg.setRamKB(1024);

    cfg.setClockKHz(SysCfgState::MAX_CLOCK_KHZ + 1);
    t.ok(!cfg.configOk(false), "clock too fast");
    cfg.setClockKHz(8000);

    cfg.setIrqLevel(8);
    t.ok(!cfg.configOk(false), "no level 8 interrupt");
    cfg.setIrqLevel(6);

    cfg.setIrqPeriodUs(SysCfgState::MIN_IRQ_PERIOD - 1);
    t.ok(!cfg.configOk(false), "interrupt period too short");
    cfg.setIrqPeriodUs(1000);

    t.ok(cfg.configOk(false), "back in range");
}


static void
testCompare(TestCtx &t)
{
    SysCfgState a;
    a.setDefaults();
    SysCfgState b(a);
    t.ok(a == b, "copies compare equal");

    b.setIrqLevel(4);
    t.ok(a != b, "interrupt level is compared");
    t.ok(!a.needsReboot(b), "interrupt changes don't rebuild the world");

    b = a;
    b.setWarnHalt(false);
    t.ok(!a.needsReboot(b), "halt warning doesn't rebuild the world");

    b = a;
    b.setRamKB(512);
    t.ok(a.needsReboot(b), "RAM size rebuilds the world");

    b = a;
    b.setClockKHz(8000);
    t.ok(a.needsReboot(b), "clock rate rebuilds the world");

    b = a;
    b.setTrace(true);
    t.ok(a.needsReboot(b), "tracing rebuilds the cpu");
}


int
main()
{
    TestCtx t("test_syscfg");
    testDefaults(t);
    testLimits(t);
    testCompare(t);
    return t.summary();
}

// vim: ts=8:et:sw=4:smarttab
