// SingleStepTests fixture reader and runner checks, using fixture images
// assembled here rather than the real (large) fixture files.

#include "SstFixture.h"
#include "test_util.h"

#include "wx/init.h"            // for wxInitializer

#include <cstdio>
#include <fstream>

// assembles a little endian fixture image
class ImageWriter
{
public:
    void u8(uint8 v)   { m_data.push_back(v); }
    void u16(uint16 v) { u8(static_cast<uint8>(v)); u8(static_cast<uint8>(v >> 8)); }
    void u32(uint32 v) { u16(static_cast<uint16>(v)); u16(static_cast<uint16>(v >> 16)); }

    // start a block; returns where its size field is to be patched
    size_t beginBlock(uint32 magic)
    {
        const size_t at = m_data.size();
        u32(0);
        u32(magic);
        return at;
    }

    void endBlock(size_t at)
    {
        patch32(at, static_cast<uint32>(m_data.size() - at));
    }

    void patch32(size_t at, uint32 v)
    {
        for (int i=0; i < 4; i++) {
            m_data[at + i] = static_cast<uint8>(v >> (8*i));
        }
    }

    std::vector<uint8>& data() noexcept { return m_data; }

private:
    std::vector<uint8> m_data;
};

struct fake_cpu_t {
    uint32 d0;
    uint32 pc;
    uint16 prefetch[2];
    std::vector<std::pair<uint32, uint16>> ram;
};

static void
writeState(ImageWriter &w, const fake_cpu_t &s)
{
    const size_t blk = w.beginBlock(0x01234567);
    w.u32(s.d0);
    for (int i=1; i < 8; i++) {
        w.u32(0);               // d1-d7
    }
    for (int i=0; i < 7; i++) {
        w.u32(0x100*i);         // a0-a6
    }
    w.u32(0x00006000);          // usp
    w.u32(0x00008000);          // ssp
    w.u32(0x2700);              // sr
    w.u32(s.pc);
    w.u32(s.prefetch[0]);
    w.u32(s.prefetch[1]);
    w.u32(static_cast<uint32>(s.ram.size()));
    for (auto &r : s.ram) {
        w.u32(r.first);
        w.u16(r.second);
    }
    w.endBlock(blk);
}


// one test: a single instruction followed by NOPs, run for four clocks,
// which is just the prefetch of the word after the next opcode
static void
writeTest(ImageWriter &w, const std::string &name, uint16 opcode,
          uint32 d0_before, uint32 d0_after)
{
    const size_t test = w.beginBlock(0xABC12367);

    const size_t nm = w.beginBlock(0x89ABCDEF);
    w.u32(static_cast<uint32>(name.size()));
    for (char c : name) {
        w.u8(static_cast<uint8>(c));
    }
    w.endBlock(nm);

    fake_cpu_t init = { d0_before, 0x1004, { opcode, 0x4E71 },
                        { { 0x1000, opcode }, { 0x1002, 0x4E71 }, { 0x1004, 0x4E71 } } };
    fake_cpu_t fin  = init;
    fin.d0 = d0_after;
    fin.pc = 0x1006;
    writeState(w, init);
    writeState(w, fin);

    const size_t bus = w.beginBlock(0x456789AB);
    w.u32(4);                   // cycles
    w.u32(1);                   // transaction count
    w.u8(1);                    // read
    w.u32(4);                   // length
    w.u32(6);                   // supervisor program
    w.u32(0x1004);
    w.u32(0x4E71);
    w.u32(1);                   // UDS
    w.u32(1);                   // LDS
    w.endBlock(bus);

    w.endBlock(test);
}


static ImageWriter
goodImage()
{
    ImageWriter w;
    w.u32(0x1A3F5D71);
    w.u32(3);
    writeTest(w, "nop",       0x4E71, 0x11111111, 0x11111111);
    writeTest(w, "moveq",     0x7005, 0x11111111, 0x00000005);
    writeTest(w, "moveq bad", 0x7005, 0x11111111, 0x00000006);
    return w;
}


static void
testParse(TestCtx &t)
{
    ImageWriter w = goodImage();
    SstFixture fx;
    t.ok(fx.parse(w.data()), "good image parses");
    t.eq(fx.error().kind, SST_OK, "no error");
    t.eq(fx.tests().size(), 3, "three tests");
    if (fx.tests().size() != 3) {
        return;
    }

    const sst_test_t &nop = fx.tests()[0];
    t.ok(nop.name == "nop", "test name");
    t.eq(nop.initial.pc, 0x1004, "initial pc");
    t.eq(nop.initial.ssp, 0x8000, "initial ssp");
    t.eq(nop.initial.a[3], 0x300, "initial a3");
    t.eq(nop.initial.ram.size(), 6, "ram words split into bytes");
    t.eq(nop.initial.ram[0].addr, 0x1000, "high byte address");
    t.eq(nop.initial.ram[0].value, 0x4E, "high byte value");
    t.eq(nop.initial.ram[1].addr, 0x1001, "low byte address");
    t.eq(nop.initial.ram[1].value, 0x71, "low byte value");
    t.eq(nop.cycles, 4, "cycle count");
    t.eq(nop.xacts.size(), 1, "one transaction");
    t.eq(nop.xacts[0].start, 0, "first transaction starts at 0");
    t.eq(nop.xacts[0].addr, 0x1004, "transaction address");
}


static void
testRun(TestCtx &t)
{
    ImageWriter w = goodImage();
    SstFixture fx;
    if (!t.ok(fx.parse(w.data()), "parse for run")) {
        return;
    }

    RamBus bus(SstFixture::RAM_KB);
    std::vector<std::string> mismatches;
    t.ok(SstFixture::runTest(fx.tests()[0], bus, true, &mismatches), "NOP passes with bus check");
    t.ok(mismatches.empty(), "no NOP mismatches");
    t.eq(bus.peekWord(0x1000), 0, "memory cleaned up after the test");

    const sst_summary_t sum = fx.runAll(true);
    t.eq(sum.passed, 2, "two tests pass");
    t.eq(sum.failed, 1, "one test fails");
    t.ok(!sum.reports.empty() &&
         sum.reports[0] == "moveq bad: D0 mismatch: got 0x00000005, expected 0x00000006",
         "mismatch report names the register");

    const sst_summary_t few = fx.runAll(false, 0);
    t.ok(few.reports.empty(), "report limit honored");
}


static void
testErrors(TestCtx &t)
{
    {
        ImageWriter w = goodImage();
        w.data().resize(6);
        SstFixture fx;
        t.ok(!fx.parse(w.data()), "short header fails");
        t.eq(fx.error().kind, SST_TRUNCATED, "short header is truncated");
    }
    {
        ImageWriter w = goodImage();
        w.patch32(4, 4);        // claims a fourth test
        SstFixture fx;
        t.ok(!fx.parse(w.data()), "missing test fails");
        t.eq(fx.error().kind, SST_TRUNCATED, "missing test is truncated");
        t.ok(fx.tests().empty(), "no partial results");
    }
    {
        ImageWriter w = goodImage();
        w.patch32(0, 0xDEADBEEF);
        SstFixture fx;
        t.ok(!fx.parse(w.data()), "bad file magic fails");
        t.eq(fx.error().kind, SST_BAD_MAGIC, "bad file magic");
        t.eq(fx.error().offset, 0, "bad file magic offset");
    }
    {
        ImageWriter w = goodImage();
        w.patch32(8 + 12, 0x12345678);     // the name block magic
        SstFixture fx;
        t.ok(!fx.parse(w.data()), "bad block magic fails");
        t.eq(fx.error().kind, SST_BAD_MAGIC, "bad block magic");
        t.eq(fx.error().offset, 8 + 8, "bad block magic offset");
    }
    {
        ImageWriter w = goodImage();
        w.patch32(8, 0x7FFFFFFF);          // the first test block size
        SstFixture fx;
        t.ok(!fx.parse(w.data()), "oversize block fails");
        t.eq(fx.error().kind, SST_OVERSIZE_BLOCK, "oversize block");
    }
    {
        SstFixture fx;
        t.ok(!fx.load("no/such/fixture.bin"), "missing file fails");
        t.eq(fx.error().kind, SST_FILE_ERROR, "missing file");
    }
}


static void
testLoad(TestCtx &t)
{
    const char *fname = "test_fixture_tmp.bin";
    ImageWriter w = goodImage();
    {
        std::ofstream ofs(fname, std::ofstream::binary);
        ofs.write(reinterpret_cast<const char*>(w.data().data()),
                  static_cast<std::streamsize>(w.data().size()));
    }

    SstFixture fx;
    t.ok(fx.load(fname), "fixture loads from a file");
    t.eq(fx.tests().size(), 3, "tests from the file");
    t.ok(fx.filename() == fname, "filename kept");
    (void)std::remove(fname);
}


int
main(int argc, char **argv)
{
    wxInitializer initializer(argc, argv);
    if (!initializer.IsOk()) {
        std::printf("test_fixture: couldn't initialize wxWidgets\n");
        return 2;
    }

    TestCtx t("test_fixture");
    testParse(t);
    testRun(t);
    testErrors(t);
    testLoad(t);
    return t.summary();
}

// vim: ts=8:et:sw=4:smarttab
