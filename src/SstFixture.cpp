// parse and run SingleStepTests 68000 fixtures

#include "SstFixture.h"
#include "Cpu68k.h"
#include "RamBus.h"
#include "host.h"       // for readBinaryFile(), dbglog()

#include <algorithm>    // for std::min
#include <cstdio>       // for snprintf
#include <utility>      // for std::move

// block magic numbers
static const uint32 FILE_MAGIC  = 0x1A3F5D71;
static const uint32 TEST_MAGIC  = 0xABC12367;
static const uint32 NAME_MAGIC  = 0x89ABCDEF;
static const uint32 STATE_MAGIC = 0x01234567;
static const uint32 XACT_MAGIC  = 0x456789AB;

// ------------------------------------------------------------------------
//  a cursor over the fixture image.  the first failure sticks; after that
//  every read returns zero and the caller checks ok() at its convenience.
// ------------------------------------------------------------------------

class FixtureReader
{
public:
    FixtureReader(const std::vector<uint8> &image, sst_error_t *err) :
        m_image(image), m_err(err)
    {
        assert(m_err != nullptr);
        *m_err = { SST_OK, 0, "" };
    }

    bool   ok() const noexcept { return m_err->kind == SST_OK; }
    size_t pos() const noexcept { return m_pos; }

    void fail(sst_error_kind_t kind, const std::string &msg)
    {
        if (ok()) {
            *m_err = { kind, m_pos, msg };
        }
    }

    bool have(size_t n, const char *what)
    {
        if (!ok()) {
            return false;
        }
        if (m_image.size() - m_pos < n) {
            fail(SST_TRUNCATED, std::string("unexpected end of data reading ") + what);
            return false;
        }
        return true;
    }

    uint8 u8(const char *what)
    {
        if (!have(1, what)) {
            return 0;
        }
        return m_image[m_pos++];
    }

    uint16 u16(const char *what)
    {
        if (!have(2, what)) {
            return 0;
        }
        const uint16 v = static_cast<uint16>(m_image[m_pos] | (m_image[m_pos+1] << 8));
        m_pos += 2;
        return v;
    }

    uint32 u32(const char *what)
    {
        if (!have(4, what)) {
            return 0;
        }
        const uint32 v = (static_cast<uint32>(m_image[m_pos+0])      )
                       | (static_cast<uint32>(m_image[m_pos+1]) <<  8)
                       | (static_cast<uint32>(m_image[m_pos+2]) << 16)
                       | (static_cast<uint32>(m_image[m_pos+3]) << 24);
        m_pos += 4;
        return v;
    }

    std::string bytes(size_t n, const char *what)
    {
        if (!have(n, what)) {
            return "";
        }
        std::string s(reinterpret_cast<const char*>(&m_image[m_pos]), n);
        m_pos += n;
        return s;
    }

    // every block starts with its size and a magic number
    void blockHeader(uint32 magic, const char *what)
    {
        const size_t start = m_pos;
        const uint32 size  = u32(what);
        const uint32 got   = u32(what);
        if (!ok()) {
            return;
        }
        if (size > m_image.size() - start) {
            m_pos = start;
            fail(SST_OVERSIZE_BLOCK,
                 std::string(what) + " block is larger than the rest of the file");
            return;
        }
        if (got != magic) {
            char buff[100];
            snprintf(&buff[0], sizeof(buff), "%s block has magic %08X, expected %08X",
                     what, got, magic);
            m_pos = start;
            fail(SST_BAD_MAGIC, buff);
        }
    }

private:
    const std::vector<uint8> &m_image;
    sst_error_t              *m_err;
    size_t                    m_pos = 0;
};


static void
readState(FixtureReader &rd, uint32 max_items, sst_state_t *st)
{
    rd.blockHeader(STATE_MAGIC, "state");

    for (auto &r : st->d) {
        r = rd.u32("registers");
    }
    for (auto &r : st->a) {
        r = rd.u32("registers");
    }
    st->usp = rd.u32("registers");
    st->ssp = rd.u32("registers");
    st->sr  = static_cast<uint16>(rd.u32("registers"));
    st->pc  = rd.u32("registers");
    st->prefetch[0] = rd.u32("prefetch");
    st->prefetch[1] = rd.u32("prefetch");

    const uint32 n = rd.u32("ram count");
    if (!rd.ok()) {
        return;
    }
    if (n > max_items || !rd.have(6*static_cast<size_t>(n), "ram")) {
        rd.fail(SST_TRUNCATED, "ram list runs past the end of the data");
        return;
    }

    st->ram.clear();
    st->ram.reserve(2*n);
    for (uint32 i=0; i < n; i++) {
        const uint32 addr = rd.u32("ram");
        const uint16 data = rd.u16("ram");
        st->ram.push_back({ addr,     static_cast<uint8>(data >> 8) });
        st->ram.push_back({ addr | 1, static_cast<uint8>(data)      });
    }
}


static void
readTransactions(FixtureReader &rd, uint32 max_items, sst_test_t *t)
{
    rd.blockHeader(XACT_MAGIC, "transactions");
    t->cycles = rd.u32("cycle count");
    const uint32 n = rd.u32("transaction count");
    if (!rd.ok()) {
        return;
    }
    if (n > max_items) {
        rd.fail(SST_TRUNCATED, "transaction count runs past the end of the data");
        return;
    }

    t->xacts.clear();
    uint32 clock = 0;
    for (uint32 i=0; i < n && rd.ok(); i++) {
        sst_xact_t x = sst_xact_t();
        x.kind   = rd.u8("transaction");
        x.length = rd.u32("transaction");
        x.start  = clock;
        if (x.kind != sst_xact_t::IDLE) {
            x.fc   = rd.u32("transaction");
            x.addr = rd.u32("transaction");
            x.data = rd.u32("transaction");
            x.uds  = rd.u32("transaction");
            x.lds  = rd.u32("transaction");
        }
        clock += x.length;
        t->xacts.push_back(x);
    }
}


// ------------------------------------------------------------------------
//  public interface
// ------------------------------------------------------------------------

bool
SstFixture::load(const std::string &filename)
{
    m_filename = filename;
    m_tests.clear();

    std::vector<uint8> image;
    if (!host::readBinaryFile(filename, &image)) {
        m_error = { SST_FILE_ERROR, 0, "couldn't read '" + filename + "'" };
        return false;
    }
    return parse(image);
}


bool
SstFixture::parse(const std::vector<uint8> &image)
{
    m_tests.clear();
    FixtureReader rd(image, &m_error);

    const uint32 magic = rd.u32("file header");
    const uint32 count = rd.u32("file header");
    if (!rd.ok()) {
        return false;
    }
    if (magic != FILE_MAGIC) {
        char buff[100];
        snprintf(&buff[0], sizeof(buff), "file magic %08X, expected %08X",
                 magic, FILE_MAGIC);
        m_error = { SST_BAD_MAGIC, 0, buff };
        return false;
    }

    for (uint32 i=0; i < count; i++) {
        sst_test_t t;
        rd.blockHeader(TEST_MAGIC, "test");

        rd.blockHeader(NAME_MAGIC, "name");
        const uint32 len = rd.u32("name length");
        t.name = rd.bytes(len, "name");

        readState(rd, MAX_ITEMS, &t.initial);
        readState(rd, MAX_ITEMS, &t.final_state);
        readTransactions(rd, MAX_ITEMS, &t);

        if (!rd.ok()) {
            m_error.message = "test " + std::to_string(i) + ": " + m_error.message;
            m_tests.clear();
            return false;
        }
        m_tests.push_back(std::move(t));
    }

    return true;
}


static void
report(std::vector<std::string> *out, const std::string &name,
       const char *what, uint32 got, uint32 expected)
{
    char buff[200];
    snprintf(&buff[0], sizeof(buff), "%s: %s mismatch: got 0x%08X, expected 0x%08X",
             name.c_str(), what, got, expected);
    out->push_back(buff);
}


// compare the reads and writes against the fixture's bus trace.
// a logged cycle carries the clock it completed on; bus cycles are
// four clocks long, as the fixtures have no wait states.
static bool
compareBusTrace(const sst_test_t &test, const RamBus &bus,
                std::vector<std::string> *out)
{
    std::vector<const RamBus::xact_t*> mine;
    for (auto &x : bus.log()) {
        if (x.kind != RamBus::XACT_IACK) {
            mine.push_back(&x);
        }
    }
    std::vector<const sst_xact_t*> theirs;
    for (auto &x : test.xacts) {
        if (x.kind != sst_xact_t::IDLE) {
            theirs.push_back(&x);
        }
    }

    bool ok = true;
    if (mine.size() != theirs.size()) {
        report(out, test.name, "bus cycle count",
               static_cast<uint32>(mine.size()), static_cast<uint32>(theirs.size()));
        ok = false;
    }

    const size_t n = std::min(mine.size(), theirs.size());
    for (size_t i=0; i < n; i++) {
        const RamBus::xact_t &m = *mine[i];
        const sst_xact_t     &t = *theirs[i];
        const int    kind  = (m.kind == RamBus::XACT_READ) ? sst_xact_t::READ
                                                           : sst_xact_t::WRITE;
        const uint32 start = static_cast<uint32>(m.stamp - 3);
        const uint32 data  = (m.word) ? t.data & 0xFFFF : t.data & 0xFF;
        const std::string what = "bus cycle " + std::to_string(i);

        if (kind != t.kind) {
            report(out, test.name, (what + " kind").c_str(), kind, t.kind);
            ok = false;
        }
        if (m.fc != t.fc) {
            report(out, test.name, (what + " fc").c_str(), m.fc, t.fc);
            ok = false;
        }
        if (m.addr != (t.addr & ADDR_MASK)) {
            report(out, test.name, (what + " address").c_str(), m.addr, t.addr);
            ok = false;
        }
        if (m.data != data) {
            report(out, test.name, (what + " data").c_str(), m.data, data);
            ok = false;
        }
        if (start != t.start) {
            report(out, test.name, (what + " start").c_str(), start, t.start);
            ok = false;
        }
    }

    return ok;
}


bool
SstFixture::runTest(const sst_test_t &test, RamBus &bus, bool compare_bus,
                    std::vector<std::string> *mismatches)
{
    assert(mismatches != nullptr);
    const sst_state_t &init = test.initial;
    const sst_state_t &fin  = test.final_state;

    bus.clearLog();
    bus.enableLog(true);
    bus.setCycleStamp(0);
    for (auto &r : init.ram) {
        bus.poke(r.addr, r.value);
    }

    const cpu_cfg_t cfg = { false, false };
    Cpu68000 cpu(bus, cfg);
    Registers68k &regs = cpu.regs();

    // S first, so the stack pointers land in the right places
    regs.setSr(init.sr);
    regs.setUsp(init.usp);
    regs.setSsp(init.ssp);
    for (int i=0; i < 8; i++) {
        regs.d[i] = init.d[i];
    }
    for (int i=0; i < 7; i++) {
        regs.a[i] = init.a[i];
    }
    regs.pc = init.pc;
    cpu.setupPrefetch(static_cast<uint16>(init.prefetch[0]),
                      static_cast<uint16>(init.prefetch[1]));

    const uint32 cycles = (test.cycles > 0) ? test.cycles : 8;
    for (uint32 n=0; n < cycles; n++) {
        bus.setCycleStamp(n);
        cpu.tick();
    }

    const size_t before = mismatches->size();
    static const char * const dnames[8] = { "D0", "D1", "D2", "D3", "D4", "D5", "D6", "D7" };
    static const char * const anames[7] = { "A0", "A1", "A2", "A3", "A4", "A5", "A6" };
    for (int i=0; i < 8; i++) {
        if (regs.d[i] != fin.d[i]) {
            report(mismatches, test.name, dnames[i], regs.d[i], fin.d[i]);
        }
    }
    for (int i=0; i < 7; i++) {
        if (regs.a[i] != fin.a[i]) {
            report(mismatches, test.name, anames[i], regs.a[i], fin.a[i]);
        }
    }
    if (regs.usp() != fin.usp) {
        report(mismatches, test.name, "USP", regs.usp(), fin.usp);
    }
    if (regs.ssp() != fin.ssp) {
        report(mismatches, test.name, "SSP", regs.ssp(), fin.ssp);
    }
    if (regs.sr() != fin.sr) {
        report(mismatches, test.name, "SR", regs.sr(), fin.sr);
    }
    if (regs.pc != fin.pc) {
        report(mismatches, test.name, "PC", regs.pc, fin.pc);
    }
    for (auto &r : fin.ram) {
        const uint8 got = bus.peek(r.addr);
        if (got != r.value) {
            char what[40];
            snprintf(&what[0], sizeof(what), "RAM[0x%06X]", r.addr & ADDR_MASK);
            report(mismatches, test.name, what, got, r.value);
        }
    }

    bool passed = (mismatches->size() == before);
    if (compare_bus && !compareBusTrace(test, bus, mismatches)) {
        passed = false;
    }

    // put back the memory this test touched, so the next one starts clean
    for (auto &r : init.ram) {
        bus.poke(r.addr, 0x00);
    }
    for (auto &r : fin.ram) {
        bus.poke(r.addr, 0x00);
    }
    for (auto &x : bus.log()) {
        if (x.kind == RamBus::XACT_WRITE) {
            bus.poke(x.addr, 0x00);
            if (x.word) {
                bus.poke(x.addr + 1, 0x00);
            }
        }
    }
    bus.clearLog();
    bus.enableLog(false);

    return passed;
}


sst_summary_t
SstFixture::runAll(bool compare_bus, int max_reports) const
{
    sst_summary_t sum = { 0, 0, {} };
    RamBus bus(RAM_KB);

    for (auto &t : m_tests) {
        std::vector<std::string> mismatches;
        if (runTest(t, bus, compare_bus, &mismatches)) {
            sum.passed++;
            continue;
        }
        sum.failed++;
        dbglog("%s: failed\n", t.name.c_str());
        for (auto &m : mismatches) {
            if (static_cast<int>(sum.reports.size()) >= max_reports) {
                break;
            }
            sum.reports.push_back(m);
        }
    }

    return sum;
}

// vim: ts=8:et:sw=4:smarttab
