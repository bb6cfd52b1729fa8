// Reader and runner for the SingleStepTests 68000 binary fixture format.
//
// A fixture file holds a few thousand test cases.  Each one gives the cpu
// state and memory before a single instruction, the state and memory
// after it, the number of clocks it takes, and the bus cycles it performs.
// All multi-byte fields are little endian.
//
//   file:    u32 magic (0x1A3F5D71), u32 number of tests
//   block:   u32 block size, u32 block magic, contents
//   test:    block magic 0xABC12367, then a name block, the initial state
//            block, the final state block and the transactions block
//   name:    block magic 0x89ABCDEF, u32 length, bytes
//   state:   block magic 0x01234567, 19 u32 (d0-d7 a0-a6 usp ssp sr pc),
//            2 u32 prefetch words, u32 n, then n x (u32 addr, u16 data);
//            the high byte of data lives at addr, the low byte at addr|1
//   bus:     block magic 0x456789AB, u32 cycles, u32 count, then per
//            transaction a u8 kind and a u32 length, and unless the kind
//            is idle, five u32: fc, addr, data, UDS, LDS
//
// Problems with the file itself are reported as an sst_error_t and never
// counted as emulation mismatches.

#ifndef _INCLUDE_SST_FIXTURE_H_
#define _INCLUDE_SST_FIXTURE_H_

#include "m68kemu.h"

class RamBus;

// why a fixture couldn't be parsed
enum sst_error_kind_t {
    SST_OK = 0,
    SST_FILE_ERROR,     // the file couldn't be read
    SST_TRUNCATED,      // ran off the end of the data
    SST_BAD_MAGIC,      // a block didn't carry the expected magic
    SST_OVERSIZE_BLOCK  // a block claims more bytes than remain
};

struct sst_error_t {
    sst_error_kind_t kind;
    size_t           offset;    // where in the file it went wrong
    std::string      message;
};

struct sst_ram_t {
    uint32 addr;
    uint8  value;
};

struct sst_state_t {
    uint32 d[8];
    uint32 a[7];
    uint32 usp;
    uint32 ssp;
    uint16 sr;
    uint32 pc;
    uint32 prefetch[2];
    std::vector<sst_ram_t> ram;
};

struct sst_xact_t {
    enum { IDLE=0, READ=1, WRITE=2 };
    int    kind;
    uint32 length;      // clocks
    uint32 start;       // clock the transaction begins on
    uint32 fc;
    uint32 addr;
    uint32 data;
    uint32 uds;
    uint32 lds;
};

struct sst_test_t {
    std::string             name;
    sst_state_t             initial;
    sst_state_t             final_state;
    uint32                  cycles;
    std::vector<sst_xact_t> xacts;
};

// totals from running a whole file
struct sst_summary_t {
    int passed;
    int failed;
    std::vector<std::string> reports;   // the first few mismatch reports
};

class SstFixture
{
public:
    CANT_ASSIGN_OR_COPY_CLASS(SstFixture);

    SstFixture() = default;
    ~SstFixture() = default;

    // read and parse a fixture file.  returns false if it couldn't;
    // error() then says why.
    bool load(const std::string &filename);

    // parse a fixture image already in memory
    bool parse(const std::vector<uint8> &image);

    const sst_error_t& error() const noexcept { return m_error; }
    const std::vector<sst_test_t>& tests() const noexcept { return m_tests; }
    const std::string& filename() const noexcept { return m_filename; }

    // run one test case on a fresh cpu against the given bus.  any
    // difference from the expected final state is appended to mismatches.
    // if compare_bus is set, the bus cycles are checked too.
    // returns true if the test passed.
    static bool runTest(const sst_test_t &test, RamBus &bus, bool compare_bus,
                        std::vector<std::string> *mismatches);

    // run every test case in the fixture, keeping at most max_reports
    // mismatch lines
    sst_summary_t runAll(bool compare_bus, int max_reports=20) const;

    // memory the runner needs, in KB
    static const int RAM_KB = 16384;

private:
    // how far to trust a transaction count or ram list length
    static const uint32 MAX_ITEMS = 0x100000;

    std::string             m_filename;
    std::vector<sst_test_t> m_tests;
    sst_error_t             m_error = { SST_OK, 0, "" };
};

#endif // _INCLUDE_SST_FIXTURE_H_

// vim: ts=8:et:sw=4:smarttab
