/////////////////////////////////////////////////////////////////////////////
// main.cpp
//
// This file contains the entry point for the emulator.  There is no gui;
// the command line says what to do:
//
//    m68kemu -t fixture.bin [more fixtures...] [-x]
//        run SingleStepTests fixture files and report pass/fail counts
//    m68kemu -r image.bin [-c cycles] [-q d0,pc,flags.z | all] [-v]
//        load a raw memory image at address 0, reset, run, then print
//        the requested pieces of cpu state
/////////////////////////////////////////////////////////////////////////////

// ----------------------------------------------------------------------------
// headers
// ----------------------------------------------------------------------------

#include "Cpu68k.h"
#include "SstFixture.h"
#include "SysCfgState.h"
#include "Ui.h"
#include "host.h"
#include "system68k.h"

#include "wx/app.h"
#include "wx/cmdline.h"         // req'd by wxCmdLineParser
#include "wx/tokenzr.h"         // for wxStringTokenizer

// ============================================================================
// declarations
// ============================================================================

class TheApp : public wxAppConsole
{
public:
    TheApp() = default;

    CANT_ASSIGN_CLASS(TheApp);

private:
    // build the world
    bool OnInit() override;

    // do what the command line asked, then return the exit code
    int OnRun() override;

    // like the name says
    int OnExit() override;

    // set the command line parsing options
    void OnInitCmdLine(wxCmdLineParser& parser) override;

    // after the command line has been parsed, decode what it finds
    bool OnCmdLineParsed(wxCmdLineParser& parser) override;

    // the two modes of operation
    int runFixtures();
    int runImage();

    // print the requested cpu state
    void printQueries() const;

    // ---- what the command line asked for ----
    std::vector<std::string> m_fixtures;        // -t and trailing params
    std::string              m_image;           // -r
    long                     m_cycles  = -1;    // -c; -1 means until halted
    std::string              m_queries;         // -q
    bool                     m_bus_cmp = false; // -x
    bool                     m_trace   = false; // -v
};

// exit codes
enum { EXIT_OK=0, EXIT_MISMATCH=1, EXIT_PARSE=2, EXIT_USAGE=3 };

// ============================================================================
// implementation
// ============================================================================

IMPLEMENT_APP_CONSOLE(TheApp)

// `Main program' equivalent: the program execution "starts" here
bool
TheApp::OnInit()
{
    // must call base class version to get command line processing
    // if false, the app terminates
    if (!wxAppConsole::OnInit()) {
        return false;
    }

    host::initialize();
    if (m_trace) {
        dbglogOpen("m68kemu.log");
    }

    system68k::initialize();  // build the world
    return true;
}


int
TheApp::OnRun()
{
    if (!m_fixtures.empty()) {
        return runFixtures();
    }
    if (!m_image.empty()) {
        return runImage();
    }

    UI_error("Nothing to do: give -t <fixture> or -r <image>");
    return EXIT_USAGE;
}


// called just before quitting the entire app, but before wxWidgets
// cleans up its internal resources.
int
TheApp::OnExit()
{
    // clean up, which includes saving .ini file
    system68k::cleanup();
    host::terminate();

    return wxAppConsole::OnExit();
}


// set the command line parsing options
void
TheApp::OnInitCmdLine(wxCmdLineParser& parser)
{
    // set default wx options
    wxAppConsole::OnInitCmdLine(parser);

    parser.DisableLongOptions();        // -foo, not --foo

    // add options specific to this app
    parser.AddOption("t", "test",   "SingleStepTests fixture file to run", wxCMD_LINE_VAL_STRING);
    parser.AddOption("r", "raw",    "raw memory image to load at address 0", wxCMD_LINE_VAL_STRING);
    parser.AddOption("c", "cycles", "number of clocks to run the image", wxCMD_LINE_VAL_NUMBER);
    parser.AddOption("q", "query",  "comma separated cpu state to print, or 'all'", wxCMD_LINE_VAL_STRING);
    parser.AddSwitch("x", "bus",    "compare bus cycles in fixture runs");
    parser.AddSwitch("v", "trace",  "log every instruction to m68kemu.log");
    parser.AddParam("more fixture files", wxCMD_LINE_VAL_STRING,
                    wxCMD_LINE_PARAM_OPTIONAL | wxCMD_LINE_PARAM_MULTIPLE);
}


// after the command line has been parsed, decode what it finds
bool
TheApp::OnCmdLineParsed(wxCmdLineParser& parser)
{
    // let base class handle its defaults
    if (!wxAppConsole::OnCmdLineParsed(parser)) {
        return false;
    }

    wxString str;
    if (parser.Found("t", &str)) {
        m_fixtures.push_back(std::string(str.c_str()));
    }
    for (size_t n=0; n < parser.GetParamCount(); n++) {
        m_fixtures.push_back(std::string(parser.GetParam(n).c_str()));
    }
    if (parser.Found("r", &str)) {
        m_image = std::string(str.c_str());
    }
    if (parser.Found("q", &str)) {
        m_queries = std::string(str.c_str());
    }

    long cycles;
    if (parser.Found("c", &cycles)) {
        if (cycles < 0) {
            UI_error("The cycle count must not be negative");
            return false;
        }
        m_cycles = cycles;
    }

    m_bus_cmp = parser.Found("x");
    m_trace   = parser.Found("v");

    if (!m_fixtures.empty() && !m_image.empty()) {
        UI_error("-t and -r can't be used together");
        return false;
    }

    return true;
}


int
TheApp::runFixtures()
{
    int passed = 0;
    int failed = 0;
    int bad_files = 0;

    for (auto &name : m_fixtures) {
        SstFixture fixture;
        if (!fixture.load(name)) {
            const sst_error_t &err = fixture.error();
            UI_error("%s: unusable fixture at offset %d: %s",
                     name.c_str(), static_cast<int>(err.offset),
                     err.message.c_str());
            bad_files++;
            continue;
        }

        const sst_summary_t sum = fixture.runAll(m_bus_cmp);
        wxPrintf("%s: %d passed, %d failed\n", name, sum.passed, sum.failed);
        for (auto &line : sum.reports) {
            wxPrintf("    %s\n", line);
        }
        passed += sum.passed;
        failed += sum.failed;
    }

    if (m_fixtures.size() > 1) {
        wxPrintf("total: %d passed, %d failed, %d unusable files\n",
                 passed, failed, bad_files);
    }

    if (bad_files > 0) {
        return EXIT_PARSE;
    }
    return (failed > 0) ? EXIT_MISMATCH : EXIT_OK;
}


int
TheApp::runImage()
{
    // -v is for this run only; it doesn't make it into the ini file
    const SysCfgState saved_cfg(system68k::config());
    if (m_trace) {
        SysCfgState cfg(saved_cfg);
        cfg.setTrace(true);
        system68k::setConfig(cfg);
    }

    if (!system68k::loadImage(m_image)) {
        if (m_trace) {
            system68k::setConfig(saved_cfg);
        }
        return EXIT_USAGE;
    }

    if (m_cycles >= 0) {
        system68k::regulateCpuSpeed(false);
        system68k::runCycles(static_cast<uint64>(m_cycles));
    } else {
        // realtime, until the cpu halts
        system68k::regulateCpuSpeed(true);
        while (!system68k::isTerminating()) {
            (void)system68k::onIdle();
        }
    }

    printQueries();

    if (m_trace) {
        system68k::setConfig(saved_cfg);
    }
    return EXIT_OK;
}


void
TheApp::printQueries() const
{
    if (m_queries.empty()) {
        return;
    }

    const Cpu68000 &cpu = system68k::cpu();
    std::vector<std::string> paths;
    if (m_queries == "all") {
        paths = cpu.queryPaths();
    } else {
        wxStringTokenizer tok(m_queries, ",");
        while (tok.HasMoreTokens()) {
            paths.push_back(std::string(tok.GetNextToken().Trim().Trim(false).c_str()));
        }
    }

    for (auto &path : paths) {
        uint64 val;
        if (cpu.query(path, &val)) {
            wxPrintf("%-10s 0x%llX\n", path, static_cast<unsigned long long>(val));
        } else {
            UI_warn("Unknown query '%s'", path.c_str());
        }
    }
}

// vim: ts=8:et:sw=4:smarttab
