// ============================================================================
// headers
// ============================================================================

#include "Ui.h"
#include "host.h"

#include "wx/filename.h"        // for wxFileName
#include "wx/fileconf.h"        // for configuration state object
#include "wx/file.h"            // for wxFile
#include "wx/utils.h"           // time/date stuff
#include "wx/stopwatch.h"       // for wxStopWatch
#include "wx/stdpaths.h"        // wxStandardPaths stuff

// ============================================================================
// module state
// ============================================================================

static std::unique_ptr<wxFileConfig> config;     // configuration file object
static std::unique_ptr<wxStopWatch>  stopwatch;  // time program started

// the root of everything we keep in the ini file
static const std::string config_root("/m68kemu/config-0/");

// ============================================================================
// file-local functions
// ============================================================================

// make sure the ini file is one we understand
static void
checkConfigVersion()
{
    std::string subgroup("..");
    std::string foo;

    bool b = host::configReadStr(subgroup, "configversion", &foo);
    if (b && (foo != "1")) {
        UI_warn("Configuration file version '%s' found.\n"
                 "Version '1' expected.\n"
                 "Attempting to read the config file anyway.\n", foo.c_str());
    }
}


static void
saveConfigVersion()
{
    std::string subgroup("..");
    std::string version("1");

    host::configWriteStr(subgroup, "configversion", version);
}


// ------------------------------------------------------------------------
//  a small logging facility, not in the host namespace
// ------------------------------------------------------------------------

#include <cstdarg>      // for var args
#include <fstream>

static std::ofstream dbg_ofs;

void
dbglogOpen(const std::string &logname)
{
    if (dbg_ofs.is_open()) {
        return;     // only one log at a time
    }
    dbg_ofs.open(logname.c_str(), std::ofstream::out | std::ofstream::trunc);
    if (!dbg_ofs.good()) {
        UI_error("Error opening '%s' for logging.\n", logname.c_str());
        exit(-1);
    }
}


static void
dbglogClose()
{
    if (dbg_ofs.is_open()) {
        dbg_ofs.close();
    }
}


bool
dbglogActive() noexcept
{
    return dbg_ofs.is_open() && dbg_ofs.good();
}


void
dbglog(const char *fmt, ...)
{
    char buff[1000];
    va_list args;

    va_start(args, fmt);
    vsnprintf(&buff[0], sizeof(buff), fmt, args);
    va_end(args);

    if (dbglogActive()) {
        dbg_ofs << &buff[0];
        // this is useful if we are getting assert()s, causing
        // the last buffered block to not appear in the log.
        dbg_ofs.flush();
    }
}


// ============================================================================
// "public" functions
// ============================================================================

void
host::initialize()
{
#ifdef _DEBUG
    dbglogOpen("m68kemu.log");
#endif

    // path to executable
    const wxStandardPathsBase &stdp = wxStandardPaths::Get();
    wxFileName exe_path(stdp.GetExecutablePath());

#ifdef __VISUALC__
    // with ms visual c++, there is a Debug directory and a Release directory.
    // these are one below the anticipated real location where the exe will
    // live, so if we detect we are running from there, we raise the directory
    // one notch.
    const int dircount = exe_path.GetDirCount();
    const wxArrayString dirnames = exe_path.GetDirs();
    if (dirnames[dircount-1].Lower() == "debug" ||
        dirnames[dircount-1].Lower() == "release") {
        exe_path.AppendDir("..");
        exe_path.Normalize();
    }
#endif

    // the ini file lives in the same directory as the executable
    const wxString app_home(exe_path.GetPath(wxPATH_GET_VOLUME));
    wxFileName ini_path(app_home, "m68kemu.ini");
    config = std::make_unique<wxFileConfig>(
                wxEmptyString,                  // appName
                wxEmptyString,                  // vendorName
                ini_path.GetFullPath(),         // localFilename
                wxEmptyString,                  // globalFilename
                wxCONFIG_USE_LOCAL_FILE
             );

    // needed so we can compute a time difference to get ms later
    stopwatch = std::make_unique<wxStopWatch>();
    stopwatch->Start(0);

    checkConfigVersion();
}


// host is a kind of singleton, and as such it isn't owned and thus isn't
// destroyed by going out of scope.  Instead, the app's OnExit() calls this.
void
host::terminate()
{
    if (config) {
        saveConfigVersion();
        config->Flush();
    }
    config    = nullptr;
    stopwatch = nullptr;

    dbglogClose();       // turn off logging
}


// slurp a whole file into memory
bool
host::readBinaryFile(const std::string &filename, std::vector<uint8> *data)
{
    assert(data != nullptr);

    wxFile file;
    if (!wxFile::Exists(filename) || !file.Open(filename, wxFile::read)) {
        UI_error("Couldn't open file '%s'", filename.c_str());
        return false;
    }

    const wxFileOffset len = file.Length();
    if (len < 0) {
        UI_error("Couldn't determine the size of '%s'", filename.c_str());
        return false;
    }

    data->resize(static_cast<size_t>(len));
    if (len > 0) {
        const ssize_t got = file.Read(data->data(), static_cast<size_t>(len));
        if (got != len) {
            UI_error("Error reading file '%s'", filename.c_str());
            data->clear();
            return false;
        }
    }

    return true;
}


// ----------------------------------------------------------------------------
// Application configuration storage
// ----------------------------------------------------------------------------

// fetch an association from the configuration file
bool
host::configReadStr(const std::string &subgroup,
                    const std::string &key,
                    std::string *val,
                    const std::string *defaultval)
{
    assert(val != nullptr);
    assert(config);
    wxString wxval;
    config->SetPath(config_root + subgroup);
    bool b = config->Read(key, &wxval);
    if (!b && (defaultval != nullptr)) {
        *val = *defaultval;
    } else {
        *val = wxval;
    }
    return b;
}


bool
host::configReadInt(const std::string &subgroup,
                    const std::string &key,
                    int *val,
                    const int defaultval)
{
    assert(val != nullptr);
    std::string valstr;
    bool b = configReadStr(subgroup, key, &valstr);
    long v = 0;
    if (b) {
        wxString wxv(valstr);
        b = wxv.ToLong(&v, 0);  // 0 means allow hex and octal notation too
    }
    *val = (b) ? (int)v : defaultval;
    return b;
}


void
host::configReadBool(const std::string &subgroup,
                     const std::string &key,
                     bool *val,
                     const bool defaultval)
{
    assert(val != nullptr);
    int v = 0;
    const bool b = configReadInt(subgroup, key, &v, ((defaultval) ? 1:0));
    if (b && (v >= 0) && (v <= 1)) {
        *val = (v==1);
    } else {
        *val = defaultval;
    }
}


// send a string association to the configuration file
void
host::configWriteStr(const std::string &subgroup,
                     const std::string &key,
                     const std::string &val)
{
    assert(config);
    wxString wxKey(key);
    wxString wxVal(val);
    config->SetPath(config_root + subgroup);
    const bool b = config->Write(wxKey, wxVal);
    assert(b);
    (void)b;
}


// send an integer association to the configuration file
void
host::configWriteInt(const std::string &subgroup,
                     const std::string &key,
                     const int val)
{
    wxString foo;
    foo.Printf("%d", val);
    configWriteStr(subgroup, key, std::string(foo));
}


// send a boolean association to the configuration file
void
host::configWriteBool(const std::string &subgroup,
                      const std::string &key,
                      const bool val)
{
    const int foo = (val) ? 1 : 0;
    configWriteInt(subgroup, key, foo);
}


// ----------------------------------------------------------------------------
// time functions
// ----------------------------------------------------------------------------

// return the time in milliseconds as a 64b signed integer
int64
host::getTimeMs()
{
    assert(stopwatch);
    // NB: wxLongLong can't be mapped directly to "long long" type,
    //     thus the following gyrations
    const wxLongLong x_time_us = stopwatch->TimeInMicro();
    const uint32 x_low     = x_time_us.GetLo();
    const  int32 x_high    = x_time_us.GetHi();
    const  int64 x_time_ms = (((int64)x_high << 32) | x_low) / 1000;
    return x_time_ms;
}


// go to sleep for approximately ms milliseconds before returning
void
host::sleep(unsigned int ms)
{
    wxMilliSleep(ms);
}

// vim: ts=8:et:sw=4:smarttab
