// This module encapsulates non-gui, host-dependent services:
//    configuration persistence
//    file access
//    real time functions
//    debug logging
//
// The configuration is kept in an .ini file, with data stored hierarchically.
// There are a few global ini values that describe the ini file format
// revision.  Beneath that is a single set of emulator configuration state,
// split into a few subgroups ("cpu", "irq", "misc").
//
// All the config* functions take as a first parameter the "subgroup", which
// is a concatenation of the ini storage path up until a final set of state.
// The "key" is the final level of lookup.

#ifndef _INCLUDE_HOST_H_
#define _INCLUDE_HOST_H_

#include "m68kemu.h"

namespace host
{
    // must be called at time 0 to initialize things
    void initialize();

    // this should be called at the end of the world to really free resources.
    void terminate();

    // ---- read or write an entry in the configuration file ----
    // the configRead* functions take a defaultval; this is the value returned
    // if the key for that subgroup isn't found in the config file.

    bool configReadStr(const std::string &subgroup,
                       const std::string &key,
                       std::string *val,
                       const std::string *defaultval = nullptr);

    void configWriteStr(const std::string &subgroup,
                        const std::string &key,
                        const std::string &val);

    bool configReadInt(const std::string &subgroup,
                       const std::string &key,
                       int *val,
                       const int defaultval = 0);

    void configWriteInt(const std::string &subgroup,
                        const std::string &key,
                        const int val);

    void configReadBool(const std::string &subgroup,
                        const std::string &key,
                        bool *val,
                        const bool defaultval = false);

    void configWriteBool(const std::string &subgroup,
                         const std::string &key,
                         const bool val);

    // ---- file access ----

    // read an entire binary file.  returns false and reports the
    // problem if the file can't be read.
    bool readBinaryFile(const std::string &filename, std::vector<uint8> *data);

    // ---- real time functions ----

    // return the time in milliseconds as a 64b signed integer
    int64 getTimeMs();

    // go to sleep for approximately ms milliseconds before returning
    void sleep(unsigned int ms);

} // namespace host

// ---- logging, not in the host namespace ----

// open the debug log; subsequent dbglog() calls append to it
void dbglogOpen(const std::string &logname);

// returns true if the debug log is accepting messages
bool dbglogActive() noexcept;

// printf-style message to the debug log
void dbglog(const char *fmt, ...);

#endif // _INCLUDE_HOST_H_

// vim: ts=8:et:sw=4:smarttab
