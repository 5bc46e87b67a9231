// Copyright (c) 2024 The ShareCodec developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Logging and formatting utilities.
 */
#ifndef SHARES_UTIL_H
#define SHARES_UTIL_H

#include <fs.h>

#include <atomic>
#include <cstdint>
#include <stdexcept>
#include <string>

#ifndef TINYFORMAT_ERROR
#define TINYFORMAT_ERROR(reasonString) throw std::runtime_error(reasonString)
#endif
#include <tinyformat.h>

/** Format arguments and return the string */
#define strprintf tfm::format

static const bool DEFAULT_LOGTIMESTAMPS = true;

extern bool fPrintToConsole;
extern bool fPrintToDebugLog;
extern bool fLogTimestamps;

/** Log categories bitfield. */
extern std::atomic<uint32_t> logCategories;

namespace BCLog {
    enum LogFlags : uint32_t {
        NONE        = 0,
        SHARES      = (1 <<  0),
        SPLIT       = (1 <<  1),
        PARSE       = (1 <<  2),
        ALL         = ~(uint32_t)0,
    };
}

/** Return true if log accepts specified category */
static inline bool LogAcceptCategory(uint32_t category)
{
    return (logCategories.load(std::memory_order_relaxed) & category) != 0;
}

/** Returns a string with the log categories. */
std::string ListLogCategories();

/** Return true if str parses as a log category and set the flags in f */
bool GetLogCategory(uint32_t *f, const std::string *str);

/** Enable the named category; returns false for an unknown name */
bool EnableLogCategory(const std::string& str);

/** Disable the named category; returns false for an unknown name */
bool DisableLogCategory(const std::string& str);

/** Send a string to the log output */
int LogPrintStr(const std::string &str);

/**
 * Open the debug log at path, creating its parent directories.
 * Lines logged before this call are kept in memory and flushed on open.
 */
bool OpenDebugLog(const fs::path& path);

/** Close the debug log file, if open */
void CloseDebugLog();

/** Get format string from VA_ARGS for error reporting */
template<typename... Args> std::string FormatStringFromLogArgs(const char *fmt, const Args&... args) { return fmt; }

#define LogPrintf(...) do { \
    std::string _log_msg_; /* Unlikely name to avoid shadowing variables */ \
    try { \
        _log_msg_ = tfm::format(__VA_ARGS__); \
    } catch (const std::runtime_error &fmterr) { \
        /* Original format string will have newline so don't add one here */ \
        _log_msg_ = "Error \"" + std::string(fmterr.what()) + "\" while formatting log message: " + FormatStringFromLogArgs(__VA_ARGS__); \
    } \
    LogPrintStr(_log_msg_); \
} while(0)

#define LogPrint(category, ...) do { \
    if (LogAcceptCategory((category))) { \
        LogPrintf(__VA_ARGS__); \
    } \
} while(0)

/** Log an error and return false */
template<typename... Args>
bool error(const char* fmt, const Args&... args)
{
    LogPrintStr("ERROR: " + tfm::format(fmt, args...) + "\n");
    return false;
}

/** ISO 8601 UTC timestamp of the current time, e.g. 2024-01-01T00:00:00Z */
std::string FormatISO8601Now();

#endif // SHARES_UTIL_H
