// Copyright (c) 2024 The ShareCodec developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <util.h>

#include <ctime>
#include <list>
#include <mutex>

bool fPrintToConsole = false;
bool fPrintToDebugLog = true;
bool fLogTimestamps = DEFAULT_LOGTIMESTAMPS;

/** Log categories bitfield. */
std::atomic<uint32_t> logCategories(0);

namespace {

/**
 * fileout is opened by OpenDebugLog. Messages logged before that are
 * buffered in vMsgsBeforeOpenLog and written out on open.
 */
std::mutex mutexDebugLog;
FILE* fileout = nullptr;
std::list<std::string> vMsgsBeforeOpenLog;

/** Cap on messages buffered before the log file is opened */
const size_t MAX_MSGS_BEFORE_OPEN_LOG = 1000;

/** Whether the next line written starts a new log line */
std::atomic_bool fStartedNewLine(true);

struct CLogCategoryDesc
{
    uint32_t flag;
    std::string category;
};

const CLogCategoryDesc LogCategories[] =
{
    {BCLog::NONE, "0"},
    {BCLog::SHARES, "shares"},
    {BCLog::SPLIT, "split"},
    {BCLog::PARSE, "parse"},
    {BCLog::ALL, "1"},
    {BCLog::ALL, "all"},
};

int FileWriteStr(const std::string &str, FILE *fp)
{
    return fwrite(str.data(), 1, str.size(), fp);
}

std::string LogTimestampStr(const std::string &str)
{
    std::string strStamped;

    if (!fLogTimestamps)
        return str;

    if (fStartedNewLine) {
        strStamped = FormatISO8601Now() + ' ' + str;
    } else {
        strStamped = str;
    }

    fStartedNewLine = !str.empty() && str[str.size() - 1] == '\n';

    return strStamped;
}

} // namespace

FILE *fsbridge::fopen(const fs::path& p, const char *mode)
{
    return ::fopen(p.string().c_str(), mode);
}

bool GetLogCategory(uint32_t *f, const std::string *str)
{
    if (f && str) {
        if (*str == "") {
            *f = BCLog::ALL;
            return true;
        }
        for (unsigned int i = 0; i < sizeof(LogCategories) / sizeof(LogCategories[0]); i++) {
            if (LogCategories[i].category == *str) {
                *f = LogCategories[i].flag;
                return true;
            }
        }
    }
    return false;
}

bool EnableLogCategory(const std::string& str)
{
    uint32_t flag = 0;
    if (!GetLogCategory(&flag, &str)) {
        return false;
    }
    logCategories |= flag;
    return true;
}

bool DisableLogCategory(const std::string& str)
{
    uint32_t flag = 0;
    if (!GetLogCategory(&flag, &str)) {
        return false;
    }
    logCategories &= ~flag;
    return true;
}

std::string ListLogCategories()
{
    std::string ret;
    int outcount = 0;
    for (unsigned int i = 0; i < sizeof(LogCategories) / sizeof(LogCategories[0]); i++) {
        // Omit the special cases.
        if (LogCategories[i].flag != BCLog::NONE && LogCategories[i].flag != BCLog::ALL) {
            if (outcount != 0) ret += ", ";
            ret += LogCategories[i].category;
            outcount++;
        }
    }
    return ret;
}

std::string FormatISO8601Now()
{
    time_t now = time(nullptr);
    struct tm ts;
    if (gmtime_r(&now, &ts) == nullptr) {
        return "";
    }
    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &ts);
    return buf;
}

bool OpenDebugLog(const fs::path& path)
{
    std::lock_guard<std::mutex> scoped_lock(mutexDebugLog);

    if (fileout) {
        fclose(fileout);
        fileout = nullptr;
    }

    try {
        if (path.has_parent_path()) {
            fs::create_directories(path.parent_path());
        }
    } catch (const fs::filesystem_error& e) {
        fprintf(stderr, "Unable to create directory for debug log %s: %s\n", path.string().c_str(), e.what());
        return false;
    }

    fileout = fsbridge::fopen(path, "a");
    if (!fileout) {
        return false;
    }

    setbuf(fileout, nullptr); // unbuffered
    // dump buffered messages from before we opened the log
    while (!vMsgsBeforeOpenLog.empty()) {
        FileWriteStr(vMsgsBeforeOpenLog.front(), fileout);
        vMsgsBeforeOpenLog.pop_front();
    }
    return true;
}

void CloseDebugLog()
{
    std::lock_guard<std::mutex> scoped_lock(mutexDebugLog);
    if (fileout) {
        fclose(fileout);
        fileout = nullptr;
    }
}

int LogPrintStr(const std::string &str)
{
    int ret = 0; // Returns total number of characters written

    std::string strTimestamped = LogTimestampStr(str);

    if (fPrintToConsole) {
        // print to console
        ret = fwrite(strTimestamped.data(), 1, strTimestamped.size(), stdout);
        fflush(stdout);
    }
    if (fPrintToDebugLog) {
        std::lock_guard<std::mutex> scoped_lock(mutexDebugLog);

        // buffer if we haven't opened the log yet
        if (fileout == nullptr) {
            ret = strTimestamped.length();
            if (vMsgsBeforeOpenLog.size() < MAX_MSGS_BEFORE_OPEN_LOG) {
                vMsgsBeforeOpenLog.push_back(strTimestamped);
            }
        } else {
            ret = FileWriteStr(strTimestamped, fileout);
        }
    }
    return ret;
}
