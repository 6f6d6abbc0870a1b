// Copyright (c) 2026 The Verdant Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <logging.h>

#include <chrono>
#include <ctime>

const char * const DEFAULT_DEBUGLOGFILE = "ledger.log";

/**
 * NOTE: the logger instance is leaked on exit. This is ugly, but will be
 * cleaned up by the OS/libc. Defining a logger as a global object doesn't work
 * since the order of destruction of static/global objects is undefined.
 * Consider if the logger gets destroyed, and then some later destructor calls
 * LogPrintf, maybe indirectly, and you get a core dump at shutdown trying to
 * access the logger.
 */
VLog::Logger* const g_logger = new VLog::Logger();

struct CLogCategoryDesc
{
    VLog::LogFlags flag;
    std::string category;
};

const CLogCategoryDesc LogCategories[] =
{
    {VLog::NONE, "0"},
    {VLog::NONE, "none"},
    {VLog::LEDGER, "ledger"},
    {VLog::ACTION, "action"},
    {VLog::TOKEN, "token"},
    {VLog::SPONSOR, "sponsor"},
    {VLog::CONFIG, "config"},
    {VLog::ALL, "1"},
    {VLog::ALL, "all"},
};

bool GetLogCategory(VLog::LogFlags& flag, const std::string& str)
{
    if (str == "") {
        flag = VLog::ALL;
        return true;
    }
    for (const CLogCategoryDesc& category_desc : LogCategories) {
        if (category_desc.category == str) {
            flag = category_desc.flag;
            return true;
        }
    }
    return false;
}

std::string ListLogCategories()
{
    std::string ret;
    int outcount = 0;
    for (const CLogCategoryDesc& category_desc : LogCategories) {
        // Omit the special cases.
        if (category_desc.flag != VLog::NONE && category_desc.flag != VLog::ALL) {
            if (outcount != 0) ret += ", ";
            ret += category_desc.category;
            outcount++;
        }
    }
    return ret;
}

namespace VLog {

Logger::~Logger()
{
    CloseDebugLog();
}

bool Logger::OpenDebugLog()
{
    std::lock_guard<std::mutex> scoped_lock(m_file_mutex);

    if (m_fileout != nullptr) {
        return true;
    }
    m_fileout = fopen(m_file_path.c_str(), "a");
    if (!m_fileout) {
        return false;
    }

    setbuf(m_fileout, nullptr); // unbuffered
    return true;
}

void Logger::CloseDebugLog()
{
    std::lock_guard<std::mutex> scoped_lock(m_file_mutex);
    if (m_fileout != nullptr) {
        fclose(m_fileout);
        m_fileout = nullptr;
    }
}

void Logger::EnableCategory(LogFlags flag)
{
    m_categories |= flag;
}

bool Logger::EnableCategory(const std::string& str)
{
    LogFlags flag;
    if (!GetLogCategory(flag, str)) return false;
    EnableCategory(flag);
    return true;
}

void Logger::DisableCategory(LogFlags flag)
{
    m_categories &= ~flag;
}

bool Logger::DisableCategory(const std::string& str)
{
    LogFlags flag;
    if (!GetLogCategory(flag, str)) return false;
    DisableCategory(flag);
    return true;
}

bool Logger::WillLogCategory(LogFlags category) const
{
    return (m_categories.load(std::memory_order_relaxed) & category) != 0;
}

std::string Logger::LogTimestampStr(const std::string& str)
{
    std::string strStamped;

    if (!m_log_timestamps)
        return str;

    if (m_started_new_line) {
        std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm tm_utc;
        gmtime_r(&now, &tm_utc);
        char buf[32];
        strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_utc);
        strStamped = std::string(buf) + ' ' + str;
    } else
        strStamped = str;

    if (!str.empty() && str[str.size()-1] == '\n')
        m_started_new_line = true;
    else
        m_started_new_line = false;

    return strStamped;
}

int Logger::LogPrintStr(const std::string& str)
{
    int ret = 0; // Returns total number of characters written
    std::string strTimestamped = LogTimestampStr(str);

    if (m_print_to_console) {
        // print to console
        ret = fwrite(strTimestamped.data(), 1, strTimestamped.size(), stderr);
        fflush(stderr);
    }
    if (m_print_to_file) {
        std::lock_guard<std::mutex> scoped_lock(m_file_mutex);
        if (m_fileout != nullptr) {
            ret = fwrite(strTimestamped.data(), 1, strTimestamped.size(), m_fileout);
        }
    }
    return ret;
}

} // namespace VLog
