/** \file   util.h
 *  \brief  Logging and other utility functions that did not seem to logically fit anywhere else.
 *
 *  \copyright 2014-2026 Universitätsbibliothek Tübingen.  All rights reserved.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU Affero General Public License as
 *  published by the Free Software Foundation, either version 3 of the
 *  License, or (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Affero General Public License for more details.
 *
 *  You should have received a copy of the GNU Affero General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#pragma once


#include <mutex>
#include <string>
#include <unistd.h>
#include "Compiler.h"


/** \brief A thread-safe logger writing one line per message to stderr.
 *  \note  The environment variable LOGGER_FORMAT holds a comma-separated list of format options: "process_pids",
 *         "thread_ids", "strip_call_site" and "no_decorations".  MIN_LOG_LEVEL, if set, overrides the default minimum log
 *         level of INFO.
 */
class Logger {
public:
    enum LogLevel { LL_ERROR = 1, LL_WARNING = 2, LL_INFO = 3, LL_DEBUG = 4 };
private:
    static const std::string CALL_SITE_SEPARATOR;

    std::mutex mutex_;
    bool log_process_pids_, log_thread_ids_, log_no_decorations_, log_strip_call_site_;
    LogLevel min_log_level_;
public:
    Logger();

    inline void setMinimumLogLevel(const LogLevel min_log_level) { min_log_level_ = min_log_level; }
    inline LogLevel getMinimumLogLevel() const { return min_log_level_; }

    //* Emits "msg" together with the current errno description, if any, and then calls exit(3).
    [[noreturn]] void error(const std::string &call_site, const std::string &msg);

    inline void warning(const std::string &call_site, const std::string &msg) { log(LL_WARNING, call_site, msg); }
    inline void info(const std::string &call_site, const std::string &msg) { log(LL_INFO, call_site, msg); }
    inline void debug(const std::string &call_site, const std::string &msg) { log(LL_DEBUG, call_site, msg); }

    //* \note Calls LOG_ERROR if "level_candidate" is not one of "ERROR", "WARNING", "INFO" or "DEBUG".
    static LogLevel StringToLogLevel(const std::string &level_candidate);

    static std::string LogLevelToString(const LogLevel log_level);
private:
    void log(const LogLevel log_level, const std::string &call_site, const std::string &msg);

    // mutex_ must be held by the caller.
    void writeLine(const LogLevel log_level, const std::string &call_site, const std::string &msg);
};
extern Logger *logger;


#define LOG_ERROR(message) logger->error(__PRETTY_FUNCTION__, message)
#define LOG_WARNING(message) logger->warning(__PRETTY_FUNCTION__, message)
#define LOG_INFO(message) logger->info(__PRETTY_FUNCTION__, message)
#define LOG_DEBUG(message) logger->debug(__PRETTY_FUNCTION__, message)


/** Must be set to point to argv[0] in main(). */
extern char *progname;


// \note Prints "usage_message" to stderr, prefixed with "Usage: ", the program name and "[--min-log-level=...]", and exits.
[[noreturn]] void Usage(const std::string &usage_message);
