/** \file    util.cc
 *  \brief   Implementation of the logger and various utility functions.
 */

/*
    Copyright (C) 2015-2026 Library of the University of Tübingen

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU Affero General Public License as
    published by the Free Software Foundation, either version 3 of the
    License, or (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU Affero General Public License for more details.

    You should have received a copy of the GNU Affero General Public License
    along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/
#include "util.h"
#include <iostream>
#include <sstream>
#include <thread>
#include <utility>
#include <vector>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include "StringUtil.h"


char *progname; // Must be set in main() with "progname = argv[0];";


const std::string Logger::CALL_SITE_SEPARATOR(" --> ");


namespace {


const std::vector<std::pair<Logger::LogLevel, std::string>> LOG_LEVELS_AND_NAMES{
    { Logger::LL_ERROR,   "ERROR"   },
    { Logger::LL_WARNING, "WARNING" },
    { Logger::LL_INFO,    "INFO"    },
    { Logger::LL_DEBUG,   "DEBUG"   },
};


std::string GetCurrentISO8601DateAndTime() {
    const time_t now(std::time(nullptr));
    struct tm tm;
    ::gmtime_r(&now, &tm);
    char buffer[30];
    if (unlikely(std::strftime(buffer, sizeof buffer, "%Y-%m-%dT%H:%M:%SZ", &tm) == 0))
        return "";
    return buffer;
}


} // unnamed namespace


Logger::Logger()
    : log_process_pids_(false), log_thread_ids_(false), log_no_decorations_(false), log_strip_call_site_(false), min_log_level_(LL_INFO)
{
    const char * const min_log_level(::getenv("MIN_LOG_LEVEL"));
    if (min_log_level != nullptr)
        min_log_level_ = StringToLogLevel(min_log_level);

    const char * const logger_format(::getenv("LOGGER_FORMAT"));
    if (logger_format == nullptr)
        return;

    std::vector<std::string> format_options;
    StringUtil::Split(std::string(logger_format), ',', &format_options, /* suppress_empty_components = */ true);
    for (const auto &untrimmed_format_option : format_options) {
        const std::string format_option(StringUtil::TrimWhite(untrimmed_format_option));
        if (format_option == "process_pids")
            log_process_pids_ = true;
        else if (format_option == "thread_ids")
            log_thread_ids_ = true;
        else if (format_option == "no_decorations")
            log_no_decorations_ = true;
        else if (format_option == "strip_call_site")
            log_strip_call_site_ = true;
    }
}


void Logger::error(const std::string &call_site, const std::string &msg) {
    std::string full_msg(msg);
    if (errno != 0)
        full_msg += " (last errno error code: " + std::string(std::strerror(errno)) + ")";

    {
        std::lock_guard<std::mutex> mutex_locker(mutex_);
        writeLine(LL_ERROR, call_site, full_msg);
    }
    std::exit(EXIT_FAILURE);
}


void Logger::log(const LogLevel log_level, const std::string &call_site, const std::string &msg) {
    if (log_level > min_log_level_)
        return;

    std::lock_guard<std::mutex> mutex_locker(mutex_);
    writeLine(log_level, call_site, msg);
}


Logger::LogLevel Logger::StringToLogLevel(const std::string &level_candidate) {
    for (const auto &log_level_and_name : LOG_LEVELS_AND_NAMES) {
        if (log_level_and_name.second == level_candidate)
            return log_level_and_name.first;
    }

    LOG_ERROR("not a valid minimum log level: \"" + level_candidate + "\"! (Use ERROR, WARNING, INFO or DEBUG)");
}


std::string Logger::LogLevelToString(const LogLevel log_level) {
    for (const auto &log_level_and_name : LOG_LEVELS_AND_NAMES) {
        if (log_level_and_name.first == log_level)
            return log_level_and_name.second;
    }

    LOG_ERROR("unsupported log level " + std::to_string(log_level) + ", we should *never* get here!");
}


void Logger::writeLine(const LogLevel log_level, const std::string &call_site, const std::string &msg) {
    std::ostringstream line;
    if (not log_no_decorations_) {
        line << GetCurrentISO8601DateAndTime() << ' ' << LogLevelToString(log_level) << ' ' << ::program_invocation_name;
        if (log_process_pids_)
            line << " [PID " << ::getpid() << ']';
        if (log_thread_ids_)
            line << " [thread " << std::this_thread::get_id() << ']';
        line << ": ";
    }
    if (not log_strip_call_site_)
        line << "in " << call_site << CALL_SITE_SEPARATOR;
    line << msg << '\n';

    const std::string formatted_line(line.str());
    if (unlikely(::write(STDERR_FILENO, formatted_line.data(), formatted_line.size()) == -1))
        _exit(EXIT_FAILURE);
}


Logger *logger(new Logger());


[[noreturn]] void Usage(const std::string &usage_message) {
    std::vector<std::string> lines;
    StringUtil::Split(usage_message, '\n', &lines, /* suppress_empty_components = */ false);
    auto line(lines.cbegin());
    if (unlikely(line == lines.cend()))
        LOG_ERROR("missing usage message!");

    std::cerr << "Usage: " << ::program_invocation_name << " [--min-log-level=(ERROR|WARNING|INFO|DEBUG)] " << StringUtil::TrimWhite(*line)
              << '\n';
    const std::string padding(__builtin_strlen("Usage: ") + __builtin_strlen(::program_invocation_name) + 1, ' ');
    for (++line; line != lines.cend(); ++line)
        std::cerr << padding << StringUtil::TrimWhite(*line) << '\n';

    std::exit(EXIT_FAILURE);
}
