/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 *
 * Permission is hereby granted, free of charge, to any person obtaining
 * a copy of this software and associated documentation files (the
 * "Software"), to deal in the Software without restriction, including
 * without limitation the rights to use, copy, modify, merge, publish,
 * distribute, sublicense, and/or sell copies of the Software, and to
 * permit persons to whom the Software is furnished to do so, subject
 * to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included
 * in all copies or substantial portions of the Software.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS
 * IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED
 * TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A
 * PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT OWNER
 * OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL,
 * EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
 * PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR
 * PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF
 * LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING
 * NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */
#ifndef MGFEM_FE_LOGGER_H
#define MGFEM_FE_LOGGER_H

/**
 * @file Logger.h
 * @brief Process-wide logger for the FE library
 */

#include "Types.h"
#include "FEConfig.h"

#include <chrono>
#include <fstream>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace mgfem {
namespace FE {

enum class LogLevel : int {
    DEBUG    = 0,
    INFO     = 1,
    WARNING  = 2,
    ERROR    = 3,
    CRITICAL = 4,
    OFF      = 5
};

inline const char* log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:    return "DEBUG";
        case LogLevel::INFO:     return "INFO";
        case LogLevel::WARNING:  return "WARN";
        case LogLevel::ERROR:    return "ERROR";
        case LogLevel::CRITICAL: return "CRIT";
        default:                 return "UNKNOWN";
    }
}

/// Case-insensitive; accepts the full names and WARN/CRIT. False if unknown.
bool parse_log_level(const std::string& name, LogLevel& level);

/// One record as handed to custom handlers
struct LogMessage {
    LogLevel level;
    std::string message;
    std::string file;
    int line;
    std::string function;
    std::chrono::system_clock::time_point timestamp;
    int mpi_rank;
    std::thread::id thread_id;
};

/**
 * @brief Thread-safe logger singleton
 *
 * Records at or above the current level go to the console (WARNING and
 * above on stderr), to the log file if one is open, and to every handler.
 * In MPI runs the file name gets a `_rank<r>` suffix and lines carry an
 * `[R<r>]` prefix. DEBUG records are dropped in release builds.
 *
 * The first configuration comes from the environment when the library is
 * loaded:
 *
 * - FE_LOG_LEVEL      DEBUG | INFO | WARNING | ERROR | CRITICAL | OFF
 * - FE_LOG_FILE       path of the log file
 * - FE_LOG_CONSOLE    0/false disables console output
 * - FE_LOG_SHOW_RANK  0/false hides the rank prefix
 * - FE_LOG_SHOW_TIME  0/false hides timestamps
 */
class Logger {
public:
    using LogHandler = std::function<void(const LogMessage&)>;

    static Logger& instance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void set_level(LogLevel level);
    LogLevel get_level() const;

    void set_console_output(bool enabled);

    /// Empty closes the current file
    void set_file_output(const std::string& filename);

    void set_show_rank(bool show);
    void set_show_timestamp(bool show);

    void configure_from_environment();

    void log(LogLevel level,
             const std::string& message,
             const char* file = "",
             int line = 0,
             const char* function = "");

    /// Handlers run under the logger lock and must not log themselves
    std::size_t add_handler(LogHandler handler);
    void remove_handler(std::size_t id);

    void flush();

private:
    Logger();
    ~Logger();

    std::string format_message(const LogMessage& msg) const;

    mutable std::mutex mutex_;
    LogLevel min_level_;
    bool console_output_;
    bool show_rank_;
    bool show_timestamp_;
    std::ofstream file_stream_;
    std::vector<std::pair<std::size_t, LogHandler>> handlers_;
    std::size_t next_handler_id_ = 0;
};

/// Logs "Starting: name" on entry and "Completed: name (elapsed: Ts)" on exit
class ScopedTimer {
public:
    explicit ScopedTimer(std::string name, LogLevel level = LogLevel::INFO);
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    std::string name_;
    LogLevel level_;
    std::chrono::steady_clock::time_point start_;
};

#define FE_LOG(level, message) \
    mgfem::FE::Logger::instance().log(level, message, __FILE__, __LINE__, __FUNCTION__)

#if FE_DEBUG_MODE
    #define FE_LOG_DEBUG(message) FE_LOG(mgfem::FE::LogLevel::DEBUG, message)
#else
    #define FE_LOG_DEBUG(message) ((void)0)
#endif

#define FE_LOG_INFO(message) FE_LOG(mgfem::FE::LogLevel::INFO, message)
#define FE_LOG_WARNING(message) FE_LOG(mgfem::FE::LogLevel::WARNING, message)

#define FE_SCOPED_TIMER_NAME_(line) fe_scoped_timer_##line
#define FE_SCOPED_TIMER_NAME(line) FE_SCOPED_TIMER_NAME_(line)

#define FE_TIMED_SCOPE_LEVEL(name, level) \
    mgfem::FE::ScopedTimer FE_SCOPED_TIMER_NAME(__LINE__)(name, level)

#define FE_TIMED_SCOPE(name) FE_TIMED_SCOPE_LEVEL(name, mgfem::FE::LogLevel::INFO)

} // namespace FE
} // namespace mgfem

#endif // MGFEM_FE_LOGGER_H
