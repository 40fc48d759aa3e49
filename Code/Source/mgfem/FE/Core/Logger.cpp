/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

/**
 * @file Logger.cpp
 * @brief Implementation of the FE logger and its environment initialization
 */

#include "Logger.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

#if FE_HAS_MPI
#include <mpi.h>
#endif

namespace mgfem {
namespace FE {

namespace {

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

// Unset variables leave `value` untouched; "0" and "false" disable
void read_bool_env(const char* name, bool& value) {
    if (const char* env = std::getenv(name)) {
        const std::string s = to_upper(env);
        value = (s != "FALSE" && s != "0");
    }
}

int current_mpi_rank() {
    int rank = -1;
#if FE_HAS_MPI
    int initialized = 0;
    MPI_Initialized(&initialized);
    if (initialized) {
        MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    }
#endif
    return rank;
}

} // anonymous namespace

bool parse_log_level(const std::string& name, LogLevel& level) {
    const std::string s = to_upper(name);
    if (s == "DEBUG") {
        level = LogLevel::DEBUG;
    } else if (s == "INFO") {
        level = LogLevel::INFO;
    } else if (s == "WARNING" || s == "WARN") {
        level = LogLevel::WARNING;
    } else if (s == "ERROR") {
        level = LogLevel::ERROR;
    } else if (s == "CRITICAL" || s == "CRIT") {
        level = LogLevel::CRITICAL;
    } else if (s == "OFF") {
        level = LogLevel::OFF;
    } else {
        return false;
    }
    return true;
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger() : min_level_(LogLevel::INFO),
                   console_output_(true),
                   show_rank_(true),
                   show_timestamp_(true) {}

Logger::~Logger() {
    if (file_stream_.is_open()) {
        file_stream_.close();
    }
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

LogLevel Logger::get_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return min_level_;
}

void Logger::set_console_output(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    console_output_ = enabled;
}

void Logger::set_file_output(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (file_stream_.is_open()) {
        file_stream_.close();
    }
    if (filename.empty()) return;

    std::string actual_filename = filename;
    const int rank = current_mpi_rank();
    if (rank >= 0) {
        const size_t dot_pos = filename.rfind('.');
        if (dot_pos != std::string::npos) {
            actual_filename = filename.substr(0, dot_pos) + "_rank" + std::to_string(rank) +
                              filename.substr(dot_pos);
        } else {
            actual_filename += "_rank" + std::to_string(rank);
        }
    }

    file_stream_.open(actual_filename, std::ios::app);
    if (!file_stream_.is_open()) {
        std::cerr << "Failed to open log file: " << actual_filename << std::endl;
    }
}

void Logger::set_show_rank(bool show) {
    std::lock_guard<std::mutex> lock(mutex_);
    show_rank_ = show;
}

void Logger::set_show_timestamp(bool show) {
    std::lock_guard<std::mutex> lock(mutex_);
    show_timestamp_ = show;
}

void Logger::configure_from_environment() {
    if (const char* env_level = std::getenv("FE_LOG_LEVEL")) {
        LogLevel level;
        if (parse_log_level(env_level, level)) {
            set_level(level);
        }
    }

    if (const char* env_file = std::getenv("FE_LOG_FILE")) {
        set_file_output(env_file);
    }

    bool console, rank, time;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        console = console_output_;
        rank = show_rank_;
        time = show_timestamp_;
    }
    read_bool_env("FE_LOG_CONSOLE", console);
    read_bool_env("FE_LOG_SHOW_RANK", rank);
    read_bool_env("FE_LOG_SHOW_TIME", time);
    set_console_output(console);
    set_show_rank(rank);
    set_show_timestamp(time);
}

void Logger::log(LogLevel level,
                 const std::string& message,
                 const char* file,
                 int line,
                 const char* function) {

    #if !FE_DEBUG_MODE
    if (level == LogLevel::DEBUG) return;
    #endif

    if (level < get_level()) return;

    LogMessage msg;
    msg.level = level;
    msg.message = message;
    msg.file = file;
    msg.line = line;
    msg.function = function;
    msg.timestamp = std::chrono::system_clock::now();
    msg.thread_id = std::this_thread::get_id();
    msg.mpi_rank = current_mpi_rank();

    std::lock_guard<std::mutex> lock(mutex_);
    const std::string formatted = format_message(msg);

    if (console_output_) {
        if (level >= LogLevel::WARNING) {
            std::cerr << formatted << std::flush;
        } else {
            std::cout << formatted << std::flush;
        }
    }

    if (file_stream_.is_open()) {
        file_stream_ << formatted << std::flush;
    }

    for (const auto& entry : handlers_) {
        entry.second(msg);
    }
}

std::size_t Logger::add_handler(LogHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.emplace_back(next_handler_id_, std::move(handler));
    return next_handler_id_++;
}

void Logger::remove_handler(std::size_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.erase(std::remove_if(handlers_.begin(), handlers_.end(),
                                   [id](const auto& entry) { return entry.first == id; }),
                    handlers_.end());
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout.flush();
    std::cerr.flush();
    if (file_stream_.is_open()) {
        file_stream_.flush();
    }
}

// Caller holds mutex_
std::string Logger::format_message(const LogMessage& msg) const {
    std::ostringstream oss;

    if (show_timestamp_) {
        const auto time_t = std::chrono::system_clock::to_time_t(msg.timestamp);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            msg.timestamp.time_since_epoch()) % 1000;
        std::tm tm_buf{};
        localtime_r(&time_t, &tm_buf);
        oss << "[" << std::put_time(&tm_buf, "%H:%M:%S")
            << "." << std::setfill('0') << std::setw(3) << ms.count() << "] ";
    }

    if (show_rank_ && msg.mpi_rank >= 0) {
        oss << "[R" << msg.mpi_rank << "] ";
    }

    oss << "[" << log_level_to_string(msg.level) << "] " << msg.message;

    #if FE_DEBUG_MODE
    if (msg.level >= LogLevel::WARNING && !msg.file.empty()) {
        oss << " (" << msg.file << ":" << msg.line;
        if (!msg.function.empty()) {
            oss << " in " << msg.function << "()";
        }
        oss << ")";
    }
    #endif

    oss << "\n";
    return oss.str();
}

ScopedTimer::ScopedTimer(std::string name, LogLevel level)
    : name_(std::move(name)), level_(level), start_(std::chrono::steady_clock::now()) {
    Logger::instance().log(level_, "Starting: " + name_);
}

ScopedTimer::~ScopedTimer() {
    const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start_;
    std::ostringstream oss;
    oss << "Completed: " << name_ << " (elapsed: " << std::fixed << std::setprecision(3)
        << elapsed.count() << "s)";
    Logger::instance().log(level_, oss.str());
}

namespace {

// Applies FE_LOG_* once when the library is loaded
struct EnvironmentConfiguration {
    EnvironmentConfiguration() { Logger::instance().configure_from_environment(); }
};

const EnvironmentConfiguration environment_configuration;

} // anonymous namespace

} // namespace FE
} // namespace mgfem
