#pragma once

#include <chrono>
#include <fstream>
#include <mutex>
#include <string>

#include "core/Types.hpp"

namespace CentiPrep {
namespace Utils {

/**
 * @brief Singleton Logger class for consistent progress and debug output.
 *
 * Errors and warnings go to stderr, everything else to stdout. Colours are
 * used only when the stream is a terminal. An optional log file receives
 * the same lines without colour codes.
 */
class Logger {
public:
    static Logger& instance();

    void set_log_level(LogLevel level);

    /**
     * @brief Appends log lines to a file as well.
     * @return false if the file cannot be opened.
     */
    bool set_log_file(const std::string& filename);

    // Core logging function
    void log(LogLevel level, const std::string& message, const char* file = nullptr, int line = -1);

    // Static helpers for cleaner syntax
    static void debug(const std::string& msg, const char* file = nullptr, int line = -1);
    static void info(const std::string& msg, const char* file = nullptr, int line = -1);
    static void warning(const std::string& msg, const char* file = nullptr, int line = -1);
    static void error(const std::string& msg, const char* file = nullptr, int line = -1);

    /**
     * @brief Maps "error", "warn", "info", "debug" (any case) to a level.
     * @return false if the name is unknown; level is left untouched.
     */
    static bool parse_level(const std::string& name, LogLevel& level);

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LogLevel current_level_ = LogLevel::LOG_INFO;
    std::ofstream log_file_;
    std::mutex mutex_;

    static const char* level_to_string(LogLevel level);
    static const char* get_color_code(LogLevel level);
};

/**
 * @brief RAII helper to log start and end of a pipeline stage.
 */
class ScopedLogger {
public:
    ScopedLogger(const std::string& action_name, LogLevel level = LogLevel::LOG_INFO);
    ~ScopedLogger();

private:
    std::string action_name_;
    LogLevel level_;
    std::chrono::steady_clock::time_point start_time_;
};

}  // namespace Utils
}  // namespace CentiPrep

// Macros to automatically capture file and line number
#define LOG_DEBUG(msg) CentiPrep::Utils::Logger::debug(msg, __FILE__, __LINE__)
#define LOG_INFO(msg) CentiPrep::Utils::Logger::info(msg, __FILE__, __LINE__)
#define LOG_WARNING(msg) CentiPrep::Utils::Logger::warning(msg, __FILE__, __LINE__)
#define LOG_ERROR(msg) CentiPrep::Utils::Logger::error(msg, __FILE__, __LINE__)
