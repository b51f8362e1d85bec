#include "utils/Logger.hpp"

#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace CentiPrep {
namespace Utils {

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

void Logger::set_log_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    current_level_ = level;
}

bool Logger::set_log_file(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_.is_open()) {
        log_file_.close();
    }

    // Ensure directory exists
    std::filesystem::path p(filename);
    if (p.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(p.parent_path(), ec);
    }

    log_file_.open(filename, std::ios::app);
    return log_file_.is_open();
}

bool Logger::parse_level(const std::string& name, LogLevel& level) {
    static const std::map<std::string, LogLevel> levels = {
        {"error", LogLevel::LOG_ERROR},
        {"warn", LogLevel::LOG_WARN},
        {"info", LogLevel::LOG_INFO},
        {"debug", LogLevel::LOG_DEBUG}
    };

    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = levels.find(lower);
    if (it == levels.end()) {
        return false;
    }
    level = it->second;
    return true;
}

const char* Logger::level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::LOG_DEBUG: return "DEBUG";
        case LogLevel::LOG_INFO:  return "INFO ";
        case LogLevel::LOG_WARN:  return "WARN ";
        case LogLevel::LOG_ERROR: return "ERROR";
        default: return "UNK  ";
    }
}

const char* Logger::get_color_code(LogLevel level) {
    // ANSI color codes
    switch (level) {
        case LogLevel::LOG_DEBUG: return "\033[36m"; // Cyan
        case LogLevel::LOG_INFO:  return "\033[32m"; // Green
        case LogLevel::LOG_WARN:  return "\033[33m"; // Yellow
        case LogLevel::LOG_ERROR: return "\033[31m"; // Red
        default: return "";
    }
}

void Logger::log(LogLevel level, const std::string& message, const char* file, int line) {
    // Levels are ordered by verbosity (ERROR=0 ... DEBUG=3)
    if (static_cast<int>(level) > static_cast<int>(current_level_)) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto now_time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    struct tm time_info;
    localtime_r(&now_time, &time_info);

    // Format: [Time][Thread][Level] Message (File:Line)
    std::stringstream ss;
    ss << "[" << std::put_time(&time_info, "%Y-%m-%d %H:%M:%S") << "." << std::setfill('0') << std::setw(3)
       << ms.count() << "]";

#ifdef _OPENMP
    if (omp_in_parallel()) {
        ss << "[T" << omp_get_thread_num() << "]";
    }
#endif

    ss << "[" << level_to_string(level) << "] " << message;

    if (file && (level == LogLevel::LOG_DEBUG || level == LogLevel::LOG_ERROR)) {
        std::filesystem::path p(file);
        ss << " (" << p.filename().string() << ":" << line << ")";
    }
    ss << "\n";

    bool to_stderr = (level == LogLevel::LOG_ERROR || level == LogLevel::LOG_WARN);
    std::ostream& out = to_stderr ? std::cerr : std::cout;
    bool color = isatty(to_stderr ? STDERR_FILENO : STDOUT_FILENO) != 0;

    std::lock_guard<std::mutex> lock(mutex_);
    if (color) {
        out << get_color_code(level) << ss.str() << "\033[0m" << std::flush;
    } else {
        out << ss.str() << std::flush;
    }

    if (log_file_.is_open()) {
        log_file_ << ss.str() << std::flush;
    }
}

void Logger::debug(const std::string& msg, const char* file, int line) {
    instance().log(LogLevel::LOG_DEBUG, msg, file, line);
}

void Logger::info(const std::string& msg, const char* file, int line) {
    instance().log(LogLevel::LOG_INFO, msg, file, line);
}

void Logger::warning(const std::string& msg, const char* file, int line) {
    instance().log(LogLevel::LOG_WARN, msg, file, line);
}

void Logger::error(const std::string& msg, const char* file, int line) {
    instance().log(LogLevel::LOG_ERROR, msg, file, line);
}

// ScopedLogger Implementation
ScopedLogger::ScopedLogger(const std::string& action_name, LogLevel level) 
    : action_name_(action_name), level_(level), start_time_(std::chrono::steady_clock::now()) {
    Logger::instance().log(level_, "START: " + action_name_);
}

ScopedLogger::~ScopedLogger() {
    auto end_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time_).count();
    Logger::instance().log(level_, "DONE : " + action_name_ + " (" + std::to_string(duration) + " ms)");
}

}  // namespace Utils
}  // namespace CentiPrep
