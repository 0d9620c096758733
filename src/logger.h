#pragma once

#include <string>
#include <iostream>
#include <fstream>
#include <mutex>
#include <sstream>
#include <chrono>
#include <iomanip>
#include <cstdint>
#include <unistd.h>

namespace meshshare {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * Parse a level name ("debug", "info", "warn", "error").
 * Unknown names fall back to INFO.
 */
LogLevel log_level_from_string(const std::string& name);
const char* log_level_to_string(LogLevel level);

class Logger {
public:
    // Singleton pattern
    static Logger& getInstance();

    // Delete copy constructor and assignment operator
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    // Set the minimum log level
    void set_log_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        min_level_ = level;
    }

    LogLevel get_log_level() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return min_level_;
    }

    // Enable/disable colors
    void set_colors_enabled(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        colors_enabled_ = enabled;
    }

    // Enable/disable timestamps
    void set_timestamps_enabled(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        timestamps_enabled_ = enabled;
    }

    // Console output control
    void set_console_logging_enabled(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        console_enabled_ = enabled;
    }

    bool is_console_logging_enabled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return console_enabled_;
    }

    // File output control
    void set_log_file_path(const std::string& path);
    std::string get_log_file_path() const;
    bool set_file_logging_enabled(bool enabled);
    bool is_file_logging_enabled() const;

    // Main logging function
    void log(LogLevel level, const std::string& module, const std::string& message);

private:
    Logger();
    ~Logger();

    std::string format_line(LogLevel level, const std::string& module, const std::string& message, bool colored);

    std::string get_level_string(LogLevel level);
    std::string get_color_code(LogLevel level);
    std::string get_module_color(const std::string& module);
    uint32_t hash_string(const std::string& str);
    std::string get_reset_code();

    mutable std::mutex mutex_;
    LogLevel min_level_;
    bool colors_enabled_;
    bool timestamps_enabled_;
    bool is_terminal_;
    bool console_enabled_;
    bool file_enabled_;
    std::string log_file_path_;
    std::ofstream log_file_;
};

} // namespace meshshare

// Convenience macros for easy logging
#define LOG_DEBUG(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        meshshare::Logger::getInstance().log(meshshare::LogLevel::DEBUG, module, oss.str()); \
    } while(0)

#define LOG_INFO(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        meshshare::Logger::getInstance().log(meshshare::LogLevel::INFO, module, oss.str()); \
    } while(0)

#define LOG_WARN(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        meshshare::Logger::getInstance().log(meshshare::LogLevel::WARN, module, oss.str()); \
    } while(0)

#define LOG_ERROR(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        meshshare::Logger::getInstance().log(meshshare::LogLevel::ERROR, module, oss.str()); \
    } while(0)
