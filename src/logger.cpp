#include "logger.h"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <cstdio>

namespace meshshare {

LogLevel log_level_from_string(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

const char* log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO:  return "info";
        case LogLevel::WARN:  return "warn";
        case LogLevel::ERROR: return "error";
        default: return "info";
    }
}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger()
    : min_level_(LogLevel::INFO), colors_enabled_(true), timestamps_enabled_(true),
      console_enabled_(true), file_enabled_(false) {
    // Check if we're outputting to a terminal
    is_terminal_ = isatty(fileno(stdout));
}

Logger::~Logger() {
    if (log_file_.is_open()) {
        log_file_.flush();
        log_file_.close();
    }
}

void Logger::set_log_file_path(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (path == log_file_path_) {
        return;
    }

    log_file_path_ = path;

    // Reopen with the new path if file logging is active
    if (file_enabled_) {
        if (log_file_.is_open()) {
            log_file_.close();
        }
        log_file_.open(log_file_path_, std::ios::out | std::ios::app);
        file_enabled_ = log_file_.is_open();
    }
}

std::string Logger::get_log_file_path() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_file_path_;
}

bool Logger::set_file_logging_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!enabled) {
        if (log_file_.is_open()) {
            log_file_.flush();
            log_file_.close();
        }
        file_enabled_ = false;
        return true;
    }

    if (log_file_path_.empty()) {
        return false;
    }

    if (!log_file_.is_open()) {
        log_file_.open(log_file_path_, std::ios::out | std::ios::app);
    }
    file_enabled_ = log_file_.is_open();
    return file_enabled_;
}

bool Logger::is_file_logging_enabled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return file_enabled_;
}

void Logger::log(LogLevel level, const std::string& module, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (level < min_level_) {
        return;
    }

    if (console_enabled_) {
        std::string line = format_line(level, module, message, colors_enabled_ && is_terminal_);

        // Output to appropriate stream
        if (level >= LogLevel::ERROR) {
            std::cerr << line;
            std::cerr.flush();
        } else {
            std::cout << line;
            std::cout.flush();
        }
    }

    if (file_enabled_ && log_file_.is_open()) {
        log_file_ << format_line(level, module, message, false);
        log_file_.flush();
    }
}

std::string Logger::format_line(LogLevel level, const std::string& module, const std::string& message, bool colored) {
    std::ostringstream oss;

    // Add timestamp if enabled
    if (timestamps_enabled_) {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm local_tm{};
        localtime_r(&time_t, &local_tm);
        oss << "[" << std::put_time(&local_tm, "%H:%M:%S");
        oss << "." << std::setfill('0') << std::setw(3) << ms.count() << "] ";
    }

    // Add colored log level
    if (colored) {
        oss << get_color_code(level) << "[" << get_level_string(level) << "]" << get_reset_code();
    } else {
        oss << "[" << get_level_string(level) << "]";
    }

    // Add colored module tag
    if (!module.empty()) {
        if (colored) {
            oss << " " << get_module_color(module) << "[" << module << "]" << get_reset_code();
        } else {
            oss << " [" << module << "]";
        }
    }

    oss << " " << message << "\n";
    return oss.str();
}

std::string Logger::get_level_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

std::string Logger::get_color_code(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[36m";  // Cyan
        case LogLevel::INFO:  return "\033[32m";  // Green
        case LogLevel::WARN:  return "\033[33m";  // Yellow
        case LogLevel::ERROR: return "\033[31m";  // Red
        default: return "";
    }
}

std::string Logger::get_module_color(const std::string& module) {
    // Map hash to a predefined set of readable colors
    static const char* colors[] = {
        "\033[35m",  // Magenta
        "\033[36m",  // Cyan
        "\033[94m",  // Bright Blue
        "\033[95m",  // Bright Magenta
        "\033[96m",  // Bright Cyan
        "\033[93m",  // Bright Yellow
        "\033[92m",  // Bright Green
        "\033[34m",  // Blue
        "\033[38;5;208m", // Orange
        "\033[38;5;141m"  // Purple
    };

    size_t color_count = sizeof(colors) / sizeof(colors[0]);
    return colors[hash_string(module) % color_count];
}

// djb2
uint32_t Logger::hash_string(const std::string& str) {
    uint32_t hash = 5381;
    for (char c : str) {
        hash = ((hash << 5) + hash) + static_cast<uint8_t>(c);
    }
    return hash;
}

std::string Logger::get_reset_code() {
    return "\033[0m";
}

} // namespace meshshare
