#pragma once

#include <string>
#include <iostream>
#include <fstream>
#include <mutex>
#include <sstream>
#include <chrono>
#include <iomanip>
#include <cstdint>

#ifdef _WIN32
    #include <windows.h>
    #include <io.h>
    #define isatty _isatty
    #define fileno _fileno
    // Undefine Windows ERROR macro to avoid conflicts with our enum
    #ifdef ERROR
        #undef ERROR
    #endif
#else
    #include <unistd.h>
#endif

namespace peerq {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

class Logger {
public:
    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void set_log_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        min_level_ = level;
    }

    LogLevel get_log_level() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return min_level_;
    }

    void set_colors_enabled(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        colors_enabled_ = enabled;
    }

    void set_timestamps_enabled(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        timestamps_enabled_ = enabled;
    }

    /**
     * Mirror every emitted line into a file (the transfer log).
     * An empty path closes the current file.
     * @return true if the file could be opened
     */
    bool set_log_file(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (log_file_.is_open()) {
            log_file_.close();
        }
        if (path.empty()) {
            return true;
        }
        log_file_.open(path, std::ios::out | std::ios::app);
        return log_file_.is_open();
    }

    void log(LogLevel level, const std::string& module, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (level < min_level_) {
            return;
        }

        std::string timestamp;
        if (timestamps_enabled_) {
            timestamp = format_timestamp();
        }

        std::ostringstream oss;
        oss << timestamp;

        if (colors_enabled_ && is_terminal_) {
            oss << get_color_code(level) << "[" << get_level_string(level) << "]" << get_reset_code();
        } else {
            oss << "[" << get_level_string(level) << "]";
        }

        if (!module.empty()) {
            if (colors_enabled_ && is_terminal_) {
                oss << " " << get_module_color(module) << "[" << module << "]" << get_reset_code();
            } else {
                oss << " [" << module << "]";
            }
        }

        oss << " " << message << std::endl;

        if (level >= LogLevel::ERROR) {
            std::cerr << oss.str();
            std::cerr.flush();
        } else {
            std::cout << oss.str();
            std::cout.flush();
        }

        // The file copy never carries colour codes
        if (log_file_.is_open()) {
            log_file_ << timestamp << "[" << get_level_string(level) << "]";
            if (!module.empty()) {
                log_file_ << " [" << module << "]";
            }
            log_file_ << " " << message << "\n";
            log_file_.flush();
        }
    }

private:
    Logger() : min_level_(LogLevel::INFO), colors_enabled_(true), timestamps_enabled_(true) {
        is_terminal_ = isatty(fileno(stdout));

#ifdef _WIN32
        if (is_terminal_) {
            HANDLE hOut = GetStdHandle(STD_OUTPUT_HANDLE);
            DWORD dwMode = 0;
            GetConsoleMode(hOut, &dwMode);
            dwMode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
            SetConsoleMode(hOut, dwMode);
        }
#endif
    }

    static std::string format_timestamp() {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::ostringstream oss;
        oss << "[" << std::put_time(std::localtime(&time_t), "%H:%M:%S");
        oss << "." << std::setfill('0') << std::setw(3) << ms.count() << "] ";
        return oss.str();
    }

    std::string get_level_string(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO:  return "INFO ";
            case LogLevel::WARN:  return "WARN ";
            case LogLevel::ERROR: return "ERROR";
            default: return "UNKNOWN";
        }
    }

    std::string get_color_code(LogLevel level) {
        if (!colors_enabled_ || !is_terminal_) return "";

        switch (level) {
            case LogLevel::DEBUG: return "\033[36m";  // Cyan
            case LogLevel::INFO:  return "\033[32m";  // Green
            case LogLevel::WARN:  return "\033[33m";  // Yellow
            case LogLevel::ERROR: return "\033[31m";  // Red
            default: return "";
        }
    }

    // One stable colour per module tag
    std::string get_module_color(const std::string& module) {
        if (!colors_enabled_ || !is_terminal_) return "";

        static const char* colors[] = {
            "\033[35m",  // Magenta
            "\033[94m",  // Bright Blue
            "\033[95m",  // Bright Magenta
            "\033[96m",  // Bright Cyan
            "\033[93m",  // Bright Yellow
            "\033[92m",  // Bright Green
            "\033[38;5;208m", // Orange
            "\033[38;5;141m"  // Purple
        };

        uint32_t hash = 5381;
        for (char c : module) {
            hash = ((hash << 5) + hash) + static_cast<uint8_t>(c);
        }
        return colors[hash % (sizeof(colors) / sizeof(colors[0]))];
    }

    std::string get_reset_code() {
        if (!colors_enabled_ || !is_terminal_) return "";
        return "\033[0m";
    }

    mutable std::mutex mutex_;
    LogLevel min_level_;
    bool colors_enabled_;
    bool timestamps_enabled_;
    bool is_terminal_;
    std::ofstream log_file_;
};

} // namespace peerq

// Convenience macros for easy logging
#define LOG_DEBUG(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        peerq::Logger::getInstance().log(peerq::LogLevel::DEBUG, module, oss.str()); \
    } while(0)

#define LOG_INFO(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        peerq::Logger::getInstance().log(peerq::LogLevel::INFO, module, oss.str()); \
    } while(0)

#define LOG_WARN(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        peerq::Logger::getInstance().log(peerq::LogLevel::WARN, module, oss.str()); \
    } while(0)

#define LOG_ERROR(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        peerq::Logger::getInstance().log(peerq::LogLevel::ERROR, module, oss.str()); \
    } while(0)
