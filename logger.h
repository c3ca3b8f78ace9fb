#pragma once

#include <string>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5
};

/// @brief Process-wide logger. Every line goes to stderr (stdout carries command
/// output) and, once set_log_file succeeds, is appended to that file too.
class Logger {
public:
    Logger();
    ~Logger();

    void set_log_level(LogLevel level);
    bool is_enabled(LogLevel level) const { return level >= min_log_level_; }

    /// @brief Append to filename from now on; an empty name stops file output
    /// @return false if the file cannot be opened
    bool set_log_file(const std::string& filename);

    void log(LogLevel level, const std::string& message);

    // "{}" placeholders are replaced left to right; formatting is skipped below the level
    template<typename... Args>
    void log_fmt(LogLevel level, const std::string& format, const Args&... args) {
        if (is_enabled(level)) {
            write_log(level, format_message(format, args...));
        }
    }

    /// @brief Parse a level name ("trace", "debug", "info", "warn", "error", "fatal")
    /// @param name Level name, case-insensitive. "warning" is accepted for WARN.
    /// @param level Receives the parsed level on success
    /// @return false if the name is not a known level
    static bool parse_level(const std::string& name, LogLevel& level);

    static Logger& instance();

private:
    LogLevel min_log_level_;
    std::unique_ptr<std::ofstream> log_file_;
    mutable std::mutex log_mutex_;
    bool is_destructing_ = false;

    static std::string get_timestamp();
    static const char* level_tag(LogLevel level);
    void write_log(LogLevel level, const std::string& message);

    static std::string format_message(const std::string& format) { return format; }

    template<typename T, typename... Args>
    static std::string format_message(const std::string& format, const T& value, const Args&... args) {
        size_t pos = format.find("{}");
        if (pos == std::string::npos) {
            return format;
        }
        std::ostringstream oss;
        oss << value;
        return format.substr(0, pos) + oss.str() + format_message(format.substr(pos + 2), args...);
    }
};

// The message expression is only evaluated when its level is enabled
#define MODELGATE_LOG(level, msg) \
    do { \
        if (Logger::instance().is_enabled(level)) Logger::instance().log(level, msg); \
    } while (0)

#define LOG_DEBUG(msg) MODELGATE_LOG(LogLevel::DEBUG, msg)
#define LOG_INFO(msg) MODELGATE_LOG(LogLevel::INFO, msg)
#define LOG_ERROR(msg) MODELGATE_LOG(LogLevel::ERROR, msg)

#define LOG_DEBUG_FMT(fmt, ...) Logger::instance().log_fmt(LogLevel::DEBUG, fmt, __VA_ARGS__)
