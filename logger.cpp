#include "logger.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

Logger::Logger()
    : min_log_level_(LogLevel::INFO) {
}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(log_mutex_);
    is_destructing_ = true;
    log_file_.reset();
}

void Logger::set_log_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    min_log_level_ = level;
}

bool Logger::set_log_file(const std::string& filename) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    log_file_.reset();

    if (filename.empty()) {
        return true;
    }

    auto file = std::make_unique<std::ofstream>(filename, std::ios::app);
    if (!file->is_open()) {
        std::cerr << "Failed to open log file: " << filename << std::endl;
        return false;
    }

    *file << "\n=== modelgate log session started at " << get_timestamp() << " ===\n";
    file->flush();
    log_file_ = std::move(file);
    return true;
}

void Logger::log(LogLevel level, const std::string& message) {
    if (is_enabled(level)) {
        write_log(level, message);
    }
}

bool Logger::parse_level(const std::string& name, LogLevel& level) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "trace") level = LogLevel::TRACE;
    else if (lower == "debug") level = LogLevel::DEBUG;
    else if (lower == "info") level = LogLevel::INFO;
    else if (lower == "warn" || lower == "warning") level = LogLevel::WARN;
    else if (lower == "error") level = LogLevel::ERROR;
    else if (lower == "fatal") level = LogLevel::FATAL;
    else return false;
    return true;
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

std::string Logger::get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    localtime_r(&time_t, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

const char* Logger::level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
    }
    return "?????";
}

void Logger::write_log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex_);

    // Static destruction order: callers may still log after the logger is gone
    if (is_destructing_) {
        return;
    }

    // [TIMESTAMP] [LEVEL] MESSAGE
    std::string line = "[" + get_timestamp() + "] [" + level_tag(level) + "] " + message;
    std::cerr << line << "\n";

    if (log_file_) {
        *log_file_ << line << std::endl;
    }
}
