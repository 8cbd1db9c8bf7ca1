#include "swarmfetch/base/logger.h"
#include <iostream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace swarmfetch {

namespace {

const char* level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::debug: return "DEBUG";
        case LogLevel::info: return "INFO";
        case LogLevel::warning: return "WARN";
        case LogLevel::error: return "ERROR";
        default: return "UNKNOWN";
    }
}

std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local_tm{};
    localtime_r(&time, &local_tm);

    std::ostringstream oss;
    oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

} // anonymous namespace

LogLevel parse_log_level(const std::string& level) {
    if (level == "debug") return LogLevel::debug;
    if (level == "info") return LogLevel::info;
    if (level == "warning" || level == "warn") return LogLevel::warning;
    if (level == "error") return LogLevel::error;
    return LogLevel::info;
}

Logger::~Logger() {
    close_file_output();
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

LogLevel Logger::get_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

void Logger::set_output(LogOutput output) {
    std::lock_guard<std::mutex> lock(mutex_);
    output_ = output;
}

bool Logger::set_file_output(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    file_stream_ = std::make_unique<std::ofstream>(path, std::ios::app);
    if (!file_stream_->is_open()) {
        std::cerr << "Failed to open log file: " << path << std::endl;
        file_stream_.reset();
        return false;
    }
    output_ = LogOutput::File;
    return true;
}

void Logger::close_file_output() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
    file_stream_.reset();
    if (output_ == LogOutput::File) {
        output_ = LogOutput::Stdout;
    }
}

bool Logger::enabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !(level < level_);
}

void Logger::log(LogLevel level, const std::string& message) {
    LogOutput output;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < level_) return;
        output = output_;
    }

    if (output == LogOutput::Stdout) {
        logger_.log(level, "", 0, "{}", message);
        return;
    }
    write_file_line(level_to_string(level), message);
}

void Logger::write_file_line(const char* tag, const std::string& message) {
    std::ostringstream oss;
    oss << "[" << get_timestamp() << "] [" << tag << "] " << message;

    std::lock_guard<std::mutex> lock(mutex_);
    if (output_ == LogOutput::File && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << oss.str() << std::endl;
    } else {
        std::cerr << oss.str() << std::endl;
    }
}

void Logger::debug(const std::string& message) {
    log(LogLevel::debug, message);
}

void Logger::info(const std::string& message) {
    log(LogLevel::info, message);
}

void Logger::warning(const std::string& message) {
    log(LogLevel::warning, message);
}

void Logger::error(const std::string& message) {
    log(LogLevel::error, message);
}

void Logger::fatal(const std::string& message) {
    write_file_line("FATAL", message);
}

} // namespace swarmfetch
