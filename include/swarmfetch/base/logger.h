#ifndef SWARMFETCH_BASE_LOGGER_H
#define SWARMFETCH_BASE_LOGGER_H

#include <elio/log/logger.hpp>
#include <fmt/format.h>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>

namespace swarmfetch {

// Alias for Elio's log level
using LogLevel = elio::log::level;

enum class LogOutput {
    Stdout,
    Stderr,
    File
};

class Logger {
public:
    ~Logger();

    static Logger& instance();

    // Level control
    void set_level(LogLevel level);
    LogLevel get_level() const;

    // Output configuration
    void set_output(LogOutput output);
    bool set_file_output(const std::string& path);
    void close_file_output();

    void log(LogLevel level, const std::string& message);

    void debug(const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);
    void fatal(const std::string& message);

    template<typename... Args>
    void debug(fmt::format_string<Args...> fmt_str, Args&&... args) {
        if (enabled(LogLevel::debug)) {
            log(LogLevel::debug, fmt::format(fmt_str, std::forward<Args>(args)...));
        }
    }

    template<typename... Args>
    void info(fmt::format_string<Args...> fmt_str, Args&&... args) {
        if (enabled(LogLevel::info)) {
            log(LogLevel::info, fmt::format(fmt_str, std::forward<Args>(args)...));
        }
    }

    template<typename... Args>
    void warning(fmt::format_string<Args...> fmt_str, Args&&... args) {
        if (enabled(LogLevel::warning)) {
            log(LogLevel::warning, fmt::format(fmt_str, std::forward<Args>(args)...));
        }
    }

    template<typename... Args>
    void error(fmt::format_string<Args...> fmt_str, Args&&... args) {
        log(LogLevel::error, fmt::format(fmt_str, std::forward<Args>(args)...));
    }

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    bool enabled(LogLevel level) const;
    void write_file_line(const char* tag, const std::string& message);

    elio::log::logger& logger_ = elio::log::logger::instance();
    LogLevel level_ = LogLevel::info;
    LogOutput output_ = LogOutput::Stdout;
    std::unique_ptr<std::ofstream> file_stream_;
    mutable std::mutex mutex_;
};

// Parse "debug", "info", "warning"/"warn", "error"; unknown strings map to info
LogLevel parse_log_level(const std::string& level);

} // namespace swarmfetch

#endif // SWARMFETCH_BASE_LOGGER_H
