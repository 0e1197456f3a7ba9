#ifndef AGENTMESH_BASE_LOGGER_H
#define AGENTMESH_BASE_LOGGER_H

#include <elio/log/logger.hpp>
#include <fmt/format.h>
#include <atomic>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>

namespace agentmesh {

struct LogConfig;

// Alias for Elio's log level
using LogLevel = elio::log::level;

enum class LogOutput {
    Stdout,
    File
};

LogLevel parse_log_level(const std::string& level);

class Logger {
public:
    ~Logger();

    static Logger& instance();

    // Apply level and output settings from the [log] section
    void configure(const LogConfig& config);

    void set_level(LogLevel level);
    LogLevel get_level() const;
    bool enabled(LogLevel level) const { return level >= level_.load(); }

    // Redirect output to a file; returns false if the file cannot be opened
    bool set_file_output(const std::string& path);
    void close_file_output();

    void log(LogLevel level, const std::string& message);

    template<typename... Args>
    void log(LogLevel level, fmt::format_string<Args...> fmt_str, Args&&... args) {
        if (!enabled(level)) return;
        log(level, fmt::format(fmt_str, std::forward<Args>(args)...));
    }

    void debug(const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);
    void fatal(const std::string& message);

    template<typename... Args>
    void debug(fmt::format_string<Args...> fmt_str, Args&&... args) {
        log(elio::log::level::debug, fmt_str, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(fmt::format_string<Args...> fmt_str, Args&&... args) {
        log(elio::log::level::info, fmt_str, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warning(fmt::format_string<Args...> fmt_str, Args&&... args) {
        log(elio::log::level::warning, fmt_str, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(fmt::format_string<Args...> fmt_str, Args&&... args) {
        log(elio::log::level::error, fmt_str, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void fatal(fmt::format_string<Args...> fmt_str, Args&&... args) {
        log(elio::log::level::error, fmt_str, std::forward<Args>(args)...);
    }

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void write_file(LogLevel level, const std::string& message);

    elio::log::logger& logger_ = elio::log::logger::instance();
    std::atomic<LogLevel> level_{elio::log::level::info};
    std::atomic<LogOutput> output_{LogOutput::Stdout};
    std::mutex file_mutex_;
    std::unique_ptr<std::ofstream> file_stream_;
};

} // namespace agentmesh

#endif // AGENTMESH_BASE_LOGGER_H
