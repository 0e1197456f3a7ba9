#include "agentmesh/base/logger.h"
#include "agentmesh/base/config.h"
#include <chrono>
#include <ctime>
#include <iostream>

namespace agentmesh {

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

    std::tm tm_buf{};
    localtime_r(&time, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
    return fmt::format("{}.{:03d}", buf, static_cast<int>(ms.count()));
}

} // anonymous namespace

LogLevel parse_log_level(const std::string& level) {
    if (level == "debug" || level == "DEBUG") return elio::log::level::debug;
    if (level == "info" || level == "INFO") return elio::log::level::info;
    if (level == "warning" || level == "WARNING" || level == "warn") return elio::log::level::warning;
    if (level == "error" || level == "ERROR") return elio::log::level::error;
    return elio::log::level::info;
}

Logger::~Logger() {
    close_file_output();
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::configure(const LogConfig& config) {
    set_level(parse_log_level(config.level));

    if (config.output == "file" && !config.file_path.empty()) {
        if (!set_file_output(config.file_path)) {
            warning("Falling back to stdout logging");
        }
    } else {
        close_file_output();
    }
}

void Logger::set_level(LogLevel level) {
    level_ = level;
}

LogLevel Logger::get_level() const {
    return level_.load();
}

bool Logger::set_file_output(const std::string& path) {
    std::lock_guard<std::mutex> lock(file_mutex_);
    auto stream = std::make_unique<std::ofstream>(path, std::ios::app);
    if (!stream->is_open()) {
        std::cerr << "Failed to open log file: " << path << std::endl;
        return false;
    }
    file_stream_ = std::move(stream);
    output_ = LogOutput::File;
    return true;
}

void Logger::close_file_output() {
    std::lock_guard<std::mutex> lock(file_mutex_);
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
    file_stream_.reset();
    output_ = LogOutput::Stdout;
}

void Logger::write_file(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(file_mutex_);
    if (file_stream_ && file_stream_->is_open()) {
        *file_stream_ << "[" << get_timestamp() << "] [" << level_to_string(level) << "] "
                      << message << '\n';
        file_stream_->flush();
    }
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!enabled(level)) return;

    if (output_ == LogOutput::File) {
        write_file(level, message);
        return;
    }
    logger_.log(level, "", 0, "{}", message);
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
    log(LogLevel::error, message);
}

} // namespace agentmesh
