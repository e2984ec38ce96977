/**
 * @file Logger.cpp
 * @brief Thread-safe logging utility implementation
 */

#include "util/Logger.hpp"

#include <cerrno>
#include <chrono>
#include <ctime>
#include <format>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace util {

Logger::~Logger() {
    shutdown();
}

auto Logger::instance() -> Logger& {
    static Logger instance;
    return instance;
}

auto Logger::initialize(const std::filesystem::path& log_dir, const std::string& app_name,
                        LogLevel min_level) -> std::expected<void, Error> {
    std::lock_guard lock(mutex_);

    if (file_.is_open()) {
        file_.close();
    }
    initialized_ = false;
    min_level_ = min_level;

    std::error_code ec;
    if (!std::filesystem::exists(log_dir, ec)) {
        if (!std::filesystem::create_directories(log_dir, ec)) {
            return std::unexpected(
                Error{std::format("Failed to create log directory {}: {}", log_dir.string(),
                                  ec.message()),
                      ec.value()});
        }
    }

    log_path_ = log_dir / (app_name + ".log");
    file_.open(log_path_, std::ios::app);
    if (!file_.is_open()) {
        return std::unexpected(
            Error{std::format("Failed to open log file {}", log_path_.string()), EIO});
    }

    initialized_ = true;
    file_ << format_line(get_timestamp(), LogLevel::INFO, "Logger",
                         std::format("Logger initialized: app={} level={}", app_name,
                                     level_to_string(min_level_)));
    file_.flush();

    return {};
}

auto Logger::is_initialized() const -> bool {
    std::lock_guard lock(mutex_);
    return initialized_;
}

void Logger::log(LogLevel level, std::string_view component, std::string_view message) {
    std::lock_guard lock(mutex_);

    if (level < min_level_) {
        return;
    }
    if (!initialized_ && !console_output_) {
        return;
    }

    const auto line = format_line(get_timestamp(), level, component, message);

    if (initialized_ && file_.is_open()) {
        file_ << line;
        file_.flush();
    }

    if (console_output_) {
        std::cerr << line;
    }
}

void Logger::debug(std::string_view component, std::string_view message) {
    log(LogLevel::DEBUG, component, message);
}

void Logger::info(std::string_view component, std::string_view message) {
    log(LogLevel::INFO, component, message);
}

void Logger::warning(std::string_view component, std::string_view message) {
    log(LogLevel::WARNING, component, message);
}

void Logger::error(std::string_view component, std::string_view message) {
    log(LogLevel::ERROR, component, message);
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard lock(mutex_);
    min_level_ = level;
}

auto Logger::get_min_level() const -> LogLevel {
    std::lock_guard lock(mutex_);
    return min_level_;
}

void Logger::set_console_output(bool enable) {
    std::lock_guard lock(mutex_);
    console_output_ = enable;
}

auto Logger::get_log_file_path() const -> std::filesystem::path {
    std::lock_guard lock(mutex_);
    if (!initialized_) {
        return {};
    }
    return log_path_;
}

void Logger::shutdown() {
    std::lock_guard lock(mutex_);

    if (initialized_ && file_.is_open()) {
        file_ << format_line(get_timestamp(), LogLevel::INFO, "Logger", "Logger shutting down");
        file_.flush();
        file_.close();
    }

    initialized_ = false;
}

auto Logger::format_line(std::string_view timestamp, LogLevel level,
                         std::string_view component, std::string_view message) -> std::string {
    return std::format("{} [{}] [{}] {}\n", timestamp, level_to_string(level), component,
                       message);
}

auto Logger::get_timestamp() -> std::string {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    gmtime_r(&time_t_now, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';

    return oss.str();
}

auto Logger::level_to_string(LogLevel level) -> std::string_view {
    switch (level) {
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO ";
        case LogLevel::WARNING:
            return "WARN ";
        case LogLevel::ERROR:
            return "ERROR";
    }
    return "?????";
}

}  // namespace util
