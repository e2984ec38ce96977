/**
 * @file Logger.hpp
 * @brief Thread-safe logging utility
 *
 * Writes component-tagged lines with ISO 8601 timestamps to a log file
 * and, optionally, to stderr.
 */

#pragma once

#include "util/Error.hpp"

#include <expected>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <string_view>

namespace util {

/**
 * @enum LogLevel
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,    ///< Detailed debugging information
    INFO,     ///< General operational information
    WARNING,  ///< Warning conditions
    ERROR     ///< Error conditions
};

/**
 * @class Logger
 * @brief Process-wide logger with optional file and console sinks
 *
 * Messages are dropped until either initialize() opens a log file or
 * console output is enabled, so library code can log unconditionally.
 *
 * Usage:
 * @code
 * auto& log = util::Logger::instance();
 * log.initialize("/var/log/ssd-health", "ssd-health-cli");
 * LOG_INFO("GenericSsdHealth", "Probing " + device_path);
 * @endcode
 */
class Logger {
public:
    /**
     * @brief Get the singleton logger instance
     * @return Reference to the global logger
     */
    static auto instance() -> Logger&;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    /**
     * @brief Open {log_dir}/{app_name}.log for appending
     * @param log_dir Directory for the log file (created if missing)
     * @param app_name Application name used in the file name
     * @param min_level Minimum level to log
     * @return Error if the directory or file cannot be opened
     */
    auto initialize(const std::filesystem::path& log_dir, const std::string& app_name,
                    LogLevel min_level = LogLevel::INFO) -> std::expected<void, Error>;

    [[nodiscard]] auto is_initialized() const -> bool;

    /**
     * @brief Log a message with specified level and component
     * @param level Log level
     * @param component Component/module name (e.g., "VendorRegistry")
     * @param message Log message
     */
    void log(LogLevel level, std::string_view component, std::string_view message);

    void debug(std::string_view component, std::string_view message);
    void info(std::string_view component, std::string_view message);
    void warning(std::string_view component, std::string_view message);
    void error(std::string_view component, std::string_view message);

    void set_min_level(LogLevel level);
    [[nodiscard]] auto get_min_level() const -> LogLevel;

    /**
     * @brief Enable/disable console output (stderr)
     */
    void set_console_output(bool enable);

    /**
     * @brief Get the current log file path
     * @return Path to the active log file, or empty if not initialized
     */
    [[nodiscard]] auto get_log_file_path() const -> std::filesystem::path;

    /**
     * @brief Flush and close the log file
     */
    void shutdown();

    /**
     * @brief Format a log line without writing it
     *
     * Exposed for tests; the timestamp is supplied by the caller.
     */
    [[nodiscard]] static auto format_line(std::string_view timestamp, LogLevel level,
                                          std::string_view component,
                                          std::string_view message) -> std::string;

    [[nodiscard]] static auto level_to_string(LogLevel level) -> std::string_view;

private:
    Logger() = default;
    ~Logger();

    /**
     * @brief Get ISO 8601 timestamp string (e.g., "2026-01-22T14:32:45.123Z")
     */
    [[nodiscard]] static auto get_timestamp() -> std::string;

    mutable std::mutex mutex_;
    std::ofstream file_;
    std::filesystem::path log_path_;
    LogLevel min_level_ = LogLevel::INFO;
    bool initialized_ = false;
    bool console_output_ = false;
};

// Convenience macros for component-based logging
#define LOG_DEBUG(component, msg) ::util::Logger::instance().debug(component, msg)
#define LOG_INFO(component, msg) ::util::Logger::instance().info(component, msg)
#define LOG_WARNING(component, msg) ::util::Logger::instance().warning(component, msg)
#define LOG_ERROR(component, msg) ::util::Logger::instance().error(component, msg)

}  // namespace util
