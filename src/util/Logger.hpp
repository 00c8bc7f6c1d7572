/**
 * @file Logger.hpp
 * @brief Process-wide logger with component tags and size-based file rotation
 *
 * The library only emits log records; the embedding application decides
 * where they go by calling initialize() and/or set_console_output(). Until
 * then records are dropped.
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace util {

/**
 * @enum LogLevel
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,    ///< Per-attribute resolution details
    INFO,     ///< Discovery summaries
    WARNING,  ///< Tolerated failures (skipped devices, unreadable optional data)
    ERROR     ///< Failures surfaced to the caller
};

/**
 * @brief Parse a level name ("debug", "info", "warning"/"warn", "error")
 * @param name Level name, case insensitive
 * @return Level, or nullopt if the name is unknown
 */
[[nodiscard]] auto parse_log_level(std::string_view name) -> std::optional<LogLevel>;

/**
 * @struct LogRotationPolicy
 * @brief Configuration for log file rotation
 */
struct LogRotationPolicy {
    std::size_t max_file_size_bytes = 2 * 1024 * 1024;  ///< Rotate after this many bytes
    int max_files = 3;                                  ///< Rotated files kept beside the active one
};

/**
 * @class Logger
 * @brief Thread-safe singleton logger
 *
 * Usage:
 * @code
 * util::Logger::instance().initialize(log_dir, "diskinfo-cli", util::LogLevel::DEBUG);
 * LOG_DEBUG("DiskBuilder", std::format("{}: model not reported", name));
 * @endcode
 */
class Logger {
public:
    static auto instance() -> Logger&;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    /**
     * @brief Start writing to {log_dir}/{app_name}.log
     * @param log_dir Directory for log files (created if missing)
     * @param app_name Base name of the log file
     * @param min_level Minimum level written
     * @param policy Rotation policy
     * @return true if the log file could be opened
     */
    auto initialize(const std::filesystem::path& log_dir, const std::string& app_name,
                    LogLevel min_level = LogLevel::INFO, LogRotationPolicy policy = {}) -> bool;

    [[nodiscard]] auto is_initialized() const -> bool;

    /**
     * @brief Write one record
     * @param level Severity
     * @param component Emitting component (e.g. "IdentifierResolver")
     * @param message Record text
     */
    void log(LogLevel level, std::string_view component, std::string_view message);

    void debug(std::string_view component, std::string_view message);
    void info(std::string_view component, std::string_view message);
    void warning(std::string_view component, std::string_view message);
    void error(std::string_view component, std::string_view message);

    void set_min_level(LogLevel level);
    [[nodiscard]] auto get_min_level() const -> LogLevel;

    /**
     * @brief Mirror records to stderr
     * @param enable Whether to also write to stderr
     */
    void set_console_output(bool enable);

    [[nodiscard]] auto get_log_file_path() const -> std::filesystem::path;

    /**
     * @brief Flush and close the log file
     */
    void shutdown();

private:
    Logger() = default;
    ~Logger();

    [[nodiscard]] static auto timestamp() -> std::string;
    [[nodiscard]] static auto level_tag(LogLevel level) -> std::string_view;

    [[nodiscard]] auto active_path() const -> std::filesystem::path;
    [[nodiscard]] auto rotated_path(int index) const -> std::filesystem::path;
    void rotate_if_needed(std::size_t incoming);
    auto open_file() -> bool;

    mutable std::mutex mutex_;
    std::ofstream file_;
    std::filesystem::path log_dir_;
    std::string app_name_;
    LogLevel min_level_ = LogLevel::INFO;
    LogRotationPolicy policy_;
    bool initialized_ = false;
    bool console_output_ = false;
    std::size_t written_bytes_ = 0;
};

#define LOG_DEBUG(component, msg) ::util::Logger::instance().debug(component, msg)
#define LOG_INFO(component, msg) ::util::Logger::instance().info(component, msg)
#define LOG_WARNING(component, msg) ::util::Logger::instance().warning(component, msg)
#define LOG_ERROR(component, msg) ::util::Logger::instance().error(component, msg)

}  // namespace util
