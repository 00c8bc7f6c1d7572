/**
 * @file Logger.cpp
 * @brief Process-wide logger implementation
 */

#include "util/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <format>
#include <iostream>

namespace util {

auto parse_log_level(std::string_view name) -> std::optional<LogLevel> {
    std::string lower{name};
    std::ranges::transform(lower, lower.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") {
        return LogLevel::DEBUG;
    }
    if (lower == "info") {
        return LogLevel::INFO;
    }
    if (lower == "warning" || lower == "warn") {
        return LogLevel::WARNING;
    }
    if (lower == "error") {
        return LogLevel::ERROR;
    }
    return std::nullopt;
}

Logger::~Logger() {
    shutdown();
}

auto Logger::instance() -> Logger& {
    static Logger logger;
    return logger;
}

auto Logger::initialize(const std::filesystem::path& log_dir, const std::string& app_name,
                        LogLevel min_level, LogRotationPolicy policy) -> bool {
    std::lock_guard lock(mutex_);

    if (file_.is_open()) {
        file_.close();
    }
    initialized_ = false;

    log_dir_ = log_dir;
    app_name_ = app_name;
    min_level_ = min_level;
    policy_ = policy;

    std::error_code ec;
    std::filesystem::create_directories(log_dir_, ec);
    if (ec) {
        std::cerr << "Logger: cannot create " << log_dir_.string() << ": " << ec.message()
                  << '\n';
        return false;
    }

    if (!open_file()) {
        return false;
    }

    initialized_ = true;
    return true;
}

auto Logger::is_initialized() const -> bool {
    std::lock_guard lock(mutex_);
    return initialized_;
}

auto Logger::active_path() const -> std::filesystem::path {
    return log_dir_ / std::format("{}.log", app_name_);
}

auto Logger::rotated_path(int index) const -> std::filesystem::path {
    return log_dir_ / std::format("{}.{}.log", app_name_, index);
}

auto Logger::open_file() -> bool {
    const auto path = active_path();
    file_.open(path, std::ios::app);
    if (!file_.is_open()) {
        std::cerr << "Logger: cannot open " << path.string() << '\n';
        return false;
    }

    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    written_bytes_ = ec ? 0 : static_cast<std::size_t>(size);
    return true;
}

void Logger::log(LogLevel level, std::string_view component, std::string_view message) {
    std::lock_guard lock(mutex_);

    if (level < min_level_) {
        return;
    }

    const auto line =
        std::format("{} [{}] [{}] {}\n", timestamp(), level_tag(level), component, message);

    if (initialized_ && file_.is_open()) {
        rotate_if_needed(line.size());
        if (file_.is_open()) {
            file_ << line;
            file_.flush();
            written_bytes_ += line.size();
        }
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
    return active_path();
}

void Logger::shutdown() {
    std::lock_guard lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }
    initialized_ = false;
}

auto Logger::timestamp() -> std::string {
    const auto now = std::chrono::system_clock::now();
    const auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    const auto seconds = std::chrono::floor<std::chrono::seconds>(now);
    return std::format("{:%Y-%m-%dT%H:%M:%S}.{:03}Z", seconds, ms.count());
}

auto Logger::level_tag(LogLevel level) -> std::string_view {
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

void Logger::rotate_if_needed(std::size_t incoming) {
    if (written_bytes_ + incoming <= policy_.max_file_size_bytes) {
        return;
    }

    file_.close();

    std::error_code ec;
    std::filesystem::remove(rotated_path(policy_.max_files), ec);
    for (int i = policy_.max_files - 1; i >= 1; --i) {
        if (std::filesystem::exists(rotated_path(i), ec)) {
            std::filesystem::rename(rotated_path(i), rotated_path(i + 1), ec);
        }
    }
    if (policy_.max_files > 0) {
        std::filesystem::rename(active_path(), rotated_path(1), ec);
    } else {
        std::filesystem::remove(active_path(), ec);
    }

    if (!open_file()) {
        initialized_ = false;
    }
}

}  // namespace util
