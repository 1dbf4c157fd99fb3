/**
 * @file logger.cpp
 * @brief Реализация консольного логгера
 */

#include "logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace weavekit::log {

std::optional<Level> parse_level(std::string_view name) noexcept {
    if (name == "debug") return Level::Debug;
    if (name == "info") return Level::Info;
    if (name == "warn" || name == "warning") return Level::Warning;
    if (name == "error") return Level::Error;
    return std::nullopt;
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::configure(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    min_level_.store(config.min_level);
}

void Logger::set_callback(LogCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    callback_ = std::move(callback);
}

bool Logger::enabled(Level level) const noexcept {
    return level >= min_level_.load();
}

void Logger::write(Level level, std::string_view component, std::string_view message) {
    if (!enabled(level)) {
        return;
    }

    if (level == Level::Error) {
        error_count_++;
    }

    LogCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (config_.console_output) {
            write_to_console(level, component, message);
        }
        callback = callback_;
    }

    // Callback вызывается без блокировки: он может сам писать в лог
    if (callback) {
        callback(level, component, message);
    }
}

void Logger::write_to_console(Level level, std::string_view component, std::string_view message) {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&time, &tm);

    std::ostringstream ss;
    ss << "[" << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << "] ";
    ss << "[" << to_string(level) << "] ";
    ss << "[" << component << "] ";
    ss << message;

    // Warning и Error уходят в stderr, остальное в stdout
    std::ostream& out = (level >= Level::Warning) ? std::cerr : std::cout;

    if (!config_.color) {
        out << ss.str() << std::endl;
        return;
    }

    switch (level) {
        case Level::Debug:
            out << "\033[90m" << ss.str() << "\033[0m" << std::endl;
            break;
        case Level::Info:
            out << "\033[32m" << ss.str() << "\033[0m" << std::endl;
            break;
        case Level::Warning:
            out << "\033[33m" << ss.str() << "\033[0m" << std::endl;
            break;
        case Level::Error:
            out << "\033[31m" << ss.str() << "\033[0m" << std::endl;
            break;
    }
}

} // namespace weavekit::log
