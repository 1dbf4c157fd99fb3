/**
 * @file logger.hpp
 * @brief Консольный логгер weavekit
 *
 * Предоставляет:
 * - Уровни Debug/Info/Warning/Error с фильтрацией по минимальному уровню
 * - Вывод с временной меткой и именем компонента
 * - Callback для внешних получателей (используется в тестах)
 *
 * Формат строки:
 * @code
 * [2026-10-19 13:11:02] [INFO] [downloader] 12/12 chunks fetched
 * @endcode
 */

#pragma once

#include "../core/types.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace weavekit::log {

// =============================================================================
// Уровни логирования
// =============================================================================

/**
 * @brief Уровень сообщения
 */
enum class Level {
    Debug,     ///< Подробности для отладки
    Info,      ///< Информационное сообщение
    Warning,   ///< Предупреждение
    Error      ///< Ошибка
};

/**
 * @brief Преобразовать уровень в строку
 */
[[nodiscard]] constexpr std::string_view to_string(Level level) noexcept {
    switch (level) {
        case Level::Debug:   return "DEBUG";
        case Level::Info:    return "INFO";
        case Level::Warning: return "WARNING";
        case Level::Error:   return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Разобрать уровень из строки конфигурации ("debug", "info", "warn", "error")
 */
[[nodiscard]] std::optional<Level> parse_level(std::string_view name) noexcept;

/**
 * @brief Callback для внешних получателей сообщений
 */
using LogCallback = std::function<void(Level level, std::string_view component,
                                       std::string_view message)>;

/**
 * @brief Конфигурация логгера
 */
struct LoggerConfig {
    /// @brief Минимальный уровень для вывода
    Level min_level{Level::Info};

    /// @brief Включить вывод в консоль
    bool console_output{true};

    /// @brief Использовать ANSI цвета
    bool color{true};
};

// =============================================================================
// Logger
// =============================================================================

/**
 * @brief Логгер процесса
 *
 * Единственный экземпляр на процесс. Потокобезопасен: строки от разных
 * worker потоков не перемешиваются.
 */
class Logger {
public:
    /**
     * @brief Получить единственный экземпляр
     */
    static Logger& instance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Установить конфигурацию
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Установить callback (пустой callback отключает его)
     *
     * Callback вызывается вне внутренней блокировки и может быть вызван
     * из нескольких потоков одновременно.
     */
    void set_callback(LogCallback callback);

    /**
     * @brief Записать сообщение
     */
    void write(Level level, std::string_view component, std::string_view message);

    /**
     * @brief Будет ли сообщение данного уровня выведено
     */
    [[nodiscard]] bool enabled(Level level) const noexcept;

    /// @brief Количество записанных сообщений уровня Error
    [[nodiscard]] uint64_t error_count() const noexcept { return error_count_.load(); }

private:
    Logger() = default;

    void write_to_console(Level level, std::string_view component, std::string_view message);

    LoggerConfig config_;
    LogCallback callback_;
    std::atomic<Level> min_level_{Level::Info};
    std::atomic<uint64_t> error_count_{0};
    mutable std::mutex mutex_;
};

// =============================================================================
// Сокращения
// =============================================================================

inline void debug(std::string_view component, std::string_view message) {
    Logger::instance().write(Level::Debug, component, message);
}

inline void info(std::string_view component, std::string_view message) {
    Logger::instance().write(Level::Info, component, message);
}

inline void warning(std::string_view component, std::string_view message) {
    Logger::instance().write(Level::Warning, component, message);
}

inline void error(std::string_view component, std::string_view message) {
    Logger::instance().write(Level::Error, component, message);
}

} // namespace weavekit::log
