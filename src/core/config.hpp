/**
 * @file config.hpp
 * @brief Конфигурация weavekit
 *
 * Загрузка и парсинг конфигурации из TOML файла. Все секции и поля
 * необязательны: отсутствующие значения берутся по умолчанию.
 *
 * Пример конфигурации (weavekit.toml):
 * @code
 * [gateway]
 * url = "http://arweave.net:80"
 * timeout_ms = 30000
 * connect_timeout_ms = 5000
 *
 * [download]
 * concurrency = 100
 * retries_per_chunk = 3
 *
 * [upload]
 * concurrency = 20
 * max_retries = 10
 * retry_backoff_ms = 1000
 *
 * [crawler]
 * concurrency = 50
 * timeout_ms = 5000
 * max_depth = 3
 * max_count = 100
 *
 * [logging]
 * level = "info"
 * color = true
 * @endcode
 */

#pragma once

#include "types.hpp"
#include "constants.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace weavekit {

// =============================================================================
// Структуры конфигурации
// =============================================================================

/**
 * @brief Шлюз и HTTP таймауты
 */
struct GatewayConfig {
    /// @brief URL шлюза
    std::string url = constants::DEFAULT_GATEWAY_URL;

    /// @brief Таймаут одного HTTP запроса (мс)
    uint32_t timeout_ms = constants::DEFAULT_HTTP_TIMEOUT_MS;

    /// @brief Таймаут установки соединения (мс)
    uint32_t connect_timeout_ms = constants::DEFAULT_CONNECT_TIMEOUT_MS;
};

/**
 * @brief Настройки скачивания
 */
struct DownloadConfig {
    std::size_t concurrency = constants::DEFAULT_CONCURRENCY_LEVEL;
    uint32_t retries_per_chunk = constants::DEFAULT_RETRIES_PER_CHUNK;
};

/**
 * @brief Настройки выгрузки
 */
struct UploadConfig {
    std::size_t concurrency = constants::DEFAULT_UPLOAD_CONCURRENCY;
    uint32_t max_retries = constants::CHUNKS_RETRIES;
    uint32_t retry_backoff_ms = constants::CHUNKS_RETRY_SLEEP_MS;
};

/**
 * @brief Настройки обхода пиров
 */
struct CrawlerConfig {
    std::size_t concurrency = constants::DEFAULT_CRAWL_CONCURRENCY;
    uint32_t timeout_ms = constants::DEFAULT_CRAWL_TIMEOUT_MS;
    std::size_t max_depth = constants::DEFAULT_CRAWL_MAX_DEPTH;
    std::size_t max_count = constants::DEFAULT_CRAWL_MAX_COUNT;
};

/**
 * @brief Настройки логирования
 */
struct LoggingConfig {
    /// @brief Уровень: "debug", "info", "warn", "error"
    std::string level = "info";

    /// @brief Цветной вывод
    bool color = true;
};

/**
 * @brief Полная конфигурация weavekit
 */
struct Config {
    GatewayConfig gateway;
    DownloadConfig download;
    UploadConfig upload;
    CrawlerConfig crawler;
    LoggingConfig logging;

    /**
     * @brief Загрузить конфигурацию из TOML файла
     *
     * @param path Путь к файлу конфигурации
     * @return Result<Config> Конфигурация или ошибка
     */
    [[nodiscard]] static Result<Config> load(const std::filesystem::path& path);

    /**
     * @brief Разобрать конфигурацию из строки TOML
     */
    [[nodiscard]] static Result<Config> parse(std::string_view toml_text);

    /**
     * @brief Загрузить конфигурацию с поиском файла
     *
     * Ищет файл в следующем порядке:
     * 1. Указанный путь
     * 2. ./weavekit.toml
     * 3. /etc/weavekit/weavekit.toml
     * 4. ~/.config/weavekit/weavekit.toml
     *
     * @param path Опциональный путь к файлу
     * @return Result<Config> Конфигурация или ошибка
     */
    [[nodiscard]] static Result<Config> load_with_search(
        const std::optional<std::filesystem::path>& path = std::nullopt
    );

    /**
     * @brief Валидация конфигурации
     *
     * Проверяет схему URL шлюза, ненулевые таймауты и степени
     * параллельности, известный уровень логирования.
     *
     * @return Result<void> Успех или ошибка валидации
     */
    [[nodiscard]] Result<void> validate() const;
};

} // namespace weavekit
