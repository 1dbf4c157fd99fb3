/**
 * @file config.cpp
 * @brief Реализация загрузки конфигурации
 *
 * Использует библиотеку toml++ для парсинга TOML файлов.
 */

#include "config.hpp"
#include "../log/logger.hpp"

#include <toml++/toml.hpp>

#include <cstdlib>
#include <limits>
#include <vector>

namespace weavekit {

namespace {

/**
 * @brief Прочитать неотрицательное целое поле, если оно задано
 *
 * Значение должно помещаться в тип поля.
 */
template<typename T>
Result<void> read_unsigned(const toml::table& section, std::string_view section_name,
                           std::string_view key, T& target) {
    auto val = section[key].value<int64_t>();
    if (!val) {
        return {};
    }
    if (*val < 0) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            std::string(section_name) + "." + std::string(key) + " не может быть отрицательным"
        );
    }
    if (static_cast<uint64_t>(*val) > std::numeric_limits<T>::max()) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            std::string(section_name) + "." + std::string(key) + " слишком велико: " +
                std::to_string(*val)
        );
    }
    target = static_cast<T>(*val);
    return {};
}

/**
 * @brief Заполнить конфигурацию из разобранной таблицы
 */
Result<Config> from_table(const toml::table& table) {
    Config config;
    Result<void> status;

    // === Секция [gateway] ===
    if (auto gateway = table["gateway"].as_table()) {
        if (auto val = (*gateway)["url"].value<std::string>()) {
            config.gateway.url = *val;
        }
        if (status = read_unsigned(*gateway, "gateway", "timeout_ms", config.gateway.timeout_ms); !status) {
            return std::unexpected(status.error());
        }
        if (status = read_unsigned(*gateway, "gateway", "connect_timeout_ms",
                                   config.gateway.connect_timeout_ms); !status) {
            return std::unexpected(status.error());
        }
    }

    // === Секция [download] ===
    if (auto download = table["download"].as_table()) {
        if (status = read_unsigned(*download, "download", "concurrency",
                                   config.download.concurrency); !status) {
            return std::unexpected(status.error());
        }
        if (status = read_unsigned(*download, "download", "retries_per_chunk",
                                   config.download.retries_per_chunk); !status) {
            return std::unexpected(status.error());
        }
    }

    // === Секция [upload] ===
    if (auto upload = table["upload"].as_table()) {
        if (status = read_unsigned(*upload, "upload", "concurrency",
                                   config.upload.concurrency); !status) {
            return std::unexpected(status.error());
        }
        if (status = read_unsigned(*upload, "upload", "max_retries",
                                   config.upload.max_retries); !status) {
            return std::unexpected(status.error());
        }
        if (status = read_unsigned(*upload, "upload", "retry_backoff_ms",
                                   config.upload.retry_backoff_ms); !status) {
            return std::unexpected(status.error());
        }
    }

    // === Секция [crawler] ===
    if (auto crawler = table["crawler"].as_table()) {
        if (status = read_unsigned(*crawler, "crawler", "concurrency",
                                   config.crawler.concurrency); !status) {
            return std::unexpected(status.error());
        }
        if (status = read_unsigned(*crawler, "crawler", "timeout_ms",
                                   config.crawler.timeout_ms); !status) {
            return std::unexpected(status.error());
        }
        if (status = read_unsigned(*crawler, "crawler", "max_depth",
                                   config.crawler.max_depth); !status) {
            return std::unexpected(status.error());
        }
        if (status = read_unsigned(*crawler, "crawler", "max_count",
                                   config.crawler.max_count); !status) {
            return std::unexpected(status.error());
        }
    }

    // === Секция [logging] ===
    if (auto logging = table["logging"].as_table()) {
        if (auto val = (*logging)["level"].value<std::string>()) {
            config.logging.level = *val;
        }
        if (auto val = (*logging)["color"].value<bool>()) {
            config.logging.color = *val;
        }
    }

    return config;
}

} // anonymous namespace

// =============================================================================
// Config - Загрузка
// =============================================================================

Result<Config> Config::load(const std::filesystem::path& path) {
    // Проверяем существование файла
    if (!std::filesystem::exists(path)) {
        return Err<Config>(
            ErrorCode::ConfigNotFound,
            "Файл конфигурации не найден: " + path.string()
        );
    }

    try {
        auto table = toml::parse_file(path.string());
        return from_table(table);
    } catch (const toml::parse_error& e) {
        return Err<Config>(
            ErrorCode::ConfigParseError,
            path.string() + ": ошибка парсинга TOML: " + std::string(e.description())
        );
    }
}

Result<Config> Config::parse(std::string_view toml_text) {
    try {
        auto table = toml::parse(toml_text);
        return from_table(table);
    } catch (const toml::parse_error& e) {
        return Err<Config>(
            ErrorCode::ConfigParseError,
            "Ошибка парсинга TOML: " + std::string(e.description())
        );
    }
}

Result<Config> Config::load_with_search(
    const std::optional<std::filesystem::path>& path
) {
    // Явно указанный файл обязан существовать
    if (path.has_value()) {
        return load(path.value());
    }

    std::vector<std::filesystem::path> search_paths;
    search_paths.push_back("weavekit.toml");
    search_paths.push_back("/etc/weavekit/weavekit.toml");

    if (const char* home = std::getenv("HOME")) {
        search_paths.push_back(
            std::filesystem::path(home) / ".config" / "weavekit" / "weavekit.toml"
        );
    }

    for (const auto& search_path : search_paths) {
        if (std::filesystem::exists(search_path)) {
            return load(search_path);
        }
    }

    return Err<Config>(
        ErrorCode::ConfigNotFound,
        "Файл конфигурации не найден в стандартных путях"
    );
}

// =============================================================================
// Config - Валидация
// =============================================================================

Result<void> Config::validate() const {
    if (!gateway.url.starts_with("http://") && !gateway.url.starts_with("https://")) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "gateway.url должен начинаться с http:// или https://"
        );
    }

    if (gateway.timeout_ms == 0 || gateway.connect_timeout_ms == 0 || crawler.timeout_ms == 0) {
        return Err<void>(ErrorCode::ConfigInvalidValue, "Таймауты не могут быть 0");
    }

    if (download.concurrency == 0 || upload.concurrency == 0 || crawler.concurrency == 0) {
        return Err<void>(ErrorCode::ConfigInvalidValue, "concurrency не может быть 0");
    }

    if (!log::parse_level(logging.level)) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "logging.level должен быть 'debug', 'info', 'warn' или 'error'"
        );
    }

    return {};
}

} // namespace weavekit
