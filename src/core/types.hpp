/**
 * @file types.hpp
 * @brief Базовые типы weavekit
 *
 * Определяет основные типы данных, используемые во всём проекте:
 * - Hash256: 32-байтный хеш (SHA256, id узла Merkle, data root)
 * - Bytes: динамический массив байт
 * - Result<T>: обёртка std::expected для обработки ошибок
 *
 * @note Ожидаемые отказы (недоступный пир, отсутствующий chunk) не являются
 *       исключительной ситуацией и возвращаются через Result.
 */

#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace weavekit {

// =============================================================================
// Базовые типы данных
// =============================================================================

/**
 * @brief 256-битный хеш (32 байта)
 *
 * Используется для:
 * - SHA256 хешей данных chunk
 * - id листьев и ветвей Merkle дерева
 * - Data root (идентификатор содержимого)
 */
using Hash256 = std::array<uint8_t, 32>;

/**
 * @brief Динамический массив байт
 */
using Bytes = std::vector<uint8_t>;

/**
 * @brief Представление (view) на массив байт без владения
 */
using ByteSpan = std::span<const uint8_t>;

// =============================================================================
// Коды ошибок
// =============================================================================

/**
 * @brief Перечисление кодов ошибок
 *
 * Коды сгруппированы по диапазонам, как и подсистемы.
 */
enum class ErrorCode {
    Success = 0,

    // Ошибки конфигурации (100-199)
    ConfigNotFound = 100,
    ConfigParseError = 101,
    ConfigInvalidValue = 102,

    // Ошибки сети (200-299)
    NetworkConnectionFailed = 200,
    NetworkTimeout = 201,
    NetworkBadStatus = 202,
    NetworkChunkNotFound = 203,
    NetworkParseError = 204,
    NetworkInvalidUrl = 205,

    // Ошибки chunk и Merkle дерева (700-799)
    ChunkEmptyInput = 700,
    ChunkInvalidLength = 701,
    MerkleEmptyTree = 710,
    MerkleInvalidNode = 711,
    MerkleInvalidProof = 712,

    // Системные ошибки (800-899)
    SystemOutOfMemory = 800,
    SystemIOError = 801,

    // Ошибки передачи данных (900-999)
    TransferMissingChunks = 900,
    TransferUploadFailed = 901,
    TransferNoPeers = 902,
};

/**
 * @brief Преобразование кода ошибки в строку
 */
[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::ConfigNotFound: return "Файл конфигурации не найден";
        case ErrorCode::ConfigParseError: return "Ошибка парсинга конфигурации";
        case ErrorCode::ConfigInvalidValue: return "Некорректное значение в конфигурации";
        case ErrorCode::NetworkConnectionFailed: return "Ошибка подключения к пиру";
        case ErrorCode::NetworkTimeout: return "Таймаут сети";
        case ErrorCode::NetworkBadStatus: return "Неожиданный HTTP статус";
        case ErrorCode::NetworkChunkNotFound: return "Chunk не найден у пира";
        case ErrorCode::NetworkParseError: return "Ошибка разбора ответа пира";
        case ErrorCode::NetworkInvalidUrl: return "Некорректный адрес пира";
        case ErrorCode::ChunkEmptyInput: return "Пустые данные нельзя разбить на chunks";
        case ErrorCode::ChunkInvalidLength: return "Некорректная длина chunk";
        case ErrorCode::MerkleEmptyTree: return "Merkle дерево без листьев";
        case ErrorCode::MerkleInvalidNode: return "Узел не является ни листом, ни ветвью";
        case ErrorCode::MerkleInvalidProof: return "Некорректное доказательство включения";
        case ErrorCode::SystemOutOfMemory: return "Недостаточно памяти";
        case ErrorCode::SystemIOError: return "Ошибка ввода/вывода";
        case ErrorCode::TransferMissingChunks: return "Получены не все chunks";
        case ErrorCode::TransferUploadFailed: return "Не все chunks отправлены";
        case ErrorCode::TransferNoPeers: return "Не указано ни одного пира";
        default: return "Неизвестная ошибка";
    }
}

// =============================================================================
// Result тип (std::expected wrapper)
// =============================================================================

/**
 * @brief Ошибка с кодом и опциональным сообщением
 *
 * Используется как error type в std::expected.
 */
struct Error {
    ErrorCode code;
    std::string message;

    /**
     * @brief Создать ошибку только с кодом
     */
    constexpr explicit Error(ErrorCode c) noexcept
        : code(c), message(std::string(to_string(c))) {}

    /**
     * @brief Создать ошибку с кодом и сообщением
     */
    Error(ErrorCode c, std::string msg) noexcept
        : code(c), message(std::move(msg)) {}

    [[nodiscard]] bool operator==(const Error& other) const noexcept {
        return code == other.code;
    }
};

/**
 * @brief Результат операции: значение или ошибка
 *
 * @tparam T Тип возвращаемого значения
 *
 * Пример использования:
 * @code
 * auto chunks = merkle::split(data);
 * if (!chunks) {
 *     log::error("chunker", chunks.error().message);
 *     return std::unexpected(chunks.error());
 * }
 * @endcode
 */
template<typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Создать результат с ошибкой
 */
template<typename T>
[[nodiscard]] constexpr Result<T> Err(ErrorCode code) {
    return std::unexpected(Error{code});
}

/**
 * @brief Создать результат с ошибкой и сообщением
 */
template<typename T>
[[nodiscard]] Result<T> Err(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

/**
 * @brief Является ли ошибка временной (имеет смысл повторить запрос)
 */
[[nodiscard]] constexpr bool is_transient(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::NetworkConnectionFailed:
        case ErrorCode::NetworkTimeout:
        case ErrorCode::NetworkBadStatus:
        case ErrorCode::NetworkChunkNotFound:
        case ErrorCode::NetworkParseError:
        case ErrorCode::ChunkInvalidLength:
            return true;
        default:
            return false;
    }
}

// =============================================================================
// Вспомогательные функции
// =============================================================================

/**
 * @brief Представить строку как span байт
 */
[[nodiscard]] inline ByteSpan as_bytes(std::string_view str) noexcept {
    return ByteSpan{reinterpret_cast<const uint8_t*>(str.data()), str.size()};
}

} // namespace weavekit
