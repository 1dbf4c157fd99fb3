/**
 * @file json.hpp
 * @brief Минимальный разбор и сборка JSON ответов узлов
 *
 * Узлы отвечают маленькими плоскими объектами, поэтому полноценный
 * парсер не нужен: значения извлекаются по ключу. Числа могут приходить
 * как строки ("123") или как литералы (123).
 */

#pragma once

#include "peer_transport.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace weavekit::net {

/**
 * @brief Извлечь значение по ключу
 *
 * Строки возвращаются без кавычек, объекты и массивы целиком,
 * числа/bool/null как есть.
 *
 * @return Значение или std::nullopt если ключа нет
 */
[[nodiscard]] std::optional<std::string> extract_value(std::string_view json, std::string_view key);

/**
 * @brief Извлечь беззнаковое целое (в кавычках или без)
 */
[[nodiscard]] Result<uint64_t> extract_uint(std::string_view json, std::string_view key);

/**
 * @brief Разобрать массив строк верхнего уровня
 */
[[nodiscard]] Result<std::vector<std::string>> parse_string_array(std::string_view json);

/**
 * @brief Разобрать ответ /tx/{id}/offset
 *
 * Нулевой размер допустим: у транзакции без данных нет окон.
 */
[[nodiscard]] Result<TxOffset> parse_tx_offset(std::string_view json);

/**
 * @brief Разобрать ответ /chunk/{offset} и декодировать поле chunk
 */
[[nodiscard]] Result<Bytes> parse_chunk_response(std::string_view json);

/**
 * @brief Собрать тело POST /chunk
 *
 * Бинарные поля в base64url без padding, целые как десятичные строки.
 */
[[nodiscard]] std::string build_chunk_body(const merkle::ChunkEnvelope& envelope);

} // namespace weavekit::net
