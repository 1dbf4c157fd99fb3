/**
 * @file encoding.hpp
 * @brief Текстовые кодировки бинарных данных
 *
 * - base64url без padding (RFC 4648 §5): формат chunk, data_path и
 *   data_root в HTTP API пиров
 * - hex: вывод хешей в логах и CLI
 */

#pragma once

#include "types.hpp"

#include <string>
#include <string_view>

namespace weavekit::encoding {

/**
 * @brief Закодировать байты в base64url без padding
 */
[[nodiscard]] std::string base64url_encode(ByteSpan data);

/**
 * @brief Декодировать base64url
 *
 * Принимает строки с padding '=' и без него. Символы стандартного
 * алфавита ('+', '/') не принимаются.
 *
 * @return Result<Bytes> Данные или NetworkParseError
 */
[[nodiscard]] Result<Bytes> base64url_decode(std::string_view text);

/**
 * @brief Закодировать байты в hex (нижний регистр)
 */
[[nodiscard]] std::string to_hex(ByteSpan data);

/**
 * @brief Декодировать hex строку
 */
[[nodiscard]] Result<Bytes> from_hex(std::string_view text);

} // namespace weavekit::encoding
