/**
 * @file encoding.cpp
 * @brief Реализация base64url и hex
 */

#include "encoding.hpp"

#include <array>

namespace weavekit::encoding {

namespace {

constexpr std::string_view BASE64URL_CHARS =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

/// @brief Обратная таблица: символ -> 6-битное значение, 0xFF для чужих символов
constexpr std::array<uint8_t, 256> make_decode_table() {
    std::array<uint8_t, 256> table{};
    table.fill(0xFF);
    for (std::size_t i = 0; i < BASE64URL_CHARS.size(); ++i) {
        table[static_cast<uint8_t>(BASE64URL_CHARS[i])] = static_cast<uint8_t>(i);
    }
    return table;
}

constexpr auto DECODE_TABLE = make_decode_table();

constexpr std::string_view HEX_CHARS = "0123456789abcdef";

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

std::string base64url_encode(ByteSpan data) {
    std::string result;
    result.reserve(((data.size() + 2) / 3) * 4);

    std::size_t i = 0;
    while (i + 3 <= data.size()) {
        uint32_t triple = (static_cast<uint32_t>(data[i]) << 16) |
                          (static_cast<uint32_t>(data[i + 1]) << 8) |
                          static_cast<uint32_t>(data[i + 2]);
        result.push_back(BASE64URL_CHARS[(triple >> 18) & 0x3F]);
        result.push_back(BASE64URL_CHARS[(triple >> 12) & 0x3F]);
        result.push_back(BASE64URL_CHARS[(triple >> 6) & 0x3F]);
        result.push_back(BASE64URL_CHARS[triple & 0x3F]);
        i += 3;
    }

    // Хвост из 1 или 2 байт, без padding
    const std::size_t rest = data.size() - i;
    if (rest == 1) {
        uint32_t triple = static_cast<uint32_t>(data[i]) << 16;
        result.push_back(BASE64URL_CHARS[(triple >> 18) & 0x3F]);
        result.push_back(BASE64URL_CHARS[(triple >> 12) & 0x3F]);
    } else if (rest == 2) {
        uint32_t triple = (static_cast<uint32_t>(data[i]) << 16) |
                          (static_cast<uint32_t>(data[i + 1]) << 8);
        result.push_back(BASE64URL_CHARS[(triple >> 18) & 0x3F]);
        result.push_back(BASE64URL_CHARS[(triple >> 12) & 0x3F]);
        result.push_back(BASE64URL_CHARS[(triple >> 6) & 0x3F]);
    }

    return result;
}

Result<Bytes> base64url_decode(std::string_view text) {
    while (!text.empty() && text.back() == '=') {
        text.remove_suffix(1);
    }

    if (text.size() % 4 == 1) {
        return Err<Bytes>(ErrorCode::NetworkParseError,
                          "Некорректная длина base64url: " + std::to_string(text.size()));
    }

    Bytes result;
    result.reserve(text.size() * 3 / 4);

    uint32_t accumulator = 0;
    int bits = 0;
    for (char c : text) {
        const uint8_t value = DECODE_TABLE[static_cast<uint8_t>(c)];
        if (value == 0xFF) {
            return Err<Bytes>(ErrorCode::NetworkParseError,
                              std::string("Недопустимый символ base64url: '") + c + "'");
        }
        accumulator = (accumulator << 6) | value;
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            result.push_back(static_cast<uint8_t>(accumulator >> bits));
        }
    }

    return result;
}

std::string to_hex(ByteSpan data) {
    std::string result;
    result.reserve(data.size() * 2);
    for (uint8_t byte : data) {
        result.push_back(HEX_CHARS[byte >> 4]);
        result.push_back(HEX_CHARS[byte & 0x0F]);
    }
    return result;
}

Result<Bytes> from_hex(std::string_view text) {
    if (text.size() % 2 != 0) {
        return Err<Bytes>(ErrorCode::NetworkParseError, "Нечётная длина hex строки");
    }

    Bytes result;
    result.reserve(text.size() / 2);
    for (std::size_t i = 0; i < text.size(); i += 2) {
        const int hi = hex_value(text[i]);
        const int lo = hex_value(text[i + 1]);
        if (hi < 0 || lo < 0) {
            return Err<Bytes>(ErrorCode::NetworkParseError, "Недопустимый символ в hex строке");
        }
        result.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return result;
}

} // namespace weavekit::encoding
