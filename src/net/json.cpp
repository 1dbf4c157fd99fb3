/**
 * @file json.cpp
 * @brief Реализация разбора ответов узлов
 */

#include "json.hpp"
#include "../core/encoding.hpp"

#include <cctype>
#include <charconv>

namespace weavekit::net {

namespace {

bool is_space(char c) noexcept {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::size_t skip_spaces(std::string_view json, std::size_t pos) noexcept {
    while (pos < json.size() && is_space(json[pos])) {
        ++pos;
    }
    return pos;
}

/**
 * @brief Найти конец строкового литерала, pos указывает на открывающую кавычку
 *
 * @return Позиция закрывающей кавычки или npos
 */
std::size_t find_string_end(std::string_view json, std::size_t pos) noexcept {
    ++pos;
    while (pos < json.size()) {
        if (json[pos] == '\\') {
            pos += 2;
            continue;
        }
        if (json[pos] == '"') {
            return pos;
        }
        ++pos;
    }
    return std::string_view::npos;
}

/**
 * @brief Найти конец объекта или массива, pos указывает на открывающую скобку
 *
 * @return Позиция за закрывающей скобкой или npos
 */
std::size_t find_container_end(std::string_view json, std::size_t pos) noexcept {
    const char open = json[pos];
    const char close = (open == '{') ? '}' : ']';
    int depth = 1;
    ++pos;
    while (pos < json.size() && depth > 0) {
        if (json[pos] == '"') {
            pos = find_string_end(json, pos);
            if (pos == std::string_view::npos) {
                return pos;
            }
        } else if (json[pos] == open) {
            ++depth;
        } else if (json[pos] == close) {
            --depth;
        }
        ++pos;
    }
    return depth == 0 ? pos : std::string_view::npos;
}

} // anonymous namespace

// =============================================================================
// Извлечение значений
// =============================================================================

std::optional<std::string> extract_value(std::string_view json, std::string_view key) {
    std::string search;
    search.reserve(key.size() + 2);
    search.push_back('"');
    search.append(key);
    search.push_back('"');

    std::size_t from = 0;
    while (true) {
        auto pos = json.find(search, from);
        if (pos == std::string_view::npos) {
            return std::nullopt;
        }
        from = pos + search.size();

        // Ключ должен быть именем поля, а не значением другого поля
        pos = skip_spaces(json, from);
        if (pos >= json.size() || json[pos] != ':') {
            continue;
        }
        pos = skip_spaces(json, pos + 1);
        if (pos >= json.size()) {
            return std::nullopt;
        }

        if (json[pos] == '"') {
            auto end = find_string_end(json, pos);
            if (end == std::string_view::npos) {
                return std::nullopt;
            }
            return std::string(json.substr(pos + 1, end - pos - 1));
        }

        if (json[pos] == '{' || json[pos] == '[') {
            auto end = find_container_end(json, pos);
            if (end == std::string_view::npos) {
                return std::nullopt;
            }
            return std::string(json.substr(pos, end - pos));
        }

        // Число, bool или null
        auto end = json.find_first_of(",}]", pos);
        if (end == std::string_view::npos) {
            end = json.size();
        }
        auto value = json.substr(pos, end - pos);
        while (!value.empty() && is_space(value.back())) {
            value.remove_suffix(1);
        }
        return std::string(value);
    }
}

Result<uint64_t> extract_uint(std::string_view json, std::string_view key) {
    auto value = extract_value(json, key);
    if (!value || value->empty()) {
        return Err<uint64_t>(
            ErrorCode::NetworkParseError,
            "Поле '" + std::string(key) + "' отсутствует"
        );
    }

    uint64_t result = 0;
    const char* first = value->data();
    const char* last = value->data() + value->size();
    auto [ptr, ec] = std::from_chars(first, last, result);
    if (ec != std::errc{} || ptr != last) {
        return Err<uint64_t>(
            ErrorCode::NetworkParseError,
            "Поле '" + std::string(key) + "' не является целым: " + *value
        );
    }

    return result;
}

Result<std::vector<std::string>> parse_string_array(std::string_view json) {
    std::size_t pos = skip_spaces(json, 0);
    if (pos >= json.size() || json[pos] != '[') {
        return Err<std::vector<std::string>>(ErrorCode::NetworkParseError, "Ожидался массив");
    }

    std::vector<std::string> result;
    pos = skip_spaces(json, pos + 1);

    while (pos < json.size() && json[pos] != ']') {
        if (json[pos] != '"') {
            return Err<std::vector<std::string>>(
                ErrorCode::NetworkParseError,
                "Ожидалась строка на позиции " + std::to_string(pos)
            );
        }
        auto end = find_string_end(json, pos);
        if (end == std::string_view::npos) {
            return Err<std::vector<std::string>>(ErrorCode::NetworkParseError,
                                                 "Незакрытая строка");
        }
        result.emplace_back(json.substr(pos + 1, end - pos - 1));

        pos = skip_spaces(json, end + 1);
        if (pos < json.size() && json[pos] == ',') {
            pos = skip_spaces(json, pos + 1);
        }
    }

    if (pos >= json.size()) {
        return Err<std::vector<std::string>>(ErrorCode::NetworkParseError, "Незакрытый массив");
    }

    return result;
}

// =============================================================================
// Ответы узлов
// =============================================================================

Result<TxOffset> parse_tx_offset(std::string_view json) {
    auto offset = extract_uint(json, "offset");
    if (!offset) {
        return std::unexpected(offset.error());
    }
    auto size = extract_uint(json, "size");
    if (!size) {
        return std::unexpected(size.error());
    }
    if (*size > *offset + 1) {
        return Err<TxOffset>(
            ErrorCode::NetworkParseError,
            "Размер " + std::to_string(*size) + " не согласован со смещением " +
                std::to_string(*offset)
        );
    }

    return TxOffset{*offset, *size};
}

Result<Bytes> parse_chunk_response(std::string_view json) {
    auto chunk = extract_value(json, "chunk");
    if (!chunk) {
        return Err<Bytes>(ErrorCode::NetworkParseError, "Поле 'chunk' отсутствует");
    }
    return encoding::base64url_decode(*chunk);
}

std::string build_chunk_body(const merkle::ChunkEnvelope& envelope) {
    std::string body;
    body.reserve(envelope.chunk.size() * 4 / 3 + envelope.data_path.size() * 4 / 3 + 256);

    body += R"({"data_root":")";
    body += encoding::base64url_encode(envelope.data_root);
    body += R"(","data_size":")";
    body += std::to_string(envelope.data_size);
    body += R"(","data_path":")";
    body += encoding::base64url_encode(envelope.data_path);
    body += R"(","offset":")";
    body += std::to_string(envelope.offset);
    body += R"(","chunk":")";
    body += encoding::base64url_encode(envelope.chunk);
    body += R"("})";

    return body;
}

} // namespace weavekit::net
