/**
 * @file test_helpers.hpp
 * @brief Общие вспомогательные функции тестов
 */

#pragma once

#include "core/encoding.hpp"
#include "core/types.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <string_view>

namespace weavekit::tests {

/**
 * @brief Детерминированные данные: старший байт i * 2654435761 (mod 2^32)
 */
inline Bytes make_fixture(std::size_t size) {
    Bytes data(size);
    for (std::size_t i = 0; i < size; ++i) {
        const uint32_t x = static_cast<uint32_t>(i) * 2654435761u;
        data[i] = static_cast<uint8_t>(x >> 24);
    }
    return data;
}

/**
 * @brief Hash256 из hex строки (64 символа)
 */
inline Hash256 hash_from_hex(std::string_view hex) {
    Hash256 hash{};
    auto bytes = encoding::from_hex(hex);
    EXPECT_TRUE(bytes.has_value()) << hex;
    if (bytes && bytes->size() == hash.size()) {
        std::copy(bytes->begin(), bytes->end(), hash.begin());
    } else {
        ADD_FAILURE() << "Некорректный hex хеша: " << hex;
    }
    return hash;
}

} // namespace weavekit::tests
