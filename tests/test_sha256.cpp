/**
 * @file test_sha256.cpp
 * @brief Тесты SHA256 реализации
 *
 * Проверяет корректность SHA256 хеширования для известных тестовых векторов,
 * потоковый режим и hash_all.
 */

#include <gtest/gtest.h>
#include <array>
#include <string>
#include <span>

#include "crypto/sha256.hpp"
#include "core/types.hpp"
#include "test_helpers.hpp"

namespace weavekit::tests {

/**
 * @brief Класс тестов для SHA256
 */
class SHA256Test : public ::testing::Test {};

/**
 * @brief Тест: пустое сообщение
 *
 * SHA256("") = e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855
 */
TEST_F(SHA256Test, EmptyMessage) {
    auto hash = crypto::sha256(ByteSpan{});

    constexpr Hash256 expected = {{
        0xe3, 0xb0, 0xc4, 0x42, 0x98, 0xfc, 0x1c, 0x14,
        0x9a, 0xfb, 0xf4, 0xc8, 0x99, 0x6f, 0xb9, 0x24,
        0x27, 0xae, 0x41, 0xe4, 0x64, 0x9b, 0x93, 0x4c,
        0xa4, 0x95, 0x99, 0x1b, 0x78, 0x52, 0xb8, 0x55
    }};

    EXPECT_EQ(hash, expected);
}

/**
 * @brief Тест: "abc"
 *
 * SHA256("abc") = ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad
 */
TEST_F(SHA256Test, SimpleMessage) {
    auto hash = crypto::sha256(as_bytes("abc"));

    constexpr Hash256 expected = {{
        0xba, 0x78, 0x16, 0xbf, 0x8f, 0x01, 0xcf, 0xea,
        0x41, 0x41, 0x40, 0xde, 0x5d, 0xae, 0x22, 0x23,
        0xb0, 0x03, 0x61, 0xa3, 0x96, 0x17, 0x7a, 0x9c,
        0xb4, 0x10, 0xff, 0x61, 0xf2, 0x00, 0x15, 0xad
    }};

    EXPECT_EQ(hash, expected);
}

/**
 * @brief Тест: 448 бит (padding уходит во второй блок)
 */
TEST_F(SHA256Test, TwoBlockPadding) {
    auto hash = crypto::sha256(as_bytes("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq"));

    EXPECT_EQ(hash, hash_from_hex(
        "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1"));
}

/**
 * @brief Тест: миллион символов 'a'
 */
TEST_F(SHA256Test, MillionA) {
    const std::string msg(1'000'000, 'a');
    auto hash = crypto::sha256(as_bytes(msg));

    EXPECT_EQ(hash, hash_from_hex(
        "cdc76e5c9914fb9281a1c7e284d73e67f1809a48a497200e046d39ccc7112cd0"));
}

/**
 * @brief Тест: потоковое хеширование частями разного размера
 */
TEST_F(SHA256Test, StreamingMatchesOneShot) {
    const auto data = make_fixture(10'000);
    const auto expected = crypto::sha256(data);

    for (std::size_t piece : {1u, 7u, 63u, 64u, 65u, 1000u}) {
        crypto::Sha256 hasher;
        ByteSpan rest(data);
        while (!rest.empty()) {
            const auto n = std::min(piece, rest.size());
            hasher.update(rest.first(n));
            rest = rest.subspan(n);
        }
        EXPECT_EQ(hasher.finalize(), expected) << "piece=" << piece;
    }
}

/**
 * @brief Тест: finalize сбрасывает состояние
 */
TEST_F(SHA256Test, FinalizeResets) {
    crypto::Sha256 hasher;
    hasher.update(as_bytes("garbage"));
    (void)hasher.finalize();

    hasher.update(as_bytes("abc"));
    EXPECT_EQ(hasher.finalize(), crypto::sha256(as_bytes("abc")));
}

/**
 * @brief Тест: hash_all хеширует каждый элемент перед конкатенацией
 */
TEST_F(SHA256Test, HashAll) {
    EXPECT_EQ(crypto::hash_all({as_bytes("abc")}), hash_from_hex(
        "4f8b42c22dd3729b519ba6f68d2da7cc5b2d606d05daed5ad5128cc03e6c6358"));

    EXPECT_EQ(crypto::hash_all({as_bytes("abc"), ByteSpan{}}), hash_from_hex(
        "6f1290896ee81a0349174d19f4473d267a10289c40480861d5c42affffbd79f9"));
}

} // namespace weavekit::tests
