/**
 * @file test_encoding.cpp
 * @brief Тесты base64url и hex
 */

#include <gtest/gtest.h>
#include <string>

#include "core/encoding.hpp"
#include "core/types.hpp"

namespace weavekit::tests {

class EncodingTest : public ::testing::Test {};

/**
 * @brief Тест: векторы RFC 4648 без padding
 */
TEST_F(EncodingTest, Base64UrlVectors) {
    EXPECT_EQ(encoding::base64url_encode(as_bytes("")), "");
    EXPECT_EQ(encoding::base64url_encode(as_bytes("f")), "Zg");
    EXPECT_EQ(encoding::base64url_encode(as_bytes("fo")), "Zm8");
    EXPECT_EQ(encoding::base64url_encode(as_bytes("foo")), "Zm9v");
    EXPECT_EQ(encoding::base64url_encode(as_bytes("foob")), "Zm9vYg");
    EXPECT_EQ(encoding::base64url_encode(as_bytes("fooba")), "Zm9vYmE");
    EXPECT_EQ(encoding::base64url_encode(as_bytes("foobar")), "Zm9vYmFy");
}

/**
 * @brief Тест: url-safe алфавит
 */
TEST_F(EncodingTest, Base64UrlAlphabet) {
    const Bytes data = {0xfb, 0xff, 0xfe};
    EXPECT_EQ(encoding::base64url_encode(data), "-__-");

    auto decoded = encoding::base64url_decode("-__-");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, data);
}

/**
 * @brief Тест: padding принимается
 */
TEST_F(EncodingTest, Base64UrlAcceptsPadding) {
    auto decoded = encoding::base64url_decode("Zm9vYg==");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(std::string(decoded->begin(), decoded->end()), "foob");
}

/**
 * @brief Тест: некорректный ввод отвергается
 */
TEST_F(EncodingTest, Base64UrlRejectsGarbage) {
    EXPECT_FALSE(encoding::base64url_decode("Zm9v+g").has_value());
    EXPECT_FALSE(encoding::base64url_decode("Zm9v/g").has_value());
    EXPECT_FALSE(encoding::base64url_decode("Z").has_value());
    EXPECT_FALSE(encoding::base64url_decode("Zm 9v").has_value());

    auto bad = encoding::base64url_decode("Zm9v!!");
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().code, ErrorCode::NetworkParseError);
}

/**
 * @brief Тест: hex
 */
TEST_F(EncodingTest, Hex) {
    const Bytes data = {0x00, 0x01, 0xab, 0xff};
    EXPECT_EQ(encoding::to_hex(data), "0001abff");

    auto decoded = encoding::from_hex("0001ABff");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, data);

    EXPECT_FALSE(encoding::from_hex("abc").has_value());
    EXPECT_FALSE(encoding::from_hex("zz").has_value());
}

} // namespace weavekit::tests
