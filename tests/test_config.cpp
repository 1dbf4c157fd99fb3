/**
 * @file test_config.cpp
 * @brief Тесты загрузки конфигурации
 */

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

#include "core/config.hpp"

namespace weavekit::tests {

class ConfigTest : public ::testing::Test {};

/**
 * @brief Тест: пустой файл даёт значения по умолчанию
 */
TEST_F(ConfigTest, Defaults) {
    auto config = Config::parse("");
    ASSERT_TRUE(config.has_value());

    EXPECT_EQ(config->gateway.url, constants::DEFAULT_GATEWAY_URL);
    EXPECT_EQ(config->download.concurrency, constants::DEFAULT_CONCURRENCY_LEVEL);
    EXPECT_EQ(config->download.retries_per_chunk, constants::DEFAULT_RETRIES_PER_CHUNK);
    EXPECT_EQ(config->upload.max_retries, constants::CHUNKS_RETRIES);
    EXPECT_EQ(config->upload.retry_backoff_ms, constants::CHUNKS_RETRY_SLEEP_MS);
    EXPECT_EQ(config->crawler.max_depth, constants::DEFAULT_CRAWL_MAX_DEPTH);
    EXPECT_EQ(config->logging.level, "info");
    EXPECT_TRUE(config->validate().has_value());
}

/**
 * @brief Тест: значения из файла переопределяют умолчания
 */
TEST_F(ConfigTest, Overrides) {
    auto config = Config::parse(R"(
[gateway]
url = "https://gateway.example:443"
timeout_ms = 1500

[download]
concurrency = 8
retries_per_chunk = 5

[upload]
concurrency = 2
max_retries = 1
retry_backoff_ms = 0

[crawler]
max_depth = 1
max_count = 25

[logging]
level = "debug"
color = false
)");
    ASSERT_TRUE(config.has_value()) << config.error().message;

    EXPECT_EQ(config->gateway.url, "https://gateway.example:443");
    EXPECT_EQ(config->gateway.timeout_ms, 1500u);
    EXPECT_EQ(config->gateway.connect_timeout_ms, constants::DEFAULT_CONNECT_TIMEOUT_MS);
    EXPECT_EQ(config->download.concurrency, 8u);
    EXPECT_EQ(config->download.retries_per_chunk, 5u);
    EXPECT_EQ(config->upload.concurrency, 2u);
    EXPECT_EQ(config->upload.max_retries, 1u);
    EXPECT_EQ(config->upload.retry_backoff_ms, 0u);
    EXPECT_EQ(config->crawler.max_depth, 1u);
    EXPECT_EQ(config->crawler.max_count, 25u);
    EXPECT_EQ(config->logging.level, "debug");
    EXPECT_FALSE(config->logging.color);
    EXPECT_TRUE(config->validate().has_value());
}

TEST_F(ConfigTest, NegativeValueRejected) {
    auto config = Config::parse("[download]\nconcurrency = -4\n");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::ConfigInvalidValue);
    EXPECT_NE(config.error().message.find("download.concurrency"), std::string::npos);
}

/**
 * @brief Тест: значение, не помещающееся в тип поля, отклоняется
 */
TEST_F(ConfigTest, OutOfRangeValueRejected) {
    auto config = Config::parse("[gateway]\ntimeout_ms = 4294967297\n");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::ConfigInvalidValue);
    EXPECT_NE(config.error().message.find("gateway.timeout_ms"), std::string::npos);

    auto max_ok = Config::parse("[gateway]\ntimeout_ms = 4294967295\n");
    ASSERT_TRUE(max_ok.has_value()) << max_ok.error().message;
    EXPECT_EQ(max_ok->gateway.timeout_ms, 4294967295u);
}

TEST_F(ConfigTest, SyntaxError) {
    auto config = Config::parse("[gateway\nurl = ");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::ConfigParseError);
}

TEST_F(ConfigTest, ValidateRejectsBadValues) {
    Config bad_url;
    bad_url.gateway.url = "ftp://gateway";
    EXPECT_EQ(bad_url.validate().error().code, ErrorCode::ConfigInvalidValue);

    Config zero_timeout;
    zero_timeout.crawler.timeout_ms = 0;
    EXPECT_FALSE(zero_timeout.validate().has_value());

    Config zero_concurrency;
    zero_concurrency.upload.concurrency = 0;
    EXPECT_FALSE(zero_concurrency.validate().has_value());

    // Ноль повторов допустим: один запрос на окно
    Config zero_retries;
    zero_retries.download.retries_per_chunk = 0;
    EXPECT_TRUE(zero_retries.validate().has_value());

    Config bad_level;
    bad_level.logging.level = "verbose";
    EXPECT_FALSE(bad_level.validate().has_value());
}

TEST_F(ConfigTest, MissingFile) {
    auto config = Config::load("/nonexistent/weavekit.toml");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::ConfigNotFound);

    // Явно указанный путь не подменяется поиском
    auto searched = Config::load_with_search(std::filesystem::path("/nonexistent/weavekit.toml"));
    ASSERT_FALSE(searched.has_value());
    EXPECT_EQ(searched.error().code, ErrorCode::ConfigNotFound);
}

TEST_F(ConfigTest, LoadFromFile) {
    const auto path = std::filesystem::temp_directory_path() / "weavekit_config_test.toml";
    {
        std::ofstream file(path);
        file << "[crawler]\nconcurrency = 3\n";
    }

    auto config = Config::load(path);
    std::filesystem::remove(path);

    ASSERT_TRUE(config.has_value()) << config.error().message;
    EXPECT_EQ(config->crawler.concurrency, 3u);
}

} // namespace weavekit::tests
