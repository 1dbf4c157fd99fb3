/**
 * @file test_logger.cpp
 * @brief Тесты логгера
 */

#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "log/logger.hpp"

namespace weavekit::tests {

class LoggerTest : public ::testing::Test {
protected:
    struct Record {
        log::Level level;
        std::string component;
        std::string message;
    };

    void SetUp() override {
        log::LoggerConfig config;
        config.min_level = log::Level::Info;
        config.console_output = false;
        log::Logger::instance().configure(config);
        log::Logger::instance().set_callback(
            [this](log::Level level, std::string_view component, std::string_view message) {
                records.push_back(Record{level, std::string(component), std::string(message)});
            });
    }

    void TearDown() override {
        log::Logger::instance().set_callback({});
        log::Logger::instance().configure(log::LoggerConfig{});
    }

    std::vector<Record> records;
};

TEST_F(LoggerTest, CallbackReceivesMessages) {
    log::info("downloader", "окно записано");

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, log::Level::Info);
    EXPECT_EQ(records[0].component, "downloader");
    EXPECT_EQ(records[0].message, "окно записано");
}

TEST_F(LoggerTest, LevelFiltering) {
    log::debug("crawler", "скрыто");
    log::warning("crawler", "видно");

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, log::Level::Warning);
    EXPECT_FALSE(log::Logger::instance().enabled(log::Level::Debug));
    EXPECT_TRUE(log::Logger::instance().enabled(log::Level::Error));
}

TEST_F(LoggerTest, ErrorCount) {
    const auto before = log::Logger::instance().error_count();
    log::error("uploader", "первая");
    log::error("uploader", "вторая");
    log::info("uploader", "не ошибка");
    EXPECT_EQ(log::Logger::instance().error_count(), before + 2);
}

/**
 * @brief Тест: callback может сам писать в лог
 */
TEST_F(LoggerTest, CallbackMayLog) {
    int depth = 0;
    log::Logger::instance().set_callback(
        [this, &depth](log::Level level, std::string_view component, std::string_view message) {
            records.push_back(Record{level, std::string(component), std::string(message)});
            if (depth++ == 0) {
                log::info("callback", "вложенное сообщение");
            }
        });

    log::info("test", "внешнее сообщение");

    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].message, "внешнее сообщение");
    EXPECT_EQ(records[1].component, "callback");
}

TEST_F(LoggerTest, ParseLevel) {
    EXPECT_EQ(log::parse_level("debug"), log::Level::Debug);
    EXPECT_EQ(log::parse_level("info"), log::Level::Info);
    EXPECT_EQ(log::parse_level("warn"), log::Level::Warning);
    EXPECT_EQ(log::parse_level("warning"), log::Level::Warning);
    EXPECT_EQ(log::parse_level("error"), log::Level::Error);
    EXPECT_FALSE(log::parse_level("INFO").has_value());
    EXPECT_FALSE(log::parse_level("").has_value());
}

} // namespace weavekit::tests
