// blockbridge Core Tests
// logger_test.cpp - Tests for the category logger

#include <gtest/gtest.h>

#include <blockbridge/core/logger.hpp>

namespace blockbridge::core {
namespace {

TEST(LogLevelTest, ParseAndName) {
    for (auto level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info, LogLevel::Warn, LogLevel::Error,
                       LogLevel::Critical, LogLevel::Off}) {
        auto parsed = parse_log_level(log_level_name(level));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, level);
    }
    EXPECT_FALSE(parse_log_level("INFO").has_value());
    EXPECT_FALSE(parse_log_level("").has_value());
}

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        LoggerConfig config;
        config.file_enabled = false;
        config.console_level = LogLevel::Warn;
        Logger::initialize(config);
    }

    void TearDown() override { Logger::shutdown(); }
};

TEST_F(LoggerTest, InitializeAndShutdown) {
    EXPECT_TRUE(Logger::is_initialized());
    Logger::shutdown();
    EXPECT_FALSE(Logger::is_initialized());
}

TEST_F(LoggerTest, CategoryLevelsOverrideGlobal) {
    EXPECT_EQ(Logger::get_global_level(), LogLevel::Warn);
    EXPECT_EQ(Logger::get_category_level(log_category::PALETTE), LogLevel::Warn);

    Logger::set_category_level(log_category::PALETTE, LogLevel::Trace);
    EXPECT_EQ(Logger::get_category_level(log_category::PALETTE), LogLevel::Trace);
    EXPECT_EQ(Logger::get_category_level(log_category::GL), LogLevel::Warn);

    Logger::set_global_level(LogLevel::Error);
    EXPECT_EQ(Logger::get_category_level(log_category::GL), LogLevel::Error);
}

TEST_F(LoggerTest, LevelFloorTracksLowestCategory) {
    EXPECT_EQ(Logger::get_level_floor(), LogLevel::Warn);

    Logger::set_category_level(log_category::PALETTE, LogLevel::Debug);
    EXPECT_EQ(Logger::get_level_floor(), LogLevel::Debug);

    Logger::set_category_level(log_category::PALETTE, LogLevel::Error);
    EXPECT_EQ(Logger::get_level_floor(), LogLevel::Warn);

    Logger::set_global_level(LogLevel::Info);
    EXPECT_EQ(Logger::get_level_floor(), LogLevel::Info);
}

TEST_F(LoggerTest, LevelFloorOpenBeforeInitialize) {
    Logger::shutdown();
    EXPECT_EQ(Logger::get_level_floor(), LogLevel::Trace);
}

TEST_F(LoggerTest, MacrosLogWithoutThrowing) {
    EXPECT_NO_THROW({
        BLOCKBRIDGE_LOG_INFO(log_category::ENGINE, "info {}", 1);
        BLOCKBRIDGE_LOG_WARN(log_category::GL, "warn {} {}", "two", 2.0);
        BLOCKBRIDGE_LOG_TRACE(log_category::PALETTE, "trace");
        Logger::flush();
    });
}

TEST_F(LoggerTest, ShutdownClearsCategoryLevels) {
    Logger::set_category_level(log_category::CONFIG, LogLevel::Trace);
    Logger::shutdown();

    LoggerConfig config;
    config.file_enabled = false;
    Logger::initialize(config);
    EXPECT_EQ(Logger::get_category_level(log_category::CONFIG), LogLevel::Info);
}

}  // namespace
}  // namespace blockbridge::core
