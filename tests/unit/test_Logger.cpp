#include <gtest/gtest.h>
#include <scratchpad/core/logger.hpp>

using namespace scratchpad;

TEST(LoggerTest, ParsesConfiguredLevelNames) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parse_log_level(" INFO "), LogLevel::INFO);
    EXPECT_EQ(parse_log_level("Warning"), LogLevel::WARN);
    EXPECT_EQ(parse_log_level("warn"), LogLevel::WARN);
    EXPECT_EQ(parse_log_level("error"), LogLevel::ERROR);
    EXPECT_EQ(parse_log_level("off"), LogLevel::OFF);
    EXPECT_EQ(parse_log_level("none"), LogLevel::OFF);
}

TEST(LoggerTest, UnknownLevelUsesFallback) {
    EXPECT_EQ(parse_log_level("verbose"), LogLevel::INFO);
    EXPECT_EQ(parse_log_level("", LogLevel::ERROR), LogLevel::ERROR);
}

TEST(LoggerTest, MacrosRunAtEveryLevel) {
    const LogLevel levels[] = {LogLevel::DEBUG, LogLevel::INFO, LogLevel::WARN,
                               LogLevel::ERROR, LogLevel::OFF};
    for (LogLevel level : levels) {
        Logger::instance().set_level(level);
        LOG_DEBUG("[LoggerTest] debug %d", 1);
        LOG_INFO("[LoggerTest] info %s", "two");
        LOG_WARN("[LoggerTest] warn %zu", static_cast<size_t>(3));
        LOG_ERROR("[LoggerTest] error");
    }
    Logger::instance().set_level(LogLevel::OFF);
}
