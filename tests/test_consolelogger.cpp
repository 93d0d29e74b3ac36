// tests/test_consolelogger.cpp
#include <sstream>
#include <string>

#include "gtest/gtest.h"

#include "../src/logging/ConsoleLogger.hpp"

TEST(ConsoleLoggerTest, FiltersBelowConfiguredLevel) {
    std::ostringstream out;
    std::ostringstream err;
    ConsoleLogger logger(LogUtils::LogLevel::WARN, out, err);

    logger.debug("hidden debug");
    logger.info("hidden info");
    logger.warn("shown warning");

    EXPECT_EQ(out.str(), "[Warning] shown warning\n");
    EXPECT_TRUE(err.str().empty());
    EXPECT_EQ(logger.getLogLevel(), LogUtils::LogLevel::WARN);
}

TEST(ConsoleLoggerTest, ErrorsGoToErrorStream) {
    std::ostringstream out;
    std::ostringstream err;
    ConsoleLogger logger(LogUtils::LogLevel::DEBUG, out, err);

    logger.error("broken");
    EXPECT_TRUE(out.str().empty());
    EXPECT_EQ(err.str(), "[Error] broken\n");
}

TEST(ConsoleLoggerTest, SetupAlwaysWritten) {
    std::ostringstream out;
    std::ostringstream err;
    ConsoleLogger logger(LogUtils::LogLevel::CERROR, out, err);

    logger.setup("starting");
    logger.info("hidden");
    EXPECT_EQ(out.str(), "[Setup] starting\n");
}

TEST(ConsoleLoggerTest, DebugLevelWritesEverything) {
    std::ostringstream out;
    std::ostringstream err;
    ConsoleLogger logger(LogUtils::LogLevel::DEBUG, out, err);

    logger.debug("one");
    logger.info("two");
    EXPECT_EQ(out.str(), "[Debug] one\n[Info] two\n");
}

TEST(ConsoleLoggerTest, GetInstanceReturnsSameLogger) {
    auto first = ConsoleLogger::getInstance(LogUtils::LogLevel::CERROR);
    auto second = ConsoleLogger::getInstance(LogUtils::LogLevel::DEBUG);
    EXPECT_EQ(first, second);
    EXPECT_EQ(second->getLogLevel(), LogUtils::LogLevel::CERROR);
}
