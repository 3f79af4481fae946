#include "core/logging.hpp"

#include <gtest/gtest.h>

using namespace cell_threshold::logging;

class LoggingTest : public ::testing::Test {
protected:
    void TearDown() override {
        LoggerFactory::setGlobalLevel(LogLevel::Info);
    }
};

TEST_F(LoggingTest, LevelFromString) {
    EXPECT_EQ(logLevelFromString("trace"), LogLevel::Trace);
    EXPECT_EQ(logLevelFromString("Debug"), LogLevel::Debug);
    EXPECT_EQ(logLevelFromString("INFO"), LogLevel::Info);
    EXPECT_EQ(logLevelFromString("warn"), LogLevel::Warning);
    EXPECT_EQ(logLevelFromString("warning"), LogLevel::Warning);
    EXPECT_EQ(logLevelFromString("error"), LogLevel::Error);
    EXPECT_EQ(logLevelFromString("critical"), LogLevel::Critical);
    EXPECT_EQ(logLevelFromString("off"), LogLevel::Off);
}

TEST_F(LoggingTest, UnknownLevelFallsBackToInfo) {
    EXPECT_EQ(logLevelFromString("verbose"), LogLevel::Info);
    EXPECT_EQ(logLevelFromString(""), LogLevel::Info);
}

TEST_F(LoggingTest, LevelStringRoundTrip) {
    for (auto level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info,
                       LogLevel::Warning, LogLevel::Error, LogLevel::Critical,
                       LogLevel::Off}) {
        EXPECT_EQ(logLevelFromString(toString(level)), level);
    }
}

TEST_F(LoggingTest, CreateReturnsSameLoggerForSameName) {
    auto first = LoggerFactory::create("LoggingTestComponent");
    auto second = LoggerFactory::create("LoggingTestComponent");

    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first.get(), second.get());
    EXPECT_EQ(first->name(), "LoggingTestComponent");
}

TEST_F(LoggingTest, SetGlobalLevelAppliesToExistingLoggers) {
    auto logger = LoggerFactory::create("LoggingTestLevel");

    LoggerFactory::setGlobalLevel(LogLevel::Error);
    EXPECT_EQ(LoggerFactory::getGlobalLevel(), LogLevel::Error);
    EXPECT_EQ(logger->level(), spdlog::level::err);

    LoggerFactory::setGlobalLevel(LogLevel::Debug);
    EXPECT_EQ(logger->level(), spdlog::level::debug);
}
