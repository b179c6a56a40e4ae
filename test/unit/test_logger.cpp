// test/unit/test_logger.cpp
// -----------------------------------------------------------
// Unit tests for the logger: sink delivery, level filtering and file output.

#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "util/logger.hpp"

namespace {

namespace logger = phiguard::util::logger;
using logger::LogLevel;
using logger::LogSink;

TEST(LoggerTest, SinkSeesEveryLevelEvenWhenConsoleIsOff) {
    std::vector<std::pair<LogLevel, std::string>> seen;
    logger::setLogLevel(LogLevel::OFF);
    logger::setSink([&seen](LogLevel level, const std::string &msg) { seen.emplace_back(level, msg); });

    logger::debug("d");
    logger::info("i");
    logger::warn("w");
    logger::error("e");
    logger::critical("c");
    logger::setSink(LogSink());

    ASSERT_EQ(seen.size(), 5u);
    EXPECT_EQ(seen[0].first, LogLevel::DEBUG);
    EXPECT_EQ(seen[2].first, LogLevel::WARN);
    EXPECT_EQ(seen[2].second, "w");
    EXPECT_EQ(seen[4].first, LogLevel::CRITICAL);
}

TEST(LoggerTest, RemovedSinkReceivesNothing) {
    int calls = 0;
    logger::setSink([&calls](LogLevel, const std::string &) { ++calls; });
    logger::setSink(LogSink());
    logger::warn("after removal");
    EXPECT_EQ(calls, 0);
}

TEST(LoggerTest, SinkMayLogWithoutDeadlock) {
    std::vector<std::string> seen;
    logger::setSink([&seen](LogLevel, const std::string &msg) {
        seen.push_back(msg);
        logger::warn("forwarded: " + msg);
    });

    logger::error("outer");
    logger::setSink(LogSink());

    // the sink's own message reaches the console but not the sink again
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], "outer");
}

TEST(LoggerTest, ThrowingSinkDoesNotReachCaller) {
    int calls = 0;
    logger::setSink([&calls](LogLevel, const std::string &) {
        ++calls;
        throw std::runtime_error("sink offline");
    });

    EXPECT_NO_THROW(logger::warn("first"));
    EXPECT_NO_THROW(logger::warn("second"));
    logger::setSink(LogSink());

    EXPECT_EQ(calls, 2);
}

TEST(LoggerTest, FileOutputHonoursLevel) {
    const std::string path = ::testing::TempDir() + "phiguard_logger_test.log";
    logger::enableFileOutput(path);
    logger::setLogLevel(LogLevel::ERROR);

    logger::warn("filtered out");
    logger::error("kept message");

    logger::disableFileOutput();
    logger::setLogLevel(LogLevel::OFF);

    std::ifstream in(path);
    ASSERT_TRUE(in.is_open());
    std::stringstream contents;
    contents << in.rdbuf();
    std::remove(path.c_str());

    EXPECT_NE(contents.str().find("[ERROR] kept message"), std::string::npos);
    EXPECT_EQ(contents.str().find("filtered out"), std::string::npos);
}

TEST(LoggerTest, LevelNames) {
    EXPECT_STREQ(logger::levelName(LogLevel::DEBUG), "DEBUG");
    EXPECT_STREQ(logger::levelName(LogLevel::WARN), "WARN");
    EXPECT_STREQ(logger::levelName(LogLevel::OFF), "OFF");
    EXPECT_EQ(logger::Logger::getInstance().getLogLevel(), LogLevel::OFF);
}

} // namespace
