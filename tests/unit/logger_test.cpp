/**
 * logger_test.cpp - Logger level filtering and formatting
 */

#include "logging/logger.hpp"

#include <gtest/gtest.h>

#include <sstream>

using namespace agentlink::logging;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved_level_ = Logger::level();
        Logger::set_sink(&captured_);
    }

    void TearDown() override {
        Logger::set_sink(nullptr);
        Logger::set_level(saved_level_);
    }

    std::ostringstream captured_;
    Level saved_level_ = Level::LVL_INFO;
};

TEST_F(LoggerTest, MessagesBelowThresholdAreDropped) {
    Logger::set_level(Level::LVL_WARN);

    LOG_INFO("[Test] hidden");
    LOG_WARN("[Test] shown " << 42);

    std::string out = captured_.str();
    EXPECT_EQ(out.find("hidden"), std::string::npos);
    EXPECT_NE(out.find("[WARN] [Test] shown 42"), std::string::npos);
}

TEST_F(LoggerTest, DebugEnabledAtDebugLevel) {
    Logger::set_level(Level::LVL_DEBUG);

    LOG_DEBUG("[Test] detail");
    EXPECT_NE(captured_.str().find("[DEBUG] [Test] detail"), std::string::npos);
}

TEST_F(LoggerTest, NoneSilencesEverything) {
    Logger::set_level(Level::LVL_NONE);

    LOG_ERROR("[Test] boom");
    EXPECT_TRUE(captured_.str().empty());
}

TEST_F(LoggerTest, LineFormat) {
    Logger::set_level(Level::LVL_INFO);

    LOG_INFO("hello");
    std::string out = captured_.str();

    // [YYYY-MM-DD HH:MM:SS.mmm] [INFO] hello
    ASSERT_GE(out.size(), 26u);
    EXPECT_EQ(out[0], '[');
    EXPECT_EQ(out[24], ']');
    EXPECT_EQ(out.substr(25), " [INFO] hello\n");
}

TEST(LoggerLevelTest, StringToLevel) {
    EXPECT_EQ(string_to_level("debug"), Level::LVL_DEBUG);
    EXPECT_EQ(string_to_level("INFO"), Level::LVL_INFO);
    EXPECT_EQ(string_to_level("Warning"), Level::LVL_WARN);
    EXPECT_EQ(string_to_level("error"), Level::LVL_ERROR);
    EXPECT_EQ(string_to_level("off"), Level::LVL_NONE);
    EXPECT_EQ(string_to_level("chatty"), Level::LVL_INFO);
}

TEST(LoggerLevelTest, LevelToString) {
    EXPECT_STREQ(level_to_string(Level::LVL_DEBUG), "DEBUG");
    EXPECT_STREQ(level_to_string(Level::LVL_WARN), "WARN");
    EXPECT_STREQ(level_to_string(Level::LVL_NONE), "NONE");
}
