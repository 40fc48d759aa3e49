/**
 * @file test_Logger.cpp
 * @brief Unit tests for the FE logger, its level filter and ScopedTimer
 */

#include <gtest/gtest.h>

#include "FE/Core/Logger.h"

#include <string>
#include <vector>

using mgfem::FE::LogLevel;
using mgfem::FE::LogMessage;
using mgfem::FE::Logger;
using mgfem::FE::ScopedTimer;
using mgfem::FE::parse_log_level;

namespace {

// Records every message and silences the console while alive
class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        previous_level_ = Logger::instance().get_level();
        Logger::instance().set_console_output(false);
        id_ = Logger::instance().add_handler([this](const LogMessage& msg) {
            records_.push_back(msg);
        });
    }

    void TearDown() override {
        Logger::instance().remove_handler(id_);
        Logger::instance().set_level(previous_level_);
        Logger::instance().set_console_output(true);
    }

    std::vector<LogMessage> records_;
    std::size_t id_ = 0;
    LogLevel previous_level_ = LogLevel::INFO;
};

} // namespace

TEST(LogLevelParsing, AcceptsNamesInAnyCase) {
    LogLevel level = LogLevel::OFF;
    EXPECT_TRUE(parse_log_level("debug", level));
    EXPECT_EQ(level, LogLevel::DEBUG);
    EXPECT_TRUE(parse_log_level("Warn", level));
    EXPECT_EQ(level, LogLevel::WARNING);
    EXPECT_TRUE(parse_log_level("CRITICAL", level));
    EXPECT_EQ(level, LogLevel::CRITICAL);
    EXPECT_TRUE(parse_log_level("off", level));
    EXPECT_EQ(level, LogLevel::OFF);

    EXPECT_FALSE(parse_log_level("verbose", level));
    EXPECT_EQ(level, LogLevel::OFF);
}

TEST_F(LoggerTest, LevelFiltersRecords) {
    Logger::instance().set_level(LogLevel::WARNING);
    FE_LOG_INFO("dropped");
    FE_LOG_WARNING("kept");

    ASSERT_EQ(records_.size(), 1u);
    EXPECT_EQ(records_[0].level, LogLevel::WARNING);
    EXPECT_EQ(records_[0].message, "kept");
    EXPECT_FALSE(records_[0].file.empty());
    EXPECT_GT(records_[0].line, 0);
}

TEST_F(LoggerTest, RemovedHandlerSeesNothing) {
    Logger::instance().set_level(LogLevel::INFO);
    Logger::instance().remove_handler(id_);
    FE_LOG_INFO("after removal");
    EXPECT_TRUE(records_.empty());
}

TEST_F(LoggerTest, OffSilencesEverything) {
    Logger::instance().set_level(LogLevel::OFF);
    FE_LOG_WARNING("nobody hears this");
    Logger::instance().log(LogLevel::CRITICAL, "nor this");
    EXPECT_TRUE(records_.empty());
}

TEST_F(LoggerTest, ScopedTimerLogsEntryAndExit) {
    Logger::instance().set_level(LogLevel::INFO);
    {
        ScopedTimer timer("assembly", LogLevel::INFO);
        ASSERT_EQ(records_.size(), 1u);
        EXPECT_EQ(records_[0].message, "Starting: assembly");
    }
    ASSERT_EQ(records_.size(), 2u);
    EXPECT_EQ(records_[1].message.rfind("Completed: assembly (elapsed: ", 0), 0u);

    // Below the threshold the timer is silent
    {
        FE_TIMED_SCOPE_LEVEL("quiet", LogLevel::DEBUG);
    }
    EXPECT_EQ(records_.size(), 2u);
}
