/**
 * @file test_logger.cpp
 * @brief Unit tests for the Logger infrastructure
 * @author Pichuka Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Pichuka. All rights reserved.
 */

#include <gtest/gtest.h>
#include "Pichuka/Core/Logger.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>

using namespace Pichuka::Core;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        testLogPath_ = (std::filesystem::temp_directory_path() / "pichuka_test_logger.log").string();
        if (std::filesystem::exists(testLogPath_)) {
            std::filesystem::remove(testLogPath_);
        }
    }

    void TearDown() override {
        Logger::Instance().Shutdown();

        if (std::filesystem::exists(testLogPath_)) {
            std::filesystem::remove(testLogPath_);
        }
    }

    std::string ReadLog() const {
        std::ifstream logFile(testLogPath_);
        return std::string((std::istreambuf_iterator<char>(logFile)),
                           std::istreambuf_iterator<char>());
    }

    std::string testLogPath_;
};

TEST_F(LoggerTest, InitializeAndShutdown) {
    auto& logger = Logger::Instance();

    EXPECT_TRUE(logger.Initialize(LogLevel::Info, LogOutput::Console));
    EXPECT_TRUE(logger.IsLevelEnabled(LogLevel::Info));
    EXPECT_FALSE(logger.IsLevelEnabled(LogLevel::Debug));

    logger.Shutdown();
    EXPECT_FALSE(logger.IsLevelEnabled(LogLevel::Info));
}

TEST_F(LoggerTest, SecondInitializeFails) {
    auto& logger = Logger::Instance();

    EXPECT_TRUE(logger.Initialize(LogLevel::Info, LogOutput::Console));
    EXPECT_FALSE(logger.Initialize(LogLevel::Debug, LogOutput::Console));
    EXPECT_FALSE(logger.IsLevelEnabled(LogLevel::Debug));
}

TEST_F(LoggerTest, LogLevelFiltering) {
    auto& logger = Logger::Instance();

    logger.Initialize(LogLevel::Warning, LogOutput::Console);

    EXPECT_FALSE(logger.IsLevelEnabled(LogLevel::Trace));
    EXPECT_FALSE(logger.IsLevelEnabled(LogLevel::Debug));
    EXPECT_FALSE(logger.IsLevelEnabled(LogLevel::Info));
    EXPECT_TRUE(logger.IsLevelEnabled(LogLevel::Warning));
    EXPECT_TRUE(logger.IsLevelEnabled(LogLevel::Error));
    EXPECT_TRUE(logger.IsLevelEnabled(LogLevel::Critical));
    EXPECT_FALSE(logger.IsLevelEnabled(LogLevel::Off));
}

TEST_F(LoggerTest, FileOutput) {
    auto& logger = Logger::Instance();

    EXPECT_TRUE(logger.Initialize(LogLevel::Debug, LogOutput::File, testLogPath_));

    logger.Log(LogLevel::Info, "Test message 1");
    logger.Log(LogLevel::Error, "Test message 2");
    logger.Log(LogLevel::Trace, "Filtered message");
    logger.Shutdown();

    EXPECT_TRUE(std::filesystem::exists(testLogPath_));

    std::string content = ReadLog();
    EXPECT_NE(content.find("Test message 1"), std::string::npos);
    EXPECT_NE(content.find("Test message 2"), std::string::npos);
    EXPECT_NE(content.find("[info]"), std::string::npos);
    EXPECT_NE(content.find("[error]"), std::string::npos);
    EXPECT_EQ(content.find("Filtered message"), std::string::npos);
}

TEST_F(LoggerTest, MacrosRecordSourceLocation) {
    auto& logger = Logger::Instance();

    logger.Initialize(LogLevel::Debug, LogOutput::File, testLogPath_);

    PICHUKA_LOG_INFO("located");
    logger.Shutdown();

    EXPECT_NE(ReadLog().find("(test_logger.cpp:"), std::string::npos);
}

TEST_F(LoggerTest, FormattedLogging) {
    auto& logger = Logger::Instance();

    logger.Initialize(LogLevel::Debug, LogOutput::File, testLogPath_);

    logger.LogFormat(LogLevel::Info, "Test %s with number %d", "message", 42);
    logger.Shutdown();

    EXPECT_NE(ReadLog().find("Test message with number 42"), std::string::npos);
}

TEST_F(LoggerTest, FormattedMessagesRespectLevel) {
    auto& logger = Logger::Instance();

    logger.Initialize(LogLevel::Warning, LogOutput::File, testLogPath_);

    logger.LogFormat(LogLevel::Info, "Hidden %d", 1);
    PICHUKA_LOG_WARNING_F("Stored value %s rejected", "abc");
    logger.Shutdown();

    std::string content = ReadLog();
    EXPECT_EQ(content.find("Hidden 1"), std::string::npos);
    EXPECT_NE(content.find("Stored value abc rejected"), std::string::npos);
    EXPECT_NE(content.find("[warning]"), std::string::npos);
}

TEST_F(LoggerTest, LongFormattedMessageIsNotTruncated) {
    auto& logger = Logger::Instance();

    logger.Initialize(LogLevel::Info, LogOutput::File, testLogPath_);

    std::string path(700, 'p');
    logger.LogFormat(LogLevel::Error, "Cannot write %s!", path.c_str());
    logger.Shutdown();

    EXPECT_NE(ReadLog().find(path + "!"), std::string::npos);
}

TEST_F(LoggerTest, MessagesBeforeInitializeAreDiscarded) {
    auto& logger = Logger::Instance();

    EXPECT_FALSE(logger.IsLevelEnabled(LogLevel::Critical));
    logger.Log(LogLevel::Critical, "Nobody listening");

    EXPECT_TRUE(logger.Initialize(LogLevel::Info, LogOutput::File, testLogPath_));
    logger.Shutdown();

    EXPECT_EQ(ReadLog().find("Nobody listening"), std::string::npos);
}

TEST_F(LoggerTest, ParseLogLevelNames) {
    LogLevel level = LogLevel::Info;

    EXPECT_TRUE(ParseLogLevel("trace", level));
    EXPECT_EQ(level, LogLevel::Trace);
    EXPECT_TRUE(ParseLogLevel("warning", level));
    EXPECT_EQ(level, LogLevel::Warning);
    EXPECT_TRUE(ParseLogLevel("off", level));
    EXPECT_EQ(level, LogLevel::Off);

    EXPECT_FALSE(ParseLogLevel("WARN", level));
    EXPECT_EQ(level, LogLevel::Off);
}
