#include <gtest/gtest.h>
#include "seedkeeper/core/logger.hpp"
#include <filesystem>
#include <fstream>

using namespace seedkeeper::core;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_file = "test_seedkeeper.log";
    }
    
    void TearDown() override {
        Logger::shutdown();
        if (std::filesystem::exists(log_file)) {
            std::filesystem::remove(log_file);
        }
    }
    
    std::string read_log() {
        Logger::get()->flush();
        std::ifstream file(log_file);
        return std::string((std::istreambuf_iterator<char>(file)),
                           std::istreambuf_iterator<char>());
    }
    
    std::string log_file;
};

TEST_F(LoggerTest, Initialize) {
    Logger::initialize(log_file, LogLevel::Debug);
    
    EXPECT_NE(Logger::get(), nullptr);
    EXPECT_TRUE(std::filesystem::exists(log_file));
}

TEST_F(LoggerTest, LogMessages) {
    Logger::initialize(log_file, LogLevel::Debug);
    
    LOG_DEBUG("Debug message: {}", 123);
    LOG_INFO("Info message: {}", "test");
    LOG_WARN("Warning message");
    LOG_ERROR("Error message");
    LOG_CRITICAL("Critical message");
    
    auto content = read_log();
    EXPECT_NE(content.find("Debug message: 123"), std::string::npos);
    EXPECT_NE(content.find("Info message: test"), std::string::npos);
    EXPECT_NE(content.find("Warning message"), std::string::npos);
    EXPECT_NE(content.find("Error message"), std::string::npos);
    EXPECT_NE(content.find("Critical message"), std::string::npos);
}

TEST_F(LoggerTest, LogLevel) {
    Logger::initialize(log_file, LogLevel::Warn);
    
    LOG_DEBUG("Debug message");
    LOG_INFO("Info message");
    LOG_WARN("Warning message");
    
    auto content = read_log();
    EXPECT_EQ(content.find("Debug message"), std::string::npos);
    EXPECT_EQ(content.find("Info message"), std::string::npos);
    EXPECT_NE(content.find("Warning message"), std::string::npos);
}

TEST_F(LoggerTest, RecentLinesKeptInMemory) {
    Logger::initialize(log_file, LogLevel::Info);
    
    LOG_INFO("first line");
    LOG_INFO("second line");
    LOG_DEBUG("filtered line");
    
    auto recent = Logger::recent(2);
    ASSERT_EQ(recent.size(), 2);
    EXPECT_NE(recent[0].find("first line"), std::string::npos);
    EXPECT_NE(recent[1].find("second line"), std::string::npos);
}

TEST_F(LoggerTest, RecentEmptyBeforeInitialize) {
    EXPECT_TRUE(Logger::recent(10).empty());
}

TEST_F(LoggerTest, LoggingAfterShutdownIsSafe) {
    Logger::initialize(log_file, LogLevel::Info);
    LOG_INFO("before shutdown");
    Logger::shutdown();
    
    ASSERT_NE(Logger::get(), nullptr);
    LOG_WARN("after shutdown {}", 1);
    LOG_ERROR("still logging");
    
    EXPECT_TRUE(Logger::recent(10).empty());
    
    Logger::shutdown();
    ASSERT_NE(Logger::get(), nullptr);
    LOG_INFO("after second shutdown");
}

TEST_F(LoggerTest, ReinitializeAfterShutdown) {
    Logger::initialize(log_file, LogLevel::Info);
    Logger::shutdown();
    Logger::initialize(log_file, LogLevel::Info);
    
    LOG_INFO("second session");
    
    auto recent = Logger::recent(1);
    ASSERT_EQ(recent.size(), 1u);
    EXPECT_NE(recent[0].find("second session"), std::string::npos);
}

TEST_F(LoggerTest, ParseLevel) {
    EXPECT_EQ(Logger::parse_level("debug"), LogLevel::Debug);
    EXPECT_EQ(Logger::parse_level(" WARNING "), LogLevel::Warn);
    EXPECT_EQ(Logger::parse_level("off"), LogLevel::Off);
    EXPECT_FALSE(Logger::parse_level("verbose").has_value());
}
