/**
 * @file test_logger.cpp
 * @brief Unit tests for the logging framework
 */

#include <gtest/gtest.h>
#include <cozyd/utils/logger.hpp>

#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace cozyd::utils;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().setOutput(&out_);
        Logger::instance().setColorEnabled(false);
        Logger::instance().setLevel(LogLevel::TRACE);
    }

    void TearDown() override {
        Logger::instance().setOutput(&std::cerr);
        Logger::instance().setLevel(LogLevel::INFO);
    }

    std::ostringstream out_;
};

TEST_F(LoggerTest, SingletonInstance) {
    auto& instance1 = Logger::instance();
    auto& instance2 = Logger::instance();
    EXPECT_EQ(&instance1, &instance2);
}

TEST_F(LoggerTest, FormatsPlaceholders) {
    LOG_INFO("Session", "Connected to {}:{} in {} ms", "192.168.1.20", 5555, 12);

    std::string line = out_.str();
    EXPECT_NE(line.find("[INFO ]"), std::string::npos);
    EXPECT_NE(line.find("[Session]"), std::string::npos);
    EXPECT_NE(line.find("Connected to 192.168.1.20:5555 in 12 ms"), std::string::npos);
}

TEST_F(LoggerTest, MissingArgumentsLeavePlaceholders) {
    LOG_WARN("Test", "value={} other={}", 1);
    EXPECT_NE(out_.str().find("value=1 other={}"), std::string::npos);
}

TEST_F(LoggerTest, LogLevelFiltering) {
    Logger::instance().setLevel(LogLevel::WARN);

    LOG_TRACE("Test", "trace line");
    LOG_DEBUG("Test", "debug line");
    LOG_INFO("Test", "info line");
    EXPECT_TRUE(out_.str().empty());

    LOG_WARN("Test", "warn line");
    LOG_ERROR("Test", "error line");
    EXPECT_NE(out_.str().find("warn line"), std::string::npos);
    EXPECT_NE(out_.str().find("error line"), std::string::npos);
}

TEST_F(LoggerTest, OffDisablesEverything) {
    Logger::instance().setLevel(LogLevel::OFF);
    LOG_ERROR("Test", "should not appear");
    EXPECT_TRUE(out_.str().empty());
    EXPECT_FALSE(Logger::instance().isEnabled(LogLevel::ERROR));
}

TEST_F(LoggerTest, LogLevelNames) {
    EXPECT_EQ(Logger::levelName(LogLevel::TRACE), "TRACE");
    EXPECT_EQ(Logger::levelName(LogLevel::DEBUG), "DEBUG");
    EXPECT_EQ(Logger::levelName(LogLevel::INFO), "INFO");
    EXPECT_EQ(Logger::levelName(LogLevel::WARN), "WARN");
    EXPECT_EQ(Logger::levelName(LogLevel::ERROR), "ERROR");
    EXPECT_EQ(Logger::levelName(LogLevel::FATAL), "FATAL");
}

TEST_F(LoggerTest, LevelFromString) {
    LogLevel level = LogLevel::INFO;
    EXPECT_TRUE(Logger::levelFromString("DEBUG", level));
    EXPECT_EQ(level, LogLevel::DEBUG);
    EXPECT_TRUE(Logger::levelFromString("OFF", level));
    EXPECT_EQ(level, LogLevel::OFF);

    EXPECT_FALSE(Logger::levelFromString("VERBOSE", level));
    EXPECT_EQ(level, LogLevel::OFF);
}

TEST_F(LoggerTest, ThreadSafety) {
    std::vector<std::thread> threads;
    const int num_threads = 8;
    const int logs_per_thread = 50;

    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([i, logs_per_thread]() {
            for (int j = 0; j < logs_per_thread; ++j) {
                LOG_INFO("Worker", "thread {} message {}", i, j);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    std::istringstream lines(out_.str());
    std::string line;
    int count = 0;
    while (std::getline(lines, line)) {
        EXPECT_NE(line.find("[Worker]"), std::string::npos);
        ++count;
    }
    EXPECT_EQ(count, num_threads * logs_per_thread);
}
