/**
 * @file test_logger.cpp
 * @brief Layer 2 tests for the asynchronous Logger.
 *
 * The logger is a process-wide singleton, so every test restores the console
 * sink and INFO level in TearDown. shutdown() is never called here: it is
 * one-way for the lifetime of the process.
 */
#include "gwb_service.hpp"
#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

namespace fs = std::filesystem;
using gwbridge::utils::Logger;

class LoggerTest : public ::testing::Test
{
  protected:
    std::vector<fs::path> paths_to_clean_;

    void TearDown() override
    {
        Logger::instance().set_console();
        Logger::instance().set_level(Logger::Level::L_INFO);
        Logger::instance().flush();
        for (const auto &p : paths_to_clean_)
        {
            std::error_code ec;
            fs::remove(p, ec);
        }
    }

    fs::path GetUniqueLogPath(const std::string &test_name)
    {
        auto p = fs::temp_directory_path() /
                 ("gwbridge_test_" + test_name + "_" + std::to_string(::getpid()) + ".log");
        paths_to_clean_.push_back(p);
        std::error_code ec;
        fs::remove(p, ec);
        return p;
    }

    static std::string ReadFile(const fs::path &p)
    {
        std::ifstream in(p);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }
};

TEST_F(LoggerTest, FileSinkReceivesMessages)
{
    const auto path = GetUniqueLogPath("file_sink");
    auto &logger = Logger::instance();
    logger.set_logfile(path.string());
    LOGGER_INFO("Relay: connected to {}", "ipc:///tmp/gateway.plugin.mqtt");
    LOGGER_WARN("Dispatcher: {} for unknown adapter '{}'", "setProperty", "a9");
    logger.flush();

    const std::string contents = ReadFile(path);
    EXPECT_NE(contents.find("Relay: connected to ipc:///tmp/gateway.plugin.mqtt"), std::string::npos);
    EXPECT_NE(contents.find("[WARN"), std::string::npos);
    EXPECT_NE(contents.find("unknown adapter 'a9'"), std::string::npos);
}

TEST_F(LoggerTest, LevelFilteringDropsLowerLevels)
{
    const auto path = GetUniqueLogPath("level_filter");
    auto &logger = Logger::instance();
    logger.set_logfile(path.string());
    logger.set_level(Logger::Level::L_WARNING);
    EXPECT_EQ(logger.level(), Logger::Level::L_WARNING);

    LOGGER_DEBUG("should-not-appear-debug");
    LOGGER_INFO("should-not-appear-info");
    LOGGER_ERROR("should-appear-error");
    logger.flush();

    const std::string contents = ReadFile(path);
    EXPECT_EQ(contents.find("should-not-appear"), std::string::npos);
    EXPECT_NE(contents.find("should-appear-error"), std::string::npos);
}

TEST_F(LoggerTest, FlushWaitsForEveryQueuedMessage)
{
    const auto path = GetUniqueLogPath("flush");
    auto &logger = Logger::instance();
    logger.set_logfile(path.string());

    constexpr int kThreads = 4;
    constexpr int kPerThread = 250;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t)
    {
        threads.emplace_back([t] {
            for (int i = 0; i < kPerThread; ++i)
                LOGGER_INFO("stress t={} i={}", t, i);
        });
    }
    for (auto &th : threads)
        th.join();
    logger.flush();

    const std::string contents = ReadFile(path);
    size_t lines = 0;
    for (size_t pos = contents.find("stress t="); pos != std::string::npos;
         pos = contents.find("stress t=", pos + 1))
        ++lines;
    EXPECT_EQ(lines, static_cast<size_t>(kThreads * kPerThread));
}

TEST_F(LoggerTest, UnopenableFileReportsThroughErrorCallback)
{
    std::atomic<bool> called{false};
    std::string message;
    std::mutex mu;
    auto &logger = Logger::instance();
    logger.set_write_error_callback([&](const std::string &msg) {
        std::lock_guard<std::mutex> lock(mu);
        message = msg;
        called = true;
    });
    logger.set_logfile("/nonexistent-dir-gwbridge/x.log");
    logger.flush();

    const bool got = [&] {
        for (int i = 0; i < 200 && !called.load(); ++i)
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        return called.load();
    }();
    EXPECT_TRUE(got);
    {
        std::lock_guard<std::mutex> lock(mu);
        EXPECT_NE(message.find("cannot open log file"), std::string::npos);
    }
    logger.set_write_error_callback(nullptr);
    logger.flush();
}

TEST(LoggerLevelTest, ParseLevelNames)
{
    EXPECT_EQ(Logger::parse_level("trace"), Logger::Level::L_TRACE);
    EXPECT_EQ(Logger::parse_level("debug"), Logger::Level::L_DEBUG);
    EXPECT_EQ(Logger::parse_level("info"), Logger::Level::L_INFO);
    EXPECT_EQ(Logger::parse_level("warn"), Logger::Level::L_WARNING);
    EXPECT_EQ(Logger::parse_level("warning"), Logger::Level::L_WARNING);
    EXPECT_EQ(Logger::parse_level("error"), Logger::Level::L_ERROR);
    EXPECT_EQ(Logger::parse_level("system"), Logger::Level::L_SYSTEM);
    EXPECT_FALSE(Logger::parse_level("verbose").has_value());
    EXPECT_STREQ(Logger::level_name(Logger::Level::L_ERROR), "ERROR");
}
