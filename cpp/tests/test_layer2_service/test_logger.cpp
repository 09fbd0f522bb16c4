/**
 * @file test_logger.cpp
 * @brief Logger tests: file sink, level filtering, flush semantics and concurrency.
 *
 * The Logger module is started once by the test entry point; each test swaps in a
 * private log file and restores the console sink and level afterwards.
 */
#include "pll_service.hpp"
#include "shared_test_helpers.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <fstream>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace plushlink::utils;
using namespace plushlink::tests::helper;
using namespace ::testing;

class LoggerTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        saved_level_ = Logger::instance().level();
        log_path_ = files_.add(unique_temp_path("logger", ".log"));
        ASSERT_TRUE(Logger::instance().set_logfile(log_path_.string()));
    }

    void TearDown() override
    {
        Logger::instance().flush();
        EXPECT_TRUE(Logger::instance().set_console());
        Logger::instance().set_level(saved_level_);
    }

    std::string contents()
    {
        Logger::instance().flush();
        std::string out;
        EXPECT_TRUE(read_file_contents(log_path_, out));
        return out;
    }

    TempFileGuard files_;
    fs::path log_path_;
    Logger::Level saved_level_{Logger::Level::L_INFO};
};

TEST_F(LoggerTest, WritesFormattedLinesToFile)
{
    Logger::instance().set_level(Logger::Level::L_TRACE);
    LOGGER_INFO("upload to slot {} committed", 2);
    LOGGER_WARN("device reported {} slots", 4);

    const std::string text = contents();
    EXPECT_THAT(text, HasSubstr("upload to slot 2 committed"));
    EXPECT_THAT(text, HasSubstr("device reported 4 slots"));
    EXPECT_THAT(text, HasSubstr("[PLL] [INFO  ]"));
    EXPECT_THAT(text, HasSubstr("[PLL] [WARN  ]"));
}

TEST_F(LoggerTest, LevelFilteringDropsLowerLevels)
{
    Logger::instance().set_level(Logger::Level::L_WARNING);
    LOGGER_DEBUG("debug-line-should-not-appear");
    LOGGER_INFO("info-line-should-not-appear");
    LOGGER_ERROR("error-line-should-appear");

    const std::string text = contents();
    EXPECT_THAT(text, Not(HasSubstr("debug-line-should-not-appear")));
    EXPECT_THAT(text, Not(HasSubstr("info-line-should-not-appear")));
    EXPECT_THAT(text, HasSubstr("error-line-should-appear"));
}

TEST_F(LoggerTest, FlushWaitsForQueuedMessages)
{
    Logger::instance().set_level(Logger::Level::L_INFO);
    constexpr int kMessages = 500;
    for (int i = 0; i < kMessages; ++i)
        LOGGER_INFO("queued message {}", i);
    const std::string text = contents();
    EXPECT_EQ(count_lines(text, "queued message"), static_cast<size_t>(kMessages));
}

TEST_F(LoggerTest, ConcurrentWritersDoNotInterleaveLines)
{
    Logger::instance().set_level(Logger::Level::L_INFO);
    constexpr int kThreads = 4;
    constexpr int kPerThread = 200;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t)
    {
        threads.emplace_back(
            [t]
            {
                for (int i = 0; i < kPerThread; ++i)
                    LOGGER_INFO("writer {} line {} end", t, i);
            });
    }
    for (auto &th : threads)
        th.join();

    const std::string text = contents();
    EXPECT_EQ(count_lines(text, "end"), static_cast<size_t>(kThreads * kPerThread));
    EXPECT_EQ(count_lines(text, "writer", "end"), 0u);
}

TEST(LoggerStaticTest, ParseLevelAcceptsKnownNames)
{
    EXPECT_EQ(Logger::parse_level("trace"), Logger::Level::L_TRACE);
    EXPECT_EQ(Logger::parse_level("debug"), Logger::Level::L_DEBUG);
    EXPECT_EQ(Logger::parse_level("info"), Logger::Level::L_INFO);
    EXPECT_EQ(Logger::parse_level("warn"), Logger::Level::L_WARNING);
    EXPECT_EQ(Logger::parse_level("warning"), Logger::Level::L_WARNING);
    EXPECT_EQ(Logger::parse_level("error"), Logger::Level::L_ERROR);
    EXPECT_EQ(Logger::parse_level("system"), Logger::Level::L_SYSTEM);
    EXPECT_FALSE(Logger::parse_level("verbose").has_value());
}

TEST(LoggerStaticTest, LogFileUnderARegularFileFails)
{
    TempFileGuard files;
    const fs::path blocker = files.add(unique_temp_path("not_a_dir"));
    {
        std::ofstream out(blocker);
        out << "x";
    }
    EXPECT_FALSE(Logger::instance().set_logfile((blocker / "x.log").string()));
    EXPECT_TRUE(Logger::instance().set_console());
}
