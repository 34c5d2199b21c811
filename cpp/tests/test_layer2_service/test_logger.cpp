/**
 * @file test_logger.cpp
 * @brief Logger tests. Lifecycle-dependent logic runs in workers (workers/logger_workers.cpp).
 */
#include "rlh_service.hpp"
#include "shared_test_helpers.h"
#include "test_patterns.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace relayhub::tests::helper;
using relayhub::utils::Logger;
using ::testing::HasSubstr;

class LoggerTest : public relayhub::tests::IsolatedProcessTest
{
  protected:
    void SetUp() override
    {
        IsolatedProcessTest::SetUp();
        dir_ = make_temp_dir("logger");
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    std::string LogPath(const std::string &name) const { return (dir_ / (name + ".log")).string(); }

    fs::path dir_;
};

TEST_F(LoggerTest, BasicLogging)
{
    auto w = SpawnWorker("logger.basic_logging", {LogPath("basic")});
    ExpectWorkerOk(w);
}

TEST_F(LoggerTest, LevelFiltering)
{
    auto w = SpawnWorker("logger.level_filtering", {LogPath("filter")});
    ExpectWorkerOk(w);
}

TEST_F(LoggerTest, BadFormatStringIsLoggedAsFormatError)
{
    auto w = SpawnWorker("logger.bad_format_string", {LogPath("badfmt")});
    ExpectWorkerOk(w);
}

TEST_F(LoggerTest, ConcurrentThreadsLoseNoMessages)
{
    auto w = SpawnWorker("logger.multithread_logging", {LogPath("mt")});
    ExpectWorkerOk(w);
}

TEST_F(LoggerTest, UnopenableLogfileKeepsPreviousSink)
{
    auto w = SpawnWorker("logger.unopenable_logfile_keeps_previous_sink", {LogPath("keep")});
    ExpectWorkerOk(w, {}, /*allow_expected_logger_errors=*/true);
}

TEST_F(LoggerTest, SinkSwitching)
{
    auto w = SpawnWorker("logger.sink_switching", {LogPath("switch")});
    ExpectWorkerOk(w, {"back on the console"});
}

TEST_F(LoggerTest, WriteErrorCallbackReportsSinkFailure)
{
    auto w = SpawnWorker("logger.write_error_callback_reports_sink_failure", {LogPath("cb")});
    ExpectWorkerOk(w);
}

TEST_F(LoggerTest, QueueOverflowReportsDrops)
{
    auto w = SpawnWorker("logger.queue_overflow_reports_drops", {LogPath("overflow")});
    ExpectWorkerOk(w);
}

TEST_F(LoggerTest, ConfiguringBeforeLifecycleIsFatal)
{
    auto w = SpawnWorker("logger.configure_before_lifecycle_aborts");
    w.wait_for_exit();
    EXPECT_NE(w.exit_code(), 0);
    EXPECT_THAT(w.get_stderr(), HasSubstr("before the Logger module was initialized"));
    EXPECT_THAT(w.get_stderr(), ::testing::Not(HasSubstr("dropped silently")));
}

TEST(LoggerLevelTest, LevelFromStringIsCaseInsensitive)
{
    EXPECT_EQ(Logger::level_from_string("trace"), Logger::Level::L_TRACE);
    EXPECT_EQ(Logger::level_from_string("DEBUG"), Logger::Level::L_DEBUG);
    EXPECT_EQ(Logger::level_from_string("Info"), Logger::Level::L_INFO);
    EXPECT_EQ(Logger::level_from_string("warn"), Logger::Level::L_WARNING);
    EXPECT_EQ(Logger::level_from_string("warning"), Logger::Level::L_WARNING);
    EXPECT_EQ(Logger::level_from_string("error"), Logger::Level::L_ERROR);
    EXPECT_EQ(Logger::level_from_string("system"), Logger::Level::L_SYSTEM);
    EXPECT_FALSE(Logger::level_from_string("loud").has_value());
}
