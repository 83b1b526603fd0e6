// QUORUMFEED - Logging Tests
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License

#include <gtest/gtest.h>

#include <quorumfeed/util/logging.h>

#include <memory>
#include <string>
#include <vector>

namespace quorumfeed {
namespace util {
namespace {

// ============================================================================
// Logging Tests
// ============================================================================

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::Instance().ClearSinks();
        Logger::Instance().EnableAllCategories();
        Logger::Instance().SetLevel(LogLevel::Trace);

        captured_.clear();
        sink_ = std::make_shared<CallbackSink>(
            [this](const LogEntry& entry) { captured_.push_back(entry); },
            LogLevel::Trace);
        Logger::Instance().AddSink(sink_);
    }

    void TearDown() override {
        Logger::Instance().ClearSinks();
        Logger::Instance().EnableAllCategories();
        Logger::Instance().SetLevel(LogLevel::Info);
    }

    std::shared_ptr<CallbackSink> sink_;
    std::vector<LogEntry> captured_;
};

TEST_F(LoggingTest, LogLevelToString) {
    EXPECT_STREQ(LogLevelToString(LogLevel::Trace), "TRACE");
    EXPECT_STREQ(LogLevelToString(LogLevel::Debug), "DEBUG");
    EXPECT_STREQ(LogLevelToString(LogLevel::Info), "INFO");
    EXPECT_STREQ(LogLevelToString(LogLevel::Warn), "WARN");
    EXPECT_STREQ(LogLevelToString(LogLevel::Error), "ERROR");
    EXPECT_STREQ(LogLevelToString(LogLevel::Fatal), "FATAL");
    EXPECT_STREQ(LogLevelToString(LogLevel::Off), "OFF");
}

TEST_F(LoggingTest, LogLevelFromString) {
    EXPECT_EQ(LogLevelFromString("trace"), LogLevel::Trace);
    EXPECT_EQ(LogLevelFromString("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(LogLevelFromString("Info"), LogLevel::Info);
    EXPECT_EQ(LogLevelFromString("warning"), LogLevel::Warn);
    EXPECT_EQ(LogLevelFromString("fatal"), LogLevel::Fatal);
    EXPECT_EQ(LogLevelFromString("invalid"), LogLevel::Info);
}

TEST_F(LoggingTest, LoggerSingleton) {
    EXPECT_EQ(&Logger::Instance(), &Logger::Instance());
}

TEST_F(LoggingTest, StreamMacroReachesSink) {
    LOG_INFO(LogCategory::FEED) << "answer " << 150 << " for round " << 1;

    ASSERT_EQ(captured_.size(), 1u);
    EXPECT_EQ(captured_[0].level, LogLevel::Info);
    EXPECT_EQ(captured_[0].category, LogCategory::FEED);
    EXPECT_EQ(captured_[0].message, "answer 150 for round 1");
    EXPECT_GT(captured_[0].line, 0);
}

TEST_F(LoggingTest, PrintfMacroReachesSink) {
    LogWarnF(LogCategory::FUNDS, "available %d allocated %d", 80, 20);

    ASSERT_EQ(captured_.size(), 1u);
    EXPECT_EQ(captured_[0].level, LogLevel::Warn);
    EXPECT_EQ(captured_[0].message, "available 80 allocated 20");
}

TEST_F(LoggingTest, LevelFiltering) {
    Logger::Instance().SetLevel(LogLevel::Warn);

    LOG_DEBUG(LogCategory::FEED) << "hidden";
    LOG_INFO(LogCategory::FEED) << "hidden";
    LOG_ERROR(LogCategory::FEED) << "shown";

    ASSERT_EQ(captured_.size(), 1u);
    EXPECT_EQ(captured_[0].message, "shown");
    EXPECT_FALSE(Logger::Instance().WillLog(LogLevel::Info, LogCategory::FEED));
    EXPECT_TRUE(Logger::Instance().WillLog(LogLevel::Error, LogCategory::FEED));
}

TEST_F(LoggingTest, OffSilencesEverything) {
    Logger::Instance().SetLevel(LogLevel::Off);
    LOG_FATAL(LogCategory::FEED) << "hidden";
    EXPECT_TRUE(captured_.empty());
}

TEST_F(LoggingTest, SinkLevelFiltersIndependently) {
    sink_->SetLevel(LogLevel::Error);
    LOG_WARN(LogCategory::FEED) << "below sink level";
    LOG_ERROR(LogCategory::FEED) << "at sink level";

    ASSERT_EQ(captured_.size(), 1u);
    EXPECT_EQ(captured_[0].message, "at sink level");
}

TEST_F(LoggingTest, EnableCategoryRestrictsOutput) {
    Logger::Instance().EnableCategory(LogCategory::QUORUM);

    EXPECT_TRUE(Logger::Instance().IsCategoryEnabled(LogCategory::QUORUM));
    EXPECT_FALSE(Logger::Instance().IsCategoryEnabled(LogCategory::FUNDS));

    LOG_INFO(LogCategory::FUNDS) << "hidden";
    LOG_INFO(LogCategory::QUORUM) << "shown";
    ASSERT_EQ(captured_.size(), 1u);
    EXPECT_EQ(captured_[0].category, LogCategory::QUORUM);
}

TEST_F(LoggingTest, DisableCategoryKeepsTheRest) {
    Logger::Instance().DisableCategory(LogCategory::CRYPTO);

    EXPECT_FALSE(Logger::Instance().IsCategoryEnabled(LogCategory::CRYPTO));
    EXPECT_TRUE(Logger::Instance().IsCategoryEnabled(LogCategory::FEED));
    EXPECT_TRUE(Logger::Instance().IsCategoryEnabled(LogCategory::VESTING));

    Logger::Instance().EnableAllCategories();
    EXPECT_TRUE(Logger::Instance().IsCategoryEnabled(LogCategory::CRYPTO));
}

TEST_F(LoggingTest, RemoveSink) {
    Logger::Instance().RemoveSink(sink_);
    LOG_ERROR(LogCategory::FEED) << "nobody listening";
    EXPECT_TRUE(captured_.empty());
}

TEST_F(LoggingTest, GetBasename) {
    EXPECT_EQ(GetBasename("/src/feed/aggregator.cpp"), "aggregator.cpp");
    EXPECT_EQ(GetBasename("C:\\src\\quorum.cpp"), "quorum.cpp");
    EXPECT_EQ(GetBasename("median.cpp"), "median.cpp");
}

TEST_F(LoggingTest, FormatLogTimestampHasMillis) {
    std::string ts = FormatLogTimestamp(std::chrono::system_clock::now());
    // YYYY-MM-DD HH:MM:SS.mmm
    ASSERT_EQ(ts.size(), 23u);
    EXPECT_EQ(ts[10], ' ');
    EXPECT_EQ(ts[19], '.');
}

} // namespace
} // namespace util
} // namespace quorumfeed
