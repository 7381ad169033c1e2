#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <tabshell/logger.hpp>
#include <vector>

using namespace tabshell;

class LoggerTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        entries_ = std::make_shared<std::vector<Logger::LogEntry>>();
        Logger::instance().clear_sinks();
        Logger::instance().add_sink(sinks::memory_sink(entries_));
        saved_level_ = Logger::instance().get_level();
        Logger::instance().set_level(LogLevel::Trace);
    }

    void TearDown() override
    {
        Logger::instance().clear_sinks();
        Logger::instance().set_level(saved_level_);
    }

    std::shared_ptr<std::vector<Logger::LogEntry>> entries_;
    LogLevel                                       saved_level_ = LogLevel::Info;
};

TEST_F(LoggerTest, MacroFormatsPlaceholders)
{
    TABSHELL_LOG_INFO("tab_manager", "view {} moved to window {} ({})", 3, 7, "drag");
    ASSERT_EQ(entries_->size(), 1u);
    EXPECT_EQ(entries_->at(0).message, "view 3 moved to window 7 (drag)");
    EXPECT_EQ(entries_->at(0).category, "tab_manager");
    EXPECT_EQ(entries_->at(0).level, LogLevel::Info);
}

TEST_F(LoggerTest, StringAndBoolArguments)
{
    std::string loc = "https://a.test";
    TABSHELL_LOG_DEBUG("lifecycle", "{} loading={}", loc, true);
    ASSERT_EQ(entries_->size(), 1u);
    EXPECT_EQ(entries_->at(0).message, "https://a.test loading=true");
}

TEST_F(LoggerTest, ExtraPlaceholdersStayLiteral)
{
    TABSHELL_LOG_WARN("drag", "{} and {}", 1);
    ASSERT_EQ(entries_->size(), 1u);
    EXPECT_EQ(entries_->at(0).message, "1 and {}");
}

TEST_F(LoggerTest, LevelFilterDropsBelowMinimum)
{
    Logger::instance().set_level(LogLevel::Warning);
    TABSHELL_LOG_DEBUG("events", "hidden");
    TABSHELL_LOG_INFO("events", "hidden");
    TABSHELL_LOG_ERROR("events", "shown");
    ASSERT_EQ(entries_->size(), 1u);
    EXPECT_EQ(entries_->at(0).level, LogLevel::Error);
}

TEST_F(LoggerTest, OffSilencesEverything)
{
    Logger::instance().set_level(LogLevel::Off);
    TABSHELL_LOG_CRITICAL("config", "nothing");
    EXPECT_TRUE(entries_->empty());
}

TEST_F(LoggerTest, EveryMacroLevel)
{
    TABSHELL_LOG_TRACE("c", "t");
    TABSHELL_LOG_DEBUG("c", "d");
    TABSHELL_LOG_INFO("c", "i");
    TABSHELL_LOG_WARN("c", "w");
    TABSHELL_LOG_ERROR("c", "e");
    TABSHELL_LOG_CRITICAL("c", "x");
    ASSERT_EQ(entries_->size(), 6u);
    EXPECT_EQ(entries_->front().level, LogLevel::Trace);
    EXPECT_EQ(entries_->back().level, LogLevel::Critical);
}

TEST(LoggerLevels, RoundTripNames)
{
    for (LogLevel l : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info, LogLevel::Warning,
                       LogLevel::Error, LogLevel::Critical, LogLevel::Off})
    {
        EXPECT_EQ(Logger::level_from_string(Logger::level_to_string(l), LogLevel::Info), l);
    }
}

TEST(LoggerLevels, FromStringIsCaseInsensitive)
{
    EXPECT_EQ(Logger::level_from_string("DeBuG", LogLevel::Info), LogLevel::Debug);
    EXPECT_EQ(Logger::level_from_string("warning", LogLevel::Info), LogLevel::Warning);
    EXPECT_EQ(Logger::level_from_string("bogus", LogLevel::Error), LogLevel::Error);
}

TEST(LoggerLevels, TimestampHasMilliseconds)
{
    std::string ts = Logger::timestamp_to_string(std::chrono::system_clock::now());
    // "YYYY-MM-DD HH:MM:SS.mmm"
    EXPECT_EQ(ts.size(), 23u);
    EXPECT_EQ(ts[19], '.');
}

TEST(LoggerSinks, MemorySinkKeepsItsVectorAlive)
{
    auto entries = std::make_shared<std::vector<Logger::LogEntry>>();
    std::weak_ptr<std::vector<Logger::LogEntry>> watch = entries;
    Logger::LogSink sink = sinks::memory_sink(entries);
    entries.reset();

    ASSERT_FALSE(watch.expired());
    sink(Logger::LogEntry{std::chrono::system_clock::now(), LogLevel::Info, "test", "kept"});
    EXPECT_EQ(watch.lock()->size(), 1u);

    sink = nullptr;
    EXPECT_TRUE(watch.expired());
}
