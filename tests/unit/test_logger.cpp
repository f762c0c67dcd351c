#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <kinema/logger.hpp>
#include <memory>
#include <string>
#include <vector>

using namespace kinema;

namespace
{

// Routes the global logger into a buffer for the duration of a test.
class LoggerTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        previous_ = Logger::instance().get_level();
        Logger::instance().clear_sinks();
        Logger::instance().add_sink(sinks::capture_sink(entries));
        Logger::instance().set_level(LogLevel::Trace);
    }

    void TearDown() override
    {
        Logger::instance().clear_sinks();
        Logger::instance().set_level(previous_);
    }

    std::shared_ptr<std::vector<Logger::LogEntry>> entries =
        std::make_shared<std::vector<Logger::LogEntry>>();

   private:
    LogLevel previous_ = LogLevel::Info;
};

enum class Sample
{
    A = 7
};

}   // anonymous namespace

TEST_F(LoggerTest, FormatsArguments)
{
    KINEMA_LOG_INFO("kinema.test", "clip {} at {} ({}), ok={}", std::string("v1"), 42, 0.5, true);

    ASSERT_EQ(entries->size(), 1u);
    const auto& e = entries->front();
    EXPECT_EQ(e.level, LogLevel::Info);
    EXPECT_EQ(e.category, "kinema.test");
    EXPECT_EQ(e.message, "clip v1 at 42 (0.5), ok=true");
}

TEST_F(LoggerTest, ExtraPlaceholdersStay)
{
    KINEMA_LOG_DEBUG("kinema.test", "{} and {}", "one");
    ASSERT_EQ(entries->size(), 1u);
    EXPECT_EQ(entries->front().message, "one and {}");
}

TEST_F(LoggerTest, EnumsPrintUnderlyingValue)
{
    KINEMA_LOG_TRACE("kinema.test", "value {}", Sample::A);
    ASSERT_EQ(entries->size(), 1u);
    EXPECT_EQ(entries->front().message, "value 7");
}

TEST_F(LoggerTest, LevelFiltersEntries)
{
    Logger::instance().set_level(LogLevel::Warning);
    KINEMA_LOG_INFO("kinema.test", "dropped");
    KINEMA_LOG_WARN("kinema.test", "kept");
    KINEMA_LOG_ERROR("kinema.test", "kept too");

    ASSERT_EQ(entries->size(), 2u);
    EXPECT_EQ((*entries)[0].level, LogLevel::Warning);
    EXPECT_EQ((*entries)[1].level, LogLevel::Error);
    EXPECT_FALSE(Logger::instance().is_enabled(LogLevel::Debug));
    EXPECT_TRUE(Logger::instance().is_enabled(LogLevel::Critical));
}

TEST_F(LoggerTest, NullSinkSwallowsOutput)
{
    Logger::instance().add_sink(sinks::null_sink());
    KINEMA_LOG_CRITICAL("kinema.test", "still captured");
    EXPECT_EQ(entries->size(), 1u);
}

TEST_F(LoggerTest, FileSinkAppendsFormattedLines)
{
    auto path = std::filesystem::temp_directory_path() / "kinema_test_logger.log";
    std::filesystem::remove(path);

    Logger::instance().add_sink(sinks::file_sink(path.string()));
    KINEMA_LOG_WARN("kinema.test", "clip {} busy", "v1");
    KINEMA_LOG_INFO("kinema.test", "second");

    std::ifstream in(path);
    std::string   first;
    std::string   second;
    ASSERT_TRUE(static_cast<bool>(std::getline(in, first)));
    ASSERT_TRUE(static_cast<bool>(std::getline(in, second)));
    EXPECT_EQ(first.substr(23), " WARN [kinema.test] clip v1 busy");
    EXPECT_EQ(second.substr(23), " INFO [kinema.test] second");

    Logger::instance().clear_sinks();
    std::filesystem::remove(path);
}

TEST_F(LoggerTest, FileSinkWithBadPathDropsEntries)
{
    Logger::instance().add_sink(sinks::file_sink("/nonexistent_dir/kinema/test.log"));
    KINEMA_LOG_ERROR("kinema.test", "nowhere to go");
    EXPECT_EQ(entries->size(), 1u);
}

TEST(LoggerLevels, NamesRoundTrip)
{
    for (LogLevel level : {LogLevel::Trace,
                           LogLevel::Debug,
                           LogLevel::Info,
                           LogLevel::Warning,
                           LogLevel::Error,
                           LogLevel::Critical})
    {
        EXPECT_EQ(Logger::level_from_string(Logger::level_to_string(level)), level);
    }
    EXPECT_EQ(Logger::level_from_string("Warning"), LogLevel::Warning);
    EXPECT_FALSE(Logger::level_from_string("verbose").has_value());
}

TEST(LoggerLevels, TimestampFormat)
{
    std::string ts = Logger::timestamp_to_string(std::chrono::system_clock::now());
    // YYYY-MM-DD HH:MM:SS.mmm
    ASSERT_EQ(ts.size(), 23u);
    EXPECT_EQ(ts[4], '-');
    EXPECT_EQ(ts[10], ' ');
    EXPECT_EQ(ts[13], ':');
    EXPECT_EQ(ts[19], '.');
}
