#include "core/logging.hpp"

#include <gtest/gtest.h>

#include <filesystem>

namespace dicom_extractor::logging::test {

class LoggingTest : public ::testing::Test {
protected:
    void TearDown() override
    {
        LoggerFactory::configure(LogConfig{});
    }
};

TEST_F(LoggingTest, LevelNamesRoundTrip)
{
    for (auto level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info,
                       LogLevel::Warning, LogLevel::Error, LogLevel::Critical,
                       LogLevel::Off}) {
        auto parsed = logLevelFromString(toString(level));
        ASSERT_TRUE(parsed.has_value()) << toString(level);
        EXPECT_EQ(*parsed, level);
    }
}

TEST_F(LoggingTest, WarnIsAcceptedAsWarning)
{
    EXPECT_EQ(logLevelFromString("warn"), LogLevel::Warning);
}

TEST_F(LoggingTest, UnknownLevelIsRejected)
{
    EXPECT_FALSE(logLevelFromString("verbose").has_value());
    EXPECT_FALSE(logLevelFromString("INFO").has_value());
    EXPECT_FALSE(logLevelFromString("").has_value());
}

TEST_F(LoggingTest, CreateReturnsRegisteredLogger)
{
    auto first = LoggerFactory::create("LoggingTestLogger");
    auto second = LoggerFactory::create("LoggingTestLogger");
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first.get(), second.get());
    EXPECT_EQ(first->name(), "LoggingTestLogger");
}

TEST_F(LoggingTest, ConfigureAppliesLevelToNewLoggers)
{
    LogConfig config;
    config.level = LogLevel::Error;
    LoggerFactory::configure(config);

    auto logger = LoggerFactory::create("LoggingTestErrorLevel");
    EXPECT_EQ(logger->level(), spdlog::level::err);
    EXPECT_EQ(LoggerFactory::getGlobalLevel(), LogLevel::Error);
}

TEST_F(LoggingTest, SetGlobalLevelUpdatesExistingLoggers)
{
    auto logger = LoggerFactory::create("LoggingTestGlobal");
    LoggerFactory::setGlobalLevel(LogLevel::Debug);
    EXPECT_EQ(logger->level(), spdlog::level::debug);
    EXPECT_EQ(LoggerFactory::getGlobalLevel(), LogLevel::Debug);
}

TEST_F(LoggingTest, FileLoggingWritesIntoDirectory)
{
    auto dir = std::filesystem::temp_directory_path() / "dicom_extractor_logging_test";
    std::filesystem::remove_all(dir);

    LogConfig config;
    config.enableFileLogging = true;
    config.logDirectory = dir;
    LoggerFactory::configure(config);

    auto logger = LoggerFactory::create("FileLogged");
    logger->info("hello");
    logger->flush();

    EXPECT_TRUE(std::filesystem::exists(dir / "FileLogged.log"));

    LoggerFactory::configure(LogConfig{});
    std::filesystem::remove_all(dir);
}

}  // namespace dicom_extractor::logging::test
