#include "Logging.hh"

#include <gtest/gtest.h>

#include <iostream>
#include <optional>
#include <sstream>
#include <string>

namespace {
using namespace std::string_view_literals;
constexpr auto MESSAGE = "This is logging"sv;
}

class LoggingTest : public testing::Test {
protected:
    virtual void SetUp()
    {
        setupLogging(Landlord::LogLevel::WARNING, stream);
    }

    virtual void TearDown()
    {
        setupLogging(Landlord::LogLevel::NONE, std::cerr);
    }

    std::ostringstream stream;
};

TEST_F(LoggingTest, testLoggingWithTriggeringLevel)
{
    setupLogging(Landlord::LogLevel::INFO, stream);
    log(Landlord::LogLevel::INFO, "format %s format"sv, MESSAGE);
    EXPECT_NE(std::string::npos, stream.str().find("format This is logging format"));
}

TEST_F(LoggingTest, testLoggingBelowLevel)
{
    log(Landlord::LogLevel::DEBUG, "%s"sv, MESSAGE);
    EXPECT_TRUE(stream.str().empty());
}

TEST_F(LoggingTest, testLoggingWithLevelNone)
{
    setupLogging(Landlord::LogLevel::NONE, stream);
    log(Landlord::LogLevel::FATAL, "%s"sv, MESSAGE);
    EXPECT_TRUE(stream.str().empty());
}

TEST_F(LoggingTest, testLoggingWithMissingFormatSpecifier)
{
    log(Landlord::LogLevel::WARNING, ""sv, MESSAGE);
    EXPECT_EQ(std::string::npos, stream.str().find(MESSAGE));
}

TEST_F(LoggingTest, testLoggingWithInvalidFormatSpecifier)
{
    log(Landlord::LogLevel::WARNING, "%"sv, MESSAGE);
    EXPECT_EQ(std::string::npos, stream.str().find(MESSAGE));
}

TEST_F(LoggingTest, testLoggingOptional)
{
    log(Landlord::LogLevel::WARNING, "%d %d"sv,
        std::optional<int> {3}, std::optional<int> {});
    EXPECT_NE(std::string::npos, stream.str().find("3 (none)"));
}

TEST_F(LoggingTest, testVerbosity)
{
    EXPECT_EQ(Landlord::LogLevel::WARNING, Landlord::getLogLevel(0));
    EXPECT_EQ(Landlord::LogLevel::INFO, Landlord::getLogLevel(1));
    EXPECT_EQ(Landlord::LogLevel::DEBUG, Landlord::getLogLevel(2));
}

TEST_F(LoggingTest, testParseLogLevel)
{
    EXPECT_EQ(Landlord::LogLevel::ERROR, Landlord::parseLogLevel("error"));
    EXPECT_EQ(Landlord::LogLevel::DEBUG, Landlord::parseLogLevel("debug"));
    EXPECT_FALSE(Landlord::parseLogLevel("verbose"));
}
