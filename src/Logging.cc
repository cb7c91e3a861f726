#include "Logging.hh"

#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <map>

namespace Landlord {

using namespace std::string_view_literals;

namespace {

auto globalLoggingStream = std::ref(std::cerr);
auto globalLoggingLevel = LogLevel::WARNING;

const std::map<std::string_view, LogLevel> LOG_LEVEL_NAMES {
    { "none"sv,    LogLevel::NONE },
    { "fatal"sv,   LogLevel::FATAL },
    { "error"sv,   LogLevel::ERROR },
    { "warning"sv, LogLevel::WARNING },
    { "info"sv,    LogLevel::INFO },
    { "debug"sv,   LogLevel::DEBUG },
};

}

namespace Impl {

bool shouldLog(const LogLevel level)
{
    static const std::map<LogLevel, std::string_view> LEVEL_PREFIXES {
        { LogLevel::FATAL,   "FATAL   "sv },
        { LogLevel::ERROR,   "ERROR   "sv },
        { LogLevel::WARNING, "WARNING "sv },
        { LogLevel::INFO,    "INFO    "sv },
        { LogLevel::DEBUG,   "DEBUG   "sv },
    };

    if (level == LogLevel::NONE || level > globalLoggingLevel) {
        return false;
    }
    const auto time = std::time(nullptr);
    logStream() << std::put_time(std::localtime(&time), "%c ") <<
        LEVEL_PREFIXES.at(level);
    return true;
}

std::ostream& logStream()
{
    return globalLoggingStream;
}

}

LogLevel getLogLevel(const int verbosity)
{
    if (verbosity >= 2) {
        return LogLevel::DEBUG;
    } else if (verbosity == 1) {
        return LogLevel::INFO;
    }
    return LogLevel::WARNING;
}

std::optional<LogLevel> parseLogLevel(const std::string_view name)
{
    const auto iter = LOG_LEVEL_NAMES.find(name);
    if (iter == LOG_LEVEL_NAMES.end()) {
        return std::nullopt;
    }
    return iter->second;
}

void setupLogging(const LogLevel level, std::ostream& stream)
{
    globalLoggingLevel = level;
    globalLoggingStream = stream;
}

}
