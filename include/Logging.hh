/** \file
 *
 * \brief Logging utilities
 */

#ifndef LANDLORD_LOGGING_HH_
#define LANDLORD_LOGGING_HH_

#include "IoUtility.hh"

#include <optional>
#include <ostream>
#include <string_view>

namespace Landlord {

/** \brief Log level
 *
 * \sa setupLogging(), log()
 */
enum class LogLevel {
    NONE,     ///< No logging
    FATAL,    ///< Unrecoverable error situations
    ERROR,    ///< Recoverable error situations
    WARNING,  ///< Unexpected concerning events
    INFO,     ///< Other events of importance
    DEBUG     ///< Verbose debugging logging
};

/// \cond DOXYGEN_IGNORE
/// These are helpers for implementing log()

namespace Impl {

bool shouldLog(LogLevel level);
std::ostream& logStream();

inline void logFormatted(std::string_view format)
{
    logStream() << format;
}

template<typename First, typename... Rest>
void logFormatted(
    std::string_view format, const First& arg, const Rest&... rest)
{
    const auto n = format.find('%');
    if (n == std::string_view::npos || n + 1 == format.size()) {
        logStream() << format.substr(0, n);
        return;
    }
    logStream() << format.substr(0, n);
    {
        // Brings the operator<< overloads for standard library vocabulary
        // types (optional, variant) into consideration
        using Landlord::operator<<;
        logStream() << arg;
    }
    logFormatted(format.substr(n + 2), rest...);
}

}

/// \endcond

/** \brief Logging utility
 *
 * Log message if \p level is at least the minimum logging level set by
 * setupLogging().
 *
 * Each \c % sign in \p format, together with the single character following
 * it, is replaced by the next argument in \p ts streamed with \c operator<<.
 * The character after the \c % sign is not interpreted, but it is encouraged
 * that it reflects the type of the argument (\c %s, \c %d, ...). Surplus
 * placeholders and surplus arguments are ignored.
 *
 * \note The utility is not thread safe. Only one thread should log at a
 * time.
 *
 * \param level the logging level
 * \param format the formatting string
 * \param ts the values streamed to the placeholders in \p format
 */
template<typename... Ts>
void log(LogLevel level, std::string_view format, const Ts&... ts)
{
    if (Impl::shouldLog(level)) {
        Impl::logFormatted(format, ts...);
        Impl::logStream() << '\n';
    }
}

/** \brief Default mapping between verbosity and logging level
 *
 * \param verbosity the verbosity level (typically the number of times -v flag
 * is given)
 *
 * \return LogLevel corresponding the verbosity (0 warning, 1 info, >=2 debug)
 */
LogLevel getLogLevel(int verbosity);

/** \brief Parse log level from its name
 *
 * The accepted names are "none", "fatal", "error", "warning", "info" and
 * "debug".
 *
 * \param name the name of the level
 *
 * \return the log level, or none if \p name is not recognized
 */
std::optional<LogLevel> parseLogLevel(std::string_view name);

/** \brief Setup logging utility
 *
 * This function sets up the (global) minimum logging level and the stream to
 * which the log is output.
 *
 * If this method is not called, the default logging level is LogLevel::WARNING
 * and the default stream is std::cerr. If the logging level is set to
 * LogLevel::NONE, no logs are produced.
 *
 * The application is responsible for ensuring that no logging takes place after
 * the lifetime of \p stream has ended until another stream has been setup using
 * this method.
 *
 * \param level the minimum logging level that causes log to be output
 * \param stream the output stream to which the logs are output
 */
void setupLogging(LogLevel level, std::ostream& stream);

}

#endif // LANDLORD_LOGGING_HH_
