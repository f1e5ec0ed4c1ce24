/** \file
 *
 * \brief Logging utilities
 *
 * Log lines are written to a single global stream set up with
 * setupLogging(). Each line contains the local time, the level and the
 * message. Lines written from different threads do not interleave.
 */

#ifndef LOGGING_HH_
#define LOGGING_HH_

#include <algorithm>
#include <iterator>
#include <ostream>
#include <sstream>
#include <string_view>

namespace Shuffle {

/** \brief Log level
 *
 * The levels are ordered from the least to the most verbose.
 *
 * \sa setupLogging(), log()
 */
enum class LogLevel {
    NONE,     ///< No logging
    FATAL,    ///< Errors terminating the program
    ERROR,    ///< Errors reported to the caller
    WARNING,  ///< Ignored invalid input
    INFO,     ///< Progress of verification runs
    DEBUG     ///< Individual shuffle steps
};

/// \cond DOXYGEN_IGNORE

namespace Impl {

bool shouldLog(LogLevel level);
void writeLog(LogLevel level, std::string_view message);

inline void format(
    std::ostream& out, std::string_view::const_iterator first,
    std::string_view::const_iterator last)
{
    out << std::string_view(first, last);
}

template<typename First, typename... Rest>
void format(
    std::ostream& out, std::string_view::const_iterator first,
    std::string_view::const_iterator last, const First& arg,
    const Rest&... rest)
{
    const auto placeholder = std::find(first, last, '%');
    if (placeholder == last || std::next(placeholder) == last) {
        Impl::format(out, first, placeholder);
        return;
    }
    Impl::format(out, first, placeholder);
    out << arg;
    Impl::format(out, std::next(placeholder, 2), last, rest...);
}

}

/// \endcond

/** \brief Log a message
 *
 * The message is written if \p level is enabled by the level given to
 * setupLogging().
 *
 * Each placeholder in \p format is a \% sign followed by exactly one
 * character, e.g. \c %s or \c %d. The character is not interpreted: the
 * next argument is streamed with \c operator<< in its place, so any
 * streamable type may be logged. Arguments without a placeholder are
 * dropped, as is a trailing lone \% sign.
 *
 * \param level the level of the message
 * \param format the format string
 * \param args the values replacing the placeholders
 */
template<typename String, typename... Args>
void log(const LogLevel level, const String& format, const Args&... args)
{
    if (!Impl::shouldLog(level)) {
        return;
    }
    const auto format_view = std::string_view {format};
    auto message = std::ostringstream {};
    Impl::format(message, format_view.begin(), format_view.end(), args...);
    Impl::writeLog(level, message.str());
}

/** \brief Map the number of -v flags to a log level
 *
 * \param verbosity the number of times the -v flag was given
 *
 * \return LogLevel::WARNING for zero, LogLevel::INFO for one and
 * LogLevel::DEBUG for more
 */
LogLevel getLogLevel(int verbosity);

/** \brief Set up logging
 *
 * Sets the most verbose level written and the stream the log is written
 * to. Until this function is called, the level is LogLevel::WARNING and the
 * stream is \c std::cerr. LogLevel::NONE disables logging.
 *
 * \p stream must outlive all logging until the next call. The function must
 * not be called while other threads are logging.
 *
 * \param level the most verbose level written
 * \param stream the log stream
 */
void setupLogging(LogLevel level, std::ostream& stream);

}

#endif // LOGGING_HH_
