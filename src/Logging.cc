#include "Logging.hh"

#include <array>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace Shuffle {

namespace {

using namespace std::string_view_literals;

constexpr auto LEVEL_NAMES = std::array {
    "NONE    "sv, "FATAL   "sv, "ERROR   "sv, "WARNING "sv, "INFO    "sv,
    "DEBUG   "sv,
};

struct LoggingState {
    std::mutex mutex;
    LogLevel level {LogLevel::WARNING};
    std::reference_wrapper<std::ostream> stream {std::cerr};
};

LoggingState& getLoggingState()
{
    static auto state = LoggingState {};
    return state;
}

}

namespace Impl {

bool shouldLog(const LogLevel level)
{
    const auto global_level = getLoggingState().level;
    return level != LogLevel::NONE && level <= global_level;
}

void writeLog(const LogLevel level, const std::string_view message)
{
    const auto now = std::time(nullptr);
    auto local_now = std::tm {};
    localtime_r(&now, &local_now);
    auto& state = getLoggingState();
    const auto lock = std::lock_guard {state.mutex};
    state.stream.get()
        << std::put_time(&local_now, "%F %T ")
        << LEVEL_NAMES.at(static_cast<std::size_t>(level))
        << message << '\n';
}

}

LogLevel getLogLevel(const int verbosity)
{
    switch (verbosity) {
    case 0:
        return LogLevel::WARNING;
    case 1:
        return LogLevel::INFO;
    default:
        return verbosity < 0 ? LogLevel::WARNING : LogLevel::DEBUG;
    }
}

void setupLogging(const LogLevel level, std::ostream& stream)
{
    auto& state = getLoggingState();
    const auto lock = std::lock_guard {state.mutex};
    state.level = level;
    state.stream = stream;
}

}
