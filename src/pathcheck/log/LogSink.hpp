#pragma once

#include <string>
#include <string_view>

namespace PC {

enum class LogLevel {
    Trace,
    Debug,
    Verbose,
    Info,
    Warn,
    Error
};

[[nodiscard]] constexpr auto logLevelToString(LogLevel level) -> std::string_view {
    switch (level) {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Verbose:
        return "VERB";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    }
    return "INFO";
}

/**
 * LogSink is the write-only reporting capability handed to a PathCheck.
 * Delivery is fire-and-forget: callers never inspect a result, and a
 * PathCheck without a sink simply drops its messages.
 *
 * Debug messages carry a verbosity level; PathCheck forwards a debug
 * message only when its level is at most debugLevel().
 */
struct LogSink {
    virtual ~LogSink() = default;

    virtual void log(LogLevel level, std::string const& message) = 0;

    virtual auto debugLevel() const -> int {
        return 0;
    }
};

} // namespace PC
