#include "log/TaggedLogSink.hpp"

#include "utils/TaggedLogger.hpp"

namespace PC {

void TaggedLogSink::log(LogLevel level, std::string const& message) {
    logger().log_impl(message, std::source_location::current(), "PathCheck", std::string(logLevelToString(level)));
}

} // namespace PC
