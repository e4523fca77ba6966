#pragma once
#include "LogSink.hpp"

namespace PC {

// Forwards messages to the process TaggedLogger, tagged "PathCheck" and the level.
class TaggedLogSink final : public LogSink {
public:
    explicit TaggedLogSink(int debugLevel = 0)
        : debugLevel_(debugLevel) {}

    void log(LogLevel level, std::string const& message) override;

    auto debugLevel() const -> int override {
        return debugLevel_;
    }

private:
    int debugLevel_;
};

} // namespace PC
