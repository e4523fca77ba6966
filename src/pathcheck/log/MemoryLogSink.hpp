#pragma once
#include "LogSink.hpp"

#include <mutex>
#include <string>
#include <vector>

namespace PC {

// Keeps every message in memory, in arrival order.
class MemoryLogSink final : public LogSink {
public:
    struct Entry {
        LogLevel    level;
        std::string message;
    };

    explicit MemoryLogSink(int debugLevel = 5)
        : debugLevel_(debugLevel) {}

    void log(LogLevel level, std::string const& message) override {
        std::lock_guard<std::mutex> lg(mutex_);
        entries_.push_back(Entry{level, message});
    }

    auto debugLevel() const -> int override {
        return debugLevel_;
    }

    auto entries() const -> std::vector<Entry> {
        std::lock_guard<std::mutex> lg(mutex_);
        return entries_;
    }

    // True if any message at `level` contains `needle`.
    auto contains(LogLevel level, std::string const& needle) const -> bool {
        std::lock_guard<std::mutex> lg(mutex_);
        for (auto const& entry : entries_)
            if (entry.level == level && entry.message.find(needle) != std::string::npos)
                return true;
        return false;
    }

    void clear() {
        std::lock_guard<std::mutex> lg(mutex_);
        entries_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
    int                debugLevel_;
};

} // namespace PC
