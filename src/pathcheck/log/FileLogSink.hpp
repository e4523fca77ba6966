#pragma once
#include "LogSink.hpp"
#include "core/Error.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace PC {

enum class LogFileMode {
    Write, // rotate an existing file to <file>.prev, then truncate
    Append
};

struct FileLogOptions {
    LogFileMode mode       = LogFileMode::Append;
    bool        timestamp  = false;
    int         debugLevel = 0;
};

/**
 * FileLogSink writes one line per message to a log file.
 *
 * Lines look like "[VERB] message", optionally prefixed with a
 * "YYYY/MM/DD-HH:MM:SS " local timestamp. The stream is flushed after every
 * line so an aborted run still leaves a complete log behind.
 */
class FileLogSink final : public LogSink {
public:
    [[nodiscard]] static auto open(std::filesystem::path path, FileLogOptions options = {})
        -> Expected<std::shared_ptr<FileLogSink>>;

    ~FileLogSink() override;

    FileLogSink(FileLogSink const&)            = delete;
    FileLogSink& operator=(FileLogSink const&) = delete;

    void log(LogLevel level, std::string const& message) override;
    auto debugLevel() const -> int override { return this->options.debugLevel; }

    // Returns false if the file was already closed.
    auto close() -> bool;

    auto path() const -> std::filesystem::path const& { return this->filePath; }

    // Basename without the ".log" suffix, when the file name ends in ".log".
    auto syslogName() const -> std::optional<std::string>;

private:
    FileLogSink(std::filesystem::path path, FileLogOptions options);

    std::filesystem::path filePath;
    FileLogOptions        options;
    std::ofstream         stream;
    std::mutex            mutex;
};

} // namespace PC
