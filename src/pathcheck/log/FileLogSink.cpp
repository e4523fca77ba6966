#include "log/FileLogSink.hpp"

#include <cerrno>
#include <cstdio>
#include <ctime>
#include <system_error>

namespace {

auto timestampPrefix() -> std::string {
    auto const now = std::time(nullptr);
    std::tm    tm{};
    localtime_r(&now, &tm);
    char buffer[32];
    auto const written = std::strftime(buffer, sizeof(buffer), "%Y/%m/%d-%H:%M:%S ", &tm);
    return std::string(buffer, written);
}

} // namespace

namespace PC {

FileLogSink::FileLogSink(std::filesystem::path path, FileLogOptions options)
    : filePath(std::move(path)), options(options) {}

FileLogSink::~FileLogSink() {
    this->close();
}

auto FileLogSink::open(std::filesystem::path path, FileLogOptions options) -> Expected<std::shared_ptr<FileLogSink>> {
    if (path.empty())
        return std::unexpected(Error{Error::Code::InvalidPath, "log file name is empty"});

    std::ios::openmode mode = std::ios::out;
    if (options.mode == LogFileMode::Write) {
        std::error_code ec;
        if (std::filesystem::exists(std::filesystem::symlink_status(path, ec))) {
            auto previous = path;
            previous += ".prev";
            std::filesystem::rename(path, previous, ec);
            if (ec)
                return std::unexpected(Error{Error::Code::SystemError,
                                             "Failed to rotate log " + path.string() + ": " + ec.message()});
        }
        mode |= std::ios::trunc;
    } else {
        mode |= std::ios::app;
    }

    std::shared_ptr<FileLogSink> sink(new FileLogSink(path, options));
    sink->stream.open(path, mode);
    if (!sink->stream.is_open()) {
        auto const verb = options.mode == LogFileMode::Write ? "write" : "append";
        return std::unexpected(systemError("Open for " + std::string(verb) + " " + path.string()));
    }
    return sink;
}

void FileLogSink::log(LogLevel level, std::string const& message) {
    std::lock_guard<std::mutex> lg(this->mutex);
    if (!this->stream.is_open())
        return;
    if (this->options.timestamp)
        this->stream << timestampPrefix();
    this->stream << '[' << logLevelToString(level) << "] " << message;
    if (message.empty() || message.back() != '\n')
        this->stream << '\n';
    this->stream.flush();
}

auto FileLogSink::close() -> bool {
    std::lock_guard<std::mutex> lg(this->mutex);
    if (!this->stream.is_open())
        return false;
    this->stream.close();
    return true;
}

auto FileLogSink::syslogName() const -> std::optional<std::string> {
    auto const filename = this->filePath.filename().string();
    constexpr std::string_view suffix = ".log";
    if (filename.size() < suffix.size() || !filename.ends_with(suffix))
        return std::nullopt;
    return filename.substr(0, filename.size() - suffix.size());
}

} // namespace PC
