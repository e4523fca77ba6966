#include "PathCheck.hpp"

#include "path/PathPredicates.hpp"
#include "utils/TaggedLogger.hpp"

namespace PC {

PathCheck::PathCheck(std::shared_ptr<LogSink> sink, bool simulate)
    : sink_(std::move(sink)), simulate_(simulate) {}

auto PathCheck::directoryExists(std::string_view path) const -> bool {
    return PC::directoryExists(path);
}

auto PathCheck::fileExists(std::string_view path) const -> bool {
    return PC::fileExists(path);
}

auto PathCheck::anyExists(std::string_view path) const -> bool {
    return PC::anyExists(path);
}

auto PathCheck::isSymlink(std::string_view path) const -> bool {
    return PC::isSymlink(path);
}

auto PathCheck::hasHardlinks(std::string_view path) const -> Expected<int> {
    auto links = PC::hasHardlinks(path);
    if (links)
        this->debug(2, "Number of links to " + std::string(path) + ": " + std::to_string(*links + 1));
    return links;
}

auto PathCheck::isHardlink(std::string_view path1, std::string_view path2) const -> Expected<bool> {
    auto same = PC::isHardlink(path1, path2);
    if (same)
        this->debug(2, "Comparing " + std::string(path1) + " and " + std::string(path2)
                           + " inodes: " + (*same ? "same" : "different"));
    return same;
}

auto PathCheck::resolveDryRun(bool keepsState, std::string_view label) const -> bool {
    if (keepsState) {
        if (this->simulate_)
            this->debug(1, std::string(label) + ": keepsState set, simulate mode ignored");
        return false;
    }
    return this->simulate_;
}

auto PathCheck::cleanup(std::string_view dest, std::optional<std::string> backup, ActionOptions const& options)
    -> Outcome {
    return this->guarded<Change>("cleanup", [&] { return this->cleanupImpl(dest, backup, options); });
}

auto PathCheck::directory(std::string_view path, DirectoryOptions const& options) -> DirectoryOutcome {
    return this->guarded<DirectoryResult>("directory", [&] { return this->directoryImpl(path, options); });
}

auto PathCheck::symlink(std::string_view target, std::string_view linkPath, LinkOptions const& options) -> Outcome {
    return this->guarded<Change>("symlink", [&] { return this->symlinkImpl(target, linkPath, options); });
}

auto PathCheck::hardlink(std::string_view target, std::string_view linkPath, LinkOptions const& options) -> Outcome {
    return this->guarded<Change>("hardlink", [&] { return this->hardlinkImpl(target, linkPath, options); });
}

auto PathCheck::status(std::string_view path, StatusOptions const& options) -> Outcome {
    return this->guarded<Change>("status", [&] { return this->statusImpl(path, options); });
}

auto PathCheck::move(std::string_view src, std::string_view dest, std::optional<std::string> backup,
                     ActionOptions const& options) -> Outcome {
    return this->guarded<Change>("move", [&] { return this->moveImpl(src, dest, backup, options); });
}

auto PathCheck::listdir(std::string_view dir, ListOptions const& options) -> Expected<std::vector<std::string>> {
    return this->guarded<std::vector<std::string>>("listdir", [&] { return this->listdirImpl(dir, options); });
}

auto PathCheck::report(LogLevel level, std::string const& message) const -> void {
    pc_log(message, "PathCheck", std::string(logLevelToString(level)));
    if (this->sink_)
        this->sink_->log(level, message);
}

auto PathCheck::debug(int level, std::string const& message) const -> void {
    if (this->sink_ && level <= this->sink_->debugLevel())
        this->sink_->log(LogLevel::Debug, message);
}

} // namespace PC
