#include "fs/TempDirectoryRegistry.hpp"

#include "utils/TaggedLogger.hpp"

#include <cstdlib>
#include <filesystem>
#include <system_error>

namespace PC::Fs {
namespace {

void register_exit_hook() {
    static std::once_flag once;
    std::call_once(once, []() {
        std::atexit([]() {
            TempDirectoryRegistry::instance().removeAll();
        });
    });
}

} // namespace

auto TempDirectoryRegistry::instance() -> TempDirectoryRegistry& {
    // Leaked so the exit hook never races static destruction.
    static auto* registry = new TempDirectoryRegistry();
    return *registry;
}

auto TempDirectoryRegistry::add(std::string path) -> void {
    register_exit_hook();
    std::lock_guard<std::mutex> lg(mutex_);
    paths_.push_back(std::move(path));
}

auto TempDirectoryRegistry::pending() const -> std::vector<std::string> {
    std::lock_guard<std::mutex> lg(mutex_);
    return paths_;
}

auto TempDirectoryRegistry::removeAll() -> std::size_t {
    std::vector<std::string> paths;
    {
        std::lock_guard<std::mutex> lg(mutex_);
        paths.swap(paths_);
    }

    std::size_t removed = 0;
    // Newest first so nested temporary directories go before their parents.
    for (auto it = paths.rbegin(); it != paths.rend(); ++it) {
        std::error_code ec;
        std::filesystem::remove_all(*it, ec);
        if (ec) {
            pc_log("Failed to remove temporary directory " + *it + ": " + ec.message(), "TempDirectoryRegistry");
            continue;
        }
        ++removed;
    }
    return removed;
}

} // namespace PC::Fs
