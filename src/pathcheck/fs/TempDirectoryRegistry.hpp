#pragma once

#include <mutex>
#include <string>
#include <vector>

namespace PC::Fs {

/**
 * Process wide list of temporary directories to remove at exit.
 *
 * The first registration installs a single std::atexit hook. Removal is
 * best effort: failures are traced through pc_log and never reported to a
 * caller.
 */
class TempDirectoryRegistry {
public:
    static auto instance() -> TempDirectoryRegistry&;

    auto add(std::string path) -> void;
    auto pending() const -> std::vector<std::string>;

    // Remove every registered directory now. Returns the number removed.
    auto removeAll() -> std::size_t;

private:
    TempDirectoryRegistry() = default;

    mutable std::mutex       mutex_;
    std::vector<std::string> paths_;
};

} // namespace PC::Fs
