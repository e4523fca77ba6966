#include "fs/FsOps.hpp"

#include "path/PathPredicates.hpp"
#include "utils/TaggedLogger.hpp"

#include <atomic>
#include <cerrno>
#include <filesystem>
#include <system_error>
#include <unistd.h>
#include <vector>

namespace {

using PC::Error;
using PC::Expected;

constexpr std::size_t kTempPlaceholders = 6;

auto filesystemError(std::string const& what, std::error_code const& ec) -> Error {
    return Error{Error::Code::SystemError, what + ": " + ec.message()};
}

// Sibling name used to stage a link before renaming it into place.
auto stagingName(std::string const& linkPath) -> std::string {
    static std::atomic<unsigned> counter{0};
    return linkPath + ".pctmp." + std::to_string(::getpid()) + "." + std::to_string(counter++);
}

template <typename Create>
auto placeLink(std::string const& linkPath, char const* label, Create&& create) -> Expected<void> {
    if (!PC::anyExists(linkPath)) {
        if (create(linkPath) != 0)
            return std::unexpected(PC::systemError(std::string(label) + " " + linkPath));
        return {};
    }

    auto const staging = stagingName(linkPath);
    if (create(staging) != 0)
        return std::unexpected(PC::systemError(std::string(label) + " " + staging));
    if (::rename(staging.c_str(), linkPath.c_str()) != 0) {
        auto const saved = errno;
        ::unlink(staging.c_str());
        return std::unexpected(PC::systemError("rename " + staging + " to " + linkPath, saved));
    }
    return {};
}

} // namespace

namespace PC::Fs {

auto removeEntry(std::string const& path) -> Expected<void> {
    auto st = lstatPath(path);
    if (!st)
        return std::unexpected(st.error());

    if (S_ISDIR(st->st_mode)) {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
        if (ec)
            return std::unexpected(filesystemError("rmtree " + path, ec));
        return {};
    }

    if (::unlink(path.c_str()) != 0)
        return std::unexpected(systemError("unlink " + path));
    return {};
}

auto moveEntry(std::string const& src, std::string const& dest) -> Expected<void> {
    if (::rename(src.c_str(), dest.c_str()) == 0)
        return {};

    if (errno != EXDEV)
        return std::unexpected(systemError("rename " + src + " to " + dest));

    pc_log("moveEntry: " + src + " and " + dest + " are on different filesystems, copying", "FsOps");
    return copyThenRemove(src, dest);
}

auto copyThenRemove(std::string const& src, std::string const& dest) -> Expected<void> {
    namespace fs = std::filesystem;
    std::error_code ec;
    auto const destStatus = fs::symlink_status(dest, ec);
    if (fs::exists(destStatus) && !fs::is_directory(destStatus)) {
        if (::unlink(dest.c_str()) != 0)
            return std::unexpected(systemError("unlink " + dest + " before copy"));
    }

    auto const options = fs::copy_options::recursive | fs::copy_options::copy_symlinks
                         | fs::copy_options::overwrite_existing;
    fs::copy(src, dest, options, ec);
    if (ec)
        return std::unexpected(filesystemError("copy " + src + " to " + dest, ec));

    // dest now holds the content; a failure here leaves a duplicate, never a loss.
    if (auto removed = removeEntry(src); !removed)
        return std::unexpected(Error{Error::Code::SystemError,
                                     "removing " + src + " after copy: " + removed.error().message.value_or("")});
    return {};
}

auto createDirectories(std::string const& path) -> Expected<void> {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec)
        return std::unexpected(filesystemError("mkdir " + path, ec));
    return {};
}

auto placeSymlink(std::string const& target, std::string const& linkPath) -> Expected<void> {
    return placeLink(linkPath, "symlink", [&target](std::string const& name) {
        return ::symlink(target.c_str(), name.c_str());
    });
}

auto placeHardlink(std::string const& target, std::string const& linkPath) -> Expected<void> {
    return placeLink(linkPath, "link", [&target](std::string const& name) {
        return ::link(target.c_str(), name.c_str());
    });
}

auto readSymlink(std::string const& linkPath) -> Expected<std::string> {
    std::vector<char> buffer(256);
    while (true) {
        auto const n = ::readlink(linkPath.c_str(), buffer.data(), buffer.size());
        if (n < 0)
            return std::unexpected(systemError("readlink " + linkPath));
        if (static_cast<std::size_t>(n) < buffer.size())
            return std::string(buffer.data(), static_cast<std::size_t>(n));
        buffer.resize(buffer.size() * 2);
    }
}

auto canonicalPath(std::string const& path) -> Expected<std::string> {
    std::error_code ec;
    auto real = std::filesystem::canonical(path, ec);
    if (ec)
        return std::unexpected(filesystemError("canonical " + path, ec));
    return real.string();
}

auto makeTempDirectory(std::string const& templ) -> Expected<std::string> {
    std::vector<char> buffer(templ.begin(), templ.end());
    buffer.push_back('\0');
    if (::mkdtemp(buffer.data()) == nullptr)
        return std::unexpected(systemError("mkdtemp " + templ));
    return std::string(buffer.data());
}

auto padTempTemplate(std::string templ) -> std::string {
    std::size_t trailing = 0;
    for (auto it = templ.rbegin(); it != templ.rend() && *it == 'X'; ++it)
        ++trailing;
    if (trailing < kTempPlaceholders)
        templ.append(kTempPlaceholders - trailing, 'X');
    return templ;
}

} // namespace PC::Fs
