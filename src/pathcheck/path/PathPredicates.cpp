#include "path/PathPredicates.hpp"

#include "utils/TaggedLogger.hpp"

#include <string>

namespace {

using PC::Error;
using PC::Expected;

auto statFollow(std::string_view path, struct stat& st) -> bool {
    if (path.empty() || path.find('\0') != std::string_view::npos)
        return false;
    std::string const p{path};
    return ::stat(p.c_str(), &st) == 0;
}

auto statNoFollow(std::string_view path, struct stat& st) -> bool {
    if (path.empty() || path.find('\0') != std::string_view::npos)
        return false;
    std::string const p{path};
    return ::lstat(p.c_str(), &st) == 0;
}

// File or symlink: the entries hasHardlinks/isHardlink accept.
auto fileOrSymlink(std::string_view path) -> bool {
    return PC::fileExists(path) || PC::isSymlink(path);
}

} // namespace

namespace PC {

auto untaintPath(std::string_view path, std::string_view what) -> Expected<std::string> {
    if (path.empty() || path.find('\0') != std::string_view::npos) {
        std::string printable;
        for (char c : path)
            printable.push_back(c == '\0' ? '?' : c);
        return std::unexpected(Error{Error::Code::InvalidPath,
                                     "Failed to untaint " + std::string(what) + ": path " + printable});
    }
    return std::string{path};
}

auto directoryExists(std::string_view path) -> bool {
    struct stat st{};
    return statFollow(path, st) && S_ISDIR(st.st_mode);
}

auto fileExists(std::string_view path) -> bool {
    struct stat st{};
    return statFollow(path, st) && S_ISREG(st.st_mode);
}

auto anyExists(std::string_view path) -> bool {
    struct stat st{};
    return statNoFollow(path, st);
}

auto isSymlink(std::string_view path) -> bool {
    struct stat st{};
    return statNoFollow(path, st) && S_ISLNK(st.st_mode);
}

auto hasHardlinks(std::string_view path) -> Expected<int> {
    auto file = untaintPath(path, "has_hardlinks");
    if (!file)
        return std::unexpected(file.error());

    if (!fileOrSymlink(*file)) {
        pc_log("hasHardlinks: " + *file + " doesn't exist or is not a file", "PathPredicates");
        return std::unexpected(Error{Error::Code::NoSuchPath, *file + " doesn't exist or is not a file"});
    }

    auto st = lstatPath(*file);
    if (!st)
        return std::unexpected(st.error());
    auto const nlinks = static_cast<int>(st->st_nlink);
    return nlinks > 0 ? nlinks - 1 : 0;
}

auto isHardlink(std::string_view path1, std::string_view path2) -> Expected<bool> {
    auto first = untaintPath(path1, "is_hardlink path1");
    if (!first)
        return std::unexpected(first.error());
    auto second = untaintPath(path2, "is_hardlink path2");
    if (!second)
        return std::unexpected(second.error());

    for (auto const* p : {&*first, &*second}) {
        if (!fileOrSymlink(*p))
            return std::unexpected(Error{Error::Code::NoSuchPath, *p + " doesn't exist or is not a file"});
    }

    auto st1 = lstatPath(*first);
    if (!st1)
        return std::unexpected(st1.error());
    auto st2 = lstatPath(*second);
    if (!st2)
        return std::unexpected(st2.error());

    bool const sameInode = st1->st_dev == st2->st_dev && st1->st_ino == st2->st_ino;
    return sameInode && *first != *second;
}

auto lstatPath(std::string const& path) -> Expected<struct stat> {
    struct stat st{};
    if (::lstat(path.c_str(), &st) != 0)
        return std::unexpected(systemError("lstat " + path));
    return st;
}

auto parentDirectory(std::string_view path) -> std::string {
    while (path.size() > 1 && path.back() == '/')
        path.remove_suffix(1);
    auto const slash = path.rfind('/');
    if (slash == std::string_view::npos)
        return ".";
    auto parent = path.substr(0, slash);
    while (parent.size() > 1 && parent.back() == '/')
        parent.remove_suffix(1);
    if (parent.empty())
        return "/";
    return std::string{parent};
}

} // namespace PC
