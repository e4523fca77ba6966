#pragma once

#include "core/Error.hpp"

#include <string>
#include <string_view>
#include <sys/stat.h>

namespace PC {

/**
 * Validate a caller supplied path before it reaches a syscall.
 * A path is accepted when it is non-empty and free of NUL bytes; the
 * returned string is the path itself. `what` names the argument in the
 * error message ("cleanup dest", "symlink", ...).
 */
[[nodiscard]] auto untaintPath(std::string_view path, std::string_view what) -> Expected<std::string>;

// The predicates below never fail: an empty path or an OS error reads as false.

// Existing directory, following symlinks.
[[nodiscard]] auto directoryExists(std::string_view path) -> bool;
// Existing regular file, following symlinks.
[[nodiscard]] auto fileExists(std::string_view path) -> bool;
// Anything at the path, including a dangling symlink.
[[nodiscard]] auto anyExists(std::string_view path) -> bool;
// A symlink, whether or not its target exists.
[[nodiscard]] auto isSymlink(std::string_view path) -> bool;

// Number of additional names for the file or symlink at `path` (link count - 1).
[[nodiscard]] auto hasHardlinks(std::string_view path) -> Expected<int>;

// True when two distinct path strings name the same inode.
[[nodiscard]] auto isHardlink(std::string_view path1, std::string_view path2) -> Expected<bool>;

// lstat wrapper reporting errno as a SystemError.
[[nodiscard]] auto lstatPath(std::string const& path) -> Expected<struct stat>;

[[nodiscard]] auto parentDirectory(std::string_view path) -> std::string;

} // namespace PC
