#pragma once

#include "core/Error.hpp"

#include <string>

namespace PC::Fs {

// Remove `path`: recursively for a real directory, unlink for anything else
// (a symlink to a directory is unlinked, never followed).
[[nodiscard]] auto removeEntry(std::string const& path) -> Expected<void>;

// Move `src` to `dest`. rename() when possible, copyThenRemove() when the
// two are on different filesystems.
[[nodiscard]] auto moveEntry(std::string const& src, std::string const& dest) -> Expected<void>;

// Copy `src` to `dest` (recursively, symlinks as symlinks, replacing a
// non-directory dest) and remove `src` once the copy is complete.
[[nodiscard]] auto copyThenRemove(std::string const& src, std::string const& dest) -> Expected<void>;

// Create a missing directory and its missing parents.
[[nodiscard]] auto createDirectories(std::string const& path) -> Expected<void>;

// Create `linkPath` as a symlink to `target`, atomically replacing whatever
// is at `linkPath`.
[[nodiscard]] auto placeSymlink(std::string const& target, std::string const& linkPath) -> Expected<void>;

// Create `linkPath` as an additional name for `target`, atomically replacing
// whatever is at `linkPath`.
[[nodiscard]] auto placeHardlink(std::string const& target, std::string const& linkPath) -> Expected<void>;

[[nodiscard]] auto readSymlink(std::string const& linkPath) -> Expected<std::string>;

// Absolute path with every symlink resolved.
[[nodiscard]] auto canonicalPath(std::string const& path) -> Expected<std::string>;

// mkdtemp wrapper; `templ` must end in XXXXXX.
[[nodiscard]] auto makeTempDirectory(std::string const& templ) -> Expected<std::string>;

// Pad a template with trailing X up to the six placeholders mkdtemp expects.
[[nodiscard]] auto padTempTemplate(std::string templ) -> std::string;

} // namespace PC::Fs
