#pragma once
#include <ctime>
#include <functional>
#include <optional>
#include <regex>
#include <string>
#include <sys/types.h>
#include <variant>

namespace PC {

struct ActionOptions {
    // Perform the action even in simulate mode.
    bool keepsState = false;
};

struct StatusOptions : ActionOptions {
    std::optional<std::string> owner; // user name or numeric uid
    std::optional<std::string> group; // group name or numeric gid
    std::optional<mode_t>      mode;  // permission bits, masked with 07777
    std::optional<std::time_t> mtime;
};

struct DirectoryOptions : StatusOptions {
    // Treat the path as a mkdtemp template and remove the result at exit.
    bool temp = false;
};

struct LinkOptions : ActionOptions {
    // Replace an existing plain file at the link path.
    bool force = false;
    // Symlink only: require the target to exist. Hardlink targets are always checked.
    bool check = false;
};

struct ListOptions {
    using Test   = std::function<bool(std::string const& name, std::string const& dir)>;
    using Filter = std::variant<std::string, std::regex>;

    Test                  test;
    std::optional<Filter> filter;
    bool                  fileExists = false;
    bool                  inverse    = false;
    bool                  addDir     = false;
};

} // namespace PC
