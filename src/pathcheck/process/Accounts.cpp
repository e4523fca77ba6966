#include "process/Accounts.hpp"

#include <charconv>
#include <grp.h>
#include <limits>
#include <optional>
#include <pwd.h>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

using PC::Error;
using PC::Expected;

auto isNumeric(std::string_view text) -> bool {
    if (text.empty())
        return false;
    for (char c : text)
        if (c < '0' || c > '9')
            return false;
    return true;
}

// Numeric id parsed in the width of Id. The all-ones value is rejected:
// chown(2) reads it as "leave unchanged".
template <typename Id>
auto parseId(std::string_view text, char const* kind) -> Expected<Id> {
    Id value = 0;
    auto const [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || value == std::numeric_limits<Id>::max())
        return std::unexpected(Error{Error::Code::PreconditionFailed,
                                     std::string("Invalid ") + kind + " id " + std::string(text)});
    return value;
}

auto bufferSize(int name) -> std::size_t {
    auto const suggested = ::sysconf(name);
    return suggested > 0 ? static_cast<std::size_t>(suggested) : 16384;
}

} // namespace

namespace PC {

auto lookupUser(std::string_view user) -> Expected<UserInfo> {
    std::vector<char> buffer(bufferSize(_SC_GETPW_R_SIZE_MAX));
    struct passwd     pwd{};
    struct passwd*    result = nullptr;

    if (isNumeric(user)) {
        auto uid = parseId<uid_t>(user, "user");
        if (!uid)
            return std::unexpected(uid.error());
        // Unmapped ids are valid owners; only a mapped one has a primary group.
        int const rc = ::getpwuid_r(*uid, &pwd, buffer.data(), buffer.size(), &result);
        if (rc != 0 || result == nullptr)
            return UserInfo{*uid, std::nullopt};
        return UserInfo{*uid, pwd.pw_gid};
    }

    std::string const name{user};
    int const         rc = ::getpwnam_r(name.c_str(), &pwd, buffer.data(), buffer.size(), &result);
    if (rc != 0)
        return std::unexpected(systemError("lookup user " + name, rc));
    if (result == nullptr)
        return std::unexpected(Error{Error::Code::PreconditionFailed, "No such user " + name});
    return UserInfo{pwd.pw_uid, pwd.pw_gid};
}

auto lookupGroup(std::string_view groupName) -> Expected<gid_t> {
    if (isNumeric(groupName))
        return parseId<gid_t>(groupName, "group");

    std::vector<char> buffer(bufferSize(_SC_GETGR_R_SIZE_MAX));
    struct group      grp{};
    struct group*     result = nullptr;
    std::string const name{groupName};

    int const rc = ::getgrnam_r(name.c_str(), &grp, buffer.data(), buffer.size(), &result);
    if (rc != 0)
        return std::unexpected(systemError("lookup group " + name, rc));
    if (result == nullptr)
        return std::unexpected(Error{Error::Code::PreconditionFailed, "No such group " + name});
    return grp.gr_gid;
}

} // namespace PC
