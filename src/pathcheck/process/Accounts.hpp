#pragma once

#include "core/Error.hpp"

#include <optional>
#include <string_view>
#include <sys/types.h>

namespace PC {

struct UserInfo {
    uid_t                uid;
    // Empty for a numeric id without a user database entry.
    std::optional<gid_t> primaryGid;
};

// Resolve a user by name or numeric id. A numeric id is used as is, whether
// or not the user database knows it; ids that do not fit uid_t are rejected.
[[nodiscard]] auto lookupUser(std::string_view user) -> Expected<UserInfo>;

// Resolve a group by name or numeric id, with the same rules as lookupUser.
[[nodiscard]] auto lookupGroup(std::string_view groupName) -> Expected<gid_t>;

} // namespace PC
