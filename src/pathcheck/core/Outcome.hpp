#pragma once
#include "Error.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace PC {

// Success half of a reconciliation result. A failed result is the error
// side of the Expected.
enum class Change {
    Unchanged,
    Changed
};

using Outcome = Expected<Change>;

struct DirectoryResult {
    Change                     change = Change::Unchanged;
    // Resolved directory. Empty for a temporary directory in simulate mode.
    std::optional<std::string> path;
};

using DirectoryOutcome = Expected<DirectoryResult>;

[[nodiscard]] constexpr auto changeToString(Change change) -> std::string_view {
    return change == Change::Changed ? "changed" : "unchanged";
}

[[nodiscard]] constexpr auto combine(Change a, Change b) -> Change {
    return (a == Change::Changed || b == Change::Changed) ? Change::Changed : Change::Unchanged;
}

[[nodiscard]] inline auto isChanged(Outcome const& outcome) -> bool {
    return outcome.has_value() && *outcome == Change::Changed;
}

} // namespace PC
