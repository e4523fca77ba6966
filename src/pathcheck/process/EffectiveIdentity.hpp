#pragma once

#include "core/Error.hpp"
#include "log/LogSink.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

namespace PC {

/**
 * EffectiveIdentity switches the effective uid/gid of the process for the
 * lifetime of the guard.
 *
 * The group is switched before the user (the new user may lack the right
 * to change groups) and the user is restored before the group. When only a
 * user is given its primary group is used. Running as root, the
 * supplementary group list is reduced to the new group and restored
 * afterwards. Ids that already match are left alone.
 */
class EffectiveIdentity {
public:
    [[nodiscard]] static auto acquire(std::optional<std::string> const& user,
                                      std::optional<std::string> const& group,
                                      std::shared_ptr<LogSink>         sink = {}) -> Expected<EffectiveIdentity>;

    EffectiveIdentity(EffectiveIdentity&& other) noexcept;
    EffectiveIdentity& operator=(EffectiveIdentity&& other) noexcept;
    EffectiveIdentity(EffectiveIdentity const&)            = delete;
    EffectiveIdentity& operator=(EffectiveIdentity const&) = delete;

    ~EffectiveIdentity();

    // Restore the original ids now. Idempotent.
    auto restore() -> Expected<void>;

    auto active() const noexcept -> bool { return this->active_; }

private:
    explicit EffectiveIdentity(std::shared_ptr<LogSink> sink);

    auto switchTo(std::optional<uid_t> uid, std::optional<gid_t> gid) -> Expected<void>;
    auto report(LogLevel level, std::string const& message) const -> void;

    std::shared_ptr<LogSink> sink_;
    uid_t                    originalUid_ = 0;
    gid_t                    originalGid_ = 0;
    std::vector<gid_t>       originalGroups_;
    bool                     groupsChanged_ = false;
    bool                     active_        = false;
};

// Run `fn` with the given effective user/group; the original ids are always restored.
[[nodiscard]] auto runAs(std::optional<std::string> const& user,
                         std::optional<std::string> const& group,
                         std::function<Expected<void>()> const& fn,
                         std::shared_ptr<LogSink> sink = {}) -> Expected<void>;

} // namespace PC
