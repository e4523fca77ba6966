#include "process/EffectiveIdentity.hpp"

#include "process/Accounts.hpp"

#include <grp.h>
#include <unistd.h>
#include <utility>

namespace PC {

EffectiveIdentity::EffectiveIdentity(std::shared_ptr<LogSink> sink)
    : sink_(std::move(sink)), originalUid_(::geteuid()), originalGid_(::getegid()) {}

EffectiveIdentity::EffectiveIdentity(EffectiveIdentity&& other) noexcept
    : sink_(std::move(other.sink_))
    , originalUid_(other.originalUid_)
    , originalGid_(other.originalGid_)
    , originalGroups_(std::move(other.originalGroups_))
    , groupsChanged_(other.groupsChanged_)
    , active_(std::exchange(other.active_, false)) {}

EffectiveIdentity& EffectiveIdentity::operator=(EffectiveIdentity&& other) noexcept {
    if (this == &other)
        return *this;
    if (this->active_)
        (void)this->restore();
    sink_           = std::move(other.sink_);
    originalUid_    = other.originalUid_;
    originalGid_    = other.originalGid_;
    originalGroups_ = std::move(other.originalGroups_);
    groupsChanged_  = other.groupsChanged_;
    active_         = std::exchange(other.active_, false);
    return *this;
}

EffectiveIdentity::~EffectiveIdentity() {
    if (!this->active_)
        return;
    if (auto restored = this->restore(); !restored)
        this->report(LogLevel::Error, describeError(restored.error()));
}

auto EffectiveIdentity::acquire(std::optional<std::string> const& user,
                                std::optional<std::string> const& group,
                                std::shared_ptr<LogSink>         sink) -> Expected<EffectiveIdentity> {
    std::optional<uid_t> uid;
    std::optional<gid_t> gid;

    if (user) {
        auto info = lookupUser(*user);
        if (!info)
            return std::unexpected(info.error());
        uid = info->uid;
        gid = info->primaryGid;
    }
    if (group) {
        auto resolved = lookupGroup(*group);
        if (!resolved)
            return std::unexpected(resolved.error());
        gid = *resolved;
    }

    EffectiveIdentity identity(std::move(sink));
    identity.active_ = true;
    if (auto switched = identity.switchTo(uid, gid); !switched) {
        (void)identity.restore();
        return std::unexpected(switched.error());
    }
    return identity;
}

auto EffectiveIdentity::switchTo(std::optional<uid_t> uid, std::optional<gid_t> gid) -> Expected<void> {
    if (gid) {
        if (::getegid() == *gid) {
            this->report(LogLevel::Verbose, "Changing EGID to " + std::to_string(*gid) + ": no changes required");
        } else {
            if (::geteuid() == 0) {
                int const count = ::getgroups(0, nullptr);
                if (count > 0) {
                    this->originalGroups_.resize(static_cast<std::size_t>(count));
                    if (::getgroups(count, this->originalGroups_.data()) < 0)
                        return std::unexpected(systemError("getgroups"));
                }
                gid_t const only = *gid;
                if (::setgroups(1, &only) != 0)
                    return std::unexpected(systemError("setgroups to " + std::to_string(only)));
                this->groupsChanged_ = true;
            }
            if (::setegid(*gid) != 0)
                return std::unexpected(systemError("Changing EGID from " + std::to_string(this->originalGid_) + " to "
                                                   + std::to_string(*gid)));
            this->report(LogLevel::Verbose, "Changing EGID from " + std::to_string(this->originalGid_) + " to "
                                                + std::to_string(*gid));
        }
    }

    if (uid) {
        if (::geteuid() == *uid) {
            this->report(LogLevel::Verbose, "Changing EUID to " + std::to_string(*uid) + ": no changes required");
        } else {
            if (::seteuid(*uid) != 0)
                return std::unexpected(systemError("Changing EUID from " + std::to_string(this->originalUid_) + " to "
                                                   + std::to_string(*uid)));
            this->report(LogLevel::Verbose, "Changing EUID from " + std::to_string(this->originalUid_) + " to "
                                                + std::to_string(*uid));
        }
    }
    return {};
}

auto EffectiveIdentity::restore() -> Expected<void> {
    if (!this->active_)
        return {};
    this->active_ = false;

    if (::geteuid() != this->originalUid_) {
        if (::seteuid(this->originalUid_) != 0)
            return std::unexpected(systemError("Restoring EUID to " + std::to_string(this->originalUid_)));
        this->report(LogLevel::Verbose, "Restoring EUID to " + std::to_string(this->originalUid_));
    }

    if (this->groupsChanged_) {
        if (::setgroups(this->originalGroups_.size(), this->originalGroups_.data()) != 0)
            return std::unexpected(systemError("Restoring supplementary groups"));
        this->groupsChanged_ = false;
    }

    if (::getegid() != this->originalGid_) {
        if (::setegid(this->originalGid_) != 0)
            return std::unexpected(systemError("Restoring EGID to " + std::to_string(this->originalGid_)));
        this->report(LogLevel::Verbose, "Restoring EGID to " + std::to_string(this->originalGid_));
    }
    return {};
}

auto EffectiveIdentity::report(LogLevel level, std::string const& message) const -> void {
    if (this->sink_)
        this->sink_->log(level, message);
}

auto runAs(std::optional<std::string> const& user,
           std::optional<std::string> const& group,
           std::function<Expected<void>()> const& fn,
           std::shared_ptr<LogSink> sink) -> Expected<void> {
    auto identity = EffectiveIdentity::acquire(user, group, std::move(sink));
    if (!identity)
        return std::unexpected(identity.error());

    auto result   = fn();
    auto restored = identity->restore();
    if (!result)
        return result;
    return restored;
}

} // namespace PC
