#include "log/MemoryLogSink.hpp"
#include "process/Accounts.hpp"
#include "process/EffectiveIdentity.hpp"

#include <doctest/doctest.h>

#include <string>
#include <unistd.h>

using namespace PC;

TEST_SUITE("process.identity") {
TEST_CASE("account lookups") {
    auto self = lookupUser(std::to_string(::geteuid()));
    REQUIRE(self.has_value());
    CHECK(self->uid == ::geteuid());

    auto group = lookupGroup(std::to_string(::getegid()));
    REQUIRE(group.has_value());
    CHECK(*group == ::getegid());

    auto noUser = lookupUser("pathcheck-no-such-user");
    REQUIRE_FALSE(noUser.has_value());
    CHECK(noUser.error().code == Error::Code::PreconditionFailed);
    CHECK(*noUser.error().message == "No such user pathcheck-no-such-user");

    auto noGroup = lookupGroup("pathcheck-no-such-group");
    REQUIRE_FALSE(noGroup.has_value());
    CHECK(noGroup.error().code == Error::Code::PreconditionFailed);
}

TEST_CASE("numeric ids must fit the id type") {
    for (auto text : {"4294967296", "4294967295", "99999999999999999999"}) {
        CAPTURE(text);
        auto user = lookupUser(text);
        REQUIRE_FALSE(user.has_value());
        CHECK(user.error().code == Error::Code::PreconditionFailed);

        auto group = lookupGroup(text);
        REQUIRE_FALSE(group.has_value());
        CHECK(group.error().code == Error::Code::PreconditionFailed);
    }

    auto identity = EffectiveIdentity::acquire(std::string("4294967296"), std::nullopt);
    REQUIRE_FALSE(identity.has_value());
    CHECK(identity.error().code == Error::Code::PreconditionFailed);
}

TEST_CASE("numeric ids need no database entry") {
    auto user = lookupUser("54321");
    REQUIRE(user.has_value());
    CHECK(user->uid == 54321);

    auto group = lookupGroup("54321");
    REQUIRE(group.has_value());
    CHECK(*group == 54321);

    auto zero = lookupUser("0");
    REQUIRE(zero.has_value());
    CHECK(zero->uid == 0);
}

TEST_CASE("switching to the current identity changes nothing") {
    auto sink  = std::make_shared<MemoryLogSink>();
    auto uid   = ::geteuid();
    auto gid   = ::getegid();
    auto guard = EffectiveIdentity::acquire(std::to_string(uid), std::to_string(gid), sink);
    REQUIRE(guard.has_value());
    CHECK(guard->active());
    CHECK(sink->contains(LogLevel::Verbose, "no changes required"));

    auto moved = std::move(*guard);
    CHECK(moved.active());
    CHECK_FALSE(guard->active());

    REQUIRE(moved.restore().has_value());
    CHECK_FALSE(moved.active());
    REQUIRE(moved.restore().has_value());

    CHECK(::geteuid() == uid);
    CHECK(::getegid() == gid);
}

TEST_CASE("runAs returns the result of the callback") {
    auto const uid   = std::to_string(::geteuid());
    auto const gid   = std::to_string(::getegid());
    int        calls = 0;

    auto ok = runAs(uid, gid, [&]() -> Expected<void> {
        ++calls;
        return {};
    });
    CHECK(ok.has_value());

    auto failed = runAs(uid, gid, [&]() -> Expected<void> {
        ++calls;
        return std::unexpected(Error{Error::Code::SystemError, "inner"});
    });
    REQUIRE_FALSE(failed.has_value());
    CHECK(*failed.error().message == "inner");
    CHECK(calls == 2);

    auto unknown = runAs(std::string("pathcheck-no-such-user"), std::nullopt, [&]() -> Expected<void> {
        ++calls;
        return {};
    });
    REQUIRE_FALSE(unknown.has_value());
    CHECK(calls == 2);
}
}
