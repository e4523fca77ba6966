#include "PathCheck.hpp"
#include "log/MemoryLogSink.hpp"
#include "unit/PathCheckTestHelper.hpp"

#include <doctest/doctest.h>

#include <string>
#include <sys/stat.h>
#include <unistd.h>

using namespace PC;
using PC::Testing::ScratchDir;
using PC::Testing::writeFile;

namespace {

using StatBuffer = struct stat;

auto statOf(std::string const& path) -> StatBuffer {
    StatBuffer st{};
    REQUIRE(::lstat(path.c_str(), &st) == 0);
    return st;
}

} // namespace

TEST_SUITE("fs.status") {
TEST_CASE("status sets the exact permission bits") {
    ScratchDir scratch("pc_status_mode");
    PathCheck  check;

    auto const file = scratch.path("file");
    writeFile(file, "x");
    REQUIRE(::chmod(file.c_str(), 0644) == 0);

    StatusOptions options;
    options.mode = 0600;

    auto changed = check.status(file, options);
    REQUIRE(changed.has_value());
    CHECK(*changed == Change::Changed);
    CHECK((statOf(file).st_mode & 07777) == 0600);

    auto same = check.status(file, options);
    REQUIRE(same.has_value());
    CHECK(*same == Change::Unchanged);

    // Bits outside 07777 are ignored.
    options.mode = S_IFREG | 0600;
    auto masked  = check.status(file, options);
    REQUIRE(masked.has_value());
    CHECK(*masked == Change::Unchanged);
}

TEST_CASE("status without attributes is unchanged") {
    ScratchDir scratch("pc_status_none");
    PathCheck  check;

    writeFile(scratch.path("file"), "x");
    auto result = check.status(scratch.path("file"));
    REQUIRE(result.has_value());
    CHECK(*result == Change::Unchanged);
}

TEST_CASE("status sets the modification time") {
    ScratchDir scratch("pc_status_mtime");
    PathCheck  check;

    auto const file = scratch.path("file");
    writeFile(file, "x");

    StatusOptions options;
    options.mtime = 1000000000;

    auto changed = check.status(file, options);
    REQUIRE(changed.has_value());
    CHECK(*changed == Change::Changed);
    CHECK(statOf(file).st_mtime == 1000000000);

    auto same = check.status(file, options);
    REQUIRE(same.has_value());
    CHECK(*same == Change::Unchanged);
}

TEST_CASE("status with the current owner and group is unchanged") {
    ScratchDir scratch("pc_status_owner");
    PathCheck  check;

    auto const file = scratch.path("file");
    writeFile(file, "x");
    auto const st = statOf(file);

    StatusOptions options;
    options.owner = std::to_string(st.st_uid);
    options.group = std::to_string(st.st_gid);

    auto result = check.status(file, options);
    REQUIRE(result.has_value());
    CHECK(*result == Change::Unchanged);
}

TEST_CASE("status accepts numeric ids without a database entry") {
    if (::geteuid() != 0) {
        MESSAGE("chown to an arbitrary id needs root, skipped");
        return;
    }
    ScratchDir scratch("pc_status_unmapped");
    PathCheck  check;

    auto const file = scratch.path("file");
    writeFile(file, "x");

    StatusOptions options;
    options.owner = "54321";
    options.group = "54321";

    auto changed = check.status(file, options);
    REQUIRE(changed.has_value());
    CHECK(*changed == Change::Changed);
    CHECK(statOf(file).st_uid == 54321);
    CHECK(statOf(file).st_gid == 54321);

    auto same = check.status(file, options);
    REQUIRE(same.has_value());
    CHECK(*same == Change::Unchanged);
}

TEST_CASE("status leaves symlink permissions alone") {
    ScratchDir scratch("pc_status_symlink");
    auto       sink = std::make_shared<MemoryLogSink>();
    PathCheck  check(sink);

    auto const target = scratch.path("target");
    auto const link   = scratch.path("link");
    writeFile(target, "x");
    REQUIRE(::chmod(target.c_str(), 0644) == 0);
    REQUIRE(::symlink(target.c_str(), link.c_str()) == 0);

    StatusOptions options;
    options.mode = 0600;

    auto result = check.status(link, options);
    REQUIRE(result.has_value());
    CHECK(*result == Change::Unchanged);
    CHECK((statOf(target).st_mode & 07777) == 0644);
    CHECK(sink->contains(LogLevel::Debug, "mode does not apply to symlink"));
}

TEST_CASE("status failures") {
    ScratchDir scratch("pc_status_fail");
    PathCheck  check;

    SUBCASE("missing path") {
        auto result = check.status(scratch.path("missing"));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == Error::Code::NoSuchPath);
        CHECK_FALSE(check.anyExists(scratch.path("missing")));
    }

    SUBCASE("ids outside the uid range never wrap to root") {
        auto const file = scratch.path("file");
        writeFile(file, "x");
        auto const before = statOf(file);

        StatusOptions ownerOptions;
        ownerOptions.owner = "4294967296";
        auto owner         = check.status(file, ownerOptions);
        REQUIRE_FALSE(owner.has_value());
        CHECK(owner.error().code == Error::Code::PreconditionFailed);

        StatusOptions groupOptions;
        groupOptions.group = "4294967296";
        auto group         = check.status(file, groupOptions);
        REQUIRE_FALSE(group.has_value());
        CHECK(group.error().code == Error::Code::PreconditionFailed);

        auto const after = statOf(file);
        CHECK(after.st_uid == before.st_uid);
        CHECK(after.st_gid == before.st_gid);
    }

    SUBCASE("unknown owner") {
        writeFile(scratch.path("file"), "x");
        StatusOptions options;
        options.owner = "pathcheck-no-such-user";
        auto result   = check.status(scratch.path("file"), options);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == Error::Code::PreconditionFailed);
        REQUIRE(check.lastFailure().has_value());
    }
}
}
