#include <pathcheck/config/PathCheckConfig.hpp>

#include "log/FileLogSink.hpp"
#include "log/TaggedLogSink.hpp"
#include "unit/PathCheckTestHelper.hpp"

#include <doctest/doctest.h>

#include <cstdlib>

using namespace PC;
using PC::Testing::ScratchDir;
using PC::Testing::writeFile;

namespace {

// Sets an environment variable for the lifetime of the guard.
class ScopedEnv {
public:
    ScopedEnv(char const* name, char const* value) : name_(name) {
        if (char const* old = std::getenv(name))
            previous_ = std::string(old);
        ::setenv(name, value, 1);
    }
    ~ScopedEnv() {
        if (previous_)
            ::setenv(name_, previous_->c_str(), 1);
        else
            ::unsetenv(name_);
    }

private:
    char const*                name_;
    std::optional<std::string> previous_;
};

} // namespace

TEST_SUITE("config.pathcheck") {
TEST_CASE("parseConfig reads every key") {
    auto config = parseConfig(R"({
        "simulate": true,
        "backup": ".prev",
        "log": { "file": "/var/log/pc.log", "mode": "write", "timestamp": true, "debug": 2 },
        "ignored": 42
    })");
    REQUIRE(config.has_value());
    CHECK(config->simulate);
    REQUIRE(config->backup.has_value());
    CHECK(*config->backup == ".prev");
    REQUIRE(config->logFile.has_value());
    CHECK(*config->logFile == "/var/log/pc.log");
    CHECK(config->logMode == LogFileMode::Write);
    CHECK(config->logTimestamp);
    CHECK(config->debugLevel == 2);
}

TEST_CASE("parseConfig defaults") {
    auto config = parseConfig("{}");
    REQUIRE(config.has_value());
    CHECK_FALSE(config->simulate);
    CHECK_FALSE(config->backup.has_value());
    CHECK_FALSE(config->logFile.has_value());
    CHECK(config->logMode == LogFileMode::Append);
    CHECK_FALSE(config->logTimestamp);
    CHECK(config->debugLevel == 0);
}

TEST_CASE("parseConfig rejects malformed input") {
    for (auto text : {"not json", "[1, 2]", R"({"simulate": "yes"})", R"({"backup": 3})", R"({"log": []})",
                      R"({"log": {"mode": "rotate"}})", R"({"log": {"debug": 1.5}})"}) {
        CAPTURE(text);
        auto config = parseConfig(text);
        REQUIRE_FALSE(config.has_value());
        CHECK(config.error().code == Error::Code::MalformedInput);
    }
}

TEST_CASE("loadConfig") {
    ScratchDir scratch("pc_config");

    auto const good = scratch.path("good.json");
    writeFile(good, R"({"backup": ".old"})");
    auto loaded = loadConfig(good);
    REQUIRE(loaded.has_value());
    CHECK(loaded->backup == std::optional<std::string>(".old"));

    auto const bad = scratch.path("bad.json");
    writeFile(bad, "{");
    auto broken = loadConfig(bad);
    REQUIRE_FALSE(broken.has_value());
    CHECK(broken.error().code == Error::Code::MalformedInput);
    CHECK(broken.error().message->starts_with(bad));

    auto missing = loadConfig(scratch.path("missing.json"));
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().code == Error::Code::SystemError);
}

TEST_CASE("applyEnvironment overrides the configuration") {
    PathCheckConfig config;

    SUBCASE("simulate and backup") {
        ScopedEnv noaction("PATHCHECK_NOACTION", "1");
        ScopedEnv backup("PATHCHECK_BACKUP", ".env");
        applyEnvironment(config);
        CHECK(config.simulate);
        CHECK(config.backup == std::optional<std::string>(".env"));
    }

    SUBCASE("falsy NOACTION disables simulate") {
        config.simulate = true;
        ScopedEnv noaction("PATHCHECK_NOACTION", " Off ");
        applyEnvironment(config);
        CHECK_FALSE(config.simulate);
    }

    SUBCASE("debug level must be numeric") {
        {
            ScopedEnv debug("PATHCHECK_DEBUG", "3");
            applyEnvironment(config);
            CHECK(config.debugLevel == 3);
        }
        {
            ScopedEnv debug("PATHCHECK_DEBUG", "lots");
            applyEnvironment(config);
            CHECK(config.debugLevel == 3);
        }
    }

    SUBCASE("empty log file is ignored") {
        ScopedEnv logFile("PATHCHECK_LOG_FILE", "");
        applyEnvironment(config);
        CHECK_FALSE(config.logFile.has_value());
    }
}

TEST_CASE("makePathCheck wires the sink and defaults") {
    ScratchDir scratch("pc_config_make");

    SUBCASE("file sink") {
        PathCheckConfig config;
        config.simulate = true;
        config.backup   = ".prev";
        config.logFile  = scratch.path("pc.log");

        auto check = makePathCheck(config);
        REQUIRE(check.has_value());
        CHECK(check->simulate());
        CHECK(check->backup() == std::optional<std::string>(".prev"));
        CHECK(dynamic_cast<FileLogSink*>(check->sink().get()) != nullptr);
        CHECK(check->fileExists(scratch.path("pc.log")));
    }

    SUBCASE("tagged logger sink") {
        PathCheckConfig config;
        config.debugLevel = 2;
        auto check        = makePathCheck(config);
        REQUIRE(check.has_value());
        CHECK_FALSE(check->simulate());
        auto const* tagged = dynamic_cast<TaggedLogSink*>(check->sink().get());
        REQUIRE(tagged != nullptr);
        CHECK(tagged->debugLevel() == 2);
    }

    SUBCASE("unopenable log file") {
        PathCheckConfig config;
        config.logFile = scratch.path("missing/dir/pc.log");
        auto check     = makePathCheck(config);
        REQUIRE_FALSE(check.has_value());
        CHECK(check.error().code == Error::Code::SystemError);
    }
}
}
