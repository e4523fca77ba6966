#include "PathCheck.hpp"
#include "log/FileLogSink.hpp"
#include "unit/PathCheckTestHelper.hpp"

#include <doctest/doctest.h>

#include <regex>

using namespace PC;
using PC::Testing::readFile;
using PC::Testing::ScratchDir;
using PC::Testing::writeFile;

TEST_SUITE("log.file_sink") {
TEST_CASE("FileLogSink writes one tagged line per message") {
    ScratchDir scratch("pc_filelog");
    auto const path = scratch.path("run.log");

    auto sink = FileLogSink::open(path);
    REQUIRE(sink.has_value());
    (*sink)->log(LogLevel::Info, "hello");
    (*sink)->log(LogLevel::Verbose, "already terminated\n");
    (*sink)->log(LogLevel::Error, "oops");

    CHECK(readFile(path) == "[INFO] hello\n[VERB] already terminated\n[ERROR] oops\n");
    CHECK((*sink)->close());
    CHECK_FALSE((*sink)->close());

    // Closed sinks drop messages.
    (*sink)->log(LogLevel::Info, "dropped");
    CHECK(readFile(path).find("dropped") == std::string::npos);
}

TEST_CASE("FileLogSink append and write modes") {
    ScratchDir scratch("pc_filelog_modes");
    auto const path = scratch.path("run.log");
    writeFile(path, "[INFO] earlier\n");

    SUBCASE("append keeps the existing content") {
        auto sink = FileLogSink::open(path);
        REQUIRE(sink.has_value());
        (*sink)->log(LogLevel::Info, "later");
        CHECK(readFile(path) == "[INFO] earlier\n[INFO] later\n");
    }

    SUBCASE("write rotates the existing file to .prev") {
        FileLogOptions options;
        options.mode = LogFileMode::Write;
        auto sink    = FileLogSink::open(path, options);
        REQUIRE(sink.has_value());
        (*sink)->log(LogLevel::Info, "fresh");
        CHECK(readFile(path) == "[INFO] fresh\n");
        CHECK(readFile(path + ".prev") == "[INFO] earlier\n");
    }
}

TEST_CASE("FileLogSink timestamps") {
    ScratchDir scratch("pc_filelog_ts");
    auto const path = scratch.path("run.log");

    FileLogOptions options;
    options.timestamp = true;
    auto sink         = FileLogSink::open(path, options);
    REQUIRE(sink.has_value());
    (*sink)->log(LogLevel::Warn, "stamped");

    std::regex const line(R"(^\d{4}/\d{2}/\d{2}-\d{2}:\d{2}:\d{2} \[WARN\] stamped\n$)");
    CHECK(std::regex_match(readFile(path), line));
}

TEST_CASE("FileLogSink open failures") {
    ScratchDir scratch("pc_filelog_fail");

    auto empty = FileLogSink::open("");
    REQUIRE_FALSE(empty.has_value());
    CHECK(empty.error().code == Error::Code::InvalidPath);

    auto missingDir = FileLogSink::open(scratch.path("no/such/dir/run.log"));
    REQUIRE_FALSE(missingDir.has_value());
    CHECK(missingDir.error().code == Error::Code::SystemError);
    CHECK(missingDir.error().message->starts_with("Open for append"));
}

TEST_CASE("FileLogSink syslog name") {
    ScratchDir scratch("pc_filelog_name");

    auto withSuffix = FileLogSink::open(scratch.path("agent.log"));
    REQUIRE(withSuffix.has_value());
    REQUIRE((*withSuffix)->syslogName().has_value());
    CHECK(*(*withSuffix)->syslogName() == "agent");

    auto without = FileLogSink::open(scratch.path("agent.txt"));
    REQUIRE(without.has_value());
    CHECK_FALSE((*without)->syslogName().has_value());
}

TEST_CASE("PathCheck filters debug messages by the sink level") {
    ScratchDir scratch("pc_filelog_debug");
    auto const quietPath = scratch.path("quiet.log");
    auto const chattyPath = scratch.path("chatty.log");

    FileLogOptions chattyOptions;
    chattyOptions.debugLevel = 1;

    auto quiet  = FileLogSink::open(quietPath);
    auto chatty = FileLogSink::open(chattyPath, chattyOptions);
    REQUIRE(quiet.has_value());
    REQUIRE(chatty.has_value());

    PathCheck quietCheck(*quiet);
    PathCheck chattyCheck(*chatty);
    REQUIRE(quietCheck.directory(scratch.root()).has_value());
    REQUIRE(chattyCheck.directory(scratch.root()).has_value());

    CHECK(readFile(quietPath).empty());
    CHECK(readFile(chattyPath).find("[DEBUG] Directory " + scratch.root() + " already exists") != std::string::npos);
}
}
