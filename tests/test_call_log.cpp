#include <catch2/catch_test_macros.hpp>

#include "test_support.hpp"
#include "voice_relay/call/call_log.hpp"
#include "voice_relay/call/session.hpp"

#include <regex>
#include <string>

using voice_relay::call::CallLog;
using voice_relay::call::CallLogRegistry;
using voice_relay::call::CallSession;
using voice_relay::testing::TempDir;
using voice_relay::testing::read_file;

TEST_CASE("call log file is named after the timestamp and stream id") {
    TempDir dir;
    CallLogRegistry registry(dir.path(), spdlog::level::info);
    const auto log = registry.open("CA123");

    REQUIRE(log.is_open());
    REQUIRE(log.path().parent_path() == dir.path());
    const std::regex expected(R"(call_\d{8}_\d{6}_CA123\.log)");
    REQUIRE(std::regex_match(log.path().filename().string(), expected));
    REQUIRE(std::filesystem::exists(log.path()));
}

TEST_CASE("entries land in the call's own file with their level") {
    TempDir dir;
    CallLogRegistry registry(dir.path(), spdlog::level::info);
    const auto log = registry.open("CA123");
    log.info("Call started - Stream SID: CA123");
    log.debug("hidden at info level");
    log.error("something broke");
    log.flush();

    const auto contents = read_file(log.path());
    REQUIRE(contents.find(" - info - Call started - Stream SID: CA123") != std::string::npos);
    REQUIRE(contents.find(" - error - something broke") != std::string::npos);
    REQUIRE(contents.find("hidden at info level") == std::string::npos);
}

TEST_CASE("debug entries are written when the call log level allows them") {
    TempDir dir;
    CallLogRegistry registry(dir.path(), spdlog::level::debug);
    const auto log = registry.open("CA9");
    log.debug("Audio payload size: 4");
    log.flush();
    REQUIRE(read_file(log.path()).find(" - debug - Audio payload size: 4") != std::string::npos);
}

TEST_CASE("two calls never share a destination") {
    TempDir dir;
    CallLogRegistry registry(dir.path(), spdlog::level::info);
    const auto first = registry.open("CA123");
    const auto second = registry.open("CA123");
    const auto other = registry.open("CA456");

    REQUIRE(first.path() != second.path());
    REQUIRE(first.path() != other.path());
    REQUIRE(dir.files().size() == 3);
}

TEST_CASE("stream ids are made safe for file names") {
    REQUIRE(voice_relay::call::sanitize_stream_id("MZ1-ab_2") == "MZ1-ab_2");
    REQUIRE(voice_relay::call::sanitize_stream_id("../x y") == "___x_y");
    REQUIRE(voice_relay::call::sanitize_stream_id("") == "unknown");
}

TEST_CASE("an unopened call log ignores every write") {
    CallLog log;
    REQUIRE_FALSE(log.is_open());
    log.info("dropped");
    log.debug("dropped");
    log.error("dropped");
    log.flush();
    REQUIRE(log.path().empty());
}

TEST_CASE("call session keeps the first stream and closes its log") {
    TempDir dir;
    CallLogRegistry registry(dir.path(), spdlog::level::info);
    CallSession session;
    REQUIRE_FALSE(session.has_started());
    REQUIRE_FALSE(session.log().is_open());

    REQUIRE(session.start("S1", registry.open("S1")));
    REQUIRE(session.stream_id() == std::optional<std::string>("S1"));
    REQUIRE(session.started_at().has_value());
    REQUIRE_FALSE(session.start("S2", CallLog()));
    REQUIRE(session.stream_id() == std::optional<std::string>("S1"));

    const auto path = session.log().path();
    session.log().info("before close");
    session.close_log();
    session.log().info("after close");
    REQUIRE_FALSE(session.log().is_open());

    const auto contents = read_file(path);
    REQUIRE(contents.find("before close") != std::string::npos);
    REQUIRE(contents.find("after close") == std::string::npos);
}
