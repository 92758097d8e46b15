// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for daemon command line parsing

#include <catch2/catch_test_macros.hpp>

#include "app/command_line.hpp"

using namespace tarpit::app;

namespace {

ParseResult Parse(std::vector<std::string> args) {
    return ParseCommandLine(args);
}

}  // namespace

TEST_CASE("CLI: Defaults", "[cli]") {
    auto result = Parse({});
    REQUIRE(result.status == ParseStatus::Run);
    CHECK(result.config.listen == "0.0.0.0:2222");
    CHECK_FALSE(result.config.max_clients.has_value());
    CHECK(result.config.delay_seconds == 10);
    CHECK(result.config.verbosity == 0);
    CHECK_FALSE(result.config.log_file.has_value());
    CHECK_FALSE(result.config.metrics_listen.has_value());
    CHECK(result.config.easter_egg_every == 0);
    CHECK(result.config.io_threads == 1);
}

TEST_CASE("CLI: Short and long options", "[cli]") {
    SECTION("Separate values") {
        auto result = Parse({"-l", "127.0.0.1:2200", "-c", "50", "-d", "3", "-v"});
        REQUIRE(result.status == ParseStatus::Run);
        CHECK(result.config.listen == "127.0.0.1:2200");
        CHECK(result.config.max_clients == 50u);
        CHECK(result.config.delay_seconds == 3);
        CHECK(result.config.verbosity == 1);
    }

    SECTION("Inline values") {
        auto result = Parse({"--listen=[::1]:2200", "--max-clients=7", "--delay=1", "--metrics-listen=127.0.0.1:9090",
                             "--log-file=/tmp/tarpitd.log", "--threads=4", "--easter-egg-every=3"});
        REQUIRE(result.status == ParseStatus::Run);
        CHECK(result.config.listen == "[::1]:2200");
        CHECK(result.config.max_clients == 7u);
        CHECK(result.config.delay_seconds == 1);
        CHECK(result.config.metrics_listen == "127.0.0.1:9090");
        CHECK(result.config.log_file == "/tmp/tarpitd.log");
        CHECK(result.config.io_threads == 4);
        CHECK(result.config.easter_egg_every == 3);
    }

    SECTION("Verbosity accumulates") {
        CHECK(Parse({"-vv"}).config.verbosity == 2);
        CHECK(Parse({"-v", "-v", "-v"}).config.verbosity == 3);
        CHECK(Parse({"--verbose", "-vv"}).config.verbosity == 3);
    }

    SECTION("Zero max clients is accepted") {
        auto result = Parse({"-c", "0"});
        REQUIRE(result.status == ParseStatus::Run);
        CHECK(result.config.max_clients == 0u);
    }
}

TEST_CASE("CLI: Help and version", "[cli]") {
    CHECK(Parse({"-h"}).status == ParseStatus::ShowHelp);
    CHECK(Parse({"--help"}).status == ParseStatus::ShowHelp);
    CHECK(Parse({"-V"}).status == ParseStatus::ShowVersion);
    CHECK(Parse({"-d", "5", "--version"}).status == ParseStatus::ShowVersion);

    const std::string usage = Usage("tarpitd");
    CHECK(usage.find("--max-clients") != std::string::npos);
    CHECK(usage.find("--delay") != std::string::npos);
    // Zero is rejected by the parser, so the help says so
    CHECK(usage.find("Seconds between responses, >= 1") != std::string::npos);
    CHECK(Parse({"-d", "0"}).status == ParseStatus::Error);
    CHECK(VersionString().starts_with("tarpitd "));
}

TEST_CASE("CLI: Invalid arguments", "[cli]") {
    SECTION("Delay must be at least one second") {
        auto result = Parse({"-d", "0"});
        CHECK(result.status == ParseStatus::Error);
        CHECK(result.error == "invalid delay: 0");
    }

    SECTION("Non-numeric values") {
        CHECK(Parse({"-d", "ten"}).status == ParseStatus::Error);
        CHECK(Parse({"-c", "-1"}).status == ParseStatus::Error);
        CHECK(Parse({"--threads", "0"}).status == ParseStatus::Error);
        CHECK(Parse({"--threads", "1000"}).status == ParseStatus::Error);
    }

    SECTION("Missing values") {
        CHECK(Parse({"-l"}).status == ParseStatus::Error);
        CHECK(Parse({"--delay"}).status == ParseStatus::Error);
        CHECK(Parse({"--log-file="}).status == ParseStatus::Error);
    }

    SECTION("Bad addresses") {
        CHECK(Parse({"-l", "localhost:2222"}).status == ParseStatus::Error);
        CHECK(Parse({"-l", "::1:2222"}).status == ParseStatus::Error);
        CHECK(Parse({"--metrics-listen", "127.0.0.1"}).status == ParseStatus::Error);
    }

    SECTION("Unknown option") {
        auto result = Parse({"--frobnicate"});
        CHECK(result.status == ParseStatus::Error);
        CHECK(result.error == "unknown option: --frobnicate");
    }
}
