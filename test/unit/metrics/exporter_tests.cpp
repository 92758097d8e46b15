// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for the text exposition of registry snapshots

#include <catch2/catch_test_macros.hpp>

#include "metrics/exporter.hpp"
#include "metrics/registry.hpp"
#include "util/time.hpp"

#include <limits>
#include <sstream>
#include <string>
#include <vector>

using namespace tarpit::metrics;
using tarpit::util::GetSteadyTime;
using tarpit::util::MockTimeScope;
using tarpit::util::SetMockTime;

namespace {

std::vector<std::string> Lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

size_t CountPrefix(const std::vector<std::string>& lines, const std::string& prefix) {
    size_t n = 0;
    for (const auto& line : lines) {
        if (line.rfind(prefix, 0) == 0) {
            ++n;
        }
    }
    return n;
}

// Value of the first line that starts with "name " (exact metric name)
std::string ValueOf(const std::vector<std::string>& lines, const std::string& name) {
    for (const auto& line : lines) {
        if (line.rfind(name + " ", 0) == 0) {
            return line.substr(name.size() + 1);
        }
    }
    return "<missing>";
}

size_t IndexOf(const std::string& text, const std::string& needle) {
    return text.find(needle);
}

}  // namespace

TEST_CASE("Exporter - Empty registry", "[metrics][exporter]") {
    RegistrySnapshot snapshot;
    const std::string text = RenderSnapshot(snapshot);
    const auto lines = Lines(text);

    SECTION("Fixed shape") {
        // 3 scalars + 3 populations x (6 scalars + 1 histogram)
        CHECK(CountPrefix(lines, "# HELP ") == 24);
        CHECK(CountPrefix(lines, "# TYPE ") == 24);
        CHECK(CountPrefix(lines, "client_connection_time_seconds_bucket{le=") == 32);
        CHECK(CountPrefix(lines, "former_connection_time_seconds_bucket{le=") == 32);
        CHECK(CountPrefix(lines, "total_connection_time_seconds_bucket{le=") == 32);
    }

    SECTION("Empty populations report zero minimum") {
        CHECK(ValueOf(lines, "client_minimum_connection_time_seconds") == "0");
        CHECK(ValueOf(lines, "former_minimum_connection_time_seconds") == "0");
        CHECK(ValueOf(lines, "total_minimum_connection_time_seconds") == "0");
        CHECK(ValueOf(lines, "connections_count") == "0");
        CHECK(ValueOf(lines, "connections_total") == "0");
    }

    SECTION("Header and value layout") {
        CHECK(text.rfind("# HELP uptime_seconds Number of seconds since startup.\n"
                         "# TYPE uptime_seconds gauge\n"
                         "uptime_seconds 0\n\n",
                         0) == 0);
        CHECK(text.find("# HELP connections_count Number of current connections.\n"
                        "# TYPE connections_count counter\n") != std::string::npos);
        CHECK(text.find("# HELP former_sent_eastereggs_sum Sum of sent eastereggs by former clients.\n") !=
              std::string::npos);
        CHECK(text.find("# HELP total_connection_time_seconds_sum Sum of connection time overall.\n") !=
              std::string::npos);
        CHECK(text.find("# HELP client_connection_time_seconds_bucket A histogram of the connection time of current "
                        "clients.\n# TYPE client_connection_time_seconds_bucket histogram\n") != std::string::npos);
    }

    SECTION("Bucket labels double") {
        CHECK(text.find("client_connection_time_seconds_bucket{le=0s} 0\n") != std::string::npos);
        CHECK(text.find("client_connection_time_seconds_bucket{le=1s} 0\n") != std::string::npos);
        CHECK(text.find("client_connection_time_seconds_bucket{le=3s} 0\n") != std::string::npos);
        CHECK(text.find("client_connection_time_seconds_bucket{le=1023s} 0\n") != std::string::npos);
        CHECK(text.find("client_connection_time_seconds_bucket{le=2147483647s} 0\n") != std::string::npos);
    }
}

TEST_CASE("Exporter - Section order", "[metrics][exporter]") {
    const std::string text = RenderSnapshot(RegistrySnapshot{});

    const std::vector<std::string> order = {
        "# HELP uptime_seconds ",
        "# HELP connections_count ",
        "# HELP connections_total ",
        "# HELP client_maximum_connection_time_seconds ",
        "# HELP client_minimum_connection_time_seconds ",
        "# HELP client_sent_chunks_sum ",
        "# HELP client_sent_eastereggs_sum ",
        "# HELP client_sent_banners_sum ",
        "# HELP client_connection_time_seconds_sum ",
        "# HELP client_connection_time_seconds_bucket ",
        "# HELP former_maximum_connection_time_seconds ",
        "# HELP former_connection_time_seconds_bucket ",
        "# HELP total_maximum_connection_time_seconds ",
        "# HELP total_connection_time_seconds_bucket ",
    };

    size_t previous = 0;
    for (const auto& needle : order) {
        INFO(needle);
        const size_t at = IndexOf(text, needle);
        REQUIRE(at != std::string::npos);
        CHECK(at >= previous);
        previous = at;
    }
}

TEST_CASE("Exporter - Values from a live registry", "[metrics][exporter]") {
    MockTimeScope mock(5'000'000);
    MetricsRegistry registry(GetSteadyTime());
    constexpr size_t kUnbounded = std::numeric_limits<size_t>::max();
    const auto now = GetSteadyTime();

    // One former client of 3s with 2 chunks, one live client of 1000s with 1 chunk
    auto gone = registry.Connect(kUnbounded, now - std::chrono::seconds(3));
    auto live = registry.Connect(kUnbounded, now - std::chrono::seconds(1000));
    REQUIRE(std::holds_alternative<Admitted>(gone));
    REQUIRE(std::holds_alternative<Admitted>(live));
    registry.RecordChunk(std::get<Admitted>(gone).token);
    registry.RecordChunk(std::get<Admitted>(gone).token);
    registry.RecordBanner(std::get<Admitted>(gone).token);
    registry.RecordChunk(std::get<Admitted>(live).token);
    REQUIRE(std::holds_alternative<Disconnected>(registry.Disconnect(std::get<Admitted>(gone).token)));

    const std::string text = registry.Export();
    const auto lines = Lines(text);

    CHECK(ValueOf(lines, "connections_count") == "1");
    CHECK(ValueOf(lines, "connections_total") == "2");

    CHECK(ValueOf(lines, "client_maximum_connection_time_seconds") == "1000");
    CHECK(ValueOf(lines, "client_minimum_connection_time_seconds") == "1000");
    CHECK(ValueOf(lines, "client_sent_chunks_sum") == "1");
    CHECK(ValueOf(lines, "former_maximum_connection_time_seconds") == "3");
    CHECK(ValueOf(lines, "former_sent_chunks_sum") == "2");
    CHECK(ValueOf(lines, "former_sent_banners_sum") == "1");
    CHECK(ValueOf(lines, "total_minimum_connection_time_seconds") == "3");
    CHECK(ValueOf(lines, "total_maximum_connection_time_seconds") == "1000");
    CHECK(ValueOf(lines, "total_sent_chunks_sum") == "3");
    CHECK(ValueOf(lines, "total_connection_time_seconds_sum") == "1003");

    SECTION("Histogram lines are cumulative") {
        // 3s lands in le=3s, 1000s in le=1023s
        CHECK(ValueOf(lines, "former_connection_time_seconds_bucket{le=1s}") == "0");
        CHECK(ValueOf(lines, "former_connection_time_seconds_bucket{le=3s}") == "1");
        CHECK(ValueOf(lines, "former_connection_time_seconds_bucket{le=2147483647s}") == "1");
        CHECK(ValueOf(lines, "client_connection_time_seconds_bucket{le=511s}") == "0");
        CHECK(ValueOf(lines, "client_connection_time_seconds_bucket{le=1023s}") == "1");
        CHECK(ValueOf(lines, "total_connection_time_seconds_bucket{le=3s}") == "1");
        CHECK(ValueOf(lines, "total_connection_time_seconds_bucket{le=1023s}") == "2");
        CHECK(ValueOf(lines, "total_connection_time_seconds_bucket{le=2147483647s}") == "2");
    }

    SECTION("Export is a pure read") {
        CHECK(registry.Export() == text);
        CHECK(registry.connections() == 1);
        CHECK(registry.connections_total() == 2);
    }

    SECTION("Live durations advance with the clock") {
        SetMockTime(5'000'010);
        const auto later = Lines(registry.Export());
        CHECK(ValueOf(later, "client_maximum_connection_time_seconds") == "1010");
        CHECK(ValueOf(later, "former_maximum_connection_time_seconds") == "3");
        CHECK(ValueOf(later, "uptime_seconds") == "10");
    }
}
