// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for the mockable clocks

#include <catch2/catch_test_macros.hpp>

#include "util/time.hpp"

#include <chrono>

using namespace tarpit::util;
using namespace std::chrono_literals;

TEST_CASE("Time - Mock time drives the steady clock", "[util][time]") {
    MockTimeScope mock(1'700'000'000);
    CHECK(GetMockTime() == 1'700'000'000);

    const auto start = GetSteadyTime();
    CHECK(SecondsSince(start) == 0);

    SetMockTime(1'700'000'090);
    CHECK(SecondsSince(start) == 90);
    CHECK(GetSteadyTime() - start == std::chrono::seconds(90));
}

TEST_CASE("Time - MockTimeScope restores the previous value", "[util][time]") {
    REQUIRE(GetMockTime() == 0);
    {
        MockTimeScope outer(1000);
        {
            MockTimeScope inner(2000);
            CHECK(GetMockTime() == 2000);
        }
        CHECK(GetMockTime() == 1000);
    }
    CHECK(GetMockTime() == 0);
}

TEST_CASE("Time - SecondsSince is never negative", "[util][time]") {
    const auto future = GetSteadyTime() + std::chrono::hours(1);
    CHECK(SecondsSince(future) == 0);
}

TEST_CASE("Time - FormatDuration", "[util][time]") {
    CHECK(FormatDuration(0ms) == "0.00ms");
    CHECK(FormatDuration(850ms) == "850.00ms");
    CHECK(FormatDuration(1500us) == "1.50ms");
    CHECK(FormatDuration(1s) == "1.00s");
    CHECK(FormatDuration(12340ms) == "12.34s");
    CHECK(FormatDuration(3600s) == "3600.00s");
}
