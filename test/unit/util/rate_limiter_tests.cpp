// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Tests for the per-callsite log budget

#include <catch2/catch_test_macros.hpp>

#include "util/rate_limiter.hpp"
#include "util/time.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace tarpit::util;

TEST_CASE("RateLimiter: Burst capacity", "[util][rate_limiter]") {
    RateLimiter limiter;

    SECTION("First N messages allowed") {
        for (int i = 0; i < 200; ++i) {
            REQUIRE(limiter.should_log("accept:1", 200, 3600));
        }
        REQUIRE_FALSE(limiter.should_log("accept:1", 200, 3600));
    }

    SECTION("Different callsites have independent buckets") {
        for (int i = 0; i < 200; ++i) {
            limiter.should_log("accept:1", 200, 3600);
        }
        REQUIRE_FALSE(limiter.should_log("accept:1", 200, 3600));
        REQUIRE(limiter.should_log("accept:2", 200, 3600));
    }

    SECTION("Non-positive limits never suppress") {
        for (int i = 0; i < 10; ++i) {
            CHECK(limiter.should_log("unlimited", 0, 3600));
            CHECK(limiter.should_log("unlimited", 5, 0));
        }
    }
}

TEST_CASE("RateLimiter: Token refill over time", "[util][rate_limiter]") {
    MockTimeScope mock_time(1000000);
    RateLimiter limiter;

    SECTION("One token back after one refill interval") {
        // 10 tokens per 100 seconds: one token every 10 seconds
        for (int i = 0; i < 10; ++i) {
            limiter.should_log("refill", 10, 100);
        }
        REQUIRE_FALSE(limiter.should_log("refill", 10, 100));

        SetMockTime(1000005);
        REQUIRE_FALSE(limiter.should_log("refill", 10, 100));

        SetMockTime(1000010);
        REQUIRE(limiter.should_log("refill", 10, 100));
        REQUIRE_FALSE(limiter.should_log("refill", 10, 100));
    }

    SECTION("Partial refills accumulate") {
        for (int i = 0; i < 10; ++i) {
            limiter.should_log("partial", 10, 100);
        }
        // Two 5 second steps add up to one token
        SetMockTime(1000005);
        REQUIRE_FALSE(limiter.should_log("partial", 10, 100));
        SetMockTime(1000010);
        REQUIRE(limiter.should_log("partial", 10, 100));
    }

    SECTION("Tokens cap at burst limit") {
        for (int i = 0; i < 5; ++i) {
            limiter.should_log("cap", 5, 1);
        }
        SetMockTime(1000010);
        for (int i = 0; i < 5; ++i) {
            REQUIRE(limiter.should_log("cap", 5, 1));
        }
        REQUIRE_FALSE(limiter.should_log("cap", 5, 1));
    }
}

TEST_CASE("RateLimiter: Scanner flood", "[util][rate_limiter]") {
    RateLimiter limiter;

    int logged_count = 0;
    for (int i = 0; i < 1000; ++i) {
        if (limiter.should_log("handle_accept:flood", 200, 3600)) {
            logged_count++;
        }
    }
    REQUIRE(logged_count == 200);
}

TEST_CASE("RateLimiter: Thread safety", "[util][rate_limiter][threading]") {
    RateLimiter limiter;

    const int num_threads = 4;
    const int attempts_per_thread = 100;
    std::atomic<int> logged_count{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&limiter, &logged_count]() {
            for (int i = 0; i < attempts_per_thread; ++i) {
                if (limiter.should_log("thread_test", 200, 3600)) {
                    logged_count++;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    // 400 attempts against a 200 token bucket, refill negligible
    REQUIRE(logged_count.load() <= 201);
    REQUIRE(logged_count.load() >= 200);
}
