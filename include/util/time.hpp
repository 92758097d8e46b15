// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace tarpit {
namespace util {

// Monotonic clock used for connection ages and uptime. When mock time is
// active it advances in lockstep with the mocked UNIX seconds.
std::chrono::steady_clock::time_point GetSteadyTime();

// Set mock time in UNIX seconds (0 disables mocking)
void SetMockTime(int64_t time);
int64_t GetMockTime();

// Whole seconds elapsed since `start` according to GetSteadyTime().
// Never negative.
uint64_t SecondsSince(std::chrono::steady_clock::time_point start);

// Render an elapsed duration for log lines: "850.00ms", "12.34s"
std::string FormatDuration(std::chrono::steady_clock::duration elapsed);

// RAII mock time for tests; restores the previous mock value on destruction
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time) : previous_(GetMockTime()) { SetMockTime(time); }
  ~MockTimeScope() { SetMockTime(previous_); }

  MockTimeScope(const MockTimeScope&) = delete;
  MockTimeScope& operator=(const MockTimeScope&) = delete;

private:
  int64_t previous_;
};

}  // namespace util
}  // namespace tarpit
