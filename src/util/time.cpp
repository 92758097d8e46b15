// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/time.hpp"

#include <atomic>
#include <mutex>

#include <spdlog/fmt/fmt.h>

namespace tarpit {
namespace util {

// 0 means mock time is disabled (use real time)
static std::atomic<int64_t> g_mock_time{0};

// Reference points used to simulate steady_clock while mocking.
// Protected by g_steady_mutex.
static std::mutex g_steady_mutex;
static std::chrono::steady_clock::time_point g_real_steady_reference;
static int64_t g_mock_steady_reference{0};
static bool g_steady_initialized{false};

std::chrono::steady_clock::time_point GetSteadyTime() {
  int64_t mock = g_mock_time.load(std::memory_order_relaxed);
  if (mock != 0) {
    std::lock_guard<std::mutex> lock(g_steady_mutex);

    if (!g_steady_initialized) {
      g_real_steady_reference = std::chrono::steady_clock::now();
      g_mock_steady_reference = mock;
      g_steady_initialized = true;
    }

    return g_real_steady_reference + std::chrono::seconds(mock - g_mock_steady_reference);
  }

  return std::chrono::steady_clock::now();
}

void SetMockTime(int64_t time) {
  g_mock_time.store(time, std::memory_order_relaxed);

  // Keep the reference point while mock time moves so offsets stay valid;
  // reset it only when mocking is switched off.
  if (time == 0) {
    std::lock_guard<std::mutex> lock(g_steady_mutex);
    g_steady_initialized = false;
  }
}

int64_t GetMockTime() {
  return g_mock_time.load(std::memory_order_relaxed);
}

uint64_t SecondsSince(std::chrono::steady_clock::time_point start) {
  const auto now = GetSteadyTime();
  if (now <= start) {
    return 0;
  }
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(now - start).count());
}

std::string FormatDuration(std::chrono::steady_clock::duration elapsed) {
  using namespace std::chrono;
  const double secs = duration<double>(elapsed).count();
  if (secs < 1.0) {
    return fmt::format("{:.2f}ms", secs * 1000.0);
  }
  return fmt::format("{:.2f}s", secs);
}

}  // namespace util
}  // namespace tarpit
