// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/rate_limiter.hpp"

#include "util/time.hpp"

#include <algorithm>

namespace tarpit {
namespace util {

namespace {
constexpr int64_t kMilli = 1000;
}  // namespace

bool RateLimiter::should_log(const std::string& callsite_key, int tokens_per_period, int period_seconds) {
  if (tokens_per_period <= 0 || period_seconds <= 0) {
    return true;
  }

  std::lock_guard<std::mutex> lock(mutex_);

  const auto now = GetSteadyTime();
  const int64_t capacity = static_cast<int64_t>(tokens_per_period) * kMilli;
  auto& bucket = buckets_[callsite_key];

  if (!bucket.initialized) {
    bucket.millitokens = capacity;
    bucket.last_refill = now;
    bucket.initialized = true;
  }

  const auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(now - bucket.last_refill).count();
  if (elapsed_ms > 0) {
    // tokens_per_period tokens per period_seconds * 1000 ms
    const int64_t refill = elapsed_ms * tokens_per_period / period_seconds;
    if (refill > 0) {
      bucket.millitokens = std::min(bucket.millitokens + refill, capacity);
      bucket.last_refill = now;
    }
  }

  if (bucket.millitokens >= kMilli) {
    bucket.millitokens -= kMilli;
    return true;
  }
  return false;
}

RateLimiter& RateLimiter::instance() {
  static RateLimiter instance;
  return instance;
}

}  // namespace util
}  // namespace tarpit
