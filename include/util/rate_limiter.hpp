// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Per-callsite log budget

#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace tarpit {
namespace util {

/**
 * RateLimiter - Token bucket for log callsites
 *
 * Every callsite starts with a full bucket of tokens_per_period tokens and
 * regains them linearly over period_seconds. A message is logged only if a
 * whole token is available.
 *
 * A tarpit is by definition exposed to hostile scanners; anything they can
 * trigger at line rate (accept errors, broken peers) is logged through this.
 */
class RateLimiter {
public:
  // Returns true if the message at callsite_key may be logged now.
  bool should_log(const std::string& callsite_key, int tokens_per_period, int period_seconds);

  // Process-wide instance used by the LOG_*_RL macros.
  static RateLimiter& instance();

private:
  struct TokenBucket {
    // Tokens are kept in millitokens so partial refills are not lost
    int64_t millitokens{0};
    std::chrono::steady_clock::time_point last_refill{};
    bool initialized{false};
  };

  std::mutex mutex_;
  std::unordered_map<std::string, TokenBucket> buckets_;
};

}  // namespace util
}  // namespace tarpit
