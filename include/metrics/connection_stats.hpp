// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <limits>

namespace tarpit {
namespace metrics {

// Number of power-of-two connection time buckets
inline constexpr size_t kHistogramBuckets = 32;

// Bucket for a connection that lasted `seconds`: the 1-based position of the
// highest set bit, so 0 -> 0, 1 -> 1, 2..3 -> 2, 4..7 -> 3, ...
// Durations past the last bucket are clamped into it.
size_t HistogramBucket(uint64_t seconds) noexcept;

// Inclusive upper bound (in seconds) of a bucket: 2^bucket - 1
uint64_t BucketUpperBound(size_t bucket) noexcept;

// One live connection
struct ClientRecord {
  std::chrono::steady_clock::time_point start{};
  uint64_t sent_chunks{0};
  uint64_t sent_eastereggs{0};
  uint64_t sent_banners{0};
};

/**
 * AggregateStats - running totals over a population of connections
 *
 * Used twice by the registry: once for clients that already left ("former",
 * accumulated at each disconnect) and once, rebuilt on every export, over the
 * clients still connected.
 */
struct AggregateStats {
  uint64_t maximum_connection_time{0};
  // "Infinite" until the first sample
  uint64_t minimum_connection_time{std::numeric_limits<uint64_t>::max()};
  std::array<uint64_t, kHistogramBuckets> connection_time_buckets{};
  uint64_t connection_time_sum{0};
  uint64_t sent_chunks_sum{0};
  uint64_t sent_eastereggs_sum{0};
  uint64_t sent_banners_sum{0};
  uint64_t samples{0};

  // Fold one connection of `duration_seconds` with the counters of `client`
  void Add(uint64_t duration_seconds, const ClientRecord& client);

  // Combine two populations
  void Merge(const AggregateStats& other);

  bool empty() const { return samples == 0; }

  // Minimum for display: 0 for an empty population
  uint64_t minimum_or_zero() const { return empty() ? 0 : minimum_connection_time; }
};

}  // namespace metrics
}  // namespace tarpit
