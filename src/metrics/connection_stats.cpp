// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "metrics/connection_stats.hpp"

#include <algorithm>
#include <bit>

namespace tarpit {
namespace metrics {

size_t HistogramBucket(uint64_t seconds) noexcept {
  // bit_width(0) is 0, so a zero-length connection lands in bucket 0 without
  // scanning an empty word
  const auto bucket = static_cast<size_t>(std::bit_width(seconds));
  return std::min(bucket, kHistogramBuckets - 1);
}

uint64_t BucketUpperBound(size_t bucket) noexcept {
  if (bucket >= 64) {
    return std::numeric_limits<uint64_t>::max();
  }
  return (uint64_t{1} << bucket) - 1;
}

void AggregateStats::Add(uint64_t duration_seconds, const ClientRecord& client) {
  maximum_connection_time = std::max(maximum_connection_time, duration_seconds);
  minimum_connection_time = std::min(minimum_connection_time, duration_seconds);
  connection_time_buckets[HistogramBucket(duration_seconds)] += 1;
  connection_time_sum += duration_seconds;
  sent_chunks_sum += client.sent_chunks;
  sent_eastereggs_sum += client.sent_eastereggs;
  sent_banners_sum += client.sent_banners;
  samples += 1;
}

void AggregateStats::Merge(const AggregateStats& other) {
  maximum_connection_time = std::max(maximum_connection_time, other.maximum_connection_time);
  minimum_connection_time = std::min(minimum_connection_time, other.minimum_connection_time);
  for (size_t i = 0; i < kHistogramBuckets; ++i) {
    connection_time_buckets[i] += other.connection_time_buckets[i];
  }
  connection_time_sum += other.connection_time_sum;
  sent_chunks_sum += other.sent_chunks_sum;
  sent_eastereggs_sum += other.sent_eastereggs_sum;
  sent_banners_sum += other.sent_banners_sum;
  samples += other.samples;
}

}  // namespace metrics
}  // namespace tarpit
