// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "metrics/exporter.hpp"

#include <iterator>
#include <string_view>

#include <spdlog/fmt/fmt.h>

namespace tarpit {
namespace metrics {

namespace {

struct Population {
  std::string_view prefix;
  // Completes "Length in seconds of longest connection ..."
  std::string_view by;
  // Completes "Sum of connection time ..."
  std::string_view of;
};

constexpr Population kCurrent{"client", "by current clients", "of current clients"};
constexpr Population kFormer{"former", "by former clients", "of former clients"};
constexpr Population kTotal{"total", "overall", "overall"};

void WriteHeader(std::string& out, std::string_view name, std::string_view type, std::string_view help) {
  fmt::format_to(std::back_inserter(out), "# HELP {} {}\n# TYPE {} {}\n", name, help, name, type);
}

void WriteValue(std::string& out, std::string_view name, std::string_view type, std::string_view help,
                uint64_t value) {
  WriteHeader(out, name, type, help);
  fmt::format_to(std::back_inserter(out), "{} {}\n\n", name, value);
}

void WritePopulation(std::string& out, const Population& pop, const AggregateStats& stats) {
  auto name = [&pop](std::string_view suffix) { return fmt::format("{}_{}", pop.prefix, suffix); };

  WriteValue(out, name("maximum_connection_time_seconds"), "counter",
             fmt::format("Length in seconds of longest connection {}.", pop.by), stats.maximum_connection_time);
  WriteValue(out, name("minimum_connection_time_seconds"), "counter",
             fmt::format("Length in seconds of shortest connection {}.", pop.by), stats.minimum_or_zero());
  WriteValue(out, name("sent_chunks_sum"), "counter", fmt::format("Sum of sent chunks {}.", pop.by),
             stats.sent_chunks_sum);
  WriteValue(out, name("sent_eastereggs_sum"), "counter", fmt::format("Sum of sent eastereggs {}.", pop.by),
             stats.sent_eastereggs_sum);
  WriteValue(out, name("sent_banners_sum"), "counter", fmt::format("Sum of sent banners {}.", pop.by),
             stats.sent_banners_sum);
  WriteValue(out, name("connection_time_seconds_sum"), "counter", fmt::format("Sum of connection time {}.", pop.of),
             stats.connection_time_sum);

  const std::string bucket_name = name("connection_time_seconds_bucket");
  WriteHeader(out, bucket_name, "histogram", fmt::format("A histogram of the connection time {}.", pop.of));
  uint64_t cumulative = 0;
  for (size_t i = 0; i < kHistogramBuckets; ++i) {
    cumulative += stats.connection_time_buckets[i];
    fmt::format_to(std::back_inserter(out), "{}{{le={}s}} {}\n", bucket_name, BucketUpperBound(i), cumulative);
  }
  out += '\n';
}

}  // namespace

std::string RenderSnapshot(const RegistrySnapshot& snapshot) {
  std::string out;
  out.reserve(16 * 1024);

  WriteValue(out, "uptime_seconds", "gauge", "Number of seconds since startup.", snapshot.uptime_seconds);
  WriteValue(out, "connections_count", "counter", "Number of current connections.", snapshot.connections_count);
  WriteValue(out, "connections_total", "counter", "Total number of connections.", snapshot.connections_total);

  WritePopulation(out, kCurrent, snapshot.live);
  WritePopulation(out, kFormer, snapshot.former);
  WritePopulation(out, kTotal, snapshot.total());

  return out;
}

}  // namespace metrics
}  // namespace tarpit
