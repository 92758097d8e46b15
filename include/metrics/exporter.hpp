// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "metrics/registry.hpp"

#include <string>

namespace tarpit {
namespace metrics {

/**
 * Render a registry snapshot as Prometheus-style text.
 *
 * Layout (fixed order, stable across calls):
 *   uptime_seconds, connections_count, connections_total
 *   then one block per population: client_*, former_*, total_*
 *     *_maximum_connection_time_seconds, *_minimum_connection_time_seconds,
 *     *_sent_chunks_sum, *_sent_eastereggs_sum, *_sent_banners_sum,
 *     *_connection_time_seconds_sum, *_connection_time_seconds_bucket{le=...}
 *
 * Every family carries "# HELP" and "# TYPE" lines. Histogram buckets are
 * cumulative, labelled le=0s, le=1s, le=3s, ... le=2147483647s.
 */
std::string RenderSnapshot(const RegistrySnapshot& snapshot);

}  // namespace metrics
}  // namespace tarpit
