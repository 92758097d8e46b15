// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "metrics/registry.hpp"

#include "metrics/exporter.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"

namespace tarpit {
namespace metrics {

const char* ToString(RegistryError error) {
  switch (error) {
  case RegistryError::InvalidToken:
    return "Invalid Token";
  case RegistryError::AlreadyDisconnected:
    return "Already Disconnected";
  }
  return "Unknown";
}

AggregateStats RegistrySnapshot::total() const {
  AggregateStats total = former;
  total.Merge(live);
  return total;
}

MetricsRegistry::MetricsRegistry(std::chrono::steady_clock::time_point startup) : startup_(startup) {}

ConnectResult MetricsRegistry::Connect(size_t max_clients, std::chrono::steady_clock::time_point start) {
  connections_total_.fetch_add(1, std::memory_order_relaxed);

  const size_t connected = connections_count_.fetch_add(1, std::memory_order_relaxed) + 1;
  if (connected > max_clients) {
    connections_count_.fetch_sub(1, std::memory_order_relaxed);
    return Rejected{connected};
  }

  ClientRecord record;
  record.start = start;

  size_t slot = 0;
  {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    slot = clients_.Insert(record);
  }
  return Admitted{connected, Token(slot)};
}

DisconnectResult MetricsRegistry::Disconnect(const Token& token) {
  std::lock_guard<std::mutex> clients_lock(clients_mutex_);

  if (!clients_.InRange(token.slot())) {
    return RegistryError::InvalidToken;
  }
  auto record = clients_.Take(token.slot());
  if (!record) {
    return RegistryError::AlreadyDisconnected;
  }

  const uint64_t duration = util::SecondsSince(record->start);
  {
    std::lock_guard<std::mutex> former_lock(former_mutex_);
    former_.Add(duration, *record);
  }

  const size_t connected = connections_count_.fetch_sub(1, std::memory_order_relaxed) - 1;
  return Disconnected{connected, duration};
}

template <typename Fn>
std::optional<RegistryError> MetricsRegistry::WithClient(const Token& token, Fn&& fn) {
  std::lock_guard<std::mutex> lock(clients_mutex_);
  if (!clients_.InRange(token.slot())) {
    return RegistryError::InvalidToken;
  }
  ClientRecord* record = clients_.Get(token.slot());
  if (record == nullptr) {
    return RegistryError::AlreadyDisconnected;
  }
  fn(*record);
  return std::nullopt;
}

std::optional<RegistryError> MetricsRegistry::Record(const Token& token, ClientEvent event) {
  return WithClient(token, [event](ClientRecord& record) {
    switch (event) {
    case ClientEvent::ChunkSent:
      ++record.sent_chunks;
      break;
    case ClientEvent::EasterEggSent:
      ++record.sent_eastereggs;
      break;
    case ClientEvent::BannerSent:
      ++record.sent_banners;
      break;
    }
  });
}

RegistrySnapshot MetricsRegistry::Snapshot() const {
  RegistrySnapshot snapshot;

  std::lock_guard<std::mutex> clients_lock(clients_mutex_);
  // Live durations are recomputed on every call, never cached
  clients_.ForEach([&snapshot](size_t, const ClientRecord& record) {
    snapshot.live.Add(util::SecondsSince(record.start), record);
  });

  {
    std::lock_guard<std::mutex> former_lock(former_mutex_);
    snapshot.former = former_;
  }

  snapshot.uptime_seconds = util::SecondsSince(startup_);
  snapshot.connections_count = connections_count_.load(std::memory_order_relaxed);
  snapshot.connections_total = connections_total_.load(std::memory_order_relaxed);
  return snapshot;
}

std::string MetricsRegistry::Export() const {
  auto snapshot = Snapshot();
  LOG_METRICS_DEBUG("export, clients: {}, total: {}", snapshot.connections_count, snapshot.connections_total);
  return RenderSnapshot(snapshot);
}

size_t MetricsRegistry::slot_capacity() const {
  std::lock_guard<std::mutex> lock(clients_mutex_);
  return clients_.Size();
}

}  // namespace metrics
}  // namespace tarpit
