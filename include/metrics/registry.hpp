// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 MetricsRegistry - live connection table, admission control and statistics

 Purpose
 - Decide whether a newly accepted connection may stay (max_clients ceiling)
 - Keep one ClientRecord per admitted connection, addressed by a Token
 - Fold every finished connection into the permanent "former" aggregate
 - Produce consistent snapshots (live + former) for the exporter

 Admission
 - connections_total_ counts every attempt, admitted or not
 - connections_count_ is the one live count: incremented optimistically,
   compared against max_clients and rolled back on rejection. Two racing
   Connect() calls near the limit may both pass; the ceiling is best-effort.
 - The rejection path never takes a lock

 Threading
 - clients_mutex_ guards the slot table, former_mutex_ guards former_
 - Lock order is always clients_mutex_ then former_mutex_
 - No lock is held across I/O; callers only hold them for one operation
 - connections() / connections_total() are lock-free approximate reads

 Tokens
 - A Token names a slot; it is valid until Disconnect() on it returns.
   Afterwards the slot may be handed to another connection, so callers must
   drop the token after disconnecting.
*/

#include "metrics/connection_stats.hpp"
#include "metrics/slot_table.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <variant>

namespace tarpit {
namespace metrics {

class Token {
public:
  explicit Token(size_t slot) : slot_(slot) {}

  size_t slot() const { return slot_; }

  bool operator==(const Token& other) const = default;

private:
  size_t slot_;
};

enum class RegistryError {
  InvalidToken,         // slot index was never allocated
  AlreadyDisconnected,  // slot is currently empty
};

const char* ToString(RegistryError error);

enum class ClientEvent {
  ChunkSent,
  EasterEggSent,
  BannerSent,
};

struct Admitted {
  size_t connections;  // live count including this connection
  Token token;
};

struct Rejected {
  size_t connections;  // attempted count that exceeded the limit
};

using ConnectResult = std::variant<Admitted, Rejected>;

struct Disconnected {
  size_t connections;  // live count after removal
  uint64_t duration_seconds;
};

using DisconnectResult = std::variant<Disconnected, RegistryError>;

// Point-in-time view of the registry, taken under both locks
struct RegistrySnapshot {
  uint64_t uptime_seconds{0};
  size_t connections_count{0};
  size_t connections_total{0};
  AggregateStats live;
  AggregateStats former;

  // former + live; never stored
  AggregateStats total() const;
};

class MetricsRegistry {
public:
  explicit MetricsRegistry(std::chrono::steady_clock::time_point startup);

  MetricsRegistry(const MetricsRegistry&) = delete;
  MetricsRegistry& operator=(const MetricsRegistry&) = delete;

  // Admit a connection that started at `start` unless more than max_clients
  // would be live. Pass SIZE_MAX for no limit.
  ConnectResult Connect(size_t max_clients, std::chrono::steady_clock::time_point start);

  // Remove the connection, folding its lifetime and counters into former.
  DisconnectResult Disconnect(const Token& token);

  // Bump one counter of a live connection.
  std::optional<RegistryError> Record(const Token& token, ClientEvent event);
  std::optional<RegistryError> RecordChunk(const Token& token) { return Record(token, ClientEvent::ChunkSent); }
  std::optional<RegistryError> RecordEasterEgg(const Token& token) {
    return Record(token, ClientEvent::EasterEggSent);
  }
  std::optional<RegistryError> RecordBanner(const Token& token) { return Record(token, ClientEvent::BannerSent); }

  // Consistent read of everything the exporter needs. Does not mutate.
  RegistrySnapshot Snapshot() const;

  // Text exposition of Snapshot()
  std::string Export() const;

  // Lock-free approximate reads (for logging)
  size_t connections() const { return connections_count_.load(std::memory_order_relaxed); }
  size_t connections_total() const { return connections_total_.load(std::memory_order_relaxed); }

  // Slot table length: the high-water mark of concurrent connections
  size_t slot_capacity() const;

  std::chrono::steady_clock::time_point startup() const { return startup_; }

private:
  // Lookup a live record under clients_mutex_ and apply fn to it
  template <typename Fn>
  std::optional<RegistryError> WithClient(const Token& token, Fn&& fn);

  const std::chrono::steady_clock::time_point startup_;

  mutable std::mutex clients_mutex_;
  SlotTable<ClientRecord> clients_;

  mutable std::mutex former_mutex_;
  AggregateStats former_;

  std::atomic<size_t> connections_count_{0};
  std::atomic<size_t> connections_total_{0};
};

}  // namespace metrics
}  // namespace tarpit
