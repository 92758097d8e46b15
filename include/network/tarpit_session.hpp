// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "metrics/registry.hpp"
#include "network/banner.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

#include <asio.hpp>

namespace tarpit {
namespace network {

struct SessionOptions {
  // Pause before every chunk, including the first
  std::chrono::milliseconds delay{std::chrono::seconds(10)};
  std::shared_ptr<const BannerPlan> banner{std::make_shared<BannerPlan>()};
};

enum class SessionState {
  Waiting,
  Writing,
  Terminated,
};

// TarpitSession - one stalled connection
//
// Loop: wait delay -> write next chunk -> (write completes) -> wait ...
// The session never reads from the peer and has no upper bound on its
// lifetime. It ends only when the timer or a write fails, at which point it
// disconnects its token from the registry exactly once and closes the socket.
//
// Lifetime: owned by the completion handlers it has outstanding (one at a
// time), so no strand is needed and nothing else has to keep it alive.
class TarpitSession : public std::enable_shared_from_this<TarpitSession> {
public:
  static std::shared_ptr<TarpitSession> create(asio::ip::tcp::socket socket, std::string peer, metrics::Token token,
                                               std::shared_ptr<metrics::MetricsRegistry> registry,
                                               SessionOptions options);

  ~TarpitSession();

  TarpitSession(const TarpitSession&) = delete;
  TarpitSession& operator=(const TarpitSession&) = delete;

  // Enter the wait/write loop
  void start();

  SessionState state() const { return state_.load(std::memory_order_relaxed); }
  const std::string& peer() const { return peer_; }

private:
  TarpitSession(asio::ip::tcp::socket socket, std::string peer, metrics::Token token,
                std::shared_ptr<metrics::MetricsRegistry> registry, SessionOptions options);

  void wait();
  void on_delay(const asio::error_code& ec);
  void on_written(const asio::error_code& ec, size_t bytes_transferred);
  void terminate(const asio::error_code& ec);

  asio::ip::tcp::socket socket_;
  asio::steady_timer timer_;
  const std::string peer_;
  const metrics::Token token_;
  std::shared_ptr<metrics::MetricsRegistry> registry_;
  const SessionOptions options_;

  BannerCursor cursor_;
  BannerStep current_;
  const std::chrono::steady_clock::time_point started_;
  std::atomic<SessionState> state_{SessionState::Waiting};
};

}  // namespace network
}  // namespace tarpit
