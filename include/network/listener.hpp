// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "metrics/registry.hpp"
#include "network/tarpit_session.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>

#include <asio.hpp>

namespace tarpit {
namespace network {

struct ListenerOptions {
  asio::ip::tcp::endpoint endpoint{asio::ip::make_address_v4("0.0.0.0"), 2222};
  // nullopt = unbounded
  std::optional<uint32_t> max_clients;
  SessionOptions session;
  // Tiny kernel buffers force the peer into a slow trickle
  int receive_buffer_size{1};
  int send_buffer_size{64};
};

// Listener - accept loop in front of the tarpit
//
// For every accepted socket: resolve the peer address (drop on failure),
// ask the registry for admission (drop on rejection), shrink the socket
// buffers (best-effort), then hand the socket to a new TarpitSession.
//
// The io_context must outlive the listener; the caller runs it.
class Listener {
public:
  Listener(asio::io_context& io_context, std::shared_ptr<metrics::MetricsRegistry> registry, ListenerOptions options);
  ~Listener();

  Listener(const Listener&) = delete;
  Listener& operator=(const Listener&) = delete;

  // Bind and start accepting. Returns false if the endpoint cannot be bound.
  bool start();

  // Close the acceptor. Sessions already running are not touched.
  void stop();

  bool is_listening() const { return acceptor_ != nullptr; }

  // Bound port (0 if not listening); resolves an ephemeral port 0
  uint16_t listening_port() const { return listening_port_; }

private:
  void start_accept();
  void handle_accept(const asio::error_code& ec, asio::ip::tcp::socket socket);
  void configure_socket(asio::ip::tcp::socket& socket, const std::string& peer);

  asio::io_context& io_context_;
  std::shared_ptr<metrics::MetricsRegistry> registry_;
  const ListenerOptions options_;
  const size_t max_clients_;

  std::unique_ptr<asio::ip::tcp::acceptor> acceptor_;
  // Backoff after accept errors such as EMFILE
  asio::steady_timer retry_timer_;
  uint16_t listening_port_{0};

  static constexpr std::chrono::milliseconds ACCEPT_RETRY_DELAY{100};
};

}  // namespace network
}  // namespace tarpit
