// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "metrics/registry.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <asio.hpp>

namespace tarpit {
namespace network {

struct HttpResponse {
  int status{200};
  std::string reason{"OK"};
  std::string content_type{"text/plain; charset=utf-8"};
  std::string body;

  // Full HTTP/1.0 response, headers included
  std::string Serialize() const;
};

// Answer one request head ("GET /metrics HTTP/1.1\r\n..."). Read-only on the
// registry.
HttpResponse HandleMetricsRequest(std::string_view request_head, const metrics::MetricsRegistry& registry);

// MetricsServer - pull-only scrape endpoint
//
// One request per connection: read the request head, write the response,
// close. Requests larger than MAX_REQUEST_BYTES or slower than
// REQUEST_TIMEOUT are dropped. Each scrape runs on its own strand, so the
// server is safe on an io_context driven by several threads. Failed accepts
// are retried after ACCEPT_RETRY_DELAY.
class MetricsServer {
public:
  MetricsServer(asio::io_context& io_context, std::shared_ptr<const metrics::MetricsRegistry> registry,
                asio::ip::tcp::endpoint endpoint,
                std::chrono::milliseconds request_timeout = REQUEST_TIMEOUT);
  ~MetricsServer();

  MetricsServer(const MetricsServer&) = delete;
  MetricsServer& operator=(const MetricsServer&) = delete;

  bool start();
  void stop();

  uint16_t listening_port() const { return listening_port_; }

  // Accept errors since start(); each one delays the next accept
  uint64_t accept_failures() const { return accept_failures_.load(std::memory_order_relaxed); }

  static constexpr size_t MAX_REQUEST_BYTES = 8 * 1024;
  static constexpr std::chrono::seconds REQUEST_TIMEOUT{10};
  static constexpr std::chrono::milliseconds ACCEPT_RETRY_DELAY{100};

private:
  void start_accept();
  void handle_accept(const asio::error_code& ec, asio::ip::tcp::socket socket);

  asio::io_context& io_context_;
  std::shared_ptr<const metrics::MetricsRegistry> registry_;
  const asio::ip::tcp::endpoint endpoint_;
  std::unique_ptr<asio::ip::tcp::acceptor> acceptor_;
  const std::chrono::milliseconds request_timeout_;
  asio::steady_timer retry_timer_;
  uint16_t listening_port_{0};
  std::atomic<uint64_t> accept_failures_{0};
};

}  // namespace network
}  // namespace tarpit
