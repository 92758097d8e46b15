// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/metrics_server.hpp"

#include "util/logging.hpp"
#include "util/netaddress.hpp"

#include <vector>

#include <spdlog/fmt/fmt.h>

namespace tarpit {
namespace network {

namespace {

HttpResponse ErrorResponse(int status, std::string reason) {
  HttpResponse response;
  response.status = status;
  response.body = reason + "\n";
  response.reason = std::move(reason);
  return response;
}

std::vector<std::string_view> SplitRequestLine(std::string_view line) {
  std::vector<std::string_view> parts;
  size_t pos = 0;
  while (pos < line.size()) {
    size_t end = line.find(' ', pos);
    if (end == std::string_view::npos) {
      end = line.size();
    }
    if (end > pos) {
      parts.push_back(line.substr(pos, end - pos));
    }
    pos = end + 1;
  }
  return parts;
}

// One scrape: read request head, write response, close.
// The timeout and the read/write chain are both outstanding at once, so every
// handler runs on strand_.
class ScrapeConnection : public std::enable_shared_from_this<ScrapeConnection> {
public:
  ScrapeConnection(asio::ip::tcp::socket socket, std::string peer,
                   std::shared_ptr<const metrics::MetricsRegistry> registry, std::chrono::milliseconds timeout)
      : socket_(std::move(socket))
      , strand_(asio::make_strand(socket_.get_executor()))
      , timer_(strand_)
      , peer_(std::move(peer))
      , registry_(std::move(registry))
      , timeout_(timeout)
      , request_(MetricsServer::MAX_REQUEST_BYTES)
  {
  }

  // Safe to call from any thread; the exchange begins on the strand
  void start() {
    asio::post(strand_, [self = shared_from_this()]() { self->start_impl(); });
  }

private:
  // Strand-serialized internals
  void start_impl() {
    timer_.expires_after(timeout_);
    timer_.async_wait(asio::bind_executor(strand_, [self = shared_from_this()](const asio::error_code& ec) {
      if (!ec) {
        LOG_METRICS_DEBUG("scrape timeout, peer: {}", self->peer_);
        self->close();
      }
    }));

    asio::async_read_until(socket_, request_, "\r\n\r\n",
                           asio::bind_executor(strand_, [self = shared_from_this()](const asio::error_code& ec,
                                                                                     size_t bytes) {
                             self->on_request(ec, bytes);
                           }));
  }

  void on_request(const asio::error_code& ec, size_t bytes) {
    if (closed_) {
      return;
    }
    if (ec == asio::error::not_found) {
      respond(ErrorResponse(400, "Bad Request"));
      return;
    }
    if (ec) {
      if (ec != asio::error::operation_aborted && ec != asio::error::eof) {
        LOG_METRICS_DEBUG("scrape read, peer: {}, error: {}", peer_, ec.message());
      }
      close();
      return;
    }

    auto data = request_.data();
    std::string head(asio::buffers_begin(data), asio::buffers_begin(data) + bytes);
    respond(HandleMetricsRequest(head, *registry_));
  }

  void respond(const HttpResponse& response) {
    LOG_METRICS_DEBUG("scrape, peer: {}, status: {}", peer_, response.status);
    response_ = response.Serialize();
    asio::async_write(socket_, asio::buffer(response_),
                      asio::bind_executor(strand_, [self = shared_from_this()](const asio::error_code& ec, size_t) {
                        if (ec && ec != asio::error::operation_aborted) {
                          LOG_METRICS_DEBUG("scrape write, peer: {}, error: {}", self->peer_, ec.message());
                        }
                        self->close();
                      }));
  }

  void close() {
    if (closed_) {
      return;
    }
    closed_ = true;
    asio::error_code ignored;
    (void)timer_.cancel();
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
  }

  asio::ip::tcp::socket socket_;
  asio::strand<asio::any_io_executor> strand_;
  asio::steady_timer timer_;
  const std::string peer_;
  std::shared_ptr<const metrics::MetricsRegistry> registry_;
  const std::chrono::milliseconds timeout_;
  asio::streambuf request_;
  std::string response_;
  // Accessed only on strand_
  bool closed_{false};
};

}  // namespace

std::string HttpResponse::Serialize() const {
  return fmt::format("HTTP/1.0 {} {}\r\nContent-Type: {}\r\nContent-Length: {}\r\nConnection: close\r\n\r\n{}", status,
                     reason, content_type, body.size(), body);
}

HttpResponse HandleMetricsRequest(std::string_view request_head, const metrics::MetricsRegistry& registry) {
  size_t eol = request_head.find('\n');
  std::string_view line = request_head.substr(0, eol);
  if (!line.empty() && line.back() == '\r') {
    line.remove_suffix(1);
  }

  auto parts = SplitRequestLine(line);
  if (parts.size() != 3 || !parts[2].starts_with("HTTP/")) {
    return ErrorResponse(400, "Bad Request");
  }
  if (parts[0] != "GET") {
    return ErrorResponse(405, "Method Not Allowed");
  }

  std::string_view target = parts[1];
  target = target.substr(0, target.find('?'));
  if (target != "/metrics" && target != "/") {
    return ErrorResponse(404, "Not Found");
  }

  HttpResponse response;
  response.content_type = "text/plain; version=0.0.4; charset=utf-8";
  response.body = registry.Export();
  return response;
}

MetricsServer::MetricsServer(asio::io_context& io_context, std::shared_ptr<const metrics::MetricsRegistry> registry,
                             asio::ip::tcp::endpoint endpoint, std::chrono::milliseconds request_timeout)
    : io_context_(io_context)
    , registry_(std::move(registry))
    , endpoint_(std::move(endpoint))
    , request_timeout_(request_timeout)
    , retry_timer_(io_context)
{
}

MetricsServer::~MetricsServer() {
  stop();
}

bool MetricsServer::start() {
  if (acceptor_) {
    return false;
  }

  const std::string addr = util::FormatEndpoint(endpoint_);
  try {
    using tcp = asio::ip::tcp;
    acceptor_ = std::make_unique<tcp::acceptor>(io_context_);
    acceptor_->open(endpoint_.protocol());
    acceptor_->set_option(tcp::acceptor::reuse_address(true));
    acceptor_->bind(endpoint_);
    acceptor_->listen(asio::socket_base::max_listen_connections);

    asio::error_code ec;
    auto ep = acceptor_->local_endpoint(ec);
    listening_port_ = ec ? 0 : ep.port();
  } catch (const std::exception& e) {
    LOG_METRICS_ERROR("metrics bind(), addr: {}, error: {}", addr, e.what());
    if (acceptor_) {
      asio::error_code ec;
      acceptor_->close(ec);
      acceptor_.reset();
    }
    listening_port_ = 0;
    return false;
  }

  LOG_METRICS_INFO("metrics listen, addr: {}, port: {}", addr, listening_port_);
  start_accept();
  return true;
}

void MetricsServer::stop() {
  (void)retry_timer_.cancel();
  if (acceptor_) {
    asio::error_code ec;
    acceptor_->close(ec);
    acceptor_.reset();
  }
  listening_port_ = 0;
}

void MetricsServer::start_accept() {
  if (!acceptor_)
    return;

  acceptor_->async_accept(
      [this](const asio::error_code& ec, asio::ip::tcp::socket socket) { handle_accept(ec, std::move(socket)); });
}

void MetricsServer::handle_accept(const asio::error_code& ec, asio::ip::tcp::socket socket) {
  if (ec) {
    if (ec == asio::error::operation_aborted || !acceptor_) {
      return;
    }
    // EMFILE and friends leave the connection in the backlog; retrying at
    // once would fail again immediately
    const uint64_t failures = accept_failures_.fetch_add(1, std::memory_order_relaxed) + 1;
    LOG_METRICS_WARN_RL("metrics accept(), error: {}, failures: {}", ec.message(), failures);
    retry_timer_.expires_after(ACCEPT_RETRY_DELAY);
    retry_timer_.async_wait([this](const asio::error_code& timer_ec) {
      if (!timer_ec) {
        start_accept();
      }
    });
    return;
  }

  asio::error_code peer_ec;
  const auto remote = socket.remote_endpoint(peer_ec);
  std::string peer = peer_ec ? std::string("unknown") : util::FormatEndpoint(remote);

  std::make_shared<ScrapeConnection>(std::move(socket), std::move(peer), registry_, request_timeout_)->start();
  start_accept();
}

}  // namespace network
}  // namespace tarpit
