// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/listener.hpp"

#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include "util/time.hpp"

#include <limits>
#include <variant>

namespace tarpit {
namespace network {

Listener::Listener(asio::io_context& io_context, std::shared_ptr<metrics::MetricsRegistry> registry,
                   ListenerOptions options)
    : io_context_(io_context)
    , registry_(std::move(registry))
    , options_(std::move(options))
    , max_clients_(options_.max_clients ? static_cast<size_t>(*options_.max_clients)
                                        : std::numeric_limits<size_t>::max())
    , retry_timer_(io_context)
{
}

Listener::~Listener() {
  stop();
}

bool Listener::start() {
  if (acceptor_) {
    LOG_NET_DEBUG("already listening");
    return false;
  }

  const std::string addr = util::FormatEndpoint(options_.endpoint);
  try {
    using tcp = asio::ip::tcp;
    acceptor_ = std::make_unique<tcp::acceptor>(io_context_);
    acceptor_->open(options_.endpoint.protocol());
    acceptor_->set_option(tcp::acceptor::reuse_address(true));
    acceptor_->bind(options_.endpoint);
    acceptor_->listen(asio::socket_base::max_listen_connections);

    asio::error_code ec;
    auto ep = acceptor_->local_endpoint(ec);
    listening_port_ = ec ? 0 : ep.port();
  } catch (const std::exception& e) {
    LOG_NET_ERROR("bind(), addr: {}, error: {}", addr, e.what());
    if (acceptor_) {
      asio::error_code ec;
      acceptor_->close(ec);
      acceptor_.reset();
    }
    listening_port_ = 0;
    return false;
  }

  LOG_NET_INFO("listen, addr: {}, port: {}", addr, listening_port_);
  start_accept();
  return true;
}

void Listener::stop() {
  (void)retry_timer_.cancel();
  if (acceptor_) {
    asio::error_code ec;
    acceptor_->close(ec);
    acceptor_.reset();
  }
  listening_port_ = 0;
}

void Listener::start_accept() {
  if (!acceptor_)
    return;

  acceptor_->async_accept(
      [this](const asio::error_code& ec, asio::ip::tcp::socket socket) { handle_accept(ec, std::move(socket)); });
}

void Listener::handle_accept(const asio::error_code& ec, asio::ip::tcp::socket socket) {
  if (ec) {
    if (ec == asio::error::operation_aborted || !acceptor_) {
      return;
    }
    LOG_NET_ERROR_RL("accept(), error: {}", ec.message());
    retry_timer_.expires_after(ACCEPT_RETRY_DELAY);
    retry_timer_.async_wait([this](const asio::error_code& timer_ec) {
      if (!timer_ec) {
        start_accept();
      }
    });
    return;
  }

  // The peer may already be gone; such a connection is not counted
  asio::error_code peer_ec;
  const auto remote = socket.remote_endpoint(peer_ec);
  if (peer_ec) {
    LOG_NET_WARN_RL("peer_addr(), error: {}", peer_ec.message());
    start_accept();
    return;
  }
  std::string peer = util::FormatEndpoint(remote);

  auto admission = registry_->Connect(max_clients_, util::GetSteadyTime());
  if (const auto* rejected = std::get_if<metrics::Rejected>(&admission)) {
    LOG_NET_INFO("reject, peer: {}, clients: {}", peer, rejected->connections);
    asio::error_code ignored;
    socket.close(ignored);
    start_accept();
    return;
  }

  const auto& admitted = std::get<metrics::Admitted>(admission);
  LOG_NET_INFO("connect, peer: {}, clients: {}", peer, admitted.connections);

  configure_socket(socket, peer);

  TarpitSession::create(std::move(socket), std::move(peer), admitted.token, registry_, options_.session)->start();

  start_accept();
}

void Listener::configure_socket(asio::ip::tcp::socket& socket, const std::string& peer) {
  asio::error_code ec;

  socket.set_option(asio::socket_base::receive_buffer_size(options_.receive_buffer_size), ec);
  if (ec) {
    LOG_NET_WARN("set_recv_buffer_size(), peer: {}, error: {}", peer, ec.message());
  }

  ec.clear();
  socket.set_option(asio::socket_base::send_buffer_size(options_.send_buffer_size), ec);
  if (ec) {
    LOG_NET_WARN("set_send_buffer_size(), peer: {}, error: {}", peer, ec.message());
  }

  // Push every chunk out as soon as it is written
  ec.clear();
  socket.set_option(asio::ip::tcp::no_delay(true), ec);
  if (ec) {
    LOG_NET_WARN("set_nodelay(), peer: {}, error: {}", peer, ec.message());
  }
}

}  // namespace network
}  // namespace tarpit
