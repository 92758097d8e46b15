// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/tarpit_session.hpp"

#include "util/logging.hpp"
#include "util/time.hpp"

#include <optional>
#include <variant>

namespace tarpit {
namespace network {

std::shared_ptr<TarpitSession> TarpitSession::create(asio::ip::tcp::socket socket, std::string peer,
                                                     metrics::Token token,
                                                     std::shared_ptr<metrics::MetricsRegistry> registry,
                                                     SessionOptions options) {
  if (!options.banner || !options.banner->valid()) {
    options.banner = std::make_shared<BannerPlan>();
  }
  return std::shared_ptr<TarpitSession>(
      new TarpitSession(std::move(socket), std::move(peer), token, std::move(registry), std::move(options)));
}

TarpitSession::TarpitSession(asio::ip::tcp::socket socket, std::string peer, metrics::Token token,
                             std::shared_ptr<metrics::MetricsRegistry> registry, SessionOptions options)
    : socket_(std::move(socket))
    , timer_(socket_.get_executor())
    , peer_(std::move(peer))
    , token_(token)
    , registry_(std::move(registry))
    , options_(std::move(options))
    , cursor_(*options_.banner)
    , started_(std::chrono::steady_clock::now())
{
}

TarpitSession::~TarpitSession() {
  asio::error_code ignored;
  socket_.close(ignored);
}

void TarpitSession::start() {
  wait();
}

void TarpitSession::wait() {
  state_.store(SessionState::Waiting, std::memory_order_relaxed);
  timer_.expires_after(options_.delay);
  timer_.async_wait([self = shared_from_this()](const asio::error_code& ec) { self->on_delay(ec); });
}

void TarpitSession::on_delay(const asio::error_code& ec) {
  if (ec) {
    terminate(ec);
    return;
  }

  state_.store(SessionState::Writing, std::memory_order_relaxed);
  current_ = cursor_.Next();
  // async_write keeps going until the whole chunk is in the kernel; with
  // TCP_NODELAY set by the listener that is also the flush
  asio::async_write(socket_, asio::buffer(current_.payload.data(), current_.payload.size()),
                    [self = shared_from_this()](const asio::error_code& ec, size_t bytes_transferred) {
                      self->on_written(ec, bytes_transferred);
                    });
}

void TarpitSession::on_written(const asio::error_code& ec, size_t bytes_transferred) {
  if (ec) {
    terminate(ec);
    return;
  }

  LOG_NET_TRACE("sent, peer: {}, bytes: {}", peer_, bytes_transferred);

  std::optional<metrics::RegistryError> error;
  if (current_.kind == ChunkKind::EasterEgg) {
    error = registry_->RecordEasterEgg(token_);
  } else {
    error = registry_->RecordChunk(token_);
    if (!error && current_.completes_banner) {
      error = registry_->RecordBanner(token_);
    }
  }
  if (error) {
    LOG_NET_ERROR("record, peer: {}, error: {}", peer_, metrics::ToString(*error));
  }

  wait();
}

void TarpitSession::terminate(const asio::error_code& ec) {
  if (state_.exchange(SessionState::Terminated, std::memory_order_relaxed) == SessionState::Terminated) {
    return;
  }

  const auto elapsed = util::FormatDuration(std::chrono::steady_clock::now() - started_);
  auto result = registry_->Disconnect(token_);
  if (const auto* done = std::get_if<metrics::Disconnected>(&result)) {
    LOG_NET_INFO("disconnect, peer: {}, duration: {}, error: {}, clients: {}", peer_, elapsed, ec.message(),
                 done->connections);
  } else {
    LOG_NET_ERROR("disconnect, peer: {}, duration: {}, error: {}, registry: {}", peer_, elapsed, ec.message(),
                  metrics::ToString(std::get<metrics::RegistryError>(result)));
  }

  asio::error_code ignored;
  (void)timer_.cancel();
  socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
  socket_.close(ignored);
}

}  // namespace network
}  // namespace tarpit
