// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "app/application.hpp"

#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include "util/time.hpp"

#include <chrono>
#include <csignal>
#include <unistd.h>  // For write(), STDOUT_FILENO (async-signal-safe)

namespace tarpit {
namespace app {

// Static instance for signal handling
Application* Application::instance_ = nullptr;

Application::Application(const AppConfig& config) : config_(config) {
  instance_ = this;
}

Application::~Application() {
  stop();
  instance_ = nullptr;
}

Application* Application::instance() {
  return instance_;
}

bool Application::initialize() {
  LOG_APP_INFO("Initializing {}...", VersionString());

  auto listen_endpoint = util::ParseEndpoint(config_.listen);
  if (!listen_endpoint) {
    LOG_APP_ERROR("Invalid listen address: {}", config_.listen);
    return false;
  }

  registry_ = std::make_shared<metrics::MetricsRegistry>(util::GetSteadyTime());

  auto banner = std::make_shared<network::BannerPlan>();
  banner->easter_egg_every = config_.easter_egg_every;

  network::ListenerOptions options;
  options.endpoint = *listen_endpoint;
  options.max_clients = config_.max_clients;
  options.session.delay = std::chrono::seconds(config_.delay_seconds);
  options.session.banner = banner;

  listener_ = std::make_unique<network::Listener>(io_context_, registry_, options);
  if (!listener_->start()) {
    LOG_APP_ERROR("Failed to bind {}", config_.listen);
    return false;
  }

  if (config_.metrics_listen) {
    auto metrics_endpoint = util::ParseEndpoint(*config_.metrics_listen);
    if (!metrics_endpoint) {
      LOG_APP_ERROR("Invalid metrics address: {}", *config_.metrics_listen);
      return false;
    }
    metrics_server_ = std::make_unique<network::MetricsServer>(io_context_, registry_, *metrics_endpoint);
    if (!metrics_server_->start()) {
      LOG_APP_ERROR("Failed to bind metrics endpoint {}", *config_.metrics_listen);
      return false;
    }
  }

  if (config_.max_clients) {
    LOG_APP_INFO("max clients: {}, delay: {}s", *config_.max_clients, config_.delay_seconds);
  } else {
    LOG_APP_INFO("max clients: unbounded, delay: {}s", config_.delay_seconds);
  }
  return true;
}

bool Application::start() {
  if (running_) {
    LOG_APP_ERROR("Application already running");
    return false;
  }
  if (!listener_) {
    LOG_APP_ERROR("Application not initialized");
    return false;
  }

  setup_signal_handlers();

  work_guard_.emplace(asio::make_work_guard(io_context_));
  for (uint32_t i = 0; i < config_.io_threads; ++i) {
    io_threads_.emplace_back([this]() { io_context_.run(); });
  }

  running_ = true;
  LOG_APP_INFO("Started with {} io thread(s)", config_.io_threads);
  return true;
}

void Application::stop() {
  if (!running_) {
    return;
  }
  shutdown();
}

void Application::wait_for_shutdown() {
  while (running_ && !shutdown_requested_) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  if (shutdown_requested_) {
    shutdown();
  }
}

void Application::shutdown() {
  if (!running_.exchange(false)) {
    return;
  }

  LOG_APP_INFO("Shutting down, clients: {}", registry_ ? registry_->connections() : 0);

  // Stop the io threads first so nothing races the acceptors below.
  // Live sessions are dropped, not drained.
  work_guard_.reset();
  io_context_.stop();
  for (auto& thread : io_threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  io_threads_.clear();

  if (metrics_server_) {
    metrics_server_->stop();
  }
  if (listener_) {
    listener_->stop();
  }

  LOG_APP_INFO("Shutdown complete");
}

void Application::setup_signal_handlers() {
  std::signal(SIGINT, Application::signal_handler);
  std::signal(SIGTERM, Application::signal_handler);
  // Peers vanish all the time; a broken pipe is an error code, not a signal
  std::signal(SIGPIPE, SIG_IGN);
}

void Application::signal_handler(int signal) {
  (void)signal;
  if (instance_) {
    // write() is async-signal-safe; iostreams and the logger are not
    static const char msg[] = "\nReceived signal\n";
    (void)write(STDOUT_FILENO, msg, sizeof(msg) - 1);

    instance_->shutdown_requested_ = true;
  }
}

}  // namespace app
}  // namespace tarpit
