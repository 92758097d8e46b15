// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "app/command_line.hpp"
#include "metrics/registry.hpp"
#include "network/listener.hpp"
#include "network/metrics_server.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

#include <asio.hpp>

namespace tarpit {
namespace app {

// Application - owns the io_context, its threads and every long-lived
// component. The MetricsRegistry is created here exactly once and shared
// with the listener, each session and the metrics endpoint.
class Application {
public:
  explicit Application(const AppConfig& config);
  ~Application();

  Application(const Application&) = delete;
  Application& operator=(const Application&) = delete;

  // Build the registry and bind the listeners. False means a socket could
  // not be bound (the caller exits with EX_OSERR).
  bool initialize();

  // Install signal handlers and start the io threads
  bool start();

  // Stop everything (idempotent)
  void stop();

  // Block until SIGINT/SIGTERM or request_shutdown()
  void wait_for_shutdown();

  void request_shutdown() { shutdown_requested_ = true; }

  bool is_running() const { return running_; }

  std::shared_ptr<metrics::MetricsRegistry> registry() const { return registry_; }
  uint16_t listening_port() const { return listener_ ? listener_->listening_port() : 0; }
  uint16_t metrics_port() const { return metrics_server_ ? metrics_server_->listening_port() : 0; }

  static Application* instance();

private:
  void shutdown();
  void setup_signal_handlers();
  static void signal_handler(int signal);

  AppConfig config_;

  // Declared first so it is destroyed last: pending session handlers die with it
  asio::io_context io_context_;
  std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;
  std::vector<std::thread> io_threads_;

  std::shared_ptr<metrics::MetricsRegistry> registry_;
  std::unique_ptr<network::Listener> listener_;
  std::unique_ptr<network::MetricsServer> metrics_server_;

  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_requested_{false};

  static Application* instance_;
};

}  // namespace app
}  // namespace tarpit
