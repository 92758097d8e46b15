// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace tarpit {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Owns one logger per component ("default", "network", "metrics", "app").
 * All loggers share the same sinks (stderr, plus an optional file).
 *
 * Thread-safety: All methods are thread-safe. Initialization is
 * performed exactly once using std::call_once. Logger access is
 * protected by mutex for safe concurrent use.
 */
class LogManager {
public:
  // Initialize logging system with the specified minimum log level.
  // Only the first call performs initialization.
  static void Initialize(const std::string& log_level = "off", bool log_to_file = false,
                         const std::string& log_file_path = "tarpitd.log");

  // Shutdown logging system (flushes buffers).
  // Subsequent logging calls after shutdown will auto-reinitialize.
  static void Shutdown();

  // Get logger for a component. Unknown components get the default logger.
  static std::shared_ptr<spdlog::logger> GetLogger(const std::string& name = "default");

  // Set log level at runtime (all components).
  static void SetLogLevel(const std::string& level);

  // Set log level for a specific component (network, metrics, app, default).
  static void SetComponentLevel(const std::string& component, const std::string& level);

  // Map the daemon's -v repeat count onto a level name.
  static std::string LevelForVerbosity(int verbosity);
};

}  // namespace util
}  // namespace tarpit

// Convenience macros for logging
#define LOG_TRACE(...) tarpit::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) tarpit::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...) tarpit::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...) tarpit::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...) tarpit::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_NET_TRACE(...) tarpit::util::LogManager::GetLogger("network")->trace(__VA_ARGS__)
#define LOG_NET_DEBUG(...) tarpit::util::LogManager::GetLogger("network")->debug(__VA_ARGS__)
#define LOG_NET_INFO(...) tarpit::util::LogManager::GetLogger("network")->info(__VA_ARGS__)
#define LOG_NET_WARN(...) tarpit::util::LogManager::GetLogger("network")->warn(__VA_ARGS__)
#define LOG_NET_ERROR(...) tarpit::util::LogManager::GetLogger("network")->error(__VA_ARGS__)

#define LOG_METRICS_DEBUG(...) tarpit::util::LogManager::GetLogger("metrics")->debug(__VA_ARGS__)
#define LOG_METRICS_INFO(...) tarpit::util::LogManager::GetLogger("metrics")->info(__VA_ARGS__)
#define LOG_METRICS_WARN(...) tarpit::util::LogManager::GetLogger("metrics")->warn(__VA_ARGS__)
#define LOG_METRICS_ERROR(...) tarpit::util::LogManager::GetLogger("metrics")->error(__VA_ARGS__)

#define LOG_APP_INFO(...) tarpit::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_ERROR(...) tarpit::util::LogManager::GetLogger("app")->error(__VA_ARGS__)

// ============================================================================
// RATE-LIMITED LOGGING MACROS
// ============================================================================
// Anything a remote scanner can trigger in a loop (accept failures, broken
// peers) goes through these so a flood cannot fill the disk.
//
// Rate limits (token bucket): 200 messages per hour per callsite.

#include "util/rate_limiter.hpp"

// Callsite key from file:line
#define CALLSITE_KEY_ (std::string(__FILE__) + ":" + std::to_string(__LINE__))

#define LOG_NET_ERROR_RL(...)                                                                                          \
  do {                                                                                                                 \
    if (tarpit::util::RateLimiter::instance().should_log(CALLSITE_KEY_, 200, 3600)) {                                  \
      tarpit::util::LogManager::GetLogger("network")->error(__VA_ARGS__);                                              \
    }                                                                                                                  \
  } while (0)

#define LOG_NET_WARN_RL(...)                                                                                           \
  do {                                                                                                                 \
    if (tarpit::util::RateLimiter::instance().should_log(CALLSITE_KEY_, 200, 3600)) {                                  \
      tarpit::util::LogManager::GetLogger("network")->warn(__VA_ARGS__);                                               \
    }                                                                                                                  \
  } while (0)

#define LOG_METRICS_WARN_RL(...)                                                                                       \
  do {                                                                                                                 \
    if (tarpit::util::RateLimiter::instance().should_log(CALLSITE_KEY_, 200, 3600)) {                                  \
      tarpit::util::LogManager::GetLogger("metrics")->warn(__VA_ARGS__);                                               \
    }                                                                                                                  \
  } while (0)
