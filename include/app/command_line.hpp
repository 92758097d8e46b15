// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tarpit {
namespace app {

struct AppConfig {
  std::string listen{"0.0.0.0:2222"};
  // Best-effort ceiling on concurrent connections; nullopt = unbounded
  std::optional<uint32_t> max_clients;
  // Seconds between chunks
  uint32_t delay_seconds{10};
  // Number of -v flags
  int verbosity{0};
  std::optional<std::string> log_file;
  // Scrape endpoint, disabled unless given
  std::optional<std::string> metrics_listen;
  // Completed banners between easter eggs (0 = never)
  uint32_t easter_egg_every{0};
  uint32_t io_threads{1};
};

enum class ParseStatus {
  Run,          // config is complete, start the daemon
  ShowHelp,     // --help
  ShowVersion,  // --version
  Error,        // see ParseResult::error
};

struct ParseResult {
  ParseStatus status{ParseStatus::Run};
  AppConfig config;
  std::string error;
};

// Parse argv (without the program name). Accepts "--opt value",
// "--opt=value", "-o value" and stacked "-vv".
ParseResult ParseCommandLine(const std::vector<std::string>& args);

std::string Usage(const std::string& program_name);
std::string VersionString();

}  // namespace app
}  // namespace tarpit
