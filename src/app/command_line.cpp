// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "app/command_line.hpp"

#include "util/netaddress.hpp"
#include "util/string_parsing.hpp"

#include <sstream>

namespace tarpit {
namespace app {

namespace {

constexpr uint32_t kMaxIoThreads = 256;

ParseResult Fail(std::string message) {
  ParseResult result;
  result.status = ParseStatus::Error;
  result.error = std::move(message);
  return result;
}

}  // namespace

std::string VersionString() {
  return "tarpitd 0.1.0";
}

std::string Usage(const std::string& program_name) {
  std::ostringstream out;
  out << "tarpitd - TCP tarpit that holds scanners on the line\n\n"
      << "Usage: " << program_name << " [options]\n\n"
      << "Options:\n"
      << "  -l, --listen <addr>          Listen address (default: 0.0.0.0:2222)\n"
      << "  -c, --max-clients <n>        Best-effort connection limit (default: unbounded)\n"
      << "  -d, --delay <seconds>        Seconds between responses, >= 1 (default: 10)\n"
      << "  -v, --verbose                Verbose level (repeat for more verbosity)\n"
      << "      --log-file <path>        Also write log lines to a file\n"
      << "      --metrics-listen <addr>  Serve metrics over HTTP on this address\n"
      << "      --easter-egg-every <n>   Send the easter egg every n banners (default: never)\n"
      << "      --threads <n>            I/O threads (default: 1)\n"
      << "  -V, --version                Show version information\n"
      << "  -h, --help                   Show this help message\n";
  return out.str();
}

ParseResult ParseCommandLine(const std::vector<std::string>& args) {
  ParseResult result;
  AppConfig& config = result.config;

  for (size_t i = 0; i < args.size(); ++i) {
    std::string arg = args[i];
    std::optional<std::string> inline_value;

    // --opt=value
    if (arg.starts_with("--")) {
      size_t eq = arg.find('=');
      if (eq != std::string::npos) {
        inline_value = arg.substr(eq + 1);
        arg = arg.substr(0, eq);
      }
    }

    auto take_value = [&]() -> std::optional<std::string> {
      if (inline_value) {
        return inline_value;
      }
      if (i + 1 >= args.size()) {
        return std::nullopt;
      }
      return args[++i];
    };

    if (arg == "-h" || arg == "--help") {
      result.status = ParseStatus::ShowHelp;
      return result;
    } else if (arg == "-V" || arg == "--version") {
      result.status = ParseStatus::ShowVersion;
      return result;
    } else if (arg == "--verbose") {
      if (inline_value) {
        return Fail("--verbose does not take a value");
      }
      ++config.verbosity;
    } else if (arg.size() >= 2 && arg[0] == '-' && arg[1] == 'v' && arg.find_first_not_of('v', 1) == std::string::npos) {
      // -v, -vv, -vvv
      config.verbosity += static_cast<int>(arg.size() - 1);
    } else if (arg == "-l" || arg == "--listen") {
      auto value = take_value();
      if (!value) {
        return Fail(arg + " requires an address");
      }
      if (!util::ParseEndpoint(*value)) {
        return Fail("invalid listen address: " + *value);
      }
      config.listen = *value;
    } else if (arg == "-c" || arg == "--max-clients") {
      auto value = take_value();
      if (!value) {
        return Fail(arg + " requires a number");
      }
      auto n = util::SafeParseUInt32(*value);
      if (!n) {
        return Fail("invalid max clients: " + *value);
      }
      config.max_clients = *n;
    } else if (arg == "-d" || arg == "--delay") {
      auto value = take_value();
      if (!value) {
        return Fail(arg + " requires a number of seconds");
      }
      auto n = util::SafeParseUInt32(*value);
      if (!n || *n == 0) {
        return Fail("invalid delay: " + *value);
      }
      config.delay_seconds = *n;
    } else if (arg == "--log-file") {
      auto value = take_value();
      if (!value || value->empty()) {
        return Fail("--log-file requires a non-empty path");
      }
      config.log_file = *value;
    } else if (arg == "--metrics-listen") {
      auto value = take_value();
      if (!value) {
        return Fail("--metrics-listen requires an address");
      }
      if (!util::ParseEndpoint(*value)) {
        return Fail("invalid metrics address: " + *value);
      }
      config.metrics_listen = *value;
    } else if (arg == "--easter-egg-every") {
      auto value = take_value();
      auto n = value ? util::SafeParseUInt32(*value) : std::nullopt;
      if (!n) {
        return Fail("invalid easter egg interval: " + value.value_or(""));
      }
      config.easter_egg_every = *n;
    } else if (arg == "--threads") {
      auto value = take_value();
      auto n = value ? util::SafeParseUInt32(*value) : std::nullopt;
      if (!n || *n == 0 || *n > kMaxIoThreads) {
        return Fail("invalid thread count: " + value.value_or(""));
      }
      config.io_threads = *n;
    } else {
      return Fail("unknown option: " + args[i]);
    }
  }

  return result;
}

}  // namespace app
}  // namespace tarpit
