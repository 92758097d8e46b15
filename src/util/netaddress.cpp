// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/netaddress.hpp"

#include "util/logging.hpp"
#include "util/string_parsing.hpp"

#include <asio/ip/address.hpp>

namespace tarpit {
namespace util {

namespace {

asio::ip::address Normalize(const asio::ip::address& ip) {
  if (ip.is_v6() && ip.to_v6().is_v4_mapped()) {
    return asio::ip::make_address_v4(asio::ip::v4_mapped, ip.to_v6());
  }
  return ip;
}

}  // namespace

std::optional<std::string> ValidateAndNormalizeIP(const std::string& address) {
  if (address.empty()) {
    return std::nullopt;
  }

  try {
    asio::error_code ec;
    auto ip = asio::ip::make_address(address, ec);
    if (ec) {
      return std::nullopt;
    }
    return Normalize(ip).to_string();
  } catch (const std::exception& e) {
    LOG_TRACE("ValidateAndNormalizeIP: exception parsing address '{}': {}", address, e.what());
    return std::nullopt;
  }
}

bool ParseIPPort(const std::string& address_port, std::string& out_ip, uint16_t& out_port) {
  if (address_port.empty()) {
    return false;
  }

  std::string ip;
  std::string port_str;

  if (address_port[0] == '[') {
    // "[IPv6]:port"
    size_t bracket_end = address_port.find(']');
    if (bracket_end == std::string::npos || bracket_end < 2) {
      return false;
    }
    if (bracket_end + 1 >= address_port.length() || address_port[bracket_end + 1] != ':') {
      return false;
    }
    ip = address_port.substr(1, bracket_end - 1);
    port_str = address_port.substr(bracket_end + 2);
  } else {
    // "IPv4:port"; more than one colon means an unbracketed IPv6 address
    size_t colon = address_port.find(':');
    if (colon == std::string::npos || address_port.find(':', colon + 1) != std::string::npos) {
      return false;
    }
    ip = address_port.substr(0, colon);
    port_str = address_port.substr(colon + 1);
    if (ip.empty()) {
      return false;
    }
  }

  auto port = SafeParsePort(port_str);
  if (!port) {
    return false;
  }
  auto normalized = ValidateAndNormalizeIP(ip);
  if (!normalized) {
    return false;
  }

  out_ip = *normalized;
  out_port = *port;
  return true;
}

std::optional<asio::ip::tcp::endpoint> ParseEndpoint(const std::string& address_port) {
  std::string ip;
  uint16_t port = 0;
  if (!ParseIPPort(address_port, ip, port)) {
    return std::nullopt;
  }

  asio::error_code ec;
  auto address = asio::ip::make_address(ip, ec);
  if (ec) {
    return std::nullopt;
  }
  return asio::ip::tcp::endpoint(address, port);
}

std::string FormatEndpoint(const asio::ip::tcp::endpoint& endpoint) {
  const auto ip = Normalize(endpoint.address());
  if (ip.is_v6()) {
    return "[" + ip.to_string() + "]:" + std::to_string(endpoint.port());
  }
  return ip.to_string() + ":" + std::to_string(endpoint.port());
}

}  // namespace util
}  // namespace tarpit
