// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Network Address Utilities

 Purpose:
 - Validate and normalize IP address strings
 - Parse listen addresses given on the command line
 - Render peer endpoints for log lines

 Key functions:
 - ValidateAndNormalizeIP: Validates address format and normalizes (IPv4-mapped -> IPv4)
 - ParseIPPort: "IP:port" / "[IPv6]:port" into components
 - ParseEndpoint: same, straight into an asio endpoint
 - FormatEndpoint: endpoint back into "IP:port" / "[IPv6]:port"
*/

#include <cstdint>
#include <optional>
#include <string>

#include <asio/ip/tcp.hpp>

namespace tarpit {
namespace util {

/**
 * Validate and normalize an IP address string
 *
 * Only numeric addresses are accepted (no hostnames). IPv4-mapped IPv6
 * addresses are folded to IPv4 so the same peer always logs the same way.
 *
 * Examples:
 *   "192.168.1.1" -> "192.168.1.1"
 *   "::ffff:192.168.1.1" -> "192.168.1.1"
 *   "2001:db8::1" -> "2001:db8::1"
 *   "invalid" -> std::nullopt
 *   "" -> std::nullopt
 */
std::optional<std::string> ValidateAndNormalizeIP(const std::string& address);

/**
 * Parse "IP:port" string into separate IP and port components
 *
 * - IPv4: "192.168.1.1:2222"
 * - IPv6: "[2001:db8::1]:2222" (brackets are mandatory)
 *
 * @return true if successfully parsed, false otherwise
 */
bool ParseIPPort(const std::string& address_port, std::string& out_ip, uint16_t& out_port);

// Parse "IP:port" / "[IPv6]:port" into a TCP endpoint.
std::optional<asio::ip::tcp::endpoint> ParseEndpoint(const std::string& address_port);

// Render an endpoint as "IP:port" or "[IPv6]:port" (IPv4-mapped shown as IPv4).
std::string FormatEndpoint(const asio::ip::tcp::endpoint& endpoint);

}  // namespace util
}  // namespace tarpit
