// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/string_parsing.hpp"

#include <charconv>
#include <limits>

namespace tarpit {
namespace util {

std::optional<uint64_t> SafeParseUInt64(const std::string& str) {
  if (str.empty() || str.size() > 20) {
    return std::nullopt;
  }
  uint64_t value = 0;
  const char* first = str.data();
  const char* last = str.data() + str.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return value;
}

std::optional<uint32_t> SafeParseUInt32(const std::string& str) {
  auto value = SafeParseUInt64(str);
  if (!value || *value > std::numeric_limits<uint32_t>::max()) {
    return std::nullopt;
  }
  return static_cast<uint32_t>(*value);
}

std::optional<uint16_t> SafeParsePort(const std::string& str) {
  auto value = SafeParseUInt64(str);
  if (!value || *value > std::numeric_limits<uint16_t>::max()) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(*value);
}

}  // namespace util
}  // namespace tarpit
