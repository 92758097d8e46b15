// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace tarpit {
namespace util {

// Strict decimal parsers: the whole string must be digits and fit the type.
// Leading '+', '-', whitespace and trailing characters are rejected.
std::optional<uint64_t> SafeParseUInt64(const std::string& str);
std::optional<uint32_t> SafeParseUInt32(const std::string& str);

// Port in 0..65535
std::optional<uint16_t> SafeParsePort(const std::string& str);

}  // namespace util
}  // namespace tarpit
