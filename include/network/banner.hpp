// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace tarpit {
namespace network {

// Default payload dribbled to every peer, one chunk per tick
inline constexpr std::string_view kDefaultBanner = "bleep bloop\r\n";
inline constexpr std::string_view kDefaultEasterEgg = "you found the tarpit, have a nice day\r\n";

/**
 * BannerPlan - the immutable payload schedule shared by all sessions
 *
 * The banner is a list of chunks sent one per tick. Once every
 * easter_egg_every completed banners the next tick carries the easter egg
 * instead (0 disables it).
 */
struct BannerPlan {
  std::vector<std::string> chunks{std::string(kDefaultBanner)};
  std::string easter_egg{kDefaultEasterEgg};
  uint32_t easter_egg_every{0};

  // A plan is usable if it has at least one non-empty chunk and a non-empty
  // easter egg when the egg is enabled.
  bool valid() const;
};

enum class ChunkKind {
  BannerChunk,
  EasterEgg,
};

struct BannerStep {
  std::string_view payload;
  ChunkKind kind{ChunkKind::BannerChunk};
  // This chunk is the last one of the banner
  bool completes_banner{false};
};

/**
 * BannerCursor - per-session position inside a BannerPlan
 *
 * Next() is called once per tick. The plan must outlive the cursor.
 */
class BannerCursor {
public:
  explicit BannerCursor(const BannerPlan& plan) : plan_(plan) {}

  BannerStep Next();

private:
  const BannerPlan& plan_;
  size_t next_chunk_{0};
  uint64_t banners_completed_{0};
  bool egg_pending_{false};
};

}  // namespace network
}  // namespace tarpit
