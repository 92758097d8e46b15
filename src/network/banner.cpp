// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/banner.hpp"

#include <algorithm>

namespace tarpit {
namespace network {

bool BannerPlan::valid() const {
  if (chunks.empty()) {
    return false;
  }
  if (std::any_of(chunks.begin(), chunks.end(), [](const std::string& c) { return c.empty(); })) {
    return false;
  }
  return easter_egg_every == 0 || !easter_egg.empty();
}

BannerStep BannerCursor::Next() {
  if (egg_pending_) {
    egg_pending_ = false;
    return BannerStep{plan_.easter_egg, ChunkKind::EasterEgg, false};
  }

  BannerStep step{plan_.chunks[next_chunk_], ChunkKind::BannerChunk, false};
  if (++next_chunk_ == plan_.chunks.size()) {
    next_chunk_ = 0;
    step.completes_banner = true;
    ++banners_completed_;
    if (plan_.easter_egg_every > 0 && banners_completed_ % plan_.easter_egg_every == 0) {
      egg_pending_ = true;
    }
  }
  return step;
}

}  // namespace network
}  // namespace tarpit
