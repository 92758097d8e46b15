// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace tarpit {
namespace metrics {

/**
 * SlotTable - growable table of optional records addressed by small indices
 *
 * Insert() fills the lowest-numbered empty slot and appends only when the
 * table is full, so the length tracks the high-water mark of concurrent
 * occupants. The table never shrinks.
 *
 * Not thread-safe; the owner serializes access.
 */
template <typename T>
class SlotTable {
public:
  // Store value in the first free slot (or a new one) and return its index.
  size_t Insert(T value) {
    for (size_t i = first_free_; i < slots_.size(); ++i) {
      if (!slots_[i].has_value()) {
        slots_[i].emplace(std::move(value));
        first_free_ = i + 1;
        return i;
      }
    }
    slots_.emplace_back(std::move(value));
    first_free_ = slots_.size();
    return slots_.size() - 1;
  }

  // Remove and return the record at index; nullopt if out of range or empty.
  std::optional<T> Take(size_t index) {
    if (index >= slots_.size() || !slots_[index].has_value()) {
      return std::nullopt;
    }
    std::optional<T> taken = std::move(slots_[index]);
    slots_[index].reset();
    if (index < first_free_) {
      first_free_ = index;
    }
    return taken;
  }

  // nullptr if out of range or empty
  T* Get(size_t index) {
    if (index >= slots_.size() || !slots_[index].has_value()) {
      return nullptr;
    }
    return &*slots_[index];
  }

  const T* Get(size_t index) const {
    if (index >= slots_.size() || !slots_[index].has_value()) {
      return nullptr;
    }
    return &*slots_[index];
  }

  // True if index was ever allocated (occupied or a hole)
  bool InRange(size_t index) const { return index < slots_.size(); }

  // Calls fn(index, const T&) for every occupied slot in index order
  template <typename Fn>
  void ForEach(Fn&& fn) const {
    for (size_t i = 0; i < slots_.size(); ++i) {
      if (slots_[i].has_value()) {
        fn(i, *slots_[i]);
      }
    }
  }

  size_t Size() const { return slots_.size(); }

private:
  std::vector<std::optional<T>> slots_;
  // Every slot below first_free_ is occupied
  size_t first_free_{0};
};

}  // namespace metrics
}  // namespace tarpit
