#pragma once
#include <atomic>
#include <cstdint>

namespace sg {

using Id = std::uint64_t;

inline constexpr Id kInvalidId = 0;

// Process-wide monotonically increasing node ids. Never returns kInvalidId.
inline Id nextNodeId() {
  static std::atomic<Id> counter{0};
  return ++counter;
}

} // namespace sg
