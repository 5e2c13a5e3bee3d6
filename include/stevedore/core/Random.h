#pragma once

#include "stevedore/core/Hash.h"
#include "stevedore/core/Types.h"

#include <algorithm>
#include <limits>
#include <span>
#include <string_view>
#include <type_traits>
#include <utility>

namespace stevedore::core {

// SplitMix64 PRNG. Deterministic per seed, which is all the sandbox and the
// tests need (reproducible regions and worker timings). Not for crypto.
class SplitMix64 {
public:
  explicit SplitMix64(u64 seed) : m_state(seed) {}

  u64 nextU64() {
    u64 z = (m_state += 0x9E3779B97F4A7C15ull);
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ull;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBull;
    return z ^ (z >> 31);
  }

  // [0, 1)
  double nextDouble01() {
    return static_cast<double>(nextU64() >> 11) * (1.0 / 9007199254740992.0);
  }

  double uniform(double min, double max) { return min + (max - min) * nextDouble01(); }

  // [lo, hi], rejection-sampled.
  template <typename Int>
  Int range(Int lo, Int hi) {
    static_assert(std::is_integral_v<Int>);
    if (hi < lo) std::swap(lo, hi);
    const u64 span = static_cast<u64>(hi) - static_cast<u64>(lo) + 1ull;
    if (span == 0) return static_cast<Int>(nextU64()); // full 64-bit range

    const u64 limit = (std::numeric_limits<u64>::max() / span) * span;
    u64 r = 0;
    do {
      r = nextU64();
    } while (r >= limit);
    return static_cast<Int>(static_cast<u64>(lo) + (r % span));
  }

  bool chance(double p) { return nextDouble01() < std::clamp(p, 0.0, 1.0); }

  template <typename T, std::size_t Extent>
  const T& pick(std::span<const T, Extent> items) {
    return items[range<std::size_t>(0u, items.size() - 1u)];
  }

private:
  u64 m_state = 0;
};

inline u64 deriveSeed(u64 parent, std::string_view tag) { return hashCombine(parent, fnv1a64(tag)); }

} // namespace stevedore::core
