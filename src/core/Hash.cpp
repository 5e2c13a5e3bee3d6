#include "stevedore/core/Hash.h"

namespace stevedore::core {

u64 fnv1a64(std::string_view text) {
  constexpr u64 kOffsetBasis = 14695981039346656037ull;
  constexpr u64 kPrime       = 1099511628211ull;

  u64 h = kOffsetBasis;
  for (const char c : text) {
    h ^= static_cast<u64>(static_cast<unsigned char>(c));
    h *= kPrime;
  }
  return h;
}

u64 hashCombine(u64 a, u64 b) {
  return a ^ (b + 0x9e3779b97f4a7c15ull + (a << 6) + (a >> 2));
}

} // namespace stevedore::core
