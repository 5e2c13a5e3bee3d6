#pragma once

#include "stevedore/core/Types.h"

#include <string_view>

namespace stevedore::core {

// 64-bit FNV-1a. Stable across runs and platforms (seeds, worker ids).
u64 fnv1a64(std::string_view text);

u64 hashCombine(u64 a, u64 b);

} // namespace stevedore::core
