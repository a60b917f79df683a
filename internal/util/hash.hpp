#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace fwbuild::util {

// FNV-1a, 64 bit. Stable across runs and platforms.
uint64_t Fnv1a64(std::string_view data, uint64_t seed = 0xcbf29ce484222325ULL);

std::string ToHex(uint64_t value);

} // namespace fwbuild::util
