#pragma once
#include <cstddef>
#include <cstdint>

namespace klotski::model::random {

struct SplitMix64 {
  std::uint64_t x;
  explicit SplitMix64(std::uint64_t seed) : x(seed) {}
  std::uint64_t next() {
    std::uint64_t z = (x += 0x9E3779B97F4A7C15ULL);
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    return z ^ (z >> 31);
  }
  // Index in [0, n); n must be > 0.
  std::size_t nextIndex(std::size_t n) { return static_cast<std::size_t>(next() % n); }
};

}  // namespace klotski::model::random
