#pragma once

#include "jarstore/base/slice.hpp"

#include <cstdint>

namespace jarstore::utils {

/// Seeded 64-bit hashing for keys. FNV-1a over the bytes followed by a
/// splitmix64 finalizer, so that every output bit depends on every input bit.
class KeyHash {
public:
  static constexpr uint64_t kFnvOffsetBasis64 = 0xCBF29CE484222325ULL;
  static constexpr uint64_t kFnvPrime64 = 0x100000001B3ULL;

  static uint64_t Hash(Slice key, uint64_t seed);

  static constexpr uint64_t Remix(uint64_t z) {
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    return z ^ (z >> 31);
  }

  /// Maps a 64-bit hash onto [0, n) without a division.
  static uint64_t Reduce(uint64_t hash, uint64_t n) {
    return static_cast<uint64_t>((static_cast<unsigned __int128>(hash) * n) >> 64);
  }
};

} // namespace jarstore::utils
