#pragma once

#include "jarstore/base/result.hpp"
#include "jarstore/base/slice.hpp"
#include "jarstore/succinct/bit_vector.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace jarstore {

struct PerfectHashOptions {
  /// Bits per remaining key on every level. Larger is faster to build and
  /// query but takes more space.
  double gamma_ = 2.0;

  uint64_t seed_ = 0x5048465345454421ULL;
};

/// Builds a minimal perfect hash over a set of unique keys.
///
/// Keys are placed level by level: on each level every remaining key hashes
/// into a bitmap of gamma * remaining bits, keys that land alone in their bit
/// are placed, colliding keys move on to the next level. The rank of a key's
/// bit over all concatenated levels is its slot, and a packed permutation
/// maps the slot back to the key's position in the build set.
class PerfectHashBuilder {
public:
  static constexpr uint32_t kMaxLevels = 64;

  /// Fails with DuplicateKey if two keys are byte-identical.
  static Result<void> CheckUnique(const std::vector<Slice>& keys);

  /// Builds over keys, so that the loaded function maps keys[i] to i, and
  /// appends the serialized form to out. out.size() must be a multiple of 8.
  static Result<void> Build(const std::vector<Slice>& keys, const PerfectHashOptions& options,
                            std::string& out);
};

/// Read-only view over a serialized perfect hash.
///
/// Layout (all little-endian uint64):
///   num_keys, seed, num_levels, perm_width, num_perm_words,
///   level_bits[num_levels], perm[num_perm_words], level bit vector
class PerfectHash {
public:
  PerfectHash() = default;

  static Result<PerfectHash> Load(Slice data, uint64_t* consumed);

  /// Returns the row index of key. Exact for keys of the build set. Any other
  /// key still yields an index in [0, NumKeys()), which carries no meaning.
  /// Returns 0 when built over no keys.
  uint64_t Lookup(Slice key) const;

  uint64_t NumKeys() const {
    return num_keys_;
  }

  uint64_t NumLevels() const {
    return level_begin_.empty() ? 0 : level_begin_.size() - 1;
  }

private:
  uint64_t num_keys_ = 0;
  uint64_t seed_ = 0;
  uint32_t perm_width_ = 0;
  const uint64_t* perm_ = nullptr;

  /// Bit offset of each level in levels_, plus the total as last entry.
  std::vector<uint64_t> level_begin_;

  succinct::BitVector levels_;
};

} // namespace jarstore
