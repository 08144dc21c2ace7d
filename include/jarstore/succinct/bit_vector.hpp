#pragma once

#include "jarstore/base/result.hpp"
#include "jarstore/base/slice.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace jarstore::succinct {

/// Mutable bit array used while building. Serialize() appends the immutable,
/// rank/select-enabled form that BitVector loads.
class BitVectorBuilder {
public:
  explicit BitVectorBuilder(uint64_t num_bits = 0) {
    Resize(num_bits);
  }

  void Resize(uint64_t num_bits) {
    num_bits_ = num_bits;
    words_.assign((num_bits + 63) / 64, 0);
  }

  void Set(uint64_t pos) {
    words_[pos / 64] |= 1ULL << (pos % 64);
  }

  bool Get(uint64_t pos) const {
    return (words_[pos / 64] >> (pos % 64)) & 1;
  }

  uint64_t Size() const {
    return num_bits_;
  }

  /// Appends the serialized bit vector, including its rank and select
  /// samples, to out. out.size() must be a multiple of 8.
  void Serialize(std::string& out) const;

private:
  uint64_t num_bits_ = 0;
  std::vector<uint64_t> words_;
};

/// Immutable bit vector with constant time rank1 and select1, viewing a
/// serialized buffer without copying it.
///
/// Layout (all little-endian uint64):
///   num_bits, num_ones, num_words, num_rank_samples, num_select_samples,
///   words[num_words], rank[num_rank_samples], select[num_select_samples]
///
/// rank[b] is the number of ones before bit b * kBitsPerBlock. select[s] is
/// the block holding the (s * kOnesPerSample)-th one.
class BitVector {
public:
  static constexpr uint64_t kBitsPerBlock = 512;
  static constexpr uint64_t kWordsPerBlock = kBitsPerBlock / 64;
  static constexpr uint64_t kOnesPerSample = 512;

  BitVector() = default;

  /// Loads a view over data. data must be 8-byte aligned and outlive the view.
  /// Returns the number of bytes consumed through consumed.
  static Result<BitVector> Load(Slice data, uint64_t* consumed);

  bool Get(uint64_t pos) const {
    return (words_[pos / 64] >> (pos % 64)) & 1;
  }

  /// Number of ones in [0, pos). pos may equal Size().
  uint64_t Rank1(uint64_t pos) const;

  /// Position of the k-th one, zero based. k must be < NumOnes().
  uint64_t Select1(uint64_t k) const;

  /// Position of the first one at or after pos, or Size() if none.
  uint64_t NextOne(uint64_t pos) const;

  uint64_t Size() const {
    return num_bits_;
  }

  uint64_t NumOnes() const {
    return num_ones_;
  }

private:
  uint64_t num_bits_ = 0;
  uint64_t num_ones_ = 0;
  uint64_t num_words_ = 0;
  uint64_t num_rank_samples_ = 0;
  uint64_t num_select_samples_ = 0;
  const uint64_t* words_ = nullptr;
  const uint64_t* rank_ = nullptr;
  const uint64_t* select_ = nullptr;
};

} // namespace jarstore::succinct
