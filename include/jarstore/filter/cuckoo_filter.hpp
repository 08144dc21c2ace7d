#pragma once

#include "jarstore/base/result.hpp"
#include "jarstore/base/slice.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace jarstore {

/// Parameters shared by the builder and the loaded filter.
struct CuckooFilterParams {
  /// Always a power of two.
  uint64_t num_buckets_ = 0;

  /// Bits per fingerprint, in [kMinFingerprintBits, kMaxFingerprintBits].
  uint32_t fingerprint_bits_ = 0;

  uint64_t seed_ = 0;
};

/// Cuckoo filter builder. Keys are inserted once each, a failed insertion
/// means the table is structurally full and the whole build must fail, since
/// dropping the key would introduce a false negative.
class CuckooFilterBuilder {
public:
  static constexpr uint32_t kSlotsPerBucket = 4;
  static constexpr uint32_t kMinFingerprintBits = 4;
  static constexpr uint32_t kMaxFingerprintBits = 16;
  static constexpr uint32_t kMaxKicks = 500;
  static constexpr uint64_t kDefaultSeed = 0x6A61727374726F65ULL;

  /// Lowest false-positive rate the widest fingerprint can honor.
  static constexpr double kMinFpRate =
      2.0 * kSlotsPerBucket / static_cast<double>(1ULL << kMaxFingerprintBits);

  /// Sizes a filter for capacity keys at false-positive rate fp_rate, which
  /// must be in [kMinFpRate, 1).
  static Result<CuckooFilterBuilder> New(uint64_t capacity, double fp_rate,
                                         uint64_t seed = kDefaultSeed);

  Result<void> Insert(Slice key);

  bool MightContain(Slice key) const;

  uint64_t NumItems() const {
    return num_items_;
  }

  uint64_t Capacity() const {
    return capacity_;
  }

  const CuckooFilterParams& Params() const {
    return params_;
  }

  /// Appends the serialized filter to out. out.size() must be a multiple of 8.
  void Serialize(std::string& out) const;

private:
  CuckooFilterBuilder(uint64_t capacity, const CuckooFilterParams& params)
      : capacity_(capacity),
        params_(params),
        slots_(params.num_buckets_ * kSlotsPerBucket, 0),
        kick_state_(params.seed_) {
  }

  bool InsertIntoBucket(uint64_t bucket, uint16_t fingerprint);

  uint64_t capacity_;
  CuckooFilterParams params_;
  std::vector<uint16_t> slots_;
  uint64_t num_items_ = 0;

  /// State of the generator picking the slot to evict.
  uint64_t kick_state_;
};

/// Read-only view over a serialized cuckoo filter. Lookups never allocate.
///
/// Layout (little-endian):
///   u64 num_buckets, u64 fingerprint_bits, u64 seed, u64 num_items,
///   u16 slots[num_buckets * 4], zero padding to 8 bytes
class CuckooFilter {
public:
  CuckooFilter() = default;

  static Result<CuckooFilter> Load(Slice data, uint64_t* consumed);

  /// false means the key was definitely never inserted.
  bool MightContain(Slice key) const;

  uint64_t NumItems() const {
    return num_items_;
  }

  const CuckooFilterParams& Params() const {
    return params_;
  }

private:
  CuckooFilterParams params_;
  uint64_t num_items_ = 0;
  const uint16_t* slots_ = nullptr;
};

} // namespace jarstore
