#include "jarstore/filter/cuckoo_filter.hpp"

#include "jarstore/base/error.hpp"
#include "jarstore/base/log.hpp"
#include "utils/hash.hpp"

#include <algorithm>
#include <bit>
#include <cmath>
#include <cstring>
#include <format>
#include <utility>

namespace jarstore {

namespace {

constexpr uint64_t kHeaderWords = 4;

/// Target load of the table when sized for the requested capacity.
constexpr double kMaxLoadFactor = 0.85;

struct KeyPosition {
  uint64_t bucket_;
  uint16_t fingerprint_;
};

KeyPosition Locate(const CuckooFilterParams& params, Slice key) {
  const uint64_t hash = utils::KeyHash::Hash(key, params.seed_);
  const uint64_t mask = (1ULL << params.fingerprint_bits_) - 1;
  auto fingerprint = static_cast<uint16_t>(hash & mask);
  // 0 marks an empty slot.
  if (fingerprint == 0) {
    fingerprint = 1;
  }
  return {(hash >> 32) & (params.num_buckets_ - 1), fingerprint};
}

/// The alternate bucket is symmetric: AltBucket(AltBucket(b, f), f) == b.
uint64_t AltBucket(const CuckooFilterParams& params, uint64_t bucket, uint16_t fingerprint) {
  return bucket ^ (utils::KeyHash::Remix(fingerprint) & (params.num_buckets_ - 1));
}

bool BucketContains(const uint16_t* slots, uint64_t bucket, uint16_t fingerprint) {
  const uint16_t* b = slots + bucket * CuckooFilterBuilder::kSlotsPerBucket;
  for (uint32_t i = 0; i < CuckooFilterBuilder::kSlotsPerBucket; ++i) {
    if (b[i] == fingerprint) {
      return true;
    }
  }
  return false;
}

bool Contains(const CuckooFilterParams& params, const uint16_t* slots, Slice key) {
  if (params.num_buckets_ == 0) {
    return false;
  }
  auto [bucket, fingerprint] = Locate(params, key);
  return BucketContains(slots, bucket, fingerprint) ||
         BucketContains(slots, AltBucket(params, bucket, fingerprint), fingerprint);
}

uint32_t FingerprintBits(double fp_rate) {
  // A lookup compares against 2 * kSlotsPerBucket fingerprints.
  const double bits = std::ceil(std::log2(2.0 * CuckooFilterBuilder::kSlotsPerBucket / fp_rate));
  return std::clamp(static_cast<uint32_t>(bits), CuckooFilterBuilder::kMinFingerprintBits,
                    CuckooFilterBuilder::kMaxFingerprintBits);
}

void AppendWord(std::string& out, uint64_t word) {
  out.append(reinterpret_cast<const char*>(&word), sizeof(word));
}

} // namespace

Result<CuckooFilterBuilder> CuckooFilterBuilder::New(uint64_t capacity, double fp_rate,
                                                     uint64_t seed) {
  if (!(fp_rate >= kMinFpRate && fp_rate < 1.0)) {
    return Error::InvalidArgument(
        std::format("filter fp_rate must be in [{}, 1), got {}", kMinFpRate, fp_rate));
  }

  const auto min_buckets = static_cast<uint64_t>(
      std::ceil(static_cast<double>(std::max<uint64_t>(capacity, 1)) /
                (kSlotsPerBucket * kMaxLoadFactor)));
  CuckooFilterParams params;
  params.num_buckets_ = std::bit_ceil(std::max<uint64_t>(min_buckets, 1));
  params.fingerprint_bits_ = FingerprintBits(fp_rate);
  params.seed_ = seed;

  JAR_DLOG("Cuckoo filter sized, capacity={}, buckets={}, fingerprint_bits={}", capacity,
           params.num_buckets_, params.fingerprint_bits_);
  return CuckooFilterBuilder(capacity, params);
}

bool CuckooFilterBuilder::InsertIntoBucket(uint64_t bucket, uint16_t fingerprint) {
  uint16_t* b = slots_.data() + bucket * kSlotsPerBucket;
  for (uint32_t i = 0; i < kSlotsPerBucket; ++i) {
    if (b[i] == 0) {
      b[i] = fingerprint;
      return true;
    }
  }
  return false;
}

Result<void> CuckooFilterBuilder::Insert(Slice key) {
  auto [bucket, fingerprint] = Locate(params_, key);
  if (InsertIntoBucket(bucket, fingerprint) ||
      InsertIntoBucket(AltBucket(params_, bucket, fingerprint), fingerprint)) {
    ++num_items_;
    return {};
  }

  // Both buckets are full, evict fingerprints along a random walk.
  uint64_t victim_bucket = (utils::KeyHash::Remix(kick_state_++) & 1)
                               ? AltBucket(params_, bucket, fingerprint)
                               : bucket;
  uint16_t victim = fingerprint;
  for (uint32_t kick = 0; kick < kMaxKicks; ++kick) {
    const uint64_t slot = utils::KeyHash::Remix(kick_state_++) % kSlotsPerBucket;
    std::swap(victim, slots_[victim_bucket * kSlotsPerBucket + slot]);
    victim_bucket = AltBucket(params_, victim_bucket, victim);
    if (InsertIntoBucket(victim_bucket, victim)) {
      ++num_items_;
      return {};
    }
  }

  // The evicted fingerprint is lost, the filter must not be used anymore.
  return Error::FilterCapacityExceeded(capacity_, num_items_);
}

bool CuckooFilterBuilder::MightContain(Slice key) const {
  return Contains(params_, slots_.data(), key);
}

void CuckooFilterBuilder::Serialize(std::string& out) const {
  AppendWord(out, params_.num_buckets_);
  AppendWord(out, params_.fingerprint_bits_);
  AppendWord(out, params_.seed_);
  AppendWord(out, num_items_);
  const size_t slot_bytes = slots_.size() * sizeof(uint16_t);
  out.append(reinterpret_cast<const char*>(slots_.data()), slot_bytes);
  out.append((8 - slot_bytes % 8) % 8, '\0');
}

Result<CuckooFilter> CuckooFilter::Load(Slice data, uint64_t* consumed) {
  if (reinterpret_cast<uintptr_t>(data.data()) % alignof(uint64_t) != 0) {
    return Error::Corrupted("filter", "-", "-", "unaligned buffer");
  }
  if (data.size() < kHeaderWords * sizeof(uint64_t)) {
    return Error::Corrupted("filter", "-", "-", "truncated header");
  }

  const auto* header = reinterpret_cast<const uint64_t*>(data.data());
  CuckooFilter filter;
  filter.params_.num_buckets_ = header[0];
  const uint64_t fingerprint_bits = header[1];
  filter.params_.seed_ = header[2];
  filter.num_items_ = header[3];
  if (!std::has_single_bit(filter.params_.num_buckets_) ||
      fingerprint_bits < CuckooFilterBuilder::kMinFingerprintBits ||
      fingerprint_bits > CuckooFilterBuilder::kMaxFingerprintBits ||
      filter.num_items_ > filter.params_.num_buckets_ * CuckooFilterBuilder::kSlotsPerBucket) {
    return Error::Corrupted("filter", "-", "-", "inconsistent header");
  }
  filter.params_.fingerprint_bits_ = static_cast<uint32_t>(fingerprint_bits);

  const uint64_t slot_bytes =
      filter.params_.num_buckets_ * CuckooFilterBuilder::kSlotsPerBucket * sizeof(uint16_t);
  const uint64_t total = kHeaderWords * sizeof(uint64_t) + (slot_bytes + 7) / 8 * 8;
  if (data.size() < total) {
    return Error::Corrupted("filter", "-", "-",
                            std::format("needs {} bytes, got {}", total, data.size()));
  }
  filter.slots_ = reinterpret_cast<const uint16_t*>(header + kHeaderWords);
  *consumed = total;
  return filter;
}

bool CuckooFilter::MightContain(Slice key) const {
  return Contains(params_, slots_, key);
}

} // namespace jarstore
