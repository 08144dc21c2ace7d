#include "jarstore/phf/perfect_hash.hpp"

#include "jarstore/base/error.hpp"
#include "jarstore/base/log.hpp"
#include "jarstore/succinct/packed_ints.hpp"
#include "utils/hash.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <numeric>

namespace jarstore {

namespace {

constexpr uint64_t kHeaderWords = 5;

uint64_t LevelSeed(uint64_t seed, uint64_t level) {
  return utils::KeyHash::Remix(seed + level);
}

/// Level sizes are multiples of 64 so levels start on word boundaries.
uint64_t LevelBits(double gamma, uint64_t remaining) {
  const auto bits = static_cast<uint64_t>(std::ceil(gamma * static_cast<double>(remaining)));
  return std::max<uint64_t>(64, (bits + 63) / 64 * 64);
}

void AppendWord(std::string& out, uint64_t word) {
  out.append(reinterpret_cast<const char*>(&word), sizeof(word));
}

} // namespace

Result<void> PerfectHashBuilder::CheckUnique(const std::vector<Slice>& keys) {
  std::vector<uint64_t> order(keys.size());
  std::iota(order.begin(), order.end(), 0);
  std::sort(order.begin(), order.end(), [&](uint64_t a, uint64_t b) {
    return keys[a] < keys[b] || (keys[a] == keys[b] && a < b);
  });
  for (size_t i = 1; i < order.size(); ++i) {
    if (keys[order[i - 1]] == keys[order[i]]) {
      return Error::DuplicateKey(order[i - 1], order[i]);
    }
  }
  return {};
}

Result<void> PerfectHashBuilder::Build(const std::vector<Slice>& keys,
                                       const PerfectHashOptions& options, std::string& out) {
  if (!(options.gamma_ >= 1.0)) {
    return Error::InvalidArgument(std::format("phf gamma must be >= 1, got {}", options.gamma_));
  }
  if (auto res = CheckUnique(keys); !res) {
    return std::move(res.error());
  }

  const uint64_t num_keys = keys.size();
  std::vector<uint64_t> level_bits;
  std::vector<uint64_t> bitmap_words;

  // Global bit position of every key, resolved once the key is placed.
  std::vector<uint64_t> key_pos(num_keys, 0);
  std::vector<uint64_t> remaining(num_keys);
  std::iota(remaining.begin(), remaining.end(), 0);
  std::vector<uint64_t> next_remaining;
  std::vector<uint64_t> hashes;

  uint64_t level_begin = 0;
  while (!remaining.empty()) {
    const uint64_t level = level_bits.size();
    if (level >= kMaxLevels) {
      return Error::PhfBuildFailed(num_keys,
                                   std::format("{} keys left after {} levels", remaining.size(),
                                               kMaxLevels));
    }

    const uint64_t bits = LevelBits(options.gamma_, remaining.size());
    const uint64_t seed = LevelSeed(options.seed_, level);
    std::vector<uint64_t> seen(bits / 64, 0);
    std::vector<uint64_t> collided(bits / 64, 0);

    hashes.resize(remaining.size());
    for (size_t i = 0; i < remaining.size(); ++i) {
      const uint64_t pos =
          utils::KeyHash::Reduce(utils::KeyHash::Hash(keys[remaining[i]], seed), bits);
      hashes[i] = pos;
      const uint64_t bit = 1ULL << (pos % 64);
      if (seen[pos / 64] & bit) {
        collided[pos / 64] |= bit;
      } else {
        seen[pos / 64] |= bit;
      }
    }

    next_remaining.clear();
    for (size_t i = 0; i < remaining.size(); ++i) {
      const uint64_t pos = hashes[i];
      if (collided[pos / 64] & (1ULL << (pos % 64))) {
        next_remaining.push_back(remaining[i]);
      } else {
        key_pos[remaining[i]] = level_begin + pos;
      }
    }
    for (uint64_t w = 0; w < seen.size(); ++w) {
      bitmap_words.push_back(seen[w] & ~collided[w]);
    }

    level_bits.push_back(bits);
    level_begin += bits;
    remaining.swap(next_remaining);
  }

  succinct::BitVectorBuilder bitmap(level_begin);
  for (uint64_t w = 0; w < bitmap_words.size(); ++w) {
    for (uint64_t word = bitmap_words[w]; word != 0; word &= word - 1) {
      bitmap.Set(w * 64 + static_cast<uint64_t>(__builtin_ctzll(word)));
    }
  }

  // Slot of a key is the rank of its bit, computed here with one scan over
  // keys sorted by bit position.
  std::vector<uint64_t> by_pos(num_keys);
  std::iota(by_pos.begin(), by_pos.end(), 0);
  std::sort(by_pos.begin(), by_pos.end(),
            [&](uint64_t a, uint64_t b) { return key_pos[a] < key_pos[b]; });

  const uint32_t perm_width = succinct::BitsNeeded(num_keys == 0 ? 0 : num_keys - 1);
  std::vector<uint64_t> perm(succinct::PackedWords(num_keys, perm_width), 0);
  for (uint64_t slot = 0; slot < num_keys; ++slot) {
    succinct::PackedWrite(perm.data(), slot, perm_width, by_pos[slot]);
  }

  AppendWord(out, num_keys);
  AppendWord(out, options.seed_);
  AppendWord(out, level_bits.size());
  AppendWord(out, perm_width);
  AppendWord(out, perm.size());
  for (auto bits : level_bits) {
    AppendWord(out, bits);
  }
  out.append(reinterpret_cast<const char*>(perm.data()), perm.size() * sizeof(uint64_t));
  bitmap.Serialize(out);

  Log::Debug("Perfect hash built, keys={}, levels={}, bits_per_key={:.2f}", num_keys,
             level_bits.size(),
             num_keys == 0 ? 0.0 : static_cast<double>(level_begin) / static_cast<double>(num_keys));
  return {};
}

Result<PerfectHash> PerfectHash::Load(Slice data, uint64_t* consumed) {
  if (reinterpret_cast<uintptr_t>(data.data()) % alignof(uint64_t) != 0) {
    return Error::Corrupted("phf", "-", "-", "unaligned buffer");
  }
  if (data.size() < kHeaderWords * sizeof(uint64_t)) {
    return Error::Corrupted("phf", "-", "-", "truncated header");
  }

  const auto* header = reinterpret_cast<const uint64_t*>(data.data());
  PerfectHash phf;
  phf.num_keys_ = header[0];
  phf.seed_ = header[1];
  const uint64_t num_levels = header[2];
  const uint64_t perm_width = header[3];
  const uint64_t num_perm_words = header[4];
  if (num_levels > PerfectHashBuilder::kMaxLevels || perm_width == 0 || perm_width > 64 ||
      num_perm_words != succinct::PackedWords(phf.num_keys_, static_cast<uint32_t>(perm_width))) {
    return Error::Corrupted("phf", "-", "-", "inconsistent header");
  }
  phf.perm_width_ = static_cast<uint32_t>(perm_width);

  const uint64_t prefix_words = kHeaderWords + num_levels + num_perm_words;
  if (data.size() / sizeof(uint64_t) < prefix_words) {
    return Error::Corrupted("phf", "-", "-", "truncated level table");
  }

  phf.level_begin_.reserve(num_levels + 1);
  uint64_t total_bits = 0;
  for (uint64_t level = 0; level < num_levels; ++level) {
    const uint64_t bits = header[kHeaderWords + level];
    if (bits == 0 || bits % 64 != 0) {
      return Error::Corrupted("phf", "-", "-", std::format("bad size of level {}", level));
    }
    phf.level_begin_.push_back(total_bits);
    total_bits += bits;
  }
  phf.level_begin_.push_back(total_bits);
  phf.perm_ = header + kHeaderWords + num_levels;

  uint64_t bitmap_bytes = 0;
  auto levels = succinct::BitVector::Load(data.substr(prefix_words * sizeof(uint64_t)),
                                          &bitmap_bytes);
  if (!levels) {
    return std::move(levels.error());
  }
  phf.levels_ = std::move(levels.value());
  if (phf.levels_.Size() != total_bits || phf.levels_.NumOnes() != phf.num_keys_) {
    return Error::Corrupted("phf", "-", "-", "level bitmap disagrees with header");
  }

  *consumed = prefix_words * sizeof(uint64_t) + bitmap_bytes;
  return phf;
}

uint64_t PerfectHash::Lookup(Slice key) const {
  if (num_keys_ == 0) {
    return 0;
  }
  const uint64_t num_levels = NumLevels();
  for (uint64_t level = 0; level < num_levels; ++level) {
    const uint64_t bits = level_begin_[level + 1] - level_begin_[level];
    const uint64_t pos =
        level_begin_[level] +
        utils::KeyHash::Reduce(utils::KeyHash::Hash(key, LevelSeed(seed_, level)), bits);
    if (levels_.Get(pos)) {
      const uint64_t row = succinct::PackedRead(perm_, levels_.Rank1(pos), perm_width_);
      // A corrupted permutation must not hand out an index out of range.
      return row < num_keys_ ? row : row % num_keys_;
    }
  }
  // Not placed on any level, so certainly not a build key.
  return utils::KeyHash::Reduce(utils::KeyHash::Hash(key, seed_), num_keys_);
}

} // namespace jarstore
