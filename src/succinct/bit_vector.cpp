#include "jarstore/succinct/bit_vector.hpp"

#include "jarstore/base/error.hpp"
#include "jarstore/base/log.hpp"

#include <algorithm>
#include <bit>
#include <cstring>
#include <format>

namespace jarstore::succinct {

namespace {

constexpr uint64_t kHeaderWords = 5;

void AppendWord(std::string& out, uint64_t word) {
  out.append(reinterpret_cast<const char*>(&word), sizeof(word));
}

/// Position of the k-th one (zero based) inside a single word.
uint64_t SelectInWord(uint64_t word, uint64_t k) {
  for (uint64_t i = 0; i < k; ++i) {
    word &= word - 1;
  }
  return static_cast<uint64_t>(std::countr_zero(word));
}

} // namespace

void BitVectorBuilder::Serialize(std::string& out) const {
  JAR_DCHECK(out.size() % 8 == 0, "bit vector must start 8-byte aligned");

  const uint64_t num_words = words_.size();
  const uint64_t num_blocks = (num_words + BitVector::kWordsPerBlock - 1) / BitVector::kWordsPerBlock;

  // One extra rank sample holds the total, so Rank1(Size()) needs no branch.
  std::vector<uint64_t> rank(num_blocks + 1, 0);
  std::vector<uint64_t> select;
  uint64_t ones = 0;
  for (uint64_t block = 0; block < num_blocks; ++block) {
    rank[block] = ones;
    for (uint64_t w = block * BitVector::kWordsPerBlock;
         w < std::min(num_words, (block + 1) * BitVector::kWordsPerBlock); ++w) {
      const uint64_t word_ones = static_cast<uint64_t>(std::popcount(words_[w]));
      // Record the block of every kOnesPerSample-th one.
      const uint64_t next_sample = select.size() * BitVector::kOnesPerSample;
      if (next_sample < ones + word_ones) {
        while (select.size() * BitVector::kOnesPerSample < ones + word_ones) {
          select.push_back(block);
        }
      }
      ones += word_ones;
    }
  }
  rank[num_blocks] = ones;

  AppendWord(out, num_bits_);
  AppendWord(out, ones);
  AppendWord(out, num_words);
  AppendWord(out, rank.size());
  AppendWord(out, select.size());
  out.append(reinterpret_cast<const char*>(words_.data()), num_words * sizeof(uint64_t));
  out.append(reinterpret_cast<const char*>(rank.data()), rank.size() * sizeof(uint64_t));
  out.append(reinterpret_cast<const char*>(select.data()), select.size() * sizeof(uint64_t));
}

Result<BitVector> BitVector::Load(Slice data, uint64_t* consumed) {
  if (reinterpret_cast<uintptr_t>(data.data()) % alignof(uint64_t) != 0) {
    return Error::Corrupted("bit vector", "-", "-", "unaligned buffer");
  }
  if (data.size() < kHeaderWords * sizeof(uint64_t)) {
    return Error::Corrupted("bit vector", "-", "-",
                            std::format("header needs {} bytes, got {}",
                                        kHeaderWords * sizeof(uint64_t), data.size()));
  }

  const auto* header = reinterpret_cast<const uint64_t*>(data.data());
  BitVector bv;
  bv.num_bits_ = header[0];
  bv.num_ones_ = header[1];
  bv.num_words_ = header[2];
  bv.num_rank_samples_ = header[3];
  bv.num_select_samples_ = header[4];

  const uint64_t num_blocks = (bv.num_words_ + kWordsPerBlock - 1) / kWordsPerBlock;
  const uint64_t expected_select = (bv.num_ones_ + kOnesPerSample - 1) / kOnesPerSample;
  if (bv.num_words_ != (bv.num_bits_ + 63) / 64 || bv.num_rank_samples_ != num_blocks + 1 ||
      bv.num_select_samples_ != expected_select || bv.num_ones_ > bv.num_bits_) {
    return Error::Corrupted("bit vector", "-", "-", "inconsistent header");
  }

  const uint64_t total_words =
      kHeaderWords + bv.num_words_ + bv.num_rank_samples_ + bv.num_select_samples_;
  if (data.size() / sizeof(uint64_t) < total_words) {
    return Error::Corrupted(
        "bit vector", "-", "-",
        std::format("needs {} bytes, got {}", total_words * sizeof(uint64_t), data.size()));
  }

  bv.words_ = header + kHeaderWords;
  bv.rank_ = bv.words_ + bv.num_words_;
  bv.select_ = bv.rank_ + bv.num_rank_samples_;
  if (bv.rank_[num_blocks] != bv.num_ones_) {
    return Error::Corrupted("bit vector", "-", "-", "rank samples disagree with one count");
  }

  *consumed = total_words * sizeof(uint64_t);
  return bv;
}

uint64_t BitVector::Rank1(uint64_t pos) const {
  const uint64_t block = pos / kBitsPerBlock;
  uint64_t rank = rank_[block];
  const uint64_t word_end = pos / 64;
  for (uint64_t w = block * kWordsPerBlock; w < word_end; ++w) {
    rank += static_cast<uint64_t>(std::popcount(words_[w]));
  }
  if (pos % 64 != 0) {
    rank += static_cast<uint64_t>(std::popcount(words_[word_end] & ((1ULL << (pos % 64)) - 1)));
  }
  return rank;
}

uint64_t BitVector::Select1(uint64_t k) const {
  JAR_DCHECK(k < num_ones_, "select1 out of range");

  // Start from the sampled block and walk blocks until the one holding k.
  uint64_t block = select_[k / kOnesPerSample];
  const uint64_t num_blocks = num_rank_samples_ - 1;
  while (block + 1 < num_blocks && rank_[block + 1] <= k) {
    ++block;
  }

  uint64_t remaining = k - rank_[block];
  for (uint64_t w = block * kWordsPerBlock; w < num_words_; ++w) {
    const uint64_t word_ones = static_cast<uint64_t>(std::popcount(words_[w]));
    if (remaining < word_ones) {
      return w * 64 + SelectInWord(words_[w], remaining);
    }
    remaining -= word_ones;
  }
  return num_bits_;
}

uint64_t BitVector::NextOne(uint64_t pos) const {
  if (pos >= num_bits_) {
    return num_bits_;
  }
  uint64_t w = pos / 64;
  uint64_t word = words_[w] & (~0ULL << (pos % 64));
  while (word == 0) {
    if (++w >= num_words_) {
      return num_bits_;
    }
    word = words_[w];
  }
  const uint64_t result = w * 64 + static_cast<uint64_t>(std::countr_zero(word));
  return result < num_bits_ ? result : num_bits_;
}

} // namespace jarstore::succinct
