#pragma once

#include <cstddef>
#include <cstdint>

namespace jarstore::succinct {

/// Number of 64-bit words needed to hold count integers of width bits each.
inline uint64_t PackedWords(uint64_t count, uint32_t width) {
  return (count * width + 63) / 64;
}

/// Number of bits needed to represent value, at least 1.
inline uint32_t BitsNeeded(uint64_t value) {
  return value == 0 ? 1 : 64 - static_cast<uint32_t>(__builtin_clzll(value));
}

/// Writes value into slot idx of a packed array. The slot must be zero.
inline void PackedWrite(uint64_t* words, uint64_t idx, uint32_t width, uint64_t value) {
  if (width == 0) {
    return;
  }
  const uint64_t bit_pos = idx * width;
  const uint64_t word = bit_pos / 64;
  const uint32_t shift = bit_pos % 64;
  words[word] |= value << shift;
  if (shift + width > 64) {
    words[word + 1] |= value >> (64 - shift);
  }
}

/// Reads slot idx of a packed array.
inline uint64_t PackedRead(const uint64_t* words, uint64_t idx, uint32_t width) {
  if (width == 0) {
    return 0;
  }
  const uint64_t bit_pos = idx * width;
  const uint64_t word = bit_pos / 64;
  const uint32_t shift = bit_pos % 64;
  const uint64_t mask = width == 64 ? ~0ULL : ((1ULL << width) - 1);
  uint64_t value = words[word] >> shift;
  if (shift + width > 64) {
    value |= words[word + 1] << (64 - shift);
  }
  return value & mask;
}

} // namespace jarstore::succinct
