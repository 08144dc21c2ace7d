#pragma once

#include "jarstore/base/slice.hpp"

#include <cstddef>
#include <cstdint>

namespace jarstore::utils {

/// Incremental crc32c over a sequence of byte ranges.
class Crc32Calculator {
public:
  Crc32Calculator() = default;

  Crc32Calculator& Update(const void* data, size_t count);

  Crc32Calculator& Update(Slice data) {
    return Update(data.data(), data.size());
  }

  uint32_t Get() const {
    return crc32_;
  }

private:
  uint32_t crc32_ = 0;
};

uint32_t Crc32(const uint8_t* src, uint64_t size);

inline uint32_t Crc32(Slice data) {
  return Crc32(data.data(), data.size());
}

} // namespace jarstore::utils
