#pragma once

#include "jarstore/base/log.hpp"
#include "jarstore/base/slice.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

namespace jarstore {

/// Owned, fixed-size byte array. Rows handed out by the reader are returned
/// in a ByteBuffer so the caller owns the decompressed bytes.
class ByteBuffer {
public:
  ByteBuffer() = default;

  /// Creates a buffer holding a copy of the given bytes.
  explicit ByteBuffer(Slice data) : bytes_(data.StringView()) {
  }

  /// Takes over the bytes, no copy.
  explicit ByteBuffer(std::string&& bytes) : bytes_(std::move(bytes)) {
  }

  // Rows are moved to the caller, never copied implicitly.
  ByteBuffer(const ByteBuffer&) = delete;
  ByteBuffer& operator=(const ByteBuffer&) = delete;

  ByteBuffer(ByteBuffer&& other) noexcept : bytes_(std::move(other.bytes_)) {
    other.bytes_.clear();
  }

  ByteBuffer& operator=(ByteBuffer&& other) noexcept {
    if (this != &other) {
      bytes_ = std::move(other.bytes_);
      other.bytes_.clear();
    }
    return *this;
  }

  size_t size() const { // NOLINT: mimic std::vector interface
    return bytes_.size();
  }

  bool empty() const { // NOLINT: mimic std::vector interface
    return bytes_.empty();
  }

  const uint8_t* data() const { // NOLINT: mimic std::vector interface
    return reinterpret_cast<const uint8_t*>(bytes_.data());
  }

  Slice slice(size_t offset = 0, size_t length = SIZE_MAX) const { // NOLINT
    if (length == SIZE_MAX) {
      length = bytes_.size() - offset;
    }
    JAR_DCHECK(offset + length <= bytes_.size(), "slice [{}, {}) out of buffer size {}", offset,
               offset + length, bytes_.size());
    return Slice(data() + offset, length);
  }

  std::string ToString() const {
    return bytes_;
  }

private:
  std::string bytes_;
};

} // namespace jarstore
