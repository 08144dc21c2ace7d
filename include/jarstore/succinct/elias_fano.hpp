#pragma once

#include "jarstore/base/result.hpp"
#include "jarstore/base/slice.hpp"
#include "jarstore/succinct/bit_vector.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace jarstore::succinct {

/// Encodes a non-decreasing sequence of integers with Elias-Fano.
///
/// Each value is split into low_bits low bits, stored packed, and the
/// remaining high part, stored in unary as a bit vector where value i sets
/// bit (high_i + i).
///
/// Layout (all little-endian uint64):
///   count, universe, low_bits, num_low_words, low[num_low_words], high bit vector
class EliasFanoBuilder {
public:
  void Reserve(uint64_t count) {
    values_.reserve(count);
  }

  /// Appends the next value. It must not be smaller than the previous one.
  Result<void> Append(uint64_t value) {
    if (!values_.empty() && value < values_.back()) {
      return Error::InvalidArgument(
          std::format("elias-fano value {} is smaller than previous {}", value, values_.back()));
    }
    values_.push_back(value);
    return {};
  }

  uint64_t Size() const {
    return values_.size();
  }

  /// Appends the encoded sequence to out. out.size() must be a multiple of 8.
  void Serialize(std::string& out) const;

private:
  std::vector<uint64_t> values_;
};

/// Read-only view over a serialized Elias-Fano sequence.
class EliasFano {
public:
  EliasFano() = default;

  /// Loads a view over data, which must be 8-byte aligned and outlive the
  /// view. Returns the number of bytes consumed through consumed.
  static Result<EliasFano> Load(Slice data, uint64_t* consumed);

  /// Returns the i-th value. i must be < Size().
  uint64_t Get(uint64_t i) const {
    const uint64_t high = high_.Select1(i) - i;
    return (high << low_bits_) | PackedReadLow(i);
  }

  /// Returns the i-th and (i+1)-th values with a single select. i + 1 must
  /// be < Size().
  std::pair<uint64_t, uint64_t> GetPair(uint64_t i) const {
    const uint64_t pos = high_.Select1(i);
    const uint64_t next_pos = high_.NextOne(pos + 1);
    const uint64_t first = ((pos - i) << low_bits_) | PackedReadLow(i);
    const uint64_t second = ((next_pos - i - 1) << low_bits_) | PackedReadLow(i + 1);
    return {first, second};
  }

  uint64_t Size() const {
    return count_;
  }

  /// The largest (last) value, 0 for an empty sequence.
  uint64_t Universe() const {
    return universe_;
  }

private:
  uint64_t PackedReadLow(uint64_t i) const;

  uint64_t count_ = 0;
  uint64_t universe_ = 0;
  uint32_t low_bits_ = 0;
  const uint64_t* low_ = nullptr;
  BitVector high_;
};

/// Accumulates the compressed length of every row of a column in one
/// append-only pass and encodes the row_count + 1 column-relative offsets.
class OffsetIndexBuilder {
public:
  OffsetIndexBuilder() {
    // offset[0] is always 0, so an empty column still has one entry.
    (void)builder_.Append(0);
  }

  void Reserve(uint64_t num_rows) {
    builder_.Reserve(num_rows + 1);
  }

  /// Records the next row's compressed length.
  void Append(uint64_t length) {
    total_ += length;
    (void)builder_.Append(total_);
  }

  uint64_t NumRows() const {
    return builder_.Size() - 1;
  }

  /// Total compressed length of the column so far.
  uint64_t TotalSize() const {
    return total_;
  }

  void Serialize(std::string& out) const {
    builder_.Serialize(out);
  }

private:
  EliasFanoBuilder builder_;
  uint64_t total_ = 0;
};

/// Maps a row index to the byte range of its compressed block inside the
/// column data blob.
class OffsetIndex {
public:
  OffsetIndex() = default;

  /// Loads and validates an offset index for a column of num_rows rows whose
  /// data blob is data_size bytes long.
  static Result<OffsetIndex> Load(Slice data, uint64_t num_rows, uint64_t data_size);

  /// Returns [begin, end) of the row's block, column relative. row must be
  /// < NumRows().
  std::pair<uint64_t, uint64_t> RowRange(uint64_t row) const {
    return offsets_.GetPair(row);
  }

  /// Returns offset[i] for i in [0, NumRows()].
  uint64_t Offset(uint64_t i) const {
    return offsets_.Get(i);
  }

  uint64_t NumRows() const {
    return offsets_.Size() - 1;
  }

private:
  EliasFano offsets_;
};

} // namespace jarstore::succinct
