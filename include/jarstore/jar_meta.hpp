#pragma once

#include "jarstore/base/result.hpp"
#include "jarstore/codec/codec.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace jarstore {

/// A byte range [offset_, offset_ + size_) of the jar file.
struct SectionRange {
  uint64_t offset_ = 0;
  uint64_t size_ = 0;

  uint64_t End() const {
    return offset_ + size_;
  }

  bool operator==(const SectionRange& other) const = default;
};

/// Schema and location of one column.
struct ColumnMeta {
  CodecType codec_ = CodecType::kRaw;
  int level_ = 0;

  /// Concatenated compressed rows.
  SectionRange data_;

  /// Serialized offset index.
  SectionRange offsets_;

  /// Trained dictionary, empty when the column has none.
  SectionRange dictionary_;

  /// Sum of the uncompressed row sizes.
  uint64_t raw_bytes_ = 0;

  /// Largest uncompressed row. Bounds every decompression of the column.
  uint64_t max_row_size_ = 0;

  /// crc32c of the data blob, checked by Jar::Verify().
  uint32_t data_crc_ = 0;
};

/// Decoded meta section of a sealed jar.
struct JarMeta {
  uint64_t version_ = 0;
  uint64_t row_count_ = 0;
  std::vector<ColumnMeta> columns_;

  /// Empty when the jar has no filter.
  SectionRange filter_;

  /// Empty when the jar has no perfect hash.
  SectionRange phf_;

  SectionRange user_header_;

  bool HasFilter() const {
    return filter_.size_ > 0;
  }

  bool HasPhf() const {
    return phf_.size_ > 0;
  }

  std::string ToJson() const;

  /// Parses the meta section. Fails with InvalidMeta, naming file, if a
  /// member is missing or has the wrong type.
  static Result<JarMeta> FromJson(std::string_view json, const std::string& file);
};

} // namespace jarstore
