#pragma once

#include "jarstore/base/result.hpp"
#include "jarstore/codec/codec.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace jarstore {

/// Per column compression settings.
struct ColumnOptions {
  CodecType codec_ = CodecType::kZstd;

  /// Compression level, only meaningful for zstd.
  int level_ = 3;

  /// Whether to train a zstd dictionary from a sample of the column's rows.
  bool train_dictionary_ = false;

  /// Upper bound of the trained dictionary (bytes).
  uint64_t max_dict_bytes_ = 64 << 10; // 64KB
};

/// The options for building a jar.
struct JarOptions {
  // ---------------------------------------------------------------------------
  // Column related options
  // ---------------------------------------------------------------------------

  /// One entry per column, the number of entries is the column count.
  std::vector<ColumnOptions> columns_;

  /// The most row bytes per column fed into dictionary training.
  uint64_t max_dict_sample_bytes_ = 4 << 20; // 4MB

  /// The number of threads compressing rows while sealing.
  uint64_t compression_threads_ = 1;

  // ---------------------------------------------------------------------------
  // Key related options, ignored when no key is pushed
  // ---------------------------------------------------------------------------

  /// Whether to build the membership filter over the keys.
  bool with_filter_ = true;

  /// Filter capacity in keys. 0 sizes the filter for the row count.
  uint64_t filter_capacity_ = 0;

  /// Target false-positive rate of the filter, in
  /// [CuckooFilterBuilder::kMinFpRate, 1).
  double filter_fp_rate_ = 0.01;

  /// Whether to build the perfect hash index over the keys. Requires
  /// with_filter_.
  bool with_phf_ = true;

  /// Bits per key on each perfect hash level, at least 1.
  double phf_gamma_ = 2.0;

  /// Options with num_columns columns sharing the same settings.
  static JarOptions Uniform(uint64_t num_columns, const ColumnOptions& column = {}) {
    JarOptions options;
    options.columns_.assign(num_columns, column);
    return options;
  }

  uint64_t NumColumns() const {
    return columns_.size();
  }

  /// Checks that every option is in its valid range.
  Result<void> Validate() const;

  std::string ToJson() const;

  static Result<JarOptions> FromJson(std::string_view json);

  static Result<JarOptions> LoadFromFile(const std::string& path);
};

} // namespace jarstore
