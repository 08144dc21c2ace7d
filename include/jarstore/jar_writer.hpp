#pragma once

#include "jarstore/base/result.hpp"
#include "jarstore/base/slice.hpp"
#include "jarstore/config/jar_options.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace jarstore {

class FileWriter;

/// Statistics of a sealed jar.
struct JarStats {
  uint64_t rows_ = 0;
  uint64_t columns_ = 0;

  /// Sum of all uncompressed rows.
  uint64_t raw_bytes_ = 0;

  /// Sum of all column data blobs.
  uint64_t compressed_bytes_ = 0;

  uint64_t offset_index_bytes_ = 0;
  uint64_t dictionary_bytes_ = 0;
  uint64_t filter_bytes_ = 0;
  uint64_t phf_bytes_ = 0;
  uint64_t file_size_ = 0;

  double CompressionRatio() const {
    return compressed_bytes_ == 0 ? 0.0
                                  : static_cast<double>(raw_bytes_) /
                                        static_cast<double>(compressed_bytes_);
  }
};

/// Builds a jar. A writer is used by a single thread and goes through
///
///   kOpen --Seal()--> kSealing --> kSealed
///                          \-----> kFailed
///
/// While open, rows (and optionally keys) are staged in memory. Seal()
/// checks the schema, trains dictionaries, compresses every row, builds the
/// offset indexes, the filter and the perfect hash, and writes the jar to a
/// temporary file that is renamed into place once the footer is durable.
/// Nothing is written to disk before the staged rows pass the schema check.
/// Once sealed or failed the writer accepts no more calls.
class JarWriter {
public:
  enum class State : uint8_t {
    kOpen = 0,
    kSealing,
    kSealed,
    kFailed,
  };

  /// Creates a writer for a jar at jar_path. Validates the options only, no
  /// file is touched until Seal().
  static Result<std::unique_ptr<JarWriter>> Create(std::string jar_path, JarOptions options);

  ~JarWriter();

  JarWriter(const JarWriter&) = delete;
  JarWriter& operator=(const JarWriter&) = delete;

  /// Stages the next row of one column.
  Result<void> PushRow(uint64_t column, Slice row);

  /// Stages one row for every column.
  Result<void> PushRecord(const std::vector<Slice>& rows);

  /// Stages the key of the next record. Keys map to row indexes in push
  /// order, the i-th key identifies row i.
  Result<void> PushKey(Slice key);

  /// Opaque bytes stored alongside the jar, returned by Jar::UserHeader().
  Result<void> SetUserHeader(Slice header);

  /// Seals the jar. On failure the writer moves to kFailed and no file is
  /// left behind.
  Result<JarStats> Seal();

  State GetState() const {
    return state_;
  }

  uint64_t NumColumns() const {
    return options_.NumColumns();
  }

  /// Rows staged so far for column, or the rows of the jar once sealed. 0 for
  /// a column the jar does not have.
  uint64_t NumRows(uint64_t column) const;

  uint64_t NumKeys() const;

  const std::string& Path() const {
    return jar_path_;
  }

private:
  /// Rows of one column, concatenated, with the end offset of every row.
  struct StagedColumn {
    std::string bytes_;
    std::vector<uint64_t> row_ends_;

    Slice Row(uint64_t row) const {
      const uint64_t begin = row == 0 ? 0 : row_ends_[row - 1];
      return Slice(bytes_.data() + begin, row_ends_[row] - begin);
    }
  };

  JarWriter(std::string jar_path, JarOptions options);

  Result<void> CheckOpen() const;

  Result<void> CheckSchema() const;

  std::vector<Slice> StagedKeys() const;

  Result<JarStats> DoSeal();

  std::string jar_path_;
  JarOptions options_;
  State state_ = State::kOpen;

  std::vector<StagedColumn> columns_;

  std::string key_bytes_;
  std::vector<uint64_t> key_ends_;

  std::string user_header_;

  /// Staging is released by Seal(), these keep the sealed counts.
  uint64_t sealed_rows_ = 0;
  uint64_t sealed_keys_ = 0;
};

const char* ToString(JarWriter::State state);

} // namespace jarstore
