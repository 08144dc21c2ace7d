#pragma once

#include "jarstore/base/result.hpp"
#include "jarstore/base/slice.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace jarstore {

class Jar;

/// JarCursor iterates over the rows of a jar in row order, decompressing the
/// selected columns of the current row into buffers it reuses.
///
/// A cursor is used by one thread, any number of cursors can share a jar.
/// The jar must outlive the cursor.
class JarCursor {
public:
  /// Creates a cursor over the given columns, all columns when columns is
  /// empty. The cursor is not positioned until one of the Seek methods is
  /// called.
  explicit JarCursor(const Jar* jar, std::vector<uint64_t> columns = {});

  JarCursor(const JarCursor&) = delete;
  JarCursor& operator=(const JarCursor&) = delete;
  JarCursor(JarCursor&&) noexcept = default;
  JarCursor& operator=(JarCursor&&) noexcept = default;

  /// Position the cursor at the first row.
  /// @return true if the cursor is valid, false if the jar is empty.
  Result<bool> SeekToFirst();

  /// Position the cursor at the given row.
  /// @return true if the cursor is valid, false if row is past the last row.
  Result<bool> Seek(uint64_t row);

  /// Move the cursor to the next row.
  /// @return true if the cursor is valid after moving, false if no more rows.
  Result<bool> Next();

  bool IsValid() const {
    return is_valid_;
  }

  uint64_t CurrentRow() const {
    return row_;
  }

  /// Number of columns the cursor reads.
  size_t NumColumns() const {
    return columns_.size();
  }

  /// The current row of the i-th selected column. Valid until the cursor
  /// moves.
  Slice CurrentValue(size_t i) const {
    return Slice(values_[i]);
  }

private:
  Result<bool> ReadCurrent();

  const Jar* jar_;
  std::vector<uint64_t> columns_;
  std::vector<std::string> values_;
  uint64_t row_ = 0;
  bool is_valid_ = false;
};

} // namespace jarstore
