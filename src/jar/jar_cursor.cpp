#include "jarstore/jar_cursor.hpp"

#include "jarstore/base/error.hpp"
#include "jarstore/jar.hpp"

#include <numeric>
#include <utility>

namespace jarstore {

JarCursor::JarCursor(const Jar* jar, std::vector<uint64_t> columns)
    : jar_(jar),
      columns_(std::move(columns)) {
  if (columns_.empty()) {
    columns_.resize(jar_->ColumnCount());
    std::iota(columns_.begin(), columns_.end(), 0);
  }
  values_.resize(columns_.size());
}

Result<bool> JarCursor::SeekToFirst() {
  return Seek(0);
}

Result<bool> JarCursor::Seek(uint64_t row) {
  row_ = row;
  return ReadCurrent();
}

Result<bool> JarCursor::Next() {
  if (!is_valid_) {
    return false;
  }
  ++row_;
  return ReadCurrent();
}

Result<bool> JarCursor::ReadCurrent() {
  is_valid_ = false;
  if (row_ >= jar_->RowCount()) {
    return false;
  }
  for (size_t i = 0; i < columns_.size(); ++i) {
    if (auto res = jar_->GetRow(columns_[i], row_, &values_[i]); !res) {
      return std::move(res.error());
    }
  }
  is_valid_ = true;
  return true;
}

} // namespace jarstore
