#pragma once

#include "jarstore/base/log.hpp"

#include <cstddef>
#include <type_traits>

namespace jarstore {

/// Splits a range [begin, end) into n sub-ranges as evenly as possible. The
/// first (size % n) sub-ranges get one extra element.
///
/// NOTE: n must be > 0.
template <typename T>
  requires(std::is_integral_v<T>)
class RangeSplits {
public:
  /// Represents a range [begin, end).
  class Range {
  public:
    Range() = default;

    Range(T begin, T end) : begin_(begin), end_(end) {
    }

    T begin() const { // NOLINT: mimic STL iterator
      return begin_;
    }

    T end() const { // NOLINT: mimic STL iterator
      return end_;
    }

    T size() const { // NOLINT: mimic STL container
      return end_ - begin_;
    }

  private:
    T begin_ = 0;
    T end_ = 0;
  };

  RangeSplits(Range range_to_split, size_t n)
      : range_to_split_(range_to_split),
        n_(n),
        base_((range_to_split.end() - range_to_split.begin()) / static_cast<T>(n)),
        extra_((range_to_split.end() - range_to_split.begin()) % static_cast<T>(n)) {
    JAR_DCHECK(n_ > 0, "Number of splits must be greater than 0");
  }

  RangeSplits(T end, size_t n) : RangeSplits({0, end}, n) {
  }

  size_t size() const { // NOLINT: mimic STL container
    return n_;
  }

  /// Returns the sub-range at the given index.
  Range operator[](size_t idx) const {
    return {GetRangeBegin(idx), GetRangeBegin(idx) + GetRangeLength(idx)};
  }

  T GetRangeBegin(size_t idx) const {
    auto range_begin = range_to_split_.begin() + base_ * static_cast<T>(idx);
    if (static_cast<T>(idx) < extra_) {
      range_begin += static_cast<T>(idx);
    } else {
      range_begin += extra_;
    }
    return range_begin;
  }

  T GetRangeLength(size_t idx) const {
    if (idx >= n_) {
      return 0;
    }
    if (static_cast<T>(idx) < extra_) {
      return base_ + 1;
    }
    return base_;
  }

private:
  Range range_to_split_;
  size_t n_;
  T base_;
  T extra_;
};

} // namespace jarstore
