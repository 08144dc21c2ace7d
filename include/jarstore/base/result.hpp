#pragma once

#include "jarstore/base/error.hpp"
#include "jarstore/base/log.hpp"

#include <expected>
#include <type_traits>
#include <utility>
#include <variant>

namespace jarstore {

/// Either a value of type T or an Error, the return type of every fallible
/// jarstore operation. Accessors follow std::expected. Result<void> carries
/// no value, only success or an error:
///
///   Result<void> Flush();
///   Result<uint64_t> RowOf(Slice key);
///
///   if (auto res = RowOf(key); !res) {
///     return std::move(res.error());
///   }
template <typename T, typename E = Error>
class [[nodiscard]] Result {
public:
  using storage_t = std::conditional_t<std::is_void_v<T>, std::monostate, T>;
  using result_t = std::expected<storage_t, E>;

  Result(result_t&& result) : result_(std::move(result)) { // NOLINT
  }

  /// Success of a Result<void>.
  Result()
    requires std::is_void_v<T>
      : result_(storage_t{}) {
  }

  Result(storage_t&& v) : result_(std::move(v)) { // NOLINT
  }

  Result(const storage_t& v) : result_(v) { // NOLINT
  }

  Result(E&& e) : result_(std::unexpected(std::move(e))) { // NOLINT
  }

  Result(const E& e) : result_(std::unexpected(e)) { // NOLINT
  }

  constexpr bool has_value() const noexcept { // NOLINT: mimicking std::expected
    return result_.has_value();
  }

  explicit operator bool() const noexcept {
    return has_value();
  }

  friend bool operator==(const Result& lhs, const Result& rhs) noexcept {
    return lhs.result_ == rhs.result_;
  }

  constexpr storage_t& value() & { // NOLINT: mimicking std::expected
    JAR_DCHECK(has_value(), "Result holds an error");
    return result_.value();
  }

  constexpr const storage_t& value() const& { // NOLINT: mimicking std::expected
    JAR_DCHECK(has_value(), "Result holds an error");
    return result_.value();
  }

  /// Moves the value out of an expiring Result.
  constexpr storage_t&& value() && { // NOLINT: mimicking std::expected
    JAR_DCHECK(has_value(), "Result holds an error");
    return std::move(result_.value());
  }

  /// Returns the value, or fallback when the Result holds an error.
  template <typename U>
    requires(!std::is_void_v<T>)
  storage_t value_or(U&& fallback) const& { // NOLINT: mimicking std::expected
    return result_.value_or(std::forward<U>(fallback));
  }

  constexpr E& error() & { // NOLINT: mimicking std::expected
    JAR_DCHECK(!has_value(), "Result holds a value");
    return result_.error();
  }

  constexpr const E& error() const& { // NOLINT: mimicking std::expected
    JAR_DCHECK(!has_value(), "Result holds a value");
    return result_.error();
  }

private:
  result_t result_;
};

} // namespace jarstore
