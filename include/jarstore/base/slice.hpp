#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>

namespace jarstore {

/// Read-only view over a byte range. Never owns the bytes, the caller keeps
/// the underlying buffer (or mapping) alive for as long as the view is used.
class Slice : public std::basic_string_view<uint8_t> {
public:
  Slice() : std::basic_string_view<uint8_t>() {
  }

  Slice(const std::string& str)
      : std::basic_string_view<uint8_t>(reinterpret_cast<const uint8_t*>(str.data()), str.size()) {
  }

  Slice(const std::string_view& str)
      : std::basic_string_view<uint8_t>(reinterpret_cast<const uint8_t*>(str.data()), str.size()) {
  }

  Slice(const uint8_t* data, size_t size) : std::basic_string_view<uint8_t>(data, size) {
  }

  Slice(std::basic_string_view<uint8_t> view) : std::basic_string_view<uint8_t>(view) {
  }

  Slice(const char* data)
      : std::basic_string_view<uint8_t>(reinterpret_cast<const uint8_t*>(data), std::strlen(data)) {
  }

  Slice(const char* data, size_t size)
      : std::basic_string_view<uint8_t>(reinterpret_cast<const uint8_t*>(data), size) {
  }

  /// Same as the base class, but stays a Slice.
  Slice substr(size_t pos, size_t count = npos) const { // NOLINT: mimic std::string_view
    return Slice(std::basic_string_view<uint8_t>::substr(pos, count));
  }

  const char* CharData() const {
    return reinterpret_cast<const char*>(data());
  }

  std::string_view StringView() const {
    return std::string_view(CharData(), size());
  }

  std::string ToString() const {
    return std::string(CharData(), size());
  }

  void CopyTo(std::string& dest) const {
    dest.resize(size());
    if (!empty()) {
      std::memcpy(dest.data(), data(), size());
    }
  }

  void AppendTo(std::string& dest) const {
    dest.append(CharData(), size());
  }
};

inline std::string ToString(Slice slice) {
  return slice.ToString();
}

} // namespace jarstore
