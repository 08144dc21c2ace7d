#pragma once

#include "jarstore/base/result.hpp"
#include "jarstore/base/slice.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace jarstore {

/// Read-only memory mapping of a whole file. The mapping is private to this
/// object and unmapped on destruction, every Slice handed out by Data() is
/// bounded by the lifetime of the MmapFile.
class MmapFile {
public:
  static Result<MmapFile> Open(std::string_view file_path);

  MmapFile(const MmapFile&) = delete;
  MmapFile& operator=(const MmapFile&) = delete;

  MmapFile(MmapFile&& other) noexcept;
  MmapFile& operator=(MmapFile&& other) noexcept;

  ~MmapFile();

  Slice Data() const {
    return Slice(data_, size_);
  }

  uint64_t Size() const {
    return size_;
  }

  const std::string& Path() const {
    return path_;
  }

private:
  MmapFile(std::string path, const uint8_t* data, uint64_t size)
      : path_(std::move(path)),
        data_(data),
        size_(size) {
  }

  void Unmap();

  std::string path_;
  const uint8_t* data_ = nullptr;
  uint64_t size_ = 0;
};

} // namespace jarstore
