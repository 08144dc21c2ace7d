#include "jarstore/io/mmap_file.hpp"

#include "jarstore/base/portable.h"
#include "jarstore/base/log.hpp"

#include <cerrno>
#include <cstring>
#include <string>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace jarstore {

Result<MmapFile> MmapFile::Open(std::string_view file_path) {
  std::string path(file_path);
  int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (JAR_UNLIKELY(fd < 0)) {
    return Error::FileOpen(path, errno, strerror(errno));
  }

  struct stat st;
  if (fstat(fd, &st) < 0) {
    auto err = errno;
    close(fd);
    return Error::FileStat(path, err, strerror(err));
  }

  auto size = static_cast<uint64_t>(st.st_size);
  if (size == 0) {
    // mmap refuses zero-length mappings, an empty file maps to an empty view.
    close(fd);
    return MmapFile(std::move(path), nullptr, 0);
  }

  void* addr = mmap(nullptr, size, PROT_READ, MAP_SHARED, fd, 0);
  auto mmap_errno = errno;
  // The mapping stays valid after the descriptor is closed.
  if (close(fd) < 0) {
    Log::Warn("Close mapped file failed, file={}, errno={}", path, errno);
  }
  if (addr == MAP_FAILED) {
    return Error::FileMmap(path, mmap_errno, strerror(mmap_errno));
  }
  return MmapFile(std::move(path), static_cast<const uint8_t*>(addr), size);
}

MmapFile::MmapFile(MmapFile&& other) noexcept
    : path_(std::move(other.path_)),
      data_(other.data_),
      size_(other.size_) {
  other.data_ = nullptr;
  other.size_ = 0;
}

MmapFile& MmapFile::operator=(MmapFile&& other) noexcept {
  if (this != &other) {
    Unmap();
    path_ = std::move(other.path_);
    data_ = other.data_;
    size_ = other.size_;
    other.data_ = nullptr;
    other.size_ = 0;
  }
  return *this;
}

MmapFile::~MmapFile() {
  Unmap();
}

void MmapFile::Unmap() {
  if (data_ != nullptr) {
    if (munmap(const_cast<uint8_t*>(data_), size_) < 0) {
      Log::Warn("Unmap file failed, file={}, errno={}", path_, errno);
    }
    data_ = nullptr;
    size_ = 0;
  }
}

} // namespace jarstore
