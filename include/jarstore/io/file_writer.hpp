#pragma once

#include "jarstore/base/result.hpp"
#include "jarstore/base/slice.hpp"

#include <cassert>
#include <cstdint>
#include <string>
#include <string_view>

namespace jarstore {

/// Sequential, append-only writer over a file descriptor.
class FileWriter {
public:
  /// Creates (or truncates) the file at file_path.
  static Result<FileWriter> New(std::string_view file_path);

  FileWriter(const FileWriter&) = delete;                      // no copy constructor
  FileWriter& operator=(const FileWriter&) = delete;           // no copy assignment
  FileWriter& operator=(FileWriter&& other) noexcept = delete; // no move assignment

  /// Only move constructor is allowed.
  FileWriter(FileWriter&& other) noexcept
      : path_(std::move(other.path_)),
        fd_(other.fd_),
        offset_(other.offset_) {
    other.fd_ = kInvalidFd;
  }

  /// Closes the descriptor without syncing if Close() was never called, which
  /// only happens on error paths where the file is discarded anyway.
  ~FileWriter();

  /// Append data to the file.
  Result<void> Append(Slice data);

  /// Flush written data to durable storage.
  Result<void> Sync();

  /// Sync and close the file. Must be called to make the written data durable.
  Result<void> Close();

  /// Returns the number of bytes written so far.
  uint64_t BytesWritten() const {
    return offset_;
  }

  const std::string& Path() const {
    return path_;
  }

private:
  static constexpr int kInvalidFd = -1;

  FileWriter(std::string path, int fd) : path_(std::move(path)), fd_(fd), offset_(0) {
    assert(fd_ >= 0);
  }

  std::string path_;

  int fd_;

  /// Current offset in the file.
  uint64_t offset_;
};

/// Atomically renames from to to, then syncs the parent directory of to so
/// the rename itself survives a crash.
Result<void> RenameFile(const std::string& from, const std::string& to);

/// Removes the file if it exists. A missing file is not an error.
Result<void> RemoveFileIfExists(const std::string& path);

} // namespace jarstore
