#include "jarstore/io/file_writer.hpp"

#include "jarstore/base/portable.h"
#include "jarstore/base/log.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <string>

#include <fcntl.h>
#include <unistd.h>

namespace jarstore {

Result<FileWriter> FileWriter::New(std::string_view file_path) {
  std::string path(file_path);
  int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (JAR_UNLIKELY(fd < 0)) {
    return Error::FileOpen(path, errno, strerror(errno));
  }
  return FileWriter(std::move(path), fd);
}

FileWriter::~FileWriter() {
  if (fd_ >= 0) {
    if (close(fd_) < 0) {
      Log::Warn("Close unfinished file failed, file={}, errno={}", path_, errno);
    }
    fd_ = kInvalidFd;
  }
}

Result<void> FileWriter::Append(Slice data) {
  if (JAR_UNLIKELY(fd_ < 0)) {
    return Error::FileWrite(path_, EBADF, "file is not open");
  }

  // pwrite may write less than requested, loop until the whole slice is out.
  size_t done = 0;
  while (done < data.size()) {
    auto written = pwrite(fd_, data.data() + done, data.size() - done,
                          static_cast<off_t>(offset_ + done));
    if (JAR_UNLIKELY(written < 0)) {
      if (errno == EINTR) {
        continue;
      }
      return Error::FileWrite(path_, errno, strerror(errno));
    }
    if (JAR_UNLIKELY(written == 0)) {
      return Error::FileWrite(path_, EIO, "pwrite wrote zero bytes");
    }
    done += static_cast<size_t>(written);
  }

  offset_ += done;
  return {};
}

Result<void> FileWriter::Sync() {
  if (JAR_UNLIKELY(fd_ < 0)) {
    return Error::FileSync(path_, EBADF, "file is not open");
  }
  if (fdatasync(fd_) < 0) {
    return Error::FileSync(path_, errno, strerror(errno));
  }
  return {};
}

Result<void> FileWriter::Close() {
  if (fd_ >= 0) {
    if (fdatasync(fd_) < 0) {
      return Error::FileSync(path_, errno, strerror(errno));
    }
    if (close(fd_) < 0) {
      fd_ = kInvalidFd;
      return Error::FileClose(path_, errno, strerror(errno));
    }
    fd_ = kInvalidFd;
  }
  return {};
}

Result<void> RenameFile(const std::string& from, const std::string& to) {
  if (rename(from.c_str(), to.c_str()) < 0) {
    return Error::FileRename(from, to, errno, strerror(errno));
  }

  auto dir = std::filesystem::path(to).parent_path();
  auto dir_str = dir.empty() ? std::string(".") : dir.string();
  int dir_fd = open(dir_str.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (dir_fd < 0) {
    return Error::FileOpen(dir_str, errno, strerror(errno));
  }
  if (fsync(dir_fd) < 0) {
    auto err = errno;
    close(dir_fd);
    return Error::FileSync(dir_str, err, strerror(err));
  }
  if (close(dir_fd) < 0) {
    return Error::FileClose(dir_str, errno, strerror(errno));
  }
  return {};
}

Result<void> RemoveFileIfExists(const std::string& path) {
  if (unlink(path.c_str()) < 0 && errno != ENOENT) {
    return Error::FileRemove(path, errno, strerror(errno));
  }
  return {};
}

} // namespace jarstore
