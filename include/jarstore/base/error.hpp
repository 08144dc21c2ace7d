#pragma once

#include <cstdint>
#include <format>
#include <ostream>
#include <string>
#include <utility>

namespace jarstore {

/// All the error code names, values, and message formats are listed in this macro.
///
/// Codes are grouped by hundreds, each group is one error category:
///   0xx general, 1xx I/O, 2xx construction, 3xx format, 4xx corruption, 5xx lookup.
#define JAR_ERROR_CODE_LIST(ACTION)                                                                \
  ACTION(General, 1, "{}")                                                                         \
  ACTION(InvalidArgument, 2, "{}")                                                                 \
  ACTION(NotImplemented, 3, "{}")                                                                  \
  ACTION(FileOpen, 100, "Open file failed, file={}, errno={}, strerror={}")                        \
  ACTION(FileClose, 101, "Close file failed, file={}, errno={}, strerror={}")                      \
  ACTION(FileRead, 102, "Read file failed, file={}, errno={}, strerror={}")                        \
  ACTION(FileWrite, 103, "Write file failed, file={}, errno={}, strerror={}")                      \
  ACTION(FileSync, 104, "Sync file failed, file={}, errno={}, strerror={}")                        \
  ACTION(FileRename, 105, "Rename file failed, from={}, to={}, errno={}, strerror={}")             \
  ACTION(FileStat, 106, "Stat file failed, file={}, errno={}, strerror={}")                        \
  ACTION(FileMmap, 107, "Mmap file failed, file={}, errno={}, strerror={}")                        \
  ACTION(FileRemove, 108, "Remove file failed, file={}, errno={}, strerror={}")                    \
  ACTION(SchemaMismatch, 200, "Column row counts differ, column={}, rows={}, expected={}")         \
  ACTION(DuplicateKey, 201, "Duplicate key, first_row={}, second_row={}")                          \
  ACTION(FilterCapacityExceeded, 202, "Filter capacity exceeded, capacity={}, inserted={}")        \
  ACTION(PhfBuildFailed, 203, "Perfect hash build failed, keys={}, reason={}")                     \
  ACTION(WriterState, 204, "Writer is not open, state={}")                                         \
  ACTION(KeyCountMismatch, 205, "Key count does not match row count, keys={}, rows={}")            \
  ACTION(CompressFailed, 206, "Compress failed, codec={}, reason={}")                              \
  ACTION(DictionaryTraining, 207, "Dictionary training failed, column={}, reason={}")              \
  ACTION(BadMagic, 300, "Bad magic, file={}, section={}")                                          \
  ACTION(UnsupportedVersion, 301, "Unsupported format version, file={}, version={}")               \
  ACTION(IncompleteJar, 302, "Incomplete jar, file={}, reason={}")                                 \
  ACTION(InvalidMeta, 303, "Invalid jar meta, file={}, reason={}")                                 \
  ACTION(Corrupted, 400, "Corrupted {}, column={}, row={}, reason={}")                             \
  ACTION(ChecksumMismatch, 401, "Checksum mismatch, section={}, expected={:#x}, actual={:#x}")     \
  ACTION(DecompressFailed, 402, "Decompress failed, codec={}, reason={}")                          \
  ACTION(OutOfRange, 500, "Out of range, {}={}, limit={}")                                         \
  ACTION(KeyNotFound, 501, "Key not found")                                                        \
  ACTION(Unsupported, 502, "Unsupported operation: {}")

#define JAR_ERROR_CODE(ename) k##ename

#define JAR_ERROR_FMT(ename) k##ename##MsgFmt

#define JAR_DEFINE_ERROR_CODE(ename, evalue, ...) JAR_ERROR_CODE(ename) = evalue,

#define JAR_DEFINE_ERROR_BUILDER(ename, ...)                                                       \
  template <typename... Args>                                                                      \
  static Error ename(Args&&... args) {                                                             \
    return Error(Error::Code::JAR_ERROR_CODE(ename),                                               \
                 std::vformat(JAR_ERROR_FMT(ename), std::make_format_args(args...)));              \
  }

#define JAR_DEFINE_ERROR_FMT(ename, evalue, efmt, ...)                                             \
  static const constexpr char* JAR_ERROR_FMT(ename) = efmt;

/// Representation of an error with code, message, and stack trace if available.
///
/// Errors are created with the static factory methods, one per error code,
/// whose arguments match the format string in JAR_ERROR_CODE_LIST:
///
///   auto err1 = Error::OutOfRange("row", 10, 3);
///   auto err2 = Error::FileRead("data.jar", errno, strerror(errno));
class Error {
public:
  /// Error codes.
  enum Code : int64_t { JAR_ERROR_CODE_LIST(JAR_DEFINE_ERROR_CODE) };

  /// Error categories, derived from the code range.
  enum class Category : uint8_t {
    kGeneral = 0,
    kIO = 1,
    kConstruction = 2,
    kFormat = 3,
    kCorruption = 4,
    kLookup = 5,
  };

  /// Returns the error code.
  Code GetCode() const {
    return code_;
  }

  /// Returns the category the error code belongs to.
  Category GetCategory() const {
    return static_cast<Category>(static_cast<int64_t>(code_) / 100);
  }

  const std::string& Message() const {
    return message_;
  }

  /// Returns the string representation of the Error, including stack trace if available.
  std::string ToString() const {
    if (stacktrace_.empty()) {
      return std::format("[ERR-{:03}] {}", static_cast<int64_t>(code_), message_);
    }
    return std::format("[ERR-{:03}] {}\n{}", static_cast<int64_t>(code_), message_, stacktrace_);
  }

  friend std::ostream& operator<<(std::ostream& os, const Error& error) {
    return os << error.ToString();
  }

  /// Two errors are equal if they have the same code and message.
  bool operator==(const Error& other) const {
    return code_ == other.code_ && message_ == other.message_;
  }

  /// Factory methods for creating errors for each error code.
  JAR_ERROR_CODE_LIST(JAR_DEFINE_ERROR_BUILDER);

private:
  Error(Code code, std::string&& message)
      : code_(code),
        message_(std::move(message)) {
#ifdef DEBUG
    stacktrace_ = CaptureStacktrace();
#endif
  }

  /// Formats the call stack above the error factory, via cpptrace.
  static std::string CaptureStacktrace();

  /// Message formats for each error code.
  JAR_ERROR_CODE_LIST(JAR_DEFINE_ERROR_FMT);

  Code code_;
  std::string message_;
  std::string stacktrace_;
};

#undef JAR_ERROR_CODE_LIST
#undef JAR_ERROR_CODE
#undef JAR_ERROR_FMT
#undef JAR_DEFINE_ERROR_CODE
#undef JAR_DEFINE_ERROR_BUILDER
#undef JAR_DEFINE_ERROR_FMT

inline const char* ToString(Error::Category category) {
  switch (category) {
  case Error::Category::kGeneral:
    return "general";
  case Error::Category::kIO:
    return "io";
  case Error::Category::kConstruction:
    return "construction";
  case Error::Category::kFormat:
    return "format";
  case Error::Category::kCorruption:
    return "corruption";
  case Error::Category::kLookup:
    return "lookup";
  }
  return "unknown";
}

} // namespace jarstore
