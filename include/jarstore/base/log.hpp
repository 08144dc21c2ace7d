#pragma once

#include <cstdint>
#include <cstdlib>
#include <format>
#include <string>
#include <utility>

#ifdef DEBUG
#define JAR_DLOG(...) jarstore::Log::Debug(__VA_ARGS__);
#define JAR_DCHECK(...) jarstore::Log::DebugCheck(__VA_ARGS__);
#else
#define JAR_DLOG(...) (void)0;
#define JAR_DCHECK(...) (void)0;
#endif

namespace jarstore {

enum class LogLevel : uint8_t {
  kDebug = 0,
  kInfo,
  kWarn,
  kError,
  kFatal,
};

struct LogOptions {
  /// The log file. Empty keeps logging on the default console logger.
  std::string log_path_;

  LogLevel log_level_ = LogLevel::kInfo;

  /// Buffered messages below warn are flushed at this interval.
  uint32_t flush_interval_seconds_ = 3;
};

/// Process wide logging facade over spdlog. Messages below the configured
/// level are dropped before they are formatted.
class Log {
public:
  static void Init(const LogOptions& options);
  static void Deinit();

  static bool IsEnabled(LogLevel level);

  /// Writes an already formatted message. Fatal messages abort the process.
  static void Write(LogLevel level, const std::string& msg);

  /// Logs msg and aborts when condition is false. Only used via JAR_DCHECK.
  static void DebugCheck(bool condition, const std::string& msg = "");

  template <typename... Args>
  static void DebugCheck(bool condition, std::format_string<Args...> fmt, Args&&... args) {
    if (!condition) {
      DebugCheck(false, std::format(fmt, std::forward<Args>(args)...));
    }
  }

  template <typename... Args>
  static void Debug(std::format_string<Args...> fmt, Args&&... args) {
    Format(LogLevel::kDebug, fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  static void Info(std::format_string<Args...> fmt, Args&&... args) {
    Format(LogLevel::kInfo, fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  static void Warn(std::format_string<Args...> fmt, Args&&... args) {
    Format(LogLevel::kWarn, fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  static void Error(std::format_string<Args...> fmt, Args&&... args) {
    Format(LogLevel::kError, fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  [[noreturn]] static void Fatal(std::format_string<Args...> fmt, Args&&... args) {
    Write(LogLevel::kFatal, std::format(fmt, std::forward<Args>(args)...));
    std::abort();
  }

private:
  template <typename... Args>
  static void Format(LogLevel level, std::format_string<Args...> fmt, Args&&... args) {
    if (IsEnabled(level)) {
      Write(level, std::format(fmt, std::forward<Args>(args)...));
    }
  }
};

} // namespace jarstore
