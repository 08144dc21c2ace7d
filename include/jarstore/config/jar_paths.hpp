#pragma once

#include <format>
#include <string>
#include <string_view>

namespace jarstore {

/// Derives every file name belonging to a jar from the jar path.
class JarPaths {
public:
  /// The sealed jar.
  static std::string DataFilePath(std::string_view jar_path) {
    return std::string(jar_path);
  }

  /// Where the writer stages the jar until it is sealed.
  static std::string TmpFilePath(std::string_view jar_path) {
    return std::format("{}{}", jar_path, kTmpSuffix);
  }

  /// Log file to pass in LogOptions when a jar is built by a standalone
  /// process.
  static std::string LogFilePath(std::string_view jar_path) {
    return std::format("{}{}", jar_path, kLogSuffix);
  }

private:
  static constexpr auto kTmpSuffix = ".tmp";
  static constexpr auto kLogSuffix = ".log";
};

} // namespace jarstore
