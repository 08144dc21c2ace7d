#include "jarstore/base/log.hpp"

#include <spdlog/common.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <string>

namespace jarstore {

namespace {

constexpr char kLoggerName[] = "jarstore";
constexpr char kLogPattern[] = "[%Y-%m-%d %H:%M:%S.%e] [%t] [%l] %v";

std::mutex logger_mutex;

/// The file logger installed by Init(), nullptr when logging to the console.
std::shared_ptr<spdlog::logger> file_logger = nullptr;

/// The logger spdlog started with, restored by Deinit().
std::shared_ptr<spdlog::logger> console_logger = spdlog::default_logger();

spdlog::level::level_enum ToSpdlogLevel(LogLevel level) {
  switch (level) {
  case LogLevel::kDebug:
    return spdlog::level::debug;
  case LogLevel::kInfo:
    return spdlog::level::info;
  case LogLevel::kWarn:
    return spdlog::level::warn;
  case LogLevel::kError:
    return spdlog::level::err;
  case LogLevel::kFatal:
    return spdlog::level::critical;
  }
  return spdlog::level::info;
}

} // namespace

void Log::Init(const LogOptions& options) {
  std::lock_guard<std::mutex> lock(logger_mutex);
  if (file_logger != nullptr) {
    return;
  }

  if (options.log_path_.empty()) {
    spdlog::set_level(ToSpdlogLevel(options.log_level_));
    return;
  }

  file_logger = spdlog::basic_logger_mt(kLoggerName, options.log_path_);
  file_logger->set_pattern(kLogPattern);
  file_logger->set_level(ToSpdlogLevel(options.log_level_));
  file_logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(file_logger);
  spdlog::flush_every(std::chrono::seconds(options.flush_interval_seconds_));
  Log::Info("Logger initialized, file={}, flush_interval={}s", options.log_path_,
            options.flush_interval_seconds_);
}

void Log::Deinit() {
  std::lock_guard<std::mutex> lock(logger_mutex);
  if (file_logger == nullptr) {
    return;
  }

  Log::Info("Logger deinitialized");
  file_logger->flush();
  spdlog::set_default_logger(console_logger);
  spdlog::drop(kLoggerName);
  file_logger = nullptr;
}

bool Log::IsEnabled(LogLevel level) {
  return spdlog::default_logger_raw()->should_log(ToSpdlogLevel(level));
}

void Log::Write(LogLevel level, const std::string& msg) {
  spdlog::default_logger_raw()->log(ToSpdlogLevel(level), msg);
  if (level == LogLevel::kFatal) {
    spdlog::default_logger_raw()->flush();
  }
}

void Log::DebugCheck(bool condition, const std::string& msg) {
  if (!condition) {
    Write(LogLevel::kFatal, std::format("Check failed: {}", msg));
    std::abort();
  }
}

} // namespace jarstore
