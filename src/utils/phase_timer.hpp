#pragma once

#include <chrono>
#include <format>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace jarstore::utils {

/// Measures consecutive phases of one long operation. Each Lap() closes the
/// running phase under the given name and starts the next one.
///
///   PhaseTimer timer;
///   BuildKeys();
///   timer.Lap("keys");
///   WriteColumns();
///   timer.Lap("columns");
///   Log::Info("done, {}", timer.ToString()); // keys=1.20ms, columns=8.31ms, total=9.51ms
class PhaseTimer {
public:
  PhaseTimer() : start_(Clock::now()), lap_start_(start_) {
  }

  void Lap(std::string_view phase) {
    auto now = Clock::now();
    phases_.emplace_back(std::string(phase), ToMs(now - lap_start_));
    lap_start_ = now;
  }

  double TotalMs() const {
    return ToMs(Clock::now() - start_);
  }

  std::string ToString() const {
    std::string result;
    for (const auto& [phase, elapsed_ms] : phases_) {
      std::format_to(std::back_inserter(result), "{}={:.2f}ms, ", phase, elapsed_ms);
    }
    std::format_to(std::back_inserter(result), "total={:.2f}ms", TotalMs());
    return result;
  }

private:
  using Clock = std::chrono::steady_clock;

  static double ToMs(Clock::duration duration) {
    return std::chrono::duration_cast<std::chrono::microseconds>(duration).count() / 1000.0;
  }

  Clock::time_point start_;
  Clock::time_point lap_start_;
  std::vector<std::pair<std::string, double>> phases_;
};

} // namespace jarstore::utils
