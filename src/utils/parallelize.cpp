#include "utils/parallelize.hpp"

#include "jarstore/base/portable.h"
#include "jarstore/base/range_splits.hpp"

#include <algorithm>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

namespace jarstore::utils {

Result<void> Parallelize::Range(uint64_t num_threads, uint64_t num_jobs,
                                const RangeHandler& handler) {
  if (JAR_UNLIKELY(num_jobs == 0)) {
    return {};
  }

  num_threads = std::clamp<uint64_t>(num_threads, 1, num_jobs);
  if (num_threads == 1) {
    return handler(0, 0, num_jobs);
  }

  RangeSplits<uint64_t> ranges(num_jobs, num_threads);
  std::vector<std::optional<Error>> errors(num_threads);
  std::vector<std::thread> threads;
  threads.reserve(num_threads);
  for (uint64_t i = 0; i < num_threads; ++i) {
    auto range = ranges[i];
    threads.emplace_back([&handler, &errors, i, begin = range.begin(), end = range.end()]() {
      if (auto res = handler(i, begin, end); !res) {
        errors[i] = std::move(res.error());
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  for (auto& error : errors) {
    if (error) {
      return std::move(*error);
    }
  }
  return {};
}

} // namespace jarstore::utils
