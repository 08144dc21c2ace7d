#pragma once

#include "jarstore/base/result.hpp"

#include <cstdint>
#include <functional>

namespace jarstore::utils {

class Parallelize {
public:
  using RangeHandler =
      std::function<Result<void>(uint64_t thread_id, uint64_t job_begin, uint64_t job_end)>;

  /// Splits [0, num_jobs) into at most num_threads contiguous ranges, range i
  /// going to thread i, and runs handler for each range on its own thread.
  /// Runs inline when only one thread is needed.
  ///
  /// Returns after every range has finished. When handlers fail, the error of
  /// the lowest failing range is returned, so the outcome does not depend on
  /// thread scheduling.
  static Result<void> Range(uint64_t num_threads, uint64_t num_jobs, const RangeHandler& handler);
};

} // namespace jarstore::utils
