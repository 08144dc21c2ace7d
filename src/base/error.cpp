#include "jarstore/base/error.hpp"

#include <cpptrace/cpptrace.hpp>

#include <sstream>

namespace jarstore {

std::string Error::CaptureStacktrace() {
  std::ostringstream os;
  // Skip this function and the Error constructor.
  cpptrace::stacktrace::current(2).print(os, false);
  return os.str();
}

} // namespace jarstore
