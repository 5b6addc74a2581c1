#pragma once

#include <stdexcept>
#include <string>

#include <fmt/core.h>

namespace slotest::common {

// Exception type for harness bugs (broken invariants, not test failures)
class InternalError : public std::runtime_error {
 public:
  InternalError(const char* context, const std::string& detail)
      : std::runtime_error(
            fmt::format("slotest internal error in {}: {}", context, detail)) {
  }
};

[[noreturn]] inline void ThrowInternalError(
    const char* context, const std::string& detail) {
  throw InternalError(context, detail);
}

}  // namespace slotest::common
