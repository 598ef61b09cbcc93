#pragma once

#include <stdexcept>
#include <string>

#include <fmt/core.h>

namespace pxu::common {

// Exception type for internal pxu errors (library bugs, not content errors)
class InternalError : public std::runtime_error {
 public:
  InternalError(const char* context, const std::string& detail)
      : std::runtime_error(
            fmt::format(
                "Internal error in {}: {}\n"
                "This is a bug in pxu, not in the provider content.",
                context, detail)) {
  }
};

[[noreturn]] inline void ThrowInternalError(
    const char* context, const std::string& detail) {
  throw InternalError(context, detail);
}

}  // namespace pxu::common
