#include "pxu/unit/validation.hpp"

#include <string>

#include <fmt/format.h>

#include "pxu/common/internal_error.hpp"

namespace pxu::unit {

auto ToString(Problem problem) -> const char* {
  switch (problem) {
    case Problem::kMissing:
      return "missing definition";
    case Problem::kEmpty:
      return "empty value";
    case Problem::kWrong:
      return "incorrect value supplied";
    case Problem::kUseless:
      return "useless field in this context";
    case Problem::kDeprecated:
      return "usage of deprecated field";
  }
  common::ThrowInternalError("ToString(Problem)", "unknown problem");
}

auto ToString(Severity severity) -> const char* {
  switch (severity) {
    case Severity::kError:
      return "error";
    case Severity::kWarning:
      return "warning";
    case Severity::kAdvice:
      return "advice";
  }
  common::ThrowInternalError("ToString(Severity)", "unknown severity");
}

auto Issue::ToString() const -> std::string {
  return fmt::format(
      "{}: {}: field '{}', {}", unit::ToString(severity), origin.ToString(),
      field, message);
}

}  // namespace pxu::unit
