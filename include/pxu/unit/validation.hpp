#pragma once

#include <cstdint>
#include <expected>
#include <string>

#include "pxu/common/origin.hpp"

namespace pxu::unit {

// Kind of problem found in one field by a static validator.
enum class Problem : uint8_t {
  kMissing,     // Required field is absent
  kEmpty,       // Field is present but blank
  kWrong,       // Field value is not acceptable
  kUseless,     // Field has no effect in this context
  kDeprecated,  // Field is deprecated and a replacement exists
};

auto ToString(Problem problem) -> const char*;

// Knobs of the static validators.
struct ValidationOptions {
  // Reject non-critical irregularities as well.
  bool strict = false;
  // Reject units using deprecated fields.
  bool deprecated = false;
};

// Field-scoped validation failure.
struct ValidationError {
  std::string field;
  Problem problem;

  auto operator==(const ValidationError&) const -> bool = default;
};

using ValidationResult = std::expected<void, ValidationError>;

// Severity of an issue found by live checks.
enum class Severity : uint8_t {
  kError,
  kWarning,
  kAdvice,
};

auto ToString(Severity severity) -> const char*;

// One finding of a live check.
struct Issue {
  Severity severity;
  std::string field;
  std::string message;
  Origin origin;

  // "error: file.pxu:3: field 'user', only root is allowed"
  [[nodiscard]] auto ToString() const -> std::string;
};

}  // namespace pxu::unit
