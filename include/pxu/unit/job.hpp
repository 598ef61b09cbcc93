#pragma once

#include <array>
#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "pxu/record/record.hpp"
#include "pxu/unit/validation.hpp"

namespace pxu::unit {

class Unit;

// Plugins a job may declare.
inline constexpr std::array<std::string_view, 9> kJobPlugins = {
    "shell",       "manual",         "user-interact",
    "user-verify", "user-interact-verify",
    "local",       "resource",       "attachment",
    "qml",
};

// Plugins that execute the `command` field.
inline constexpr std::array<std::string_view, 4> kCommandPlugins = {
    "shell", "local", "resource", "attachment"};

// Longest summary that fits on one line of a test selection screen.
inline constexpr size_t kMaxSummaryLength = 80;

// A job definition: one test or one helper that produces data for tests.
struct JobData {
  // Partial identifier, taken from `id` or from the legacy `name` field.
  std::optional<std::string> id;
  bool uses_legacy_name = false;

  std::optional<std::string> summary;
  std::optional<std::string> plugin;
  std::optional<std::string> command;
  std::optional<std::string> description;
  std::optional<std::string> purpose;
  std::optional<std::string> steps;
  std::optional<std::string> verification;
  std::optional<std::string> user;
  std::optional<std::string> environ;
  std::optional<double> estimated_duration;
  std::optional<std::string> depends;
  std::optional<std::string> after;
  std::optional<std::string> requires_expr;
  std::optional<std::string> category_id;
  std::optional<std::string> flags;
  std::optional<std::string> imports;

  // Fails when a field value cannot be interpreted.
  static auto FromRecord(const record::FieldMap& data)
      -> std::expected<JobData, std::string>;

  // Whitespace separated dependency identifiers from `depends`.
  [[nodiscard]] auto DependencyIds() const -> std::vector<std::string>;

  [[nodiscard]] auto HasFlag(std::string_view flag) const -> bool;
};

auto ValidateJob(
    const Unit& unit, const JobData& job, const ValidationOptions& options)
    -> ValidationResult;

auto CheckJob(const Unit& unit, const JobData& job) -> std::vector<Issue>;

}  // namespace pxu::unit
