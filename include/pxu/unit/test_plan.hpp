#pragma once

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "pxu/record/record.hpp"
#include "pxu/unit/validation.hpp"

namespace pxu::unit {

class Unit;

// A named selection of jobs to run, expressed as identifier patterns.
struct TestPlanData {
  std::optional<std::string> id;
  std::optional<std::string> name;
  std::optional<std::string> description;
  std::optional<std::string> include;
  std::optional<std::string> exclude;
  std::optional<std::string> mandatory_include;
  std::optional<std::string> bootstrap_include;
  std::optional<std::string> icon;
  std::optional<std::string> category_overrides;
  std::optional<double> estimated_duration;

  static auto FromRecord(const record::FieldMap& data)
      -> std::expected<TestPlanData, std::string>;
};

// Patterns of a pattern-list field: one per line, first whitespace
// separated token, '#' starts a comment.
auto ExtractPatterns(std::string_view text) -> std::vector<std::string>;

auto ValidateTestPlan(
    const Unit& unit, const TestPlanData& plan,
    const ValidationOptions& options) -> ValidationResult;

auto CheckTestPlan(const Unit& unit, const TestPlanData& plan)
    -> std::vector<Issue>;

}  // namespace pxu::unit
