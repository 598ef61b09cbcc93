#include "pxu/unit/category.hpp"

#include <expected>
#include <string>
#include <vector>

#include <fmt/format.h>

#include "pxu/record/record.hpp"
#include "pxu/unit/field_parsing.hpp"
#include "pxu/unit/unit.hpp"
#include "pxu/unit/validation.hpp"

namespace pxu::unit {

auto CategoryData::FromRecord(const record::FieldMap& data)
    -> std::expected<CategoryData, std::string> {
  return CategoryData{
      .id = GetField(data, "id"),
      .name = GetField(data, "name"),
  };
}

auto ValidateCategory(
    const Unit& /*unit*/, const CategoryData& category,
    const ValidationOptions& options) -> ValidationResult {
  if (auto result = ValidateId(category.id, options); !result) {
    return result;
  }
  if (!category.name) {
    return std::unexpected(
        ValidationError{.field = "name", .problem = Problem::kMissing});
  }
  return {};
}

auto CheckCategory(const Unit& unit, const CategoryData& /*category*/)
    -> std::vector<Issue> {
  std::vector<Issue> issues;
  if (unit.record().raw_data.contains("name")) {
    issues.push_back(
        Issue{
            .severity = Severity::kAdvice,
            .field = "name",
            .message = fmt::format(
                "please use '{}name' to mark the field as translatable",
                record::kTranslatableMarker),
            .origin = unit.FieldOrigin("name"),
        });
  }
  return issues;
}

}  // namespace pxu::unit
