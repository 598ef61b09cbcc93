#pragma once

#include <expected>
#include <optional>
#include <string>
#include <vector>

#include "pxu/record/record.hpp"
#include "pxu/unit/validation.hpp"

namespace pxu::unit {

class Unit;

// Human-readable group that jobs refer to through `category_id`.
struct CategoryData {
  std::optional<std::string> id;
  std::optional<std::string> name;

  static auto FromRecord(const record::FieldMap& data)
      -> std::expected<CategoryData, std::string>;
};

auto ValidateCategory(
    const Unit& unit, const CategoryData& category,
    const ValidationOptions& options) -> ValidationResult;

auto CheckCategory(const Unit& unit, const CategoryData& category)
    -> std::vector<Issue>;

}  // namespace pxu::unit
