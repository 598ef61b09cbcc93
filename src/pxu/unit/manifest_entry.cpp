#include "pxu/unit/manifest_entry.hpp"

#include <algorithm>
#include <array>
#include <expected>
#include <string>
#include <string_view>

#include "pxu/common/string_utils.hpp"
#include "pxu/record/record.hpp"
#include "pxu/unit/field_parsing.hpp"
#include "pxu/unit/unit.hpp"
#include "pxu/unit/validation.hpp"

namespace pxu::unit {

namespace {

constexpr std::array<std::string_view, 2> kValueTypes = {"bool", "natural"};

}  // namespace

auto ManifestEntryData::FromRecord(const record::FieldMap& data)
    -> std::expected<ManifestEntryData, std::string> {
  return ManifestEntryData{
      .id = GetField(data, "id"),
      .name = GetField(data, "name"),
      .value_type = GetField(data, "value-type"),
      .value_units = GetField(data, "value-units"),
      .resource_key = GetField(data, "resource-key"),
  };
}

auto ValidateManifestEntry(
    const Unit& /*unit*/, const ManifestEntryData& entry,
    const ValidationOptions& options) -> ValidationResult {
  if (auto result = ValidateId(entry.id, options); !result) {
    return result;
  }
  if (!entry.name) {
    return std::unexpected(
        ValidationError{.field = "name", .problem = Problem::kMissing});
  }
  if (common::IsBlankLine(*entry.name)) {
    return std::unexpected(
        ValidationError{.field = "name", .problem = Problem::kEmpty});
  }
  if (!entry.value_type) {
    return std::unexpected(
        ValidationError{.field = "value-type", .problem = Problem::kMissing});
  }
  if (std::ranges::find(kValueTypes, *entry.value_type) == kValueTypes.end()) {
    return std::unexpected(
        ValidationError{.field = "value-type", .problem = Problem::kWrong});
  }
  return {};
}

}  // namespace pxu::unit
