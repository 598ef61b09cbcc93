#pragma once

#include <expected>
#include <optional>
#include <string>
#include <vector>

#include "pxu/record/record.hpp"
#include "pxu/unit/validation.hpp"

namespace pxu::unit {

class Unit;

// Declaration of one hardware manifest question (e.g. "has a touchpad").
struct ManifestEntryData {
  std::optional<std::string> id;
  std::optional<std::string> name;
  std::optional<std::string> value_type;
  std::optional<std::string> value_units;
  std::optional<std::string> resource_key;

  static auto FromRecord(const record::FieldMap& data)
      -> std::expected<ManifestEntryData, std::string>;
};

auto ValidateManifestEntry(
    const Unit& unit, const ManifestEntryData& entry,
    const ValidationOptions& options) -> ValidationResult;

}  // namespace pxu::unit
