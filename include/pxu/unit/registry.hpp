#pragma once

#include <expected>
#include <span>
#include <string>
#include <string_view>

#include "pxu/common/diagnostic/diagnostic.hpp"
#include "pxu/record/record.hpp"
#include "pxu/unit/unit.hpp"

namespace pxu::unit {

// Kind assumed for records without a `unit` field.
inline constexpr std::string_view kDefaultUnitKind = "job";

using UnitDataBuilder = auto (*)(const record::FieldMap& data)
    -> std::expected<UnitData, std::string>;

// Registry entry mapping a `unit` field value to a constructor.
struct UnitKindInfo {
  std::string_view name;
  UnitKind kind;
  UnitDataBuilder build;
};

// All registered kinds, in UnitKind order.
auto RegisteredUnitKinds() -> std::span<const UnitKindInfo>;

auto FindUnitKind(std::string_view name) -> const UnitKindInfo*;

// Build a unit from one record. The kind comes from the record's `unit`
// field (kDefaultUnitKind when absent). Failures are kLoadError diagnostics
// with kUnknownUnitKind or kUnitDefinition.
auto BuildUnit(
    record::Record record, const provider::Provider* provider,
    bool is_virtual = false) -> Result<UnitPtr>;

}  // namespace pxu::unit
