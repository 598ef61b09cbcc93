#include "pxu/unit/registry.hpp"

#include <array>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include "pxu/common/diagnostic/diagnostic.hpp"
#include "pxu/record/record.hpp"
#include "pxu/unit/unit.hpp"

namespace pxu::unit {

namespace {

template <typename T>
auto BuildData(const record::FieldMap& data)
    -> std::expected<UnitData, std::string> {
  auto result = T::FromRecord(data);
  if (!result) {
    return std::unexpected(std::move(result.error()));
  }
  return UnitData{std::move(*result)};
}

constexpr std::array<UnitKindInfo, 5> kUnitKinds = {{
    {.name = "job", .kind = UnitKind::kJob, .build = &BuildData<JobData>},
    {.name = "category",
     .kind = UnitKind::kCategory,
     .build = &BuildData<CategoryData>},
    {.name = "test plan",
     .kind = UnitKind::kTestPlan,
     .build = &BuildData<TestPlanData>},
    {.name = "file", .kind = UnitKind::kFile, .build = &BuildData<FileData>},
    {.name = "manifest entry",
     .kind = UnitKind::kManifestEntry,
     .build = &BuildData<ManifestEntryData>},
}};

}  // namespace

auto RegisteredUnitKinds() -> std::span<const UnitKindInfo> {
  return kUnitKinds;
}

auto FindUnitKind(std::string_view name) -> const UnitKindInfo* {
  for (const auto& info : kUnitKinds) {
    if (info.name == name) {
      return &info;
    }
  }
  return nullptr;
}

auto BuildUnit(
    record::Record record, const provider::Provider* provider, bool is_virtual)
    -> Result<UnitPtr> {
  std::string kind_name =
      record.Get("unit").value_or(std::string(kDefaultUnitKind));
  const UnitKindInfo* info = FindUnitKind(kind_name);
  if (info == nullptr) {
    return std::unexpected(
        Diagnostic::LoadError(
            record.origin, fmt::format("Unknown unit type: '{}'", kind_name),
            LoadFailure::kUnknownUnitKind));
  }

  auto data = info->build(record.data);
  if (!data) {
    return std::unexpected(
        Diagnostic::LoadError(
            record.origin,
            fmt::format(
                "Cannot define unit from record {}: {}",
                record.origin.ToString(), data.error()),
            LoadFailure::kUnitDefinition));
  }
  return std::make_shared<const Unit>(
      std::move(record), std::move(*data), provider, is_virtual);
}

}  // namespace pxu::unit
