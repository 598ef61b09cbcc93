#include "pxu/unit/unit.hpp"

#include <algorithm>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/format.h>

#include "pxu/common/internal_error.hpp"
#include "pxu/common/overloaded.hpp"
#include "pxu/common/string_utils.hpp"
#include "pxu/provider/provider.hpp"

namespace pxu::unit {

auto ToString(UnitKind kind) -> std::string_view {
  switch (kind) {
    case UnitKind::kJob:
      return "job";
    case UnitKind::kCategory:
      return "category";
    case UnitKind::kTestPlan:
      return "test plan";
    case UnitKind::kFile:
      return "file";
    case UnitKind::kManifestEntry:
      return "manifest entry";
  }
  common::ThrowInternalError("ToString(UnitKind)", "unknown unit kind");
}

Unit::Unit(
    record::Record record, UnitData data, const provider::Provider* provider,
    bool is_virtual)
    : record_(std::move(record)),
      data_(std::move(data)),
      provider_(provider),
      is_virtual_(is_virtual) {
}

auto Unit::Kind() const -> UnitKind {
  return static_cast<UnitKind>(data_.index());
}

auto Unit::GetRecordValue(std::string_view field) const
    -> std::optional<std::string> {
  return record_.Get(field);
}

auto Unit::FieldOrigin(std::string_view field) const -> Origin {
  return record_.FieldOrigin(field);
}

auto Unit::PartialId() const -> std::optional<std::string> {
  return std::visit(
      common::Overloaded{
          [](const FileData&) -> std::optional<std::string> {
            return std::nullopt;
          },
          [](const auto& data) -> std::optional<std::string> {
            return data.id;
          },
      },
      data_);
}

auto Unit::Id() const -> std::optional<std::string> {
  auto partial = PartialId();
  if (!partial) {
    return std::nullopt;
  }
  auto ns = ProviderNamespace();
  if (!ns || partial->find(kNamespaceSeparator) != std::string::npos) {
    return partial;
  }
  return fmt::format("{}{}{}", *ns, kNamespaceSeparator, *partial);
}

auto Unit::Path() const -> std::optional<std::string> {
  if (const auto* file = As<FileData>()) {
    return file->path;
  }
  return std::nullopt;
}

auto Unit::ProviderNamespace() const -> std::optional<std::string> {
  if (provider_ == nullptr) {
    return std::nullopt;
  }
  return provider_->Namespace();
}

auto Unit::ToString() const -> std::string {
  if (auto path = Path()) {
    return fmt::format("<{} path:'{}'>", unit::ToString(Kind()), *path);
  }
  return fmt::format(
      "<{} id:'{}'>", unit::ToString(Kind()), Id().value_or("?"));
}

auto ValidateId(
    const std::optional<std::string>& id, const ValidationOptions& options)
    -> ValidationResult {
  if (!id) {
    return std::unexpected(
        ValidationError{.field = "id", .problem = Problem::kMissing});
  }
  if (common::IsBlankLine(*id)) {
    return std::unexpected(
        ValidationError{.field = "id", .problem = Problem::kEmpty});
  }
  if (options.strict && std::ranges::any_of(*id, common::IsBlank)) {
    return std::unexpected(
        ValidationError{.field = "id", .problem = Problem::kWrong});
  }
  return {};
}

auto Validate(const Unit& unit, const ValidationOptions& options)
    -> ValidationResult {
  return std::visit(
      common::Overloaded{
          [&](const JobData& job) { return ValidateJob(unit, job, options); },
          [&](const CategoryData& category) {
            return ValidateCategory(unit, category, options);
          },
          [&](const TestPlanData& plan) {
            return ValidateTestPlan(unit, plan, options);
          },
          [](const FileData&) { return ValidationResult{}; },
          [&](const ManifestEntryData& entry) {
            return ValidateManifestEntry(unit, entry, options);
          },
      },
      unit.data());
}

auto Check(const Unit& unit) -> std::vector<Issue> {
  return std::visit(
      common::Overloaded{
          [&](const JobData& job) { return CheckJob(unit, job); },
          [&](const CategoryData& category) {
            return CheckCategory(unit, category);
          },
          [&](const TestPlanData& plan) { return CheckTestPlan(unit, plan); },
          [](const auto&) { return std::vector<Issue>{}; },
      },
      unit.data());
}

}  // namespace pxu::unit
