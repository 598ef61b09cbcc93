#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "pxu/common/origin.hpp"
#include "pxu/record/record.hpp"
#include "pxu/unit/category.hpp"
#include "pxu/unit/file.hpp"
#include "pxu/unit/job.hpp"
#include "pxu/unit/manifest_entry.hpp"
#include "pxu/unit/test_plan.hpp"
#include "pxu/unit/validation.hpp"

namespace pxu::provider {
class Provider;
}  // namespace pxu::provider

namespace pxu::unit {

enum class UnitKind : uint8_t {
  kJob,
  kCategory,
  kTestPlan,
  kFile,
  kManifestEntry,
};

// Name used in the `unit` field ("job", "test plan", ...).
auto ToString(UnitKind kind) -> std::string_view;

// Kind-specific fields. Alternatives are listed in UnitKind order.
using UnitData = std::variant<
    JobData, CategoryData, TestPlanData, FileData, ManifestEntryData>;

// Separator between the provider namespace and a partial identifier.
inline constexpr std::string_view kNamespaceSeparator = "::";

// A typed, immutable piece of provider content built from one record.
//
// Units are shared between the aggregator's list and indexes; they are
// never copied after construction. The provider pointer is a non-owning
// back-reference and may be null for units loaded outside of a provider.
class Unit {
 public:
  Unit(
      record::Record record, UnitData data, const provider::Provider* provider,
      bool is_virtual);

  [[nodiscard]] auto Kind() const -> UnitKind;

  [[nodiscard]] auto data() const -> const UnitData& {
    return data_;
  }
  [[nodiscard]] auto record() const -> const record::Record& {
    return record_;
  }
  [[nodiscard]] auto origin() const -> const Origin& {
    return record_.origin;
  }
  [[nodiscard]] auto provider() const -> const provider::Provider* {
    return provider_;
  }
  [[nodiscard]] auto is_virtual() const -> bool {
    return is_virtual_;
  }

  template <typename T>
  [[nodiscard]] auto As() const -> const T* {
    return std::get_if<T>(&data_);
  }

  // Field value with the translatable marker already removed from the key.
  [[nodiscard]] auto GetRecordValue(std::string_view field) const
      -> std::optional<std::string>;

  // Origin of the line that defines `field`, or the unit origin.
  [[nodiscard]] auto FieldOrigin(std::string_view field) const -> Origin;

  // Identifier as written in the record; nullopt for kinds without one.
  [[nodiscard]] auto PartialId() const -> std::optional<std::string>;

  // Identifier qualified with the provider namespace ("ns::id"). Already
  // qualified identifiers and units without a provider are left as is.
  [[nodiscard]] auto Id() const -> std::optional<std::string>;

  // Path of the file a file unit describes; nullopt for other kinds.
  [[nodiscard]] auto Path() const -> std::optional<std::string>;

  // Namespace of the owning provider, if any.
  [[nodiscard]] auto ProviderNamespace() const -> std::optional<std::string>;

  // "<job id:'ns::foo'>" style description for logs.
  [[nodiscard]] auto ToString() const -> std::string;

 private:
  record::Record record_;
  UnitData data_;
  const provider::Provider* provider_;
  bool is_virtual_;
};

using UnitPtr = std::shared_ptr<const Unit>;

// Run the static validators of the unit's kind.
auto Validate(const Unit& unit, const ValidationOptions& options = {})
    -> ValidationResult;

// Run the live consistency checks of the unit's kind.
auto Check(const Unit& unit) -> std::vector<Issue>;

// Validation shared by every kind with an identifier.
auto ValidateId(
    const std::optional<std::string>& id, const ValidationOptions& options)
    -> ValidationResult;

}  // namespace pxu::unit
