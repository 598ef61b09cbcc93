#pragma once

#include <filesystem>
#include <memory>
#include <variant>
#include <vector>

#include "pxu/common/diagnostic/diagnostic.hpp"
#include "pxu/provider/classifier.hpp"
#include "pxu/provider/lazy_text.hpp"
#include "pxu/unit/selection_list.hpp"
#include "pxu/unit/unit.hpp"
#include "pxu/unit/validation.hpp"

namespace pxu::provider {

class Provider;

struct LoadOptions {
  // Run the static validators of every loaded unit.
  bool validate = true;
  unit::ValidationOptions validation;
  // Run live checks; an error-severity issue rejects the file.
  bool check = false;
};

// Everything a loader needs to know about one file.
struct LoadInput {
  std::filesystem::path filename;
  const LazyText* text = nullptr;
  const Provider* provider = nullptr;
  ClassificationResult classification;
  LoadOptions options;
};

struct UnitSourceContent {
  std::vector<unit::UnitPtr> units;
  // One list per test plan, built from its `include` field.
  std::vector<unit::SelectionList> selection_lists;
};

// Loader-specific interpretation of a file.
using InspectResult =
    std::variant<std::monostate, UnitSourceContent, unit::SelectionList>;

struct LoadResult {
  std::vector<unit::UnitPtr> unit_list;
  std::vector<unit::SelectionList> selection_list_list;
};

// Turns one classified file into units and selection lists.
//
// Loading runs in phases: Inspect interprets the file format, then
// DiscoverUnits and DiscoverSelectionLists extract the primary content and
// SynthesizeUnits adds virtual units describing the file itself. Only
// Inspect can fail.
class ContentLoader {
 public:
  virtual ~ContentLoader() = default;

  [[nodiscard]] virtual auto Kind() const -> LoaderKind = 0;

  [[nodiscard]] virtual auto Inspect(const LoadInput& input) const
      -> Result<InspectResult> = 0;

  [[nodiscard]] virtual auto DiscoverUnits(
      const InspectResult& result, const LoadInput& input) const
      -> std::vector<unit::UnitPtr> = 0;

  [[nodiscard]] virtual auto DiscoverSelectionLists(
      const InspectResult& result, const LoadInput& input) const
      -> std::vector<unit::SelectionList> = 0;

  [[nodiscard]] virtual auto SynthesizeUnits(
      const InspectResult& result, const LoadInput& input) const
      -> std::vector<unit::UnitPtr> = 0;

 protected:
  // Virtual file unit recording the classification of input.filename.
  static auto MakeFileUnit(const LoadInput& input) -> unit::UnitPtr;
};

// Files without a unit format (data, executables, documentation...).
class ProviderContentLoader final : public ContentLoader {
 public:
  [[nodiscard]] auto Kind() const -> LoaderKind override {
    return LoaderKind::kProviderContent;
  }
  [[nodiscard]] auto Inspect(const LoadInput& input) const
      -> Result<InspectResult> override;
  [[nodiscard]] auto DiscoverUnits(
      const InspectResult& result, const LoadInput& input) const
      -> std::vector<unit::UnitPtr> override;
  [[nodiscard]] auto DiscoverSelectionLists(
      const InspectResult& result, const LoadInput& input) const
      -> std::vector<unit::SelectionList> override;
  [[nodiscard]] auto SynthesizeUnits(
      const InspectResult& result, const LoadInput& input) const
      -> std::vector<unit::UnitPtr> override;
};

// PXU unit definition files.
class UnitSourceLoader final : public ContentLoader {
 public:
  [[nodiscard]] auto Kind() const -> LoaderKind override {
    return LoaderKind::kUnitSource;
  }
  [[nodiscard]] auto Inspect(const LoadInput& input) const
      -> Result<InspectResult> override;
  [[nodiscard]] auto DiscoverUnits(
      const InspectResult& result, const LoadInput& input) const
      -> std::vector<unit::UnitPtr> override;
  [[nodiscard]] auto DiscoverSelectionLists(
      const InspectResult& result, const LoadInput& input) const
      -> std::vector<unit::SelectionList> override;
  [[nodiscard]] auto SynthesizeUnits(
      const InspectResult& result, const LoadInput& input) const
      -> std::vector<unit::UnitPtr> override;
};

// Legacy whitelists. Each one also becomes a virtual test plan.
class SelectionListLoader final : public ContentLoader {
 public:
  [[nodiscard]] auto Kind() const -> LoaderKind override {
    return LoaderKind::kSelectionList;
  }
  [[nodiscard]] auto Inspect(const LoadInput& input) const
      -> Result<InspectResult> override;
  [[nodiscard]] auto DiscoverUnits(
      const InspectResult& result, const LoadInput& input) const
      -> std::vector<unit::UnitPtr> override;
  [[nodiscard]] auto DiscoverSelectionLists(
      const InspectResult& result, const LoadInput& input) const
      -> std::vector<unit::SelectionList> override;
  [[nodiscard]] auto SynthesizeUnits(
      const InspectResult& result, const LoadInput& input) const
      -> std::vector<unit::UnitPtr> override;
};

auto MakeContentLoader(LoaderKind kind) -> std::unique_ptr<ContentLoader>;

// Run every phase of loader on input. Failures are kLoadError diagnostics.
auto LoadFile(const ContentLoader& loader, const LoadInput& input)
    -> Result<LoadResult>;

}  // namespace pxu::provider
