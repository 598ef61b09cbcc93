#include "pxu/provider/content_loader.hpp"

#include <algorithm>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "pxu/common/diagnostic/diagnostic.hpp"
#include "pxu/common/internal_error.hpp"
#include "pxu/common/origin.hpp"
#include "pxu/provider/provider.hpp"
#include "pxu/record/parser.hpp"
#include "pxu/record/record.hpp"
#include "pxu/unit/file_role.hpp"
#include "pxu/unit/registry.hpp"
#include "pxu/unit/selection_list.hpp"
#include "pxu/unit/unit.hpp"
#include "pxu/unit/validation.hpp"

namespace pxu::provider {

namespace {

auto FileOrigin(const LoadInput& input) -> Origin {
  return Origin(FileTextSource{.filename = input.filename.string()});
}

auto SpanOrigin(const DiagSpan& span, const Origin& fallback) -> Origin {
  if (const auto* origin = std::get_if<Origin>(&span)) {
    return *origin;
  }
  return fallback;
}

auto ImplicitNamespace(const LoadInput& input) -> std::optional<std::string> {
  if (input.provider == nullptr) {
    return std::nullopt;
  }
  return input.provider->Namespace();
}

// Build a unit that loaders create themselves. Such records are always
// well formed.
auto BuildVirtualUnit(record::Record record, const Provider* provider)
    -> unit::UnitPtr {
  auto unit = unit::BuildUnit(std::move(record), provider, true);
  if (!unit) {
    common::ThrowInternalError(
        "BuildVirtualUnit", unit.error().primary.message);
  }
  return *std::move(unit);
}

// Run live checks and validators of one freshly built unit.
auto VerifyUnit(const unit::Unit& unit, const LoadOptions& options)
    -> Result<void> {
  if (options.check) {
    for (const auto& issue : unit::Check(unit)) {
      if (issue.severity == unit::Severity::kError) {
        return std::unexpected(
            Diagnostic::LoadError(
                issue.origin,
                fmt::format("Problem in unit definition, {}", issue.ToString()),
                LoadFailure::kCheck));
      }
      spdlog::debug("{}", issue.ToString());
    }
  }

  if (options.validate) {
    auto valid = unit::Validate(unit, options.validation);
    if (!valid) {
      const auto& error = valid.error();
      return std::unexpected(
          Diagnostic::LoadError(
              unit.FieldOrigin(error.field),
              fmt::format(
                  "Problem in unit definition, field {}: {}", error.field,
                  unit::ToString(error.problem)),
              LoadFailure::kValidation));
    }
  }
  return {};
}

}  // namespace

auto ContentLoader::MakeFileUnit(const LoadInput& input) -> unit::UnitPtr {
  record::FieldMap raw_data{
      {"unit", "file"},
      {"path", input.filename.string()},
      {"role", std::string(unit::ToString(input.classification.role))},
  };
  if (!input.classification.base_dir.empty()) {
    raw_data.emplace("base", input.classification.base_dir.string());
  }
  return BuildVirtualUnit(
      record::Record::FromRawData(std::move(raw_data), FileOrigin(input)),
      input.provider);
}

// ============================================================================
// ProviderContentLoader
// ============================================================================

auto ProviderContentLoader::Inspect(const LoadInput& /*input*/) const
    -> Result<InspectResult> {
  return InspectResult{};
}

auto ProviderContentLoader::DiscoverUnits(
    const InspectResult& /*result*/, const LoadInput& /*input*/) const
    -> std::vector<unit::UnitPtr> {
  return {};
}

auto ProviderContentLoader::DiscoverSelectionLists(
    const InspectResult& /*result*/, const LoadInput& /*input*/) const
    -> std::vector<unit::SelectionList> {
  return {};
}

auto ProviderContentLoader::SynthesizeUnits(
    const InspectResult& /*result*/, const LoadInput& input) const
    -> std::vector<unit::UnitPtr> {
  return {MakeFileUnit(input)};
}

// ============================================================================
// UnitSourceLoader
// ============================================================================

auto UnitSourceLoader::Inspect(const LoadInput& input) const
    -> Result<InspectResult> {
  auto text = input.text->Read();
  if (!text) {
    return std::unexpected(
        Diagnostic::LoadError(
            FileOrigin(input),
            fmt::format(
                "Cannot load job definitions from '{}': {}",
                input.filename.string(), text.error().primary.message),
            LoadFailure::kRead));
  }

  auto records = record::ParseRecords(
      *text, FileTextSource{.filename = input.filename.string()});
  if (!records) {
    Origin origin =
        SpanOrigin(records.error().primary.span, FileOrigin(input));
    return std::unexpected(
        Diagnostic::LoadError(
            origin,
            fmt::format(
                "Cannot load job definitions from '{}': {}: {}",
                input.filename.string(), origin.ToString(),
                records.error().primary.message),
            LoadFailure::kSyntax));
  }

  UnitSourceContent content;
  for (auto& record : *records) {
    auto unit = unit::BuildUnit(std::move(record), input.provider);
    if (!unit) {
      return std::unexpected(std::move(unit.error()));
    }
    if (auto verified = VerifyUnit(**unit, input.options); !verified) {
      return std::unexpected(std::move(verified.error()));
    }
    spdlog::debug(
        "Loaded {} from {}", (*unit)->ToString(), input.filename.string());

    if (const auto* plan = (*unit)->As<unit::TestPlanData>();
        plan != nullptr && plan->include) {
      auto list = unit::SelectionList::FromString(
          *plan->include, (*unit)->PartialId().value_or(""),
          (*unit)->FieldOrigin("include"), ImplicitNamespace(input));
      if (!list) {
        return std::unexpected(
            Diagnostic::LoadError(
                SpanOrigin(list.error().primary.span, (*unit)->origin()),
                fmt::format(
                    "Problem in unit definition, field include: {}",
                    list.error().primary.message),
                LoadFailure::kSelectionList));
      }
      content.selection_lists.push_back(*std::move(list));
    }
    content.units.push_back(*std::move(unit));
  }
  return content;
}

auto UnitSourceLoader::DiscoverUnits(
    const InspectResult& result, const LoadInput& /*input*/) const
    -> std::vector<unit::UnitPtr> {
  return std::get<UnitSourceContent>(result).units;
}

auto UnitSourceLoader::DiscoverSelectionLists(
    const InspectResult& result, const LoadInput& /*input*/) const
    -> std::vector<unit::SelectionList> {
  return std::get<UnitSourceContent>(result).selection_lists;
}

auto UnitSourceLoader::SynthesizeUnits(
    const InspectResult& /*result*/, const LoadInput& input) const
    -> std::vector<unit::UnitPtr> {
  return {MakeFileUnit(input)};
}

// ============================================================================
// SelectionListLoader
// ============================================================================

auto SelectionListLoader::Inspect(const LoadInput& input) const
    -> Result<InspectResult> {
  auto text = input.text->Read();
  if (!text) {
    return std::unexpected(
        Diagnostic::LoadError(
            FileOrigin(input),
            fmt::format(
                "Cannot load whitelist '{}': {}", input.filename.string(),
                text.error().primary.message),
            LoadFailure::kRead));
  }

  auto list = unit::SelectionList::FromString(
      *text, input.filename.stem().string(), FileOrigin(input),
      ImplicitNamespace(input));
  if (!list) {
    return std::unexpected(
        Diagnostic::LoadError(
            SpanOrigin(list.error().primary.span, FileOrigin(input)),
            fmt::format(
                "Cannot load whitelist '{}': {}", input.filename.string(),
                list.error().primary.message),
            LoadFailure::kSelectionList));
  }
  return InspectResult{*std::move(list)};
}

auto SelectionListLoader::DiscoverUnits(
    const InspectResult& /*result*/, const LoadInput& /*input*/) const
    -> std::vector<unit::UnitPtr> {
  return {};
}

auto SelectionListLoader::DiscoverSelectionLists(
    const InspectResult& result, const LoadInput& /*input*/) const
    -> std::vector<unit::SelectionList> {
  return {std::get<unit::SelectionList>(result)};
}

auto SelectionListLoader::SynthesizeUnits(
    const InspectResult& /*result*/, const LoadInput& input) const
    -> std::vector<unit::UnitPtr> {
  if (input.provider == nullptr) {
    return {};
  }

  // Inspect already read the text successfully.
  auto text = input.text->Read();
  if (!text) {
    common::ThrowInternalError(
        "SelectionListLoader::SynthesizeUnits", text.error().primary.message);
  }
  std::string stem = input.filename.stem().string();
  auto line_count = static_cast<uint32_t>(std::ranges::count(*text, '\n'));

  auto record = record::Record::FromRawData(
      record::FieldMap{
          {"unit", "test plan"},
          {"id", stem},
          {"name", stem},
          {"include", std::string(*text)},
      },
      Origin(
          FileTextSource{.filename = input.filename.string()}, 1,
          std::max<uint32_t>(1, line_count)));
  record.field_offset_map.emplace("include", 0);

  return {
      MakeFileUnit(input),
      BuildVirtualUnit(std::move(record), input.provider),
  };
}

// ============================================================================
// Dispatch
// ============================================================================

auto MakeContentLoader(LoaderKind kind) -> std::unique_ptr<ContentLoader> {
  switch (kind) {
    case LoaderKind::kUnitSource:
      return std::make_unique<UnitSourceLoader>();
    case LoaderKind::kSelectionList:
      return std::make_unique<SelectionListLoader>();
    case LoaderKind::kProviderContent:
      return std::make_unique<ProviderContentLoader>();
  }
  common::ThrowInternalError("MakeContentLoader", "unknown loader kind");
}

auto LoadFile(const ContentLoader& loader, const LoadInput& input)
    -> Result<LoadResult> {
  if (input.text == nullptr) {
    common::ThrowInternalError("LoadFile", "input without text");
  }
  auto inspected = loader.Inspect(input);
  if (!inspected) {
    return std::unexpected(std::move(inspected.error()));
  }

  LoadResult result{
      .unit_list = loader.DiscoverUnits(*inspected, input),
      .selection_list_list = loader.DiscoverSelectionLists(*inspected, input),
  };
  for (auto& unit : loader.SynthesizeUnits(*inspected, input)) {
    result.unit_list.push_back(std::move(unit));
  }
  return result;
}

}  // namespace pxu::provider
