#include "pxu/provider/content_aggregator.hpp"

#include <cstddef>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "pxu/common/diagnostic/diagnostic.hpp"
#include "pxu/provider/classifier.hpp"
#include "pxu/provider/content_loader.hpp"
#include "pxu/provider/enumerator.hpp"
#include "pxu/unit/file_role.hpp"
#include "pxu/unit/unit.hpp"

namespace pxu::provider {

ContentAggregator::ContentAggregator(
    const ContentEnumerator& enumerator, const Classifier& classifier,
    const Provider* provider)
    : enumerator_(enumerator),
      classifier_(classifier),
      provider_(provider),
      loaders_{
          MakeContentLoader(LoaderKind::kUnitSource),
          MakeContentLoader(LoaderKind::kSelectionList),
          MakeContentLoader(LoaderKind::kProviderContent),
      } {
}

void ContentAggregator::Load(const LoadOptions& options) {
  Clear();
  EnumerationResult enumeration = enumerator_.Enumerate();

  for (const auto& file : enumeration.files) {
    auto classification = classifier_.Classify(file.path);
    if (!classification) {
      AddProblem(std::move(classification.error()));
      continue;
    }
    if (!classification->loader) {
      continue;
    }

    const ContentLoader& loader =
        *loaders_.at(static_cast<size_t>(*classification->loader));
    spdlog::debug(
        "Loading {} ({}) with {} loader", file.path.string(),
        unit::ToString(classification->role), ToString(loader.Kind()));

    auto result = LoadFile(
        loader, LoadInput{
                    .filename = file.path,
                    .text = &file.text,
                    .provider = provider_,
                    .classification = *classification,
                    .options = options,
                });
    if (!result) {
      AddProblem(std::move(result.error()));
      continue;
    }
    for (const auto& unit : result->unit_list) {
      AddUnit(unit);
    }
    for (auto& list : result->selection_list_list) {
      selection_list_list_.push_back(std::move(list));
    }
  }

  for (auto& problem : enumeration.problems) {
    AddProblem(std::move(problem));
  }
  is_loaded_ = true;
}

void ContentAggregator::Clear() {
  is_loaded_ = false;
  unit_list_.clear();
  selection_list_list_.clear();
  problems_.Clear();
  id_map_.clear();
  path_map_.clear();
}

void ContentAggregator::AddUnit(const unit::UnitPtr& unit) {
  unit_list_.push_back(unit);
  if (auto id = unit->Id()) {
    id_map_[*id].push_back(unit);
  }
  if (auto path = unit->Path()) {
    path_map_[*path].push_back(unit);
  }
}

void ContentAggregator::AddProblem(Diagnostic problem) {
  spdlog::warn("{}", problem.primary.message);
  problems_.Report(std::move(problem));
}

}  // namespace pxu::provider
