#include "pxu/provider/provider.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "pxu/common/diagnostic/diagnostic.hpp"
#include "pxu/common/string_utils.hpp"
#include "pxu/config/provider_definition.hpp"
#include "pxu/unit/unit.hpp"

namespace pxu::provider {

namespace fs = std::filesystem;

namespace {

// Executable files directly inside dir. A missing directory has none.
auto ListExecutables(const std::optional<fs::path>& dir)
    -> std::vector<fs::path> {
  std::vector<fs::path> result;
  if (!dir) {
    return result;
  }
  std::error_code ec;
  fs::directory_iterator it(*dir, ec);
  if (ec == std::errc::no_such_file_or_directory) {
    return result;
  }
  for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
    if (IsExecutableFile(it->path())) {
      result.push_back(it->path());
    }
  }
  if (ec) {
    throw fs::filesystem_error("cannot list executables", *dir, ec);
  }
  return result;
}

auto SortedById(std::vector<unit::UnitPtr> units)
    -> std::vector<unit::UnitPtr> {
  std::ranges::stable_sort(units, {}, [](const unit::UnitPtr& unit) {
    return unit->Id().value_or("");
  });
  return units;
}

auto EnumeratorOrDefault(
    std::unique_ptr<ContentEnumerator> enumerator, const ProviderDirs& dirs)
    -> std::unique_ptr<ContentEnumerator> {
  if (enumerator != nullptr) {
    return enumerator;
  }
  return std::make_unique<FsContentEnumerator>(ContentDirs(dirs));
}

}  // namespace

Provider::Provider(
    ProviderInfo info, ProviderDirs dirs, LoadOptions options,
    std::unique_ptr<ContentEnumerator> enumerator)
    : info_(std::move(info)),
      options_(options),
      classifier_(std::move(dirs)),
      enumerator_(
          EnumeratorOrDefault(std::move(enumerator), classifier_.dirs())),
      aggregator_(*enumerator_, classifier_, this) {
}

auto Provider::FromDefinition(
    const config::ProviderDefinition& definition, bool secure,
    LoadOptions options) -> std::unique_ptr<Provider> {
  ProviderInfo info{
      .name = definition.name,
      .version = definition.version,
      .description = definition.description,
      .secure = secure,
      .gettext_domain = definition.gettext_domain,
  };
  ProviderDirs dirs{
      .base = definition.location,
      .units = definition.EffectiveUnitsDir(),
      .jobs = definition.EffectiveJobsDir(),
      .whitelists = definition.EffectiveWhitelistsDir(),
      .data = definition.EffectiveDataDir(),
      .bin = definition.EffectiveBinDir(),
      .locale = definition.EffectiveLocaleDir(),
  };
  return std::make_unique<Provider>(
      std::move(info), std::move(dirs), options);
}

auto Provider::FromDefinitionFile(
    const fs::path& path, const std::vector<fs::path>& secure_dirs,
    LoadOptions options) -> Result<std::unique_ptr<Provider>> {
  auto definition = config::LoadProviderDefinition(path);
  if (!definition) {
    return std::unexpected(std::move(definition.error()));
  }
  return FromDefinition(
      *definition, config::IsSecureLocation(path, secure_dirs), options);
}

auto Provider::Namespace() const -> std::string {
  return info_.name.substr(0, info_.name.find(':'));
}

auto Provider::Classify(const fs::path& path) const
    -> Result<ClassificationResult> {
  return classifier_.Classify(path);
}

void Provider::Load() {
  spdlog::info("Loading content of provider {}", info_.name);
  aggregator_.Load(options_);
}

void Provider::Load(const LoadOptions& options) {
  options_ = options;
  Load();
}

void Provider::EnsureLoaded() {
  if (!aggregator_.is_loaded()) {
    Load();
  }
}

auto Provider::unit_list() -> const std::vector<unit::UnitPtr>& {
  EnsureLoaded();
  return aggregator_.unit_list();
}

auto Provider::problem_list() -> const std::vector<Diagnostic>& {
  EnsureLoaded();
  return aggregator_.problem_list();
}

auto Provider::selection_list_list()
    -> const std::vector<unit::SelectionList>& {
  EnsureLoaded();
  return aggregator_.selection_list_list();
}

auto Provider::id_map() -> const UnitIndex& {
  EnsureLoaded();
  return aggregator_.id_map();
}

auto Provider::path_map() -> const UnitIndex& {
  EnsureLoaded();
  return aggregator_.path_map();
}

auto Provider::GetUnits() -> UnitsAndProblems {
  EnsureLoaded();
  return UnitsAndProblems{
      .units = aggregator_.unit_list(),
      .problems = aggregator_.problem_list(),
  };
}

auto Provider::LoadAllJobs() -> UnitsAndProblems {
  auto [units, problems] = GetUnits();
  std::vector<unit::UnitPtr> jobs;
  std::ranges::copy_if(units, std::back_inserter(jobs), [](const auto& unit) {
    return unit->Kind() == unit::UnitKind::kJob;
  });
  return UnitsAndProblems{
      .units = SortedById(std::move(jobs)),
      .problems = std::move(problems),
  };
}

auto Provider::GetBuiltinJobs() -> std::vector<unit::UnitPtr> {
  auto [jobs, problems] = LoadAllJobs();
  if (!problems.empty()) {
    throw DiagnosticException(std::move(problems.front()));
  }
  return std::move(jobs);
}

auto Provider::GetSelectionLists() -> std::vector<unit::SelectionList> {
  std::vector<unit::SelectionList> lists = selection_list_list();
  std::ranges::stable_sort(lists, {}, &unit::SelectionList::name);
  return lists;
}

auto Provider::GetAllExecutables() const -> std::vector<fs::path> {
  std::vector<fs::path> result = ListExecutables(dirs().bin);
  for (auto& path : BuildBinExecutables()) {
    result.push_back(std::move(path));
  }
  std::ranges::sort(result);
  return result;
}

// src/EXECUTABLES, when present, names the build/bin files that are
// executables. Otherwise every executable of build/bin counts.
auto Provider::BuildBinExecutables() const -> std::vector<fs::path> {
  auto build_bin_dir = dirs().BuildBinDir();
  if (!build_bin_dir) {
    return {};
  }
  fs::path hint_file = *dirs().SrcDir() / "EXECUTABLES";
  std::error_code ec;
  if (!fs::is_regular_file(hint_file, ec)) {
    return ListExecutables(build_bin_dir);
  }

  std::vector<fs::path> result;
  std::ifstream stream(hint_file);
  std::string line;
  while (std::getline(stream, line)) {
    auto name = common::Trim(line);
    if (!name.empty()) {
      result.push_back(*build_bin_dir / std::string(name));
    }
  }
  return result;
}

}  // namespace pxu::provider
