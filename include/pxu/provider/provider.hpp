#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "pxu/common/diagnostic/diagnostic.hpp"
#include "pxu/config/provider_definition.hpp"
#include "pxu/provider/classifier.hpp"
#include "pxu/provider/content_aggregator.hpp"
#include "pxu/provider/content_loader.hpp"
#include "pxu/provider/enumerator.hpp"
#include "pxu/provider/provider_dirs.hpp"
#include "pxu/unit/selection_list.hpp"
#include "pxu/unit/unit.hpp"

namespace pxu::provider {

struct ProviderInfo {
  // IQN-like name, e.g. "2013.com.example:smoke".
  std::string name;
  std::string version;
  std::string description;
  // Providers installed in a secure location may run jobs as root.
  bool secure = false;
  std::optional<std::string> gettext_domain;
};

// Units together with the problems found while loading them.
struct UnitsAndProblems {
  std::vector<unit::UnitPtr> units;
  std::vector<Diagnostic> problems;
};

// A named bundle of test content spread over a set of directories.
//
// The provider owns its classifier, enumerator and aggregator. Units keep a
// pointer back to the provider, so providers are neither copied nor moved.
// Content is loaded on first access; Load() forces a reload. Loading is not
// thread-safe.
class Provider final {
 public:
  Provider(
      ProviderInfo info, ProviderDirs dirs, LoadOptions options = {},
      std::unique_ptr<ContentEnumerator> enumerator = nullptr);

  Provider(const Provider&) = delete;
  auto operator=(const Provider&) -> Provider& = delete;
  Provider(Provider&&) = delete;
  auto operator=(Provider&&) -> Provider& = delete;
  ~Provider() = default;

  static auto FromDefinition(
      const config::ProviderDefinition& definition, bool secure,
      LoadOptions options = {}) -> std::unique_ptr<Provider>;

  // Load a definition file. The provider is secure when the file lives in
  // one of secure_dirs.
  static auto FromDefinitionFile(
      const std::filesystem::path& path,
      const std::vector<std::filesystem::path>& secure_dirs,
      LoadOptions options = {}) -> Result<std::unique_ptr<Provider>>;

  [[nodiscard]] auto info() const -> const ProviderInfo& {
    return info_;
  }
  [[nodiscard]] auto name() const -> const std::string& {
    return info_.name;
  }
  [[nodiscard]] auto version() const -> const std::string& {
    return info_.version;
  }
  [[nodiscard]] auto secure() const -> bool {
    return info_.secure;
  }
  [[nodiscard]] auto dirs() const -> const ProviderDirs& {
    return classifier_.dirs();
  }

  // Namespace of the provider's units: the name up to the first ':'.
  [[nodiscard]] auto Namespace() const -> std::string;

  [[nodiscard]] auto Classify(const std::filesystem::path& path) const
      -> Result<ClassificationResult>;

  // Reload all content with the stored options.
  void Load();
  // Reload all content with new options; they are kept for later loads.
  void Load(const LoadOptions& options);

  [[nodiscard]] auto is_loaded() const -> bool {
    return aggregator_.is_loaded();
  }

  auto unit_list() -> const std::vector<unit::UnitPtr>&;
  auto problem_list() -> const std::vector<Diagnostic>&;
  auto selection_list_list() -> const std::vector<unit::SelectionList>&;
  auto id_map() -> const UnitIndex&;
  auto path_map() -> const UnitIndex&;

  auto GetUnits() -> UnitsAndProblems;

  // Job units sorted by identifier.
  auto LoadAllJobs() -> UnitsAndProblems;

  // Job units sorted by identifier. Throws DiagnosticException with the
  // first problem when any file failed to load.
  auto GetBuiltinJobs() -> std::vector<unit::UnitPtr>;

  // Selection lists sorted by name.
  auto GetSelectionLists() -> std::vector<unit::SelectionList>;

  // Executables of the bin directory and of build/bin, sorted by path. A
  // missing directory yields nothing; other errors throw
  // std::filesystem::filesystem_error.
  [[nodiscard]] auto GetAllExecutables() const
      -> std::vector<std::filesystem::path>;

 private:
  void EnsureLoaded();
  [[nodiscard]] auto BuildBinExecutables() const
      -> std::vector<std::filesystem::path>;

  ProviderInfo info_;
  LoadOptions options_;
  Classifier classifier_;
  std::unique_ptr<ContentEnumerator> enumerator_;
  ContentAggregator aggregator_;
};

}  // namespace pxu::provider
