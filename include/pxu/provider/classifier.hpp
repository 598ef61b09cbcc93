#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "pxu/common/diagnostic/diagnostic.hpp"
#include "pxu/provider/provider_dirs.hpp"
#include "pxu/unit/file_role.hpp"

namespace pxu::provider {

// Which content loader understands a file.
enum class LoaderKind : uint8_t {
  kUnitSource,
  kSelectionList,
  kProviderContent,
};

auto ToString(LoaderKind kind) -> std::string_view;

struct ClassificationResult {
  unit::FileRole role;
  // Directory that can be subtracted from the path to relocate the file.
  std::filesystem::path base_dir;
  // Absent for files that carry no loadable content.
  std::optional<LoaderKind> loader;

  auto operator==(const ClassificationResult&) const -> bool = default;
};

// Decide the role of every file reachable from a provider's directories.
//
// Rules are derived once from the declared directories and tried in a fixed
// precedence order; the first rule that accepts a path wins. The last rule
// accepts everything, so classification of any path succeeds.
class Classifier final {
 public:
  explicit Classifier(ProviderDirs dirs);

  Classifier(const Classifier&) = delete;
  auto operator=(const Classifier&) -> Classifier& = delete;
  Classifier(Classifier&&) = delete;
  auto operator=(Classifier&&) -> Classifier& = delete;
  ~Classifier() = default;

  [[nodiscard]] auto Classify(const std::filesystem::path& path) const
      -> Result<ClassificationResult>;

  [[nodiscard]] auto dirs() const -> const ProviderDirs& {
    return dirs_;
  }

  // Names listed in src/EXECUTABLES (read on first use).
  [[nodiscard]] auto Executables() const -> const std::set<std::string>&;

 private:
  using Rule = std::function<std::optional<ClassificationResult>(
      const std::filesystem::path&)>;

  void AddRules();

  ProviderDirs dirs_;
  std::vector<Rule> rules_;
  mutable std::optional<std::set<std::string>> executables_;
};

// True when path is strictly below dir, compared component by component
// after lexical normalization.
auto IsInsideDirectory(
    const std::filesystem::path& path, const std::filesystem::path& dir)
    -> bool;

// True for regular files the current user may execute.
auto IsExecutableFile(const std::filesystem::path& path) -> bool;

}  // namespace pxu::provider
