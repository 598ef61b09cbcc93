#include "pxu/provider/classifier.hpp"

#include <unistd.h>

#include <algorithm>
#include <array>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <fmt/format.h>

#include "pxu/common/diagnostic/diagnostic.hpp"
#include "pxu/common/internal_error.hpp"
#include "pxu/common/string_utils.hpp"
#include "pxu/unit/file_role.hpp"

namespace pxu::provider {

namespace fs = std::filesystem;

using unit::FileRole;

namespace {

constexpr std::array<std::string_view, 3> kUnitSourceSuffixes = {
    ".txt", ".txt.in", ".pxu"};
constexpr std::array<std::string_view, 3> kLegalNames = {
    "COPYING", "COPYING.LESSER", "LICENSE"};
constexpr std::array<std::string_view, 4> kDocNames = {
    "README", "README.md", "README.rst", "README.txt"};
constexpr std::array<std::string_view, 2> kVcsIgnoreNames = {
    ".gitignore", ".bzrignore"};
constexpr std::array<std::string_view, 2> kVcsDirNames = {".git", ".bzr"};

auto Normalize(const fs::path& path) -> fs::path {
  fs::path normal = path.lexically_normal();
  // "/p/jobs/" normalizes with a trailing empty component.
  if (!normal.has_filename() && normal.has_relative_path()) {
    normal = normal.parent_path();
  }
  return normal;
}

template <size_t N>
auto Contains(
    const std::array<std::string_view, N>& names, std::string_view name)
    -> bool {
  return std::ranges::find(names, name) != names.end();
}

auto HasUnitSourceSuffix(const fs::path& path) -> bool {
  std::string name = path.filename().string();
  return std::ranges::any_of(
      kUnitSourceSuffixes, [&](std::string_view suffix) {
        return name.size() > suffix.size() && name.ends_with(suffix);
      });
}

// Scripts are told apart from binaries by their "#!" line.
auto ExecutableRole(const fs::path& path) -> FileRole {
  std::ifstream stream(path, std::ios::binary);
  std::array<char, 2> chunk{};
  if (!stream.read(chunk.data(), chunk.size())) {
    return FileRole::kBinary;
  }
  return chunk[0] == '#' && chunk[1] == '!' ? FileRole::kScript
                                            : FileRole::kBinary;
}

auto Accept(FileRole role, fs::path base_dir, std::optional<LoaderKind> loader)
    -> std::optional<ClassificationResult> {
  return ClassificationResult{
      .role = role, .base_dir = std::move(base_dir), .loader = loader};
}

}  // namespace

auto ToString(LoaderKind kind) -> std::string_view {
  switch (kind) {
    case LoaderKind::kUnitSource:
      return "unit-source";
    case LoaderKind::kSelectionList:
      return "selection-list";
    case LoaderKind::kProviderContent:
      return "provider-content";
  }
  common::ThrowInternalError("ToString(LoaderKind)", "unknown loader kind");
}

auto IsInsideDirectory(const fs::path& path, const fs::path& dir) -> bool {
  fs::path normal_path = Normalize(path);
  fs::path normal_dir = Normalize(dir);
  auto [dir_it, path_it] = std::mismatch(
      normal_dir.begin(), normal_dir.end(), normal_path.begin(),
      normal_path.end());
  return dir_it == normal_dir.end() && path_it != normal_path.end();
}

auto IsExecutableFile(const fs::path& path) -> bool {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    return false;
  }
  return ::access(path.c_str(), X_OK) == 0;
}

Classifier::Classifier(ProviderDirs dirs) : dirs_(std::move(dirs)) {
  AddRules();
}

auto Classifier::Classify(const fs::path& path) const
    -> Result<ClassificationResult> {
  for (const auto& rule : rules_) {
    if (auto result = rule(path)) {
      return *result;
    }
  }
  return std::unexpected(
      Diagnostic::ClassificationError(
          fmt::format("Unable to classify: '{}'", path.string())));
}

auto Classifier::Executables() const -> const std::set<std::string>& {
  if (executables_) {
    return *executables_;
  }
  executables_.emplace();
  auto src_dir = dirs_.SrcDir();
  if (!src_dir) {
    return *executables_;
  }
  std::ifstream stream(*src_dir / "EXECUTABLES");
  std::string line;
  while (std::getline(stream, line)) {
    auto name = common::Trim(line);
    if (!name.empty()) {
      executables_->emplace(name);
    }
  }
  return *executables_;
}

void Classifier::AddRules() {
  auto unit_source_rule = [](fs::path dir) -> Rule {
    return [dir = std::move(dir)](const fs::path& path) {
      if (IsInsideDirectory(path, dir) && HasUnitSourceSuffix(path)) {
        return Accept(FileRole::kUnitSource, dir, LoaderKind::kUnitSource);
      }
      return std::optional<ClassificationResult>{};
    };
  };

  if (dirs_.jobs) {
    rules_.push_back(unit_source_rule(*dirs_.jobs));
  }
  if (dirs_.units) {
    rules_.push_back(unit_source_rule(*dirs_.units));
  }
  if (dirs_.whitelists) {
    rules_.push_back([dir = *dirs_.whitelists](const fs::path& path) {
      if (IsInsideDirectory(path, dir) && path.extension() == ".whitelist") {
        return Accept(
            FileRole::kLegacyWhitelist, dir, LoaderKind::kSelectionList);
      }
      return std::optional<ClassificationResult>{};
    });
  }
  if (dirs_.data) {
    rules_.push_back([dir = *dirs_.data](const fs::path& path) {
      if (IsInsideDirectory(path, dir)) {
        return Accept(FileRole::kData, dir, LoaderKind::kProviderContent);
      }
      return std::optional<ClassificationResult>{};
    });
  }
  if (dirs_.bin) {
    rules_.push_back([dir = *dirs_.bin](const fs::path& path) {
      if (IsInsideDirectory(path, dir) && IsExecutableFile(path)) {
        return Accept(ExecutableRole(path), dir, LoaderKind::kProviderContent);
      }
      return std::optional<ClassificationResult>{};
    });
  }
  if (auto dir = dirs_.BuildBinDir()) {
    rules_.push_back([this, dir = *dir](const fs::path& path) {
      if (IsInsideDirectory(path, dir) && IsExecutableFile(path) &&
          Executables().contains(path.filename().string())) {
        return Accept(ExecutableRole(path), dir, LoaderKind::kProviderContent);
      }
      return std::optional<ClassificationResult>{};
    });
  }
  if (auto dir = dirs_.BuildMoDir()) {
    rules_.push_back([dir = *dir](const fs::path& path) {
      if (IsInsideDirectory(path, dir) && path.extension() == ".mo") {
        return Accept(FileRole::kI18n, dir, LoaderKind::kProviderContent);
      }
      return std::optional<ClassificationResult>{};
    });
  }
  if (auto dir = dirs_.BuildDir()) {
    rules_.push_back([dir = *dir](const fs::path& path) {
      if (IsInsideDirectory(path, dir)) {
        return Accept(FileRole::kBuild, dir, std::nullopt);
      }
      return std::optional<ClassificationResult>{};
    });
  }

  if (!dirs_.base) {
    rules_.push_back([](const fs::path&) {
      return Accept(FileRole::kUnknown, fs::path(), std::nullopt);
    });
    return;
  }

  const fs::path base = *dirs_.base;
  rules_.push_back([base, dir = *dirs_.PoDir()](const fs::path& path) {
    bool is_po = path.extension() == ".po" || path.extension() == ".pot" ||
                 path.filename() == "POTFILES.in";
    if (is_po && Normalize(path.parent_path()) == Normalize(dir)) {
      return Accept(FileRole::kSrc, base, std::nullopt);
    }
    return std::optional<ClassificationResult>{};
  });
  rules_.push_back([base, dir = *dirs_.SrcDir()](const fs::path& path) {
    if (IsInsideDirectory(path, dir)) {
      return Accept(FileRole::kSrc, base, std::nullopt);
    }
    return std::optional<ClassificationResult>{};
  });
  rules_.push_back([base](const fs::path& path) {
    if (Contains(kLegalNames, path.filename().string())) {
      return Accept(FileRole::kLegal, base, LoaderKind::kProviderContent);
    }
    return std::optional<ClassificationResult>{};
  });
  rules_.push_back([base](const fs::path& path) {
    if (Contains(kDocNames, path.filename().string())) {
      return Accept(FileRole::kDocs, base, LoaderKind::kProviderContent);
    }
    return std::optional<ClassificationResult>{};
  });
  rules_.push_back([base](const fs::path& path) {
    if (Normalize(path) == Normalize(base / "manage.py")) {
      return Accept(FileRole::kManagePy, base, std::nullopt);
    }
    return std::optional<ClassificationResult>{};
  });
  rules_.push_back([base](const fs::path& path) {
    if (Contains(kVcsIgnoreNames, path.filename().string())) {
      return Accept(FileRole::kVcs, base, std::nullopt);
    }
    // Any directory between the base and the file may be VCS metadata.
    fs::path relative = Normalize(path).lexically_relative(Normalize(base));
    if (relative.empty() || *relative.begin() == "..") {
      relative = Normalize(path).relative_path();
    }
    for (const auto& component : relative) {
      if (Contains(kVcsDirNames, component.string())) {
        return Accept(FileRole::kVcs, base, std::nullopt);
      }
    }
    return std::optional<ClassificationResult>{};
  });
  rules_.push_back([base](const fs::path&) {
    return Accept(FileRole::kUnknown, base, std::nullopt);
  });
}

}  // namespace pxu::provider
