#pragma once

#include <filesystem>
#include <optional>

namespace pxu::provider {

// Directories a provider declares. Any of them may be absent. The build,
// src and po directories only exist for providers with a base directory
// (a provider used from its source tree).
struct ProviderDirs {
  std::optional<std::filesystem::path> base;
  std::optional<std::filesystem::path> units;
  std::optional<std::filesystem::path> jobs;
  std::optional<std::filesystem::path> whitelists;
  std::optional<std::filesystem::path> data;
  std::optional<std::filesystem::path> bin;
  std::optional<std::filesystem::path> locale;

  [[nodiscard]] auto BuildDir() const -> std::optional<std::filesystem::path>;
  [[nodiscard]] auto BuildBinDir() const
      -> std::optional<std::filesystem::path>;
  [[nodiscard]] auto BuildMoDir() const -> std::optional<std::filesystem::path>;
  [[nodiscard]] auto SrcDir() const -> std::optional<std::filesystem::path>;
  [[nodiscard]] auto PoDir() const -> std::optional<std::filesystem::path>;
};

}  // namespace pxu::provider
