#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "pxu/common/diagnostic/diagnostic.hpp"

namespace pxu::config {

// Contents of a `*.provider.toml` file:
//
//   [provider]
//   name = "2013.com.example:smoke"
//   version = "1.0"
//   location = "/path/to/provider"
//
// Directory settings are optional. Unset directories are looked up below
// `location`.
struct ProviderDefinition {
  // File the definition was read from; empty for in-memory definitions.
  std::filesystem::path definition_path;

  std::string name;
  std::string version;
  std::string description;
  std::optional<std::string> gettext_domain;
  std::optional<std::filesystem::path> location;
  std::optional<std::filesystem::path> units_dir;
  std::optional<std::filesystem::path> jobs_dir;
  std::optional<std::filesystem::path> whitelists_dir;
  std::optional<std::filesystem::path> data_dir;
  std::optional<std::filesystem::path> bin_dir;
  std::optional<std::filesystem::path> locale_dir;

  [[nodiscard]] auto EffectiveUnitsDir() const
      -> std::optional<std::filesystem::path>;
  [[nodiscard]] auto EffectiveJobsDir() const
      -> std::optional<std::filesystem::path>;
  [[nodiscard]] auto EffectiveWhitelistsDir() const
      -> std::optional<std::filesystem::path>;
  [[nodiscard]] auto EffectiveDataDir() const
      -> std::optional<std::filesystem::path>;
  [[nodiscard]] auto EffectiveBinDir() const
      -> std::optional<std::filesystem::path>;
  // Also falls back to `location/build/mo` for providers used from source.
  [[nodiscard]] auto EffectiveLocaleDir() const
      -> std::optional<std::filesystem::path>;

  // Name with ':' replaced by '.', usable as a file name.
  [[nodiscard]] auto NameWithoutColon() const -> std::string;
};

// Parse and validate a definition. `source_name` names the text in
// diagnostics.
auto ParseProviderDefinition(
    std::string_view text, std::string_view source_name)
    -> Result<ProviderDefinition>;

auto LoadProviderDefinition(const std::filesystem::path& path)
    -> Result<ProviderDefinition>;

// Reject the first invalid field.
auto ValidateProviderDefinition(const ProviderDefinition& definition)
    -> Result<void>;

// Directories whose providers are trusted to run privileged jobs.
auto DefaultSecureProviderPaths() -> std::vector<std::filesystem::path>;

// True when the definition file lives directly in one of secure_dirs.
auto IsSecureLocation(
    const std::filesystem::path& definition_path,
    const std::vector<std::filesystem::path>& secure_dirs) -> bool;

// All `*.provider.toml` files directly inside dirs, sorted. Missing
// directories are skipped.
auto FindProviderDefinitions(const std::vector<std::filesystem::path>& dirs)
    -> std::vector<std::filesystem::path>;

}  // namespace pxu::config
