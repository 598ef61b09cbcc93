#include "pxu/config/provider_definition.hpp"

#include <algorithm>
#include <array>
#include <filesystem>
#include <fstream>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "pxu/common/diagnostic/diagnostic.hpp"
#include "pxu/common/origin.hpp"

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-literal-operator"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-literal-operator"
#endif
#include <toml++/toml.hpp>
#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

namespace pxu::config {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kDefinitionSuffix = ".provider.toml";

// RFC3720 IQN without the "iqn." prefix: "2013.com.example:smoke".
const char* const kIqnPattern =
    R"(^[0-9]{4}\.[a-z][a-z0-9-]*(\.[a-z][a-z0-9-]*)+:[a-z][a-z0-9-]*$)";
const char* const kVersionPattern = R"(^[0-9]+(\.[0-9]+)*$)";
const char* const kGettextDomainPattern = R"(^[a-z0-9_-]+$)";

auto DefinitionOrigin(const fs::path& definition_path) -> Origin {
  if (definition_path.empty()) {
    return Origin();
  }
  return Origin(FileTextSource{.filename = definition_path.string()});
}

auto FieldProblem(
    const ProviderDefinition& definition, std::string_view field,
    std::string_view message) -> Diagnostic {
  return Diagnostic::HostError(
      DefinitionOrigin(definition.definition_path),
      fmt::format(
          "Problem in provider definition, field '{}': {}", field, message));
}

auto Matches(const std::string& value, const char* pattern) -> bool {
  return std::regex_match(value, std::regex(pattern, std::regex::ECMAScript));
}

// Validate one optional directory setting.
auto CheckDirectory(
    const ProviderDefinition& definition, std::string_view field,
    const std::optional<fs::path>& dir) -> Result<void> {
  if (!dir) {
    return {};
  }
  if (dir->empty()) {
    return std::unexpected(FieldProblem(definition, field, "cannot be empty"));
  }
  if (dir->is_relative()) {
    return std::unexpected(
        FieldProblem(definition, field, "cannot be relative"));
  }
  std::error_code ec;
  if (!fs::is_directory(*dir, ec)) {
    return std::unexpected(
        FieldProblem(definition, field, "no such directory"));
  }
  return {};
}

auto Effective(
    const std::optional<fs::path>& explicit_dir,
    const std::optional<fs::path>& location, const fs::path& relative)
    -> std::optional<fs::path> {
  if (explicit_dir) {
    return explicit_dir;
  }
  if (!location) {
    return std::nullopt;
  }
  fs::path implicit_dir = *location / relative;
  std::error_code ec;
  if (fs::is_directory(implicit_dir, ec)) {
    return implicit_dir;
  }
  return std::nullopt;
}

// Reads string keys of the [provider] table.
class FieldReader {
 public:
  FieldReader(const toml::table& table, const ProviderDefinition& definition)
      : table_(table), definition_(definition) {
  }

  auto String(std::string_view key) -> Result<std::optional<std::string>> {
    const toml::node* node = table_.get(key);
    if (node == nullptr) {
      return std::nullopt;
    }
    auto value = node->value<std::string>();
    if (!node->is_string() || !value) {
      return std::unexpected(
          FieldProblem(definition_, key, "must be a string"));
    }
    return value;
  }

  auto Path(std::string_view key) -> Result<std::optional<fs::path>> {
    auto value = String(key);
    if (!value) {
      return std::unexpected(std::move(value.error()));
    }
    if (!*value) {
      return std::nullopt;
    }
    return fs::path(**value);
  }

 private:
  const toml::table& table_;
  const ProviderDefinition& definition_;
};

}  // namespace

auto ProviderDefinition::EffectiveUnitsDir() const -> std::optional<fs::path> {
  return Effective(units_dir, location, "units");
}

auto ProviderDefinition::EffectiveJobsDir() const -> std::optional<fs::path> {
  return Effective(jobs_dir, location, "jobs");
}

auto ProviderDefinition::EffectiveWhitelistsDir() const
    -> std::optional<fs::path> {
  return Effective(whitelists_dir, location, "whitelists");
}

auto ProviderDefinition::EffectiveDataDir() const -> std::optional<fs::path> {
  return Effective(data_dir, location, "data");
}

auto ProviderDefinition::EffectiveBinDir() const -> std::optional<fs::path> {
  return Effective(bin_dir, location, "bin");
}

auto ProviderDefinition::EffectiveLocaleDir() const
    -> std::optional<fs::path> {
  if (auto dir = Effective(locale_dir, location, "locale")) {
    return dir;
  }
  return Effective(std::nullopt, location, fs::path("build") / "mo");
}

auto ProviderDefinition::NameWithoutColon() const -> std::string {
  std::string result = name;
  std::ranges::replace(result, ':', '.');
  return result;
}

auto ParseProviderDefinition(
    std::string_view text, std::string_view source_name)
    -> Result<ProviderDefinition> {
  ProviderDefinition definition;
  definition.definition_path = fs::path(source_name);

  toml::table tbl;
  try {
    tbl = toml::parse(text, source_name);
  } catch (const toml::parse_error& e) {
    return std::unexpected(
        Diagnostic::HostError(
            DefinitionOrigin(definition.definition_path),
            fmt::format("failed to parse {}: {}", source_name, e.what())));
  }

  const toml::table* provider = tbl["provider"].as_table();
  if (provider == nullptr) {
    return std::unexpected(
        Diagnostic::HostError(
            DefinitionOrigin(definition.definition_path),
            fmt::format("{}: missing [provider] section", source_name)));
  }

  FieldReader reader(*provider, definition);

  auto name = reader.String("name");
  if (!name) {
    return std::unexpected(std::move(name.error()));
  }
  if (!*name) {
    return std::unexpected(
        FieldProblem(definition, "name", "must be set to something"));
  }
  definition.name = **name;

  auto version = reader.String("version");
  if (!version) {
    return std::unexpected(std::move(version.error()));
  }
  if (!*version) {
    return std::unexpected(
        FieldProblem(definition, "version", "must be set to something"));
  }
  definition.version = **version;

  auto description = reader.String("description");
  if (!description) {
    return std::unexpected(std::move(description.error()));
  }
  definition.description = description->value_or("");

  auto gettext_domain = reader.String("gettext_domain");
  if (!gettext_domain) {
    return std::unexpected(std::move(gettext_domain.error()));
  }
  definition.gettext_domain = *gettext_domain;

  using DirField = std::pair<std::string_view, std::optional<fs::path>*>;
  const std::array<DirField, 7> dirs{{
      {"location", &definition.location},
      {"units_dir", &definition.units_dir},
      {"jobs_dir", &definition.jobs_dir},
      {"whitelists_dir", &definition.whitelists_dir},
      {"data_dir", &definition.data_dir},
      {"bin_dir", &definition.bin_dir},
      {"locale_dir", &definition.locale_dir},
  }};
  for (const auto& [key, dir] : dirs) {
    auto value = reader.Path(key);
    if (!value) {
      return std::unexpected(std::move(value.error()));
    }
    *dir = *value;
  }

  if (auto valid = ValidateProviderDefinition(definition); !valid) {
    return std::unexpected(std::move(valid.error()));
  }
  return definition;
}

auto LoadProviderDefinition(const fs::path& path)
    -> Result<ProviderDefinition> {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format("cannot open '{}'", path.string())));
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return ParseProviderDefinition(buffer.str(), path.string());
}

auto ValidateProviderDefinition(const ProviderDefinition& definition)
    -> Result<void> {
  if (definition.name.empty()) {
    return std::unexpected(
        FieldProblem(definition, "name", "cannot be empty"));
  }
  if (!Matches(definition.name, kIqnPattern)) {
    return std::unexpected(
        FieldProblem(definition, "name", "must look like RFC3720 IQN"));
  }
  if (definition.version.empty()) {
    return std::unexpected(
        FieldProblem(definition, "version", "cannot be empty"));
  }
  if (!Matches(definition.version, kVersionPattern)) {
    return std::unexpected(
        FieldProblem(
            definition, "version",
            "must be a sequence of digits separated by dots"));
  }
  if (definition.gettext_domain &&
      !Matches(*definition.gettext_domain, kGettextDomainPattern)) {
    return std::unexpected(
        FieldProblem(
            definition, "gettext_domain",
            "must be a valid gettext domain name"));
  }

  using DirField = std::pair<std::string_view, const std::optional<fs::path>*>;
  const std::array<DirField, 7> dirs{{
      {"location", &definition.location},
      {"units_dir", &definition.units_dir},
      {"jobs_dir", &definition.jobs_dir},
      {"whitelists_dir", &definition.whitelists_dir},
      {"data_dir", &definition.data_dir},
      {"bin_dir", &definition.bin_dir},
      {"locale_dir", &definition.locale_dir},
  }};
  for (const auto& [field, dir] : dirs) {
    if (auto valid = CheckDirectory(definition, field, *dir); !valid) {
      return valid;
    }
  }
  return {};
}

auto DefaultSecureProviderPaths() -> std::vector<fs::path> {
  return {
      "/usr/local/share/pxu-providers-1",
      "/usr/share/pxu-providers-1",
  };
}

auto IsSecureLocation(
    const fs::path& definition_path, const std::vector<fs::path>& secure_dirs)
    -> bool {
  fs::path dir = definition_path.parent_path().lexically_normal();
  return std::ranges::any_of(secure_dirs, [&](const fs::path& secure_dir) {
    fs::path normal = secure_dir.lexically_normal();
    if (!normal.has_filename() && normal.has_relative_path()) {
      normal = normal.parent_path();
    }
    return normal == dir;
  });
}

auto FindProviderDefinitions(const std::vector<fs::path>& dirs)
    -> std::vector<fs::path> {
  std::vector<fs::path> result;
  for (const auto& dir : dirs) {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
      std::string name = it->path().filename().string();
      std::error_code status_ec;
      if (name.size() > kDefinitionSuffix.size() &&
          name.ends_with(kDefinitionSuffix) &&
          it->is_regular_file(status_ec)) {
        result.push_back(it->path());
      }
    }
    if (ec && ec != std::errc::no_such_file_or_directory) {
      spdlog::warn("cannot list '{}': {}", dir.string(), ec.message());
    }
  }
  std::ranges::sort(result);
  return result;
}

}  // namespace pxu::config
