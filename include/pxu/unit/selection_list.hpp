#pragma once

#include <filesystem>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "pxu/common/diagnostic/diagnostic.hpp"
#include "pxu/common/origin.hpp"

namespace pxu::unit {

// Ordered list of job identifier patterns (a legacy "whitelist", or the
// `include` field of a test plan).
class SelectionList {
 public:
  // Parse one pattern per line. '#' starts a comment, blank lines are
  // skipped and the first word of a line is its pattern. Patterns without
  // a namespace get `implicit_namespace::` in front of them. An invalid
  // regular expression is a syntax error at its line.
  static auto FromString(
      std::string_view text, std::string name, Origin origin,
      std::optional<std::string> implicit_namespace = std::nullopt)
      -> Result<SelectionList>;

  // Same as FromString with the file stem as name.
  static auto FromFile(
      const std::filesystem::path& path,
      std::optional<std::string> implicit_namespace = std::nullopt)
      -> Result<SelectionList>;

  [[nodiscard]] auto name() const -> const std::string& {
    return name_;
  }
  [[nodiscard]] auto origin() const -> const Origin& {
    return origin_;
  }
  [[nodiscard]] auto implicit_namespace() const
      -> const std::optional<std::string>& {
    return implicit_namespace_;
  }
  // Patterns after namespace qualification, in file order.
  [[nodiscard]] auto patterns() const -> const std::vector<std::string>& {
    return patterns_;
  }

  // True when any pattern matches the whole qualified identifier.
  [[nodiscard]] auto Matches(std::string_view qualified_id) const -> bool;

 private:
  SelectionList() = default;

  std::string name_;
  Origin origin_;
  std::optional<std::string> implicit_namespace_;
  std::vector<std::string> patterns_;
  std::vector<std::regex> regexes_;
};

}  // namespace pxu::unit
