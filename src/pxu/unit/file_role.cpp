#include "pxu/unit/file_role.hpp"

#include <array>
#include <optional>
#include <string_view>
#include <utility>

#include "pxu/common/internal_error.hpp"

namespace pxu::unit {

namespace {

constexpr std::array<std::pair<FileRole, std::string_view>, 13> kRoleNames = {{
    {FileRole::kUnitSource, "unit-source"},
    {FileRole::kLegacyWhitelist, "legacy-whitelist"},
    {FileRole::kData, "data"},
    {FileRole::kI18n, "i18n"},
    {FileRole::kScript, "script"},
    {FileRole::kBinary, "binary"},
    {FileRole::kBuild, "build"},
    {FileRole::kLegal, "legal"},
    {FileRole::kDocs, "docs"},
    {FileRole::kManagePy, "manage-py"},
    {FileRole::kSrc, "src"},
    {FileRole::kVcs, "vcs"},
    {FileRole::kUnknown, "unknown"},
}};

}  // namespace

auto ToString(FileRole role) -> std::string_view {
  for (const auto& [candidate, name] : kRoleNames) {
    if (candidate == role) {
      return name;
    }
  }
  common::ThrowInternalError("ToString(FileRole)", "unknown file role");
}

auto ParseFileRole(std::string_view name) -> std::optional<FileRole> {
  for (const auto& [role, candidate] : kRoleNames) {
    if (candidate == name) {
      return role;
    }
  }
  return std::nullopt;
}

}  // namespace pxu::unit
