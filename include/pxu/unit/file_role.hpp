#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace pxu::unit {

// Role of one file inside a provider.
enum class FileRole : uint8_t {
  kUnitSource,       // PXU unit definitions
  kLegacyWhitelist,  // Legacy selection list
  kData,             // Data used by jobs at runtime
  kI18n,             // Compiled translation catalog
  kScript,           // Executable starting with "#!"
  kBinary,           // Any other executable
  kBuild,            // Build artifact
  kLegal,            // License or copyright notice
  kDocs,             // Standalone documentation
  kManagePy,         // Provider management script
  kSrc,              // Source of executables or translations
  kVcs,              // Version control metadata
  kUnknown,          // Anything else
};

// Stable textual names, as used by the `role` field of file units.
auto ToString(FileRole role) -> std::string_view;

auto ParseFileRole(std::string_view name) -> std::optional<FileRole>;

}  // namespace pxu::unit
