#pragma once

#include <expected>
#include <optional>
#include <string>

#include "pxu/record/record.hpp"
#include "pxu/unit/file_role.hpp"

namespace pxu::unit {

// Provenance record of one provider file. Loaders synthesize these; they
// have no identifier and are indexed by path.
struct FileData {
  std::string path;
  FileRole role = FileRole::kUnknown;
  // Directory that can be subtracted from path to relocate the file.
  std::optional<std::string> base;

  static auto FromRecord(const record::FieldMap& data)
      -> std::expected<FileData, std::string>;
};

}  // namespace pxu::unit
