#include "pxu/unit/file.hpp"

#include <expected>
#include <string>

#include <fmt/format.h>

#include "pxu/record/record.hpp"
#include "pxu/unit/field_parsing.hpp"
#include "pxu/unit/file_role.hpp"

namespace pxu::unit {

auto FileData::FromRecord(const record::FieldMap& data)
    -> std::expected<FileData, std::string> {
  auto path = GetField(data, "path");
  if (!path) {
    return std::unexpected("file unit requires the 'path' field");
  }
  FileData file{
      .path = *path,
      .role = FileRole::kUnknown,
      .base = GetField(data, "base"),
  };
  if (auto role = GetField(data, "role")) {
    auto parsed = ParseFileRole(*role);
    if (!parsed) {
      return std::unexpected(fmt::format("unknown file role '{}'", *role));
    }
    file.role = *parsed;
  }
  return file;
}

}  // namespace pxu::unit
