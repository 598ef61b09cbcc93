#include "pxu/record/record.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace pxu::record {

auto Record::FromRawData(FieldMap raw_data, Origin origin) -> Record {
  Record record;
  for (const auto& [key, value] : raw_data) {
    record.data.insert_or_assign(std::string(NormalizeKey(key)), value);
  }
  record.raw_data = std::move(raw_data);
  record.origin = std::move(origin);
  return record;
}

auto Record::Get(std::string_view key) const -> std::optional<std::string> {
  auto it = data.find(key);
  if (it == data.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto Record::FieldOrigin(std::string_view key) const -> Origin {
  auto it = field_offset_map.find(key);
  if (it == field_offset_map.end()) {
    return origin;
  }
  return origin.WithOffset(it->second).JustLine();
}

}  // namespace pxu::record
