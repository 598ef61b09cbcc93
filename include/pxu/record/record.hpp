#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "pxu/common/origin.hpp"

namespace pxu::record {

// Field name -> field value. Field order carries no meaning.
using FieldMap = std::map<std::string, std::string, std::less<>>;

// Field name -> line offset of the field relative to the record's first line
using FieldOffsetMap = std::map<std::string, uint32_t, std::less<>>;

// Fields whose name starts with this marker are translatable. The marker is
// part of the raw key only.
inline constexpr char kTranslatableMarker = '_';

// Strip the translatable-field marker from a raw key.
inline auto NormalizeKey(std::string_view raw_key) -> std::string_view {
  if (raw_key.size() > 1 && raw_key.front() == kTranslatableMarker) {
    raw_key.remove_prefix(1);
  }
  return raw_key;
}

// One parsed group of fields with its source span.
//
// raw_data keeps keys as written, data has the translatable marker removed
// from every key. field_offset_map is keyed like data.
struct Record {
  FieldMap data;
  FieldMap raw_data;
  FieldOffsetMap field_offset_map;
  Origin origin;

  auto operator==(const Record&) const -> bool = default;

  // Build a record from raw fields (as a writer would see them).
  static auto FromRawData(FieldMap raw_data, Origin origin = Origin())
      -> Record;

  [[nodiscard]] auto Get(std::string_view key) const
      -> std::optional<std::string>;

  // Origin of a single field: the record origin moved to the field's line.
  [[nodiscard]] auto FieldOrigin(std::string_view key) const -> Origin;
};

}  // namespace pxu::record
