#pragma once

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "pxu/record/record.hpp"

namespace pxu::unit {

// Value of a field, nullopt when the record does not define it.
auto GetField(const record::FieldMap& data, std::string_view key)
    -> std::optional<std::string>;

// Parse an `estimated_duration` value: a non-negative number of seconds.
auto ParseEstimatedDuration(std::string_view text)
    -> std::expected<double, std::string>;

// Split a list field on whitespace and commas, dropping empty words.
auto SplitWords(std::string_view text) -> std::vector<std::string>;

// Number of UTF-8 code points in text.
auto CountCodePoints(std::string_view text) -> size_t;

}  // namespace pxu::unit
