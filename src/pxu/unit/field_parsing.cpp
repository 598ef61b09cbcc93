#include "pxu/unit/field_parsing.hpp"

#include <charconv>
#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "pxu/common/string_utils.hpp"
#include "pxu/record/record.hpp"

namespace pxu::unit {

auto GetField(const record::FieldMap& data, std::string_view key)
    -> std::optional<std::string> {
  auto it = data.find(key);
  if (it == data.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto ParseEstimatedDuration(std::string_view text)
    -> std::expected<double, std::string> {
  std::string_view trimmed = common::Trim(text);
  double value = 0.0;
  const char* end = trimmed.data() + trimmed.size();
  auto [ptr, ec] = std::from_chars(trimmed.data(), end, value);
  if (trimmed.empty() || ec != std::errc() || ptr != end || value < 0.0) {
    return std::unexpected(
        fmt::format(
            "estimated_duration must be a non-negative number, got '{}'",
            text));
  }
  return value;
}

auto SplitWords(std::string_view text) -> std::vector<std::string> {
  std::vector<std::string> words;
  std::string current;
  for (char c : text) {
    if (common::IsBlank(c) || c == ',') {
      if (!current.empty()) {
        words.push_back(std::move(current));
        current.clear();
      }
      continue;
    }
    current += c;
  }
  if (!current.empty()) {
    words.push_back(std::move(current));
  }
  return words;
}

auto CountCodePoints(std::string_view text) -> size_t {
  size_t count = 0;
  for (char c : text) {
    // Continuation bytes look like 10xxxxxx.
    if ((static_cast<unsigned char>(c) & 0xC0U) != 0x80U) {
      ++count;
    }
  }
  return count;
}

}  // namespace pxu::unit
