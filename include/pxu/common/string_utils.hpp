#pragma once

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace pxu::common {

inline auto IsBlank(char c) -> bool {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' ||
         c == '\v';
}

inline auto Trim(std::string_view s) -> std::string_view {
  auto begin = std::ranges::find_if_not(s, IsBlank);
  if (begin == s.end()) {
    return {};
  }
  auto end = std::find_if_not(s.rbegin(), s.rend(), IsBlank).base();
  return s.substr(
      static_cast<size_t>(begin - s.begin()),
      static_cast<size_t>(end - begin));
}

inline auto IsBlankLine(std::string_view s) -> bool {
  return std::ranges::all_of(s, IsBlank);
}

// Split text into lines on '\n'. A trailing newline does not produce an
// extra empty line and a trailing '\r' is removed from each line.
inline auto SplitLines(std::string_view text) -> std::vector<std::string_view> {
  std::vector<std::string_view> lines;
  size_t pos = 0;
  while (pos < text.size()) {
    size_t end = text.find('\n', pos);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    std::string_view line = text.substr(pos, end - pos);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    lines.push_back(line);
    pos = end + 1;
  }
  return lines;
}

// Join pieces with a separator.
inline auto Join(const std::vector<std::string>& parts, std::string_view sep)
    -> std::string {
  std::string result;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i != 0) {
      result += sep;
    }
    result += parts[i];
  }
  return result;
}

}  // namespace pxu::common
