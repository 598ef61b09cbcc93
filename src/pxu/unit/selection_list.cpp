#include "pxu/unit/selection_list.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include "pxu/common/diagnostic/diagnostic.hpp"
#include "pxu/common/origin.hpp"
#include "pxu/common/string_utils.hpp"
#include "pxu/unit/unit.hpp"

namespace pxu::unit {

auto SelectionList::FromString(
    std::string_view text, std::string name, Origin origin,
    std::optional<std::string> implicit_namespace) -> Result<SelectionList> {
  SelectionList list;
  list.name_ = std::move(name);
  list.implicit_namespace_ = std::move(implicit_namespace);

  uint32_t first_line = origin.line_start().value_or(1);
  auto lines = common::SplitLines(text);
  for (size_t index = 0; index < lines.size(); ++index) {
    std::string_view line = lines[index];
    if (auto hash = line.find('#'); hash != std::string_view::npos) {
      line = line.substr(0, hash);
    }
    line = common::Trim(line);
    if (line.empty()) {
      continue;
    }
    std::string pattern(
        line.begin(), std::ranges::find_if(line, common::IsBlank));
    if (list.implicit_namespace_ &&
        pattern.find(kNamespaceSeparator) == std::string::npos) {
      pattern = fmt::format(
          "{}{}{}", *list.implicit_namespace_, kNamespaceSeparator, pattern);
    }

    try {
      list.regexes_.emplace_back(pattern, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
      auto line_no = first_line + static_cast<uint32_t>(index);
      return std::unexpected(
          Diagnostic::SyntaxError(
              Origin(origin.source(), line_no, line_no),
              fmt::format("invalid pattern '{}': {}", pattern, e.what())));
    }
    list.patterns_.push_back(std::move(pattern));
  }

  list.origin_ = std::move(origin);
  return list;
}

auto SelectionList::FromFile(
    const std::filesystem::path& path,
    std::optional<std::string> implicit_namespace) -> Result<SelectionList> {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format("cannot open '{}'", path.string())));
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  return FromString(
      buffer.str(), path.stem().string(),
      Origin(FileTextSource{.filename = path.string()}),
      std::move(implicit_namespace));
}

auto SelectionList::Matches(std::string_view qualified_id) const -> bool {
  return std::ranges::any_of(regexes_, [&](const std::regex& regex) {
    return std::regex_match(qualified_id.begin(), qualified_id.end(), regex);
  });
}

}  // namespace pxu::unit
