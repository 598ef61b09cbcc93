#include "pxu/record/writer.hpp"

#include <algorithm>
#include <cstddef>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "pxu/common/string_utils.hpp"

namespace pxu::record {

namespace {

// Inverse of the continuation-line unescaping done by the parser. A line
// holding only whitespace would end the record, so it is written as an
// empty line.
auto EscapeContinuation(std::string_view line) -> std::string {
  if (common::IsBlankLine(line)) {
    return ".";
  }
  std::string_view stripped = common::Trim(line);
  if (!stripped.empty() &&
      std::ranges::all_of(stripped, [](char c) { return c == '.'; })) {
    return "." + std::string(stripped);
  }
  return std::string(line);
}

// The parser trims the value on the key line, so values with surrounding
// whitespace go to continuation lines as well.
auto NeedsContinuation(std::string_view value) -> bool {
  return value.find('\n') != std::string_view::npos ||
         common::Trim(value).size() != value.size();
}

}  // namespace

void WriteRecord(const FieldMap& fields, std::ostream& out) {
  for (const auto& [key, value] : fields) {
    if (!NeedsContinuation(value)) {
      out << key << ": " << value << "\n";
      continue;
    }
    out << key << ":\n";
    std::string_view rest = value;
    while (true) {
      size_t newline = rest.find('\n');
      std::string_view line = rest.substr(0, newline);
      out << " " << EscapeContinuation(line) << "\n";
      if (newline == std::string_view::npos) {
        break;
      }
      rest.remove_prefix(newline + 1);
    }
  }
  out << "\n";
}

void WriteRecord(const Record& record, std::ostream& out) {
  WriteRecord(record.raw_data, out);
}

auto FormatRecord(const FieldMap& fields) -> std::string {
  std::ostringstream out;
  WriteRecord(fields, out);
  return out.str();
}

auto FormatRecords(const std::vector<Record>& records) -> std::string {
  std::ostringstream out;
  for (const auto& record : records) {
    WriteRecord(record, out);
  }
  return out.str();
}

}  // namespace pxu::record
