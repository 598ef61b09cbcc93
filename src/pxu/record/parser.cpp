#include "pxu/record/parser.hpp"

#include <algorithm>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "pxu/common/diagnostic/diagnostic.hpp"
#include "pxu/common/string_utils.hpp"

namespace pxu::record {

namespace {

// Accumulates the fields of the record being parsed.
class RecordBuilder {
 public:
  explicit RecordBuilder(const TextSource& source) : source_(source) {
  }

  [[nodiscard]] auto HasOpenField() const -> bool {
    return key_.has_value();
  }

  // Start a new field. Fails if the key is already part of this record.
  auto StartField(std::string raw_key, std::string value, uint32_t line_no)
      -> Result<void> {
    CommitField();
    std::string key(NormalizeKey(raw_key));
    if (auto it = data_.find(key); it != data_.end()) {
      return std::unexpected(
          Diagnostic::SyntaxError(
              Origin(source_, line_no, line_no),
              fmt::format(
                  "Job has a duplicate key '{}' with old value '{}' and new "
                  "value '{}'",
                  raw_key, it->second, value)));
    }
    if (!start_line_) {
      start_line_ = line_no;
    }
    field_offset_map_[key] = line_no - *start_line_;
    end_line_ = line_no;
    raw_key_ = std::move(raw_key);
    key_ = std::move(key);
    first_value_ = std::move(value);
    continuation_.clear();
    return {};
  }

  void ContinueField(std::string line, uint32_t line_no) {
    continuation_.push_back(std::move(line));
    end_line_ = line_no;
  }

  // Finish the current record, if any, and append it to `out`.
  void CommitRecord(std::vector<Record>& out) {
    CommitField();
    if (!start_line_) {
      return;
    }
    out.push_back(
        Record{
            .data = std::move(data_),
            .raw_data = std::move(raw_data_),
            .field_offset_map = std::move(field_offset_map_),
            .origin = Origin(source_, *start_line_, end_line_),
        });
    data_.clear();
    raw_data_.clear();
    field_offset_map_.clear();
    start_line_.reset();
    end_line_ = 0;
  }

 private:
  void CommitField() {
    if (!key_) {
      return;
    }
    std::vector<std::string> parts;
    if (!first_value_.empty()) {
      parts.push_back(std::move(first_value_));
    }
    parts.insert(parts.end(), continuation_.begin(), continuation_.end());
    std::string value = common::Join(parts, "\n");
    data_[*key_] = value;
    raw_data_[raw_key_] = std::move(value);
    key_.reset();
    raw_key_.clear();
    first_value_.clear();
    continuation_.clear();
  }

  const TextSource& source_;
  FieldMap data_;
  FieldMap raw_data_;
  FieldOffsetMap field_offset_map_;
  std::optional<uint32_t> start_line_;
  uint32_t end_line_ = 0;

  std::optional<std::string> key_;
  std::string raw_key_;
  std::string first_value_;
  std::vector<std::string> continuation_;
};

// Undo the period escaping of continuation lines: "." is an empty line and
// a run of N periods stands for N-1 periods.
auto UnescapeContinuation(std::string_view content) -> std::string {
  std::string_view stripped = common::Trim(content);
  if (!stripped.empty() &&
      std::ranges::all_of(stripped, [](char c) { return c == '.'; })) {
    return std::string(stripped.substr(1));
  }
  return std::string(content);
}

// Split "key: value" into its trimmed parts. Keys cannot be empty, cannot
// contain whitespace and the line cannot start with whitespace.
auto SplitKeyValue(std::string_view line)
    -> std::optional<std::pair<std::string, std::string>> {
  if (line.empty() || common::IsBlank(line.front())) {
    return std::nullopt;
  }
  size_t colon = line.find(':');
  if (colon == std::string_view::npos) {
    return std::nullopt;
  }
  std::string_view key = common::Trim(line.substr(0, colon));
  if (key.empty() || std::ranges::any_of(key, common::IsBlank)) {
    return std::nullopt;
  }
  std::string_view value = common::Trim(line.substr(colon + 1));
  return std::make_pair(std::string(key), std::string(value));
}

}  // namespace

auto ParseRecords(std::string_view text, const TextSource& source)
    -> Result<std::vector<Record>> {
  std::vector<Record> records;
  RecordBuilder builder(source);

  auto lines = common::SplitLines(text);
  for (size_t index = 0; index < lines.size(); ++index) {
    auto line_no = static_cast<uint32_t>(index + 1);
    std::string_view line = lines[index];

    if (common::IsBlankLine(line)) {
      builder.CommitRecord(records);
      continue;
    }

    if (line.front() == ' ') {
      if (!builder.HasOpenField()) {
        return std::unexpected(
            Diagnostic::SyntaxError(
                Origin(source, line_no, line_no),
                std::string(kUnexpectedMultiLineValue)));
      }
      builder.ContinueField(UnescapeContinuation(line.substr(1)), line_no);
      continue;
    }

    auto key_value = SplitKeyValue(line);
    if (!key_value) {
      return std::unexpected(
          Diagnostic::SyntaxError(
              Origin(source, line_no, line_no),
              std::string(kUnexpectedNonEmptyLine)));
    }
    auto started = builder.StartField(
        std::move(key_value->first), std::move(key_value->second), line_no);
    if (!started) {
      return std::unexpected(std::move(started.error()));
    }
  }
  builder.CommitRecord(records);
  return records;
}

auto ParseRecordsFromFile(const std::filesystem::path& path)
    -> Result<std::vector<Record>> {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format("cannot open '{}'", path.string())));
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return ParseRecords(buffer.str(), FileTextSource{.filename = path.string()});
}

}  // namespace pxu::record
