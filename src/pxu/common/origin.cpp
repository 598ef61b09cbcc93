#include "pxu/common/origin.hpp"

#include <compare>
#include <optional>
#include <string>
#include <utility>
#include <variant>

#include <fmt/core.h>

#include "pxu/common/overloaded.hpp"

namespace pxu {

namespace {

// Ordering between two sources, nullopt when they are not comparable.
// Unknown sources are all equivalent to each other; file and caller sources
// are ordered by filename.
auto CompareSources(const TextSource& lhs, const TextSource& rhs)
    -> std::optional<std::weak_ordering> {
  auto lhs_name = SourceFilename(lhs);
  auto rhs_name = SourceFilename(rhs);
  if (!lhs_name && !rhs_name) {
    return std::weak_ordering::equivalent;
  }
  if (!lhs_name || !rhs_name) {
    return std::nullopt;
  }
  return *lhs_name <=> *rhs_name;
}

}  // namespace

auto ToString(const TextSource& source) -> std::string {
  return std::visit(
      common::Overloaded{
          [](const UnknownTextSource&) -> std::string { return "???"; },
          [](const FileTextSource& file) -> std::string {
            return file.filename;
          },
          [](const CallerTextSource& caller) -> std::string {
            return caller.filename;
          },
      },
      source);
}

auto SourceFilename(const TextSource& source) -> std::optional<std::string> {
  return std::visit(
      common::Overloaded{
          [](const UnknownTextSource&) -> std::optional<std::string> {
            return std::nullopt;
          },
          [](const FileTextSource& file) -> std::optional<std::string> {
            return file.filename;
          },
          [](const CallerTextSource& caller) -> std::optional<std::string> {
            return caller.filename;
          },
      },
      source);
}

Origin::Origin(
    TextSource source, std::optional<uint32_t> line_start,
    std::optional<uint32_t> line_end)
    : source_(std::move(source)), line_start_(line_start), line_end_(line_end) {
}

auto Origin::Caller(std::source_location location) -> Origin {
  return Origin(
      CallerTextSource{.filename = location.file_name()}, location.line(),
      location.line());
}

auto Origin::WithOffset(uint32_t offset) const -> Origin {
  if (!line_start_ || !line_end_) {
    return *this;
  }
  return Origin(source_, *line_start_ + offset, *line_end_ + offset);
}

auto Origin::JustLine() const -> Origin {
  return Origin(source_, line_start_, line_start_);
}

auto Origin::ToString() const -> std::string {
  std::string source = pxu::ToString(source_);
  if (!line_start_) {
    return source;
  }
  if (!line_end_ || *line_end_ == *line_start_) {
    return fmt::format("{}:{}", source, *line_start_);
  }
  return fmt::format("{}:{}-{}", source, *line_start_, *line_end_);
}

auto Origin::operator<=>(const Origin& other) const -> std::weak_ordering {
  auto by_source = CompareSources(source_, other.source_);
  if (!by_source) {
    throw IncomparableOriginError(
        fmt::format(
            "cannot order origins {} and {}", ToString(), other.ToString()));
  }
  if (*by_source != 0) {
    return *by_source;
  }
  if (auto cmp = line_start_ <=> other.line_start_; cmp != 0) {
    return cmp;
  }
  return line_end_ <=> other.line_end_;
}

}  // namespace pxu
