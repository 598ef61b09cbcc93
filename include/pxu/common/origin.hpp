#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <source_location>
#include <stdexcept>
#include <string>
#include <variant>

namespace pxu {

// Placeholder for text that did not come from any named source (in-memory
// strings, anonymous streams). Renders as "???".
struct UnknownTextSource {
  auto operator==(const UnknownTextSource&) const -> bool = default;
};

// Text loaded from a named file.
struct FileTextSource {
  std::string filename;

  auto operator==(const FileTextSource&) const -> bool = default;
};

// Text defined by a C++ caller (units built programmatically, mostly in
// tests). The filename is the caller's source file.
struct CallerTextSource {
  std::string filename;

  auto operator==(const CallerTextSource&) const -> bool = default;
};

using TextSource =
    std::variant<UnknownTextSource, FileTextSource, CallerTextSource>;

auto ToString(const TextSource& source) -> std::string;

// Returns the filename of file-like sources, nullopt for unknown sources.
auto SourceFilename(const TextSource& source) -> std::optional<std::string>;

// Thrown when two origins whose sources have no defined order are compared.
class IncomparableOriginError : public std::logic_error {
 public:
  using std::logic_error::logic_error;
};

// Where a piece of data came from: a text source and an inclusive line span.
// Both lines are absent for an origin describing a whole source.
class Origin {
 public:
  Origin() = default;
  explicit Origin(
      TextSource source, std::optional<uint32_t> line_start = std::nullopt,
      std::optional<uint32_t> line_end = std::nullopt);

  // Origin of the C++ code calling this function.
  static auto Caller(
      std::source_location location = std::source_location::current())
      -> Origin;

  [[nodiscard]] auto source() const -> const TextSource& {
    return source_;
  }
  [[nodiscard]] auto line_start() const -> std::optional<uint32_t> {
    return line_start_;
  }
  [[nodiscard]] auto line_end() const -> std::optional<uint32_t> {
    return line_end_;
  }

  // Same source, both lines moved down by offset. Line-less origins are
  // returned unchanged.
  [[nodiscard]] auto WithOffset(uint32_t offset) const -> Origin;

  // Same source, span collapsed to the first line.
  [[nodiscard]] auto JustLine() const -> Origin;

  // "file:10-12", "file:10" or "file"
  [[nodiscard]] auto ToString() const -> std::string;

  auto operator==(const Origin&) const -> bool = default;

  // Orders by (source, line_start, line_end). Throws IncomparableOriginError
  // when the sources cannot be ordered against each other.
  auto operator<=>(const Origin& other) const -> std::weak_ordering;

 private:
  TextSource source_;
  std::optional<uint32_t> line_start_;
  std::optional<uint32_t> line_end_;
};

}  // namespace pxu
