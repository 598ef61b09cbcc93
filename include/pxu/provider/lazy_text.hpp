#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "pxu/common/diagnostic/diagnostic.hpp"

namespace pxu::provider {

// Text of one provider file, read on first access and cached afterwards.
// Read failures are not cached.
class LazyText {
 public:
  explicit LazyText(std::filesystem::path path);

  // Text that is already in memory.
  static auto FromString(std::string text) -> LazyText;

  [[nodiscard]] auto Read() const -> Result<std::string_view>;

  [[nodiscard]] auto IsLoaded() const -> bool {
    return text_.has_value();
  }
  [[nodiscard]] auto path() const
      -> const std::optional<std::filesystem::path>& {
    return path_;
  }

 private:
  LazyText() = default;

  std::optional<std::filesystem::path> path_;
  mutable std::optional<std::string> text_;
};

}  // namespace pxu::provider
