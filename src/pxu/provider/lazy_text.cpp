#include "pxu/provider/lazy_text.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include "pxu/common/diagnostic/diagnostic.hpp"
#include "pxu/common/internal_error.hpp"

namespace pxu::provider {

LazyText::LazyText(std::filesystem::path path) : path_(std::move(path)) {
}

auto LazyText::FromString(std::string text) -> LazyText {
  LazyText lazy;
  lazy.text_ = std::move(text);
  return lazy;
}

auto LazyText::Read() const -> Result<std::string_view> {
  if (text_) {
    return std::string_view(*text_);
  }
  if (!path_) {
    common::ThrowInternalError("LazyText::Read", "text without a source");
  }

  std::ifstream in(*path_, std::ios::binary);
  if (!in) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format("cannot open '{}'", path_->string())));
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format("cannot read '{}'", path_->string())));
  }
  text_ = std::move(buffer).str();
  return std::string_view(*text_);
}

}  // namespace pxu::provider
