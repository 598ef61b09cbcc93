#include "pxu/provider/provider_dirs.hpp"

#include <filesystem>
#include <optional>

namespace pxu::provider {

namespace fs = std::filesystem;

namespace {

auto UnderBase(const std::optional<fs::path>& base, const fs::path& relative)
    -> std::optional<fs::path> {
  if (!base) {
    return std::nullopt;
  }
  return *base / relative;
}

}  // namespace

auto ProviderDirs::BuildDir() const -> std::optional<fs::path> {
  return UnderBase(base, "build");
}

auto ProviderDirs::BuildBinDir() const -> std::optional<fs::path> {
  return UnderBase(base, fs::path("build") / "bin");
}

auto ProviderDirs::BuildMoDir() const -> std::optional<fs::path> {
  return UnderBase(base, fs::path("build") / "mo");
}

auto ProviderDirs::SrcDir() const -> std::optional<fs::path> {
  return UnderBase(base, "src");
}

auto ProviderDirs::PoDir() const -> std::optional<fs::path> {
  return UnderBase(base, "po");
}

}  // namespace pxu::provider
