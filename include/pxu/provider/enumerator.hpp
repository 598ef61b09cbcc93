#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "pxu/common/diagnostic/diagnostic.hpp"
#include "pxu/provider/lazy_text.hpp"
#include "pxu/provider/provider_dirs.hpp"

namespace pxu::provider {

struct ContentFile {
  std::filesystem::path path;
  LazyText text;
};

struct EnumerationResult {
  // Sorted by path, without duplicates.
  std::vector<ContentFile> files;
  // Entries that were listed but could not be examined.
  std::vector<Diagnostic> problems;
};

// Source of the files that make up a provider.
class ContentEnumerator {
 public:
  virtual ~ContentEnumerator() = default;
  [[nodiscard]] virtual auto Enumerate() const -> EnumerationResult = 0;
};

// Walks directories recursively. Missing directories are skipped; any other
// failure to list a directory throws std::filesystem::filesystem_error.
class FsContentEnumerator final : public ContentEnumerator {
 public:
  explicit FsContentEnumerator(std::vector<std::filesystem::path> dirs);

  [[nodiscard]] auto Enumerate() const -> EnumerationResult override;

  [[nodiscard]] auto dirs() const
      -> const std::vector<std::filesystem::path>& {
    return dirs_;
  }

 private:
  std::vector<std::filesystem::path> dirs_;
};

// Serves files from memory. Lets callers load content that is not on disk.
class InMemoryContentEnumerator final : public ContentEnumerator {
 public:
  void AddFile(std::filesystem::path path, std::string text);
  void AddProblem(Diagnostic problem);

  [[nodiscard]] auto Enumerate() const -> EnumerationResult override;

 private:
  std::vector<ContentFile> files_;
  std::vector<Diagnostic> problems_;
};

// Directories to walk for a provider. Providers with a base directory are
// walked from the base (plus the build output); others through each
// declared directory.
auto ContentDirs(const ProviderDirs& dirs)
    -> std::vector<std::filesystem::path>;

}  // namespace pxu::provider
