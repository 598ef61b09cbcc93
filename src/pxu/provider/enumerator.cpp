#include "pxu/provider/enumerator.hpp"

#include <algorithm>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "pxu/common/diagnostic/diagnostic.hpp"
#include "pxu/provider/lazy_text.hpp"
#include "pxu/provider/provider_dirs.hpp"

namespace pxu::provider {

namespace fs = std::filesystem;

namespace {

void SortAndDeduplicate(std::vector<ContentFile>& files) {
  std::ranges::stable_sort(files, {}, &ContentFile::path);
  auto duplicates = std::ranges::unique(files, {}, &ContentFile::path);
  files.erase(duplicates.begin(), duplicates.end());
}

auto StatError(const fs::path& path, const std::error_code& ec)
    -> Diagnostic {
  return Diagnostic::HostError(
      fmt::format("cannot stat '{}': {}", path.string(), ec.message()));
}

}  // namespace

FsContentEnumerator::FsContentEnumerator(std::vector<fs::path> dirs)
    : dirs_(std::move(dirs)) {
}

auto FsContentEnumerator::Enumerate() const -> EnumerationResult {
  EnumerationResult result;
  for (const auto& dir : dirs_) {
    std::error_code ec;
    fs::recursive_directory_iterator it(dir, ec);
    if (ec == std::errc::no_such_file_or_directory) {
      continue;
    }
    if (ec) {
      throw fs::filesystem_error("cannot list provider content", dir, ec);
    }
    while (it != fs::recursive_directory_iterator()) {
      std::error_code status_ec;
      if (it->is_regular_file(status_ec)) {
        fs::path path = it->path().lexically_normal();
        result.files.push_back(
            ContentFile{.path = path, .text = LazyText(path)});
      } else if (status_ec &&
                 status_ec != std::errc::no_such_file_or_directory) {
        result.problems.push_back(StatError(it->path(), status_ec));
      }
      it.increment(ec);
      if (ec) {
        throw fs::filesystem_error("cannot list provider content", dir, ec);
      }
    }
  }
  SortAndDeduplicate(result.files);
  return result;
}

void InMemoryContentEnumerator::AddFile(fs::path path, std::string text) {
  files_.push_back(
      ContentFile{
          .path = std::move(path),
          .text = LazyText::FromString(std::move(text)),
      });
}

void InMemoryContentEnumerator::AddProblem(Diagnostic problem) {
  problems_.push_back(std::move(problem));
}

auto InMemoryContentEnumerator::Enumerate() const -> EnumerationResult {
  EnumerationResult result{.files = files_, .problems = problems_};
  SortAndDeduplicate(result.files);
  return result;
}

auto ContentDirs(const ProviderDirs& dirs) -> std::vector<fs::path> {
  std::vector<fs::path> result;
  if (dirs.base) {
    result.push_back(*dirs.base);
    result.push_back(*dirs.SrcDir());
    result.push_back(*dirs.BuildBinDir());
    result.push_back(*dirs.BuildMoDir());
    return result;
  }
  for (const auto& dir :
       {dirs.units, dirs.jobs, dirs.data, dirs.bin, dirs.locale,
        dirs.whitelists}) {
    if (dir) {
      result.push_back(*dir);
    }
  }
  return result;
}

}  // namespace pxu::provider
