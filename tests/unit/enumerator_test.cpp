#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

#include "pxu/provider/enumerator.hpp"
#include "pxu/provider/provider_dirs.hpp"
#include "tests/unit/temp_dir_fixture.hpp"

namespace pxu::provider {
namespace {

namespace fs = std::filesystem;

class EnumeratorTest : public test::TempDirFixture {
 protected:
  static auto Paths(const EnumerationResult& result)
      -> std::vector<std::string> {
    std::vector<std::string> paths;
    for (const auto& file : result.files) {
      paths.push_back(file.path.string());
    }
    return paths;
  }

  static auto Strings(const std::vector<fs::path>& dirs)
      -> std::vector<std::string> {
    std::vector<std::string> result;
    for (const auto& dir : dirs) {
      result.push_back(dir.string());
    }
    return result;
  }
};

// ============================================================================
// Filesystem
// ============================================================================

TEST_F(EnumeratorTest, ListsRegularFilesRecursively) {
  auto b = WriteFile("units/sub/b.pxu", "id: b\n");
  auto a = WriteFile("units/a.pxu", "id: a\n");
  MakeDir("units/empty");

  FsContentEnumerator enumerator({TestDir() / "units"});
  auto result = enumerator.Enumerate();

  EXPECT_EQ(Paths(result), (std::vector<std::string>{a.string(), b.string()}));
  EXPECT_TRUE(result.problems.empty());
  EXPECT_FALSE(result.files.front().text.IsLoaded());
}

TEST_F(EnumeratorTest, OverlappingDirectoriesListFilesOnce) {
  auto a = WriteFile("units/a.pxu", "id: a\n");

  FsContentEnumerator enumerator({TestDir(), TestDir() / "units"});
  auto result = enumerator.Enumerate();

  EXPECT_EQ(Paths(result), (std::vector<std::string>{a.string()}));
}

TEST_F(EnumeratorTest, MissingDirectoryIsSkipped) {
  auto a = WriteFile("units/a.pxu", "id: a\n");

  FsContentEnumerator enumerator(
      {TestDir() / "no-such-dir", TestDir() / "units"});
  auto result = enumerator.Enumerate();

  EXPECT_EQ(Paths(result), (std::vector<std::string>{a.string()}));
  EXPECT_TRUE(result.problems.empty());
}

TEST_F(EnumeratorTest, UnlistableDirectoryThrows) {
  auto not_a_dir = WriteFile("units", "plain file\n");

  FsContentEnumerator enumerator({not_a_dir});
  EXPECT_THROW(
      { [[maybe_unused]] auto result = enumerator.Enumerate(); },
      fs::filesystem_error);
}

TEST_F(EnumeratorTest, ListedFilesReadTheirText) {
  WriteFile("units/a.pxu", "id: a\n");

  FsContentEnumerator enumerator({TestDir() / "units"});
  auto result = enumerator.Enumerate();

  ASSERT_EQ(result.files.size(), 1U);
  auto text = result.files.front().text.Read();
  ASSERT_TRUE(text.has_value());
  EXPECT_EQ(*text, "id: a\n");
}

// ============================================================================
// In memory
// ============================================================================

TEST_F(EnumeratorTest, InMemoryFilesAreSortedAndUnique) {
  InMemoryContentEnumerator enumerator;
  enumerator.AddFile("/p/units/b.pxu", "id: b\n");
  enumerator.AddFile("/p/units/a.pxu", "id: a\n");
  enumerator.AddFile("/p/units/b.pxu", "id: other\n");

  auto result = enumerator.Enumerate();

  EXPECT_EQ(
      Paths(result),
      (std::vector<std::string>{"/p/units/a.pxu", "/p/units/b.pxu"}));
  auto text = result.files.back().text.Read();
  ASSERT_TRUE(text.has_value());
  EXPECT_EQ(*text, "id: b\n");
}

// ============================================================================
// Content directories
// ============================================================================

TEST_F(EnumeratorTest, BaseDirectoryIncludesBuildOutput) {
  auto dirs = ContentDirs(ProviderDirs{.base = "/p"});
  EXPECT_EQ(
      Strings(dirs), (std::vector<std::string>{
                         "/p", "/p/src", "/p/build/bin", "/p/build/mo"}));
}

TEST_F(EnumeratorTest, WithoutBaseOnlyDeclaredDirectories) {
  auto dirs = ContentDirs(
      ProviderDirs{.units = "/p/units", .whitelists = "/p/whitelists"});
  EXPECT_EQ(
      Strings(dirs), (std::vector<std::string>{"/p/units", "/p/whitelists"}));
}

}  // namespace
}  // namespace pxu::provider
