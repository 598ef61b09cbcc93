#include <gtest/gtest.h>

#include <filesystem>
#include <optional>

#include "pxu/provider/classifier.hpp"
#include "pxu/provider/provider_dirs.hpp"
#include "pxu/unit/file_role.hpp"
#include "tests/unit/temp_dir_fixture.hpp"

namespace pxu::provider {
namespace {

namespace fs = std::filesystem;

using unit::FileRole;

class ClassifierTest : public test::TempDirFixture {
 protected:
  void SetUp() override {
    TempDirFixture::SetUp();
    root_ = TestDir();
    dirs_ = ProviderDirs{
        .base = root_,
        .units = root_ / "units",
        .jobs = root_ / "jobs",
        .whitelists = root_ / "whitelists",
        .data = root_ / "data",
        .bin = root_ / "bin",
        .locale = std::nullopt,
    };
  }

  auto Classify(const fs::path& relative_path) -> ClassificationResult {
    Classifier classifier(dirs_);
    auto result = classifier.Classify(root_ / relative_path);
    EXPECT_TRUE(result.has_value());
    return result.value_or(ClassificationResult{
        .role = FileRole::kUnknown, .base_dir = {}, .loader = std::nullopt});
  }

  fs::path root_;
  ProviderDirs dirs_;
};

// =============================================================================
// Unit sources and selection lists
// =============================================================================

TEST_F(ClassifierTest, UnitSourcesInUnitsDir) {
  for (const char* name :
       {"units/a.pxu", "units/sub/b.txt", "units/c.txt.in"}) {
    auto result = Classify(name);
    EXPECT_EQ(result.role, FileRole::kUnitSource) << name;
    EXPECT_EQ(result.base_dir, root_ / "units") << name;
    EXPECT_EQ(result.loader, LoaderKind::kUnitSource) << name;
  }
}

TEST_F(ClassifierTest, UnitSourcesInJobsDir) {
  auto result = Classify("jobs/disk.txt");
  EXPECT_EQ(result.role, FileRole::kUnitSource);
  EXPECT_EQ(result.base_dir, root_ / "jobs");
}

TEST_F(ClassifierTest, OtherFilesInUnitsDirAreUnknown) {
  auto result = Classify("units/notes.md");
  EXPECT_EQ(result.role, FileRole::kUnknown);
  EXPECT_EQ(result.base_dir, root_);
  EXPECT_FALSE(result.loader.has_value());
}

TEST_F(ClassifierTest, ContainmentIsComponentWise) {
  EXPECT_EQ(Classify("unitsx/a.pxu").role, FileRole::kUnknown);
  EXPECT_EQ(
      Classify("units/../whitelists/a.whitelist").role,
      FileRole::kLegacyWhitelist);
}

TEST_F(ClassifierTest, Whitelists) {
  auto result = Classify("whitelists/smoke.whitelist");
  EXPECT_EQ(result.role, FileRole::kLegacyWhitelist);
  EXPECT_EQ(result.base_dir, root_ / "whitelists");
  EXPECT_EQ(result.loader, LoaderKind::kSelectionList);
}

// =============================================================================
// Data and executables
// =============================================================================

TEST_F(ClassifierTest, AnythingInDataDirIsData) {
  auto result = Classify("data/sub/COPYING");
  EXPECT_EQ(result.role, FileRole::kData);
  EXPECT_EQ(result.base_dir, root_ / "data");
  EXPECT_EQ(result.loader, LoaderKind::kProviderContent);
}

TEST_F(ClassifierTest, ExecutablesInBinDir) {
  WriteExecutable("bin/script", "#!/bin/sh\necho hi\n");
  WriteExecutable("bin/tool", "\x7f" "ELF");
  WriteFile("bin/plain", "#!/bin/sh\n");

  auto script = Classify("bin/script");
  EXPECT_EQ(script.role, FileRole::kScript);
  EXPECT_EQ(script.base_dir, root_ / "bin");
  EXPECT_EQ(script.loader, LoaderKind::kProviderContent);
  EXPECT_EQ(Classify("bin/tool").role, FileRole::kBinary);
  EXPECT_EQ(Classify("bin/plain").role, FileRole::kUnknown);
}

TEST_F(ClassifierTest, BuiltExecutablesMustBeListed) {
  WriteFile("src/EXECUTABLES", "listed\n");
  WriteExecutable("build/bin/listed", "#!/bin/sh\n");
  WriteExecutable("build/bin/other", "#!/bin/sh\n");

  auto listed = Classify("build/bin/listed");
  EXPECT_EQ(listed.role, FileRole::kScript);
  EXPECT_EQ(listed.base_dir, root_ / "build" / "bin");

  auto other = Classify("build/bin/other");
  EXPECT_EQ(other.role, FileRole::kBuild);
  EXPECT_EQ(other.base_dir, root_ / "build");
  EXPECT_FALSE(other.loader.has_value());
}

TEST_F(ClassifierTest, TranslationCatalogs) {
  auto result = Classify("build/mo/de/LC_MESSAGES/smoke.mo");
  EXPECT_EQ(result.role, FileRole::kI18n);
  EXPECT_EQ(result.base_dir, root_ / "build" / "mo");
  EXPECT_EQ(result.loader, LoaderKind::kProviderContent);
  EXPECT_EQ(Classify("build/mo/stamp").role, FileRole::kBuild);
}

// =============================================================================
// Source tree layout
// =============================================================================

TEST_F(ClassifierTest, TranslationSources) {
  EXPECT_EQ(Classify("po/de.po").role, FileRole::kSrc);
  EXPECT_EQ(Classify("po/smoke.pot").role, FileRole::kSrc);
  EXPECT_EQ(Classify("po/POTFILES.in").role, FileRole::kSrc);
  EXPECT_EQ(Classify("po/Makefile").role, FileRole::kUnknown);
  EXPECT_EQ(Classify("po/old/de.po").role, FileRole::kUnknown);
}

TEST_F(ClassifierTest, SourcesOfExecutables) {
  auto result = Classify("src/main.c");
  EXPECT_EQ(result.role, FileRole::kSrc);
  EXPECT_EQ(result.base_dir, root_);
  EXPECT_FALSE(result.loader.has_value());
}

TEST_F(ClassifierTest, LegalAndDocs) {
  auto legal = Classify("COPYING");
  EXPECT_EQ(legal.role, FileRole::kLegal);
  EXPECT_EQ(legal.loader, LoaderKind::kProviderContent);
  EXPECT_EQ(Classify("LICENSE").role, FileRole::kLegal);
  EXPECT_EQ(Classify("README.rst").role, FileRole::kDocs);
  EXPECT_EQ(Classify("readme.md").role, FileRole::kUnknown);
}

TEST_F(ClassifierTest, ManagePyOnlyAtBase) {
  EXPECT_EQ(Classify("manage.py").role, FileRole::kManagePy);
  EXPECT_FALSE(Classify("manage.py").loader.has_value());
  EXPECT_EQ(Classify("tools/manage.py").role, FileRole::kUnknown);
}

TEST_F(ClassifierTest, VersionControl) {
  EXPECT_EQ(Classify(".gitignore").role, FileRole::kVcs);
  EXPECT_EQ(Classify(".git/config").role, FileRole::kVcs);
  EXPECT_EQ(Classify(".bzr/branch/format").role, FileRole::kVcs);
  EXPECT_EQ(Classify("units/.bzrignore").role, FileRole::kVcs);
}

TEST_F(ClassifierTest, UnitSourcesWinOverLegalNames) {
  dirs_.units = root_;
  EXPECT_EQ(Classify("COPYING.txt").role, FileRole::kUnitSource);
}

// =============================================================================
// Providers without a base directory
// =============================================================================

TEST_F(ClassifierTest, WithoutBaseEverythingElseIsUnknown) {
  dirs_ = ProviderDirs{.units = root_ / "units"};
  auto result = Classify("COPYING");
  EXPECT_EQ(result.role, FileRole::kUnknown);
  EXPECT_TRUE(result.base_dir.empty());
  EXPECT_EQ(Classify("units/a.pxu").role, FileRole::kUnitSource);
  EXPECT_EQ(Classify("src/main.c").role, FileRole::kUnknown);
}

TEST_F(ClassifierTest, ExecutablesHintIsReadOnce) {
  WriteFile("src/EXECUTABLES", "one\n\n two \n");
  Classifier classifier(dirs_);
  EXPECT_EQ(classifier.Executables().size(), 2U);
  WriteFile("src/EXECUTABLES", "one\n");
  EXPECT_EQ(classifier.Executables().size(), 2U);
}

TEST_F(ClassifierTest, IsInsideDirectory) {
  EXPECT_TRUE(IsInsideDirectory("/p/units/a.pxu", "/p/units"));
  EXPECT_TRUE(IsInsideDirectory("/p/units/a.pxu", "/p/units/"));
  EXPECT_TRUE(IsInsideDirectory("/p/units/x/../a.pxu", "/p/units"));
  EXPECT_FALSE(IsInsideDirectory("/p/unitsx/a.pxu", "/p/units"));
  EXPECT_FALSE(IsInsideDirectory("/p/units", "/p/units"));
  EXPECT_FALSE(IsInsideDirectory("/p/units/../a.pxu", "/p/units"));
}

}  // namespace
}  // namespace pxu::provider
