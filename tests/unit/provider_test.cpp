#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <fmt/format.h>

#include "pxu/common/diagnostic/diagnostic.hpp"
#include "pxu/provider/content_loader.hpp"
#include "pxu/provider/enumerator.hpp"
#include "pxu/provider/provider.hpp"
#include "pxu/provider/provider_dirs.hpp"
#include "pxu/unit/file_role.hpp"
#include "pxu/unit/unit.hpp"
#include "tests/unit/temp_dir_fixture.hpp"

namespace pxu::provider {
namespace {

namespace fs = std::filesystem;

constexpr const char* kProviderName = "2013.com.example:smoke";

class ProviderTest : public test::TempDirFixture {
 protected:
  void SetUp() override {
    TempDirFixture::SetUp();
    WriteFile(
        "units/disk.pxu",
        "id: disk/write\n"
        "plugin: manual\n"
        "\n"
        "id: disk/read\n"
        "plugin: shell\n"
        "command: true\n"
        "\n"
        "unit: test plan\n"
        "id: plan\n"
        "name: Disk\n"
        "include: disk/.*\n"
        "\n"
        "unit: category\n"
        "id: disk\n"
        "name: Disks\n");
    WriteFile("whitelists/old.whitelist", "disk/read\n");
    WriteExecutable("bin/tool", "#!/bin/sh\n");
    WriteExecutable("build/bin/helper", "\x7f" "ELF");
    WriteFile("src/EXECUTABLES", "helper\n");
    WriteFile("COPYING", "license\n");
    WriteFile("manage.py", "#!/usr/bin/env python3\n");
  }

  auto Dirs() -> ProviderDirs {
    return ProviderDirs{
        .base = TestDir(),
        .units = TestDir() / "units",
        .whitelists = TestDir() / "whitelists",
        .bin = TestDir() / "bin",
    };
  }

  auto MakeProvider(LoadOptions options = {}) -> std::unique_ptr<Provider> {
    return std::make_unique<Provider>(
        ProviderInfo{.name = kProviderName, .version = "1.0"}, Dirs(),
        options);
  }

  static auto Ids(const std::vector<unit::UnitPtr>& units)
      -> std::vector<std::string> {
    std::vector<std::string> ids;
    for (const auto& unit : units) {
      ids.push_back(unit->Id().value_or(""));
    }
    return ids;
  }
};

// =============================================================================
// Identity
// =============================================================================

TEST_F(ProviderTest, NamespaceIsNameBeforeColon) {
  auto provider = MakeProvider();
  EXPECT_EQ(provider->Namespace(), "2013.com.example");
  EXPECT_EQ(provider->name(), kProviderName);
  EXPECT_EQ(provider->version(), "1.0");
  EXPECT_FALSE(provider->secure());

  Provider plain(ProviderInfo{.name = "plain"}, ProviderDirs{});
  EXPECT_EQ(plain.Namespace(), "plain");
}

TEST_F(ProviderTest, ClassifyUsesProviderDirs) {
  auto provider = MakeProvider();
  auto result = provider->Classify(TestDir() / "units" / "disk.pxu");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->role, unit::FileRole::kUnitSource);
  EXPECT_EQ(result->loader, LoaderKind::kUnitSource);
}

// =============================================================================
// Content
// =============================================================================

TEST_F(ProviderTest, LoadsLazilyOnFirstAccess) {
  auto provider = MakeProvider();
  EXPECT_FALSE(provider->is_loaded());
  EXPECT_FALSE(provider->unit_list().empty());
  EXPECT_TRUE(provider->is_loaded());
}

TEST_F(ProviderTest, LoadAllJobsSortedById) {
  auto provider = MakeProvider();
  auto [jobs, problems] = provider->LoadAllJobs();
  EXPECT_TRUE(problems.empty());
  EXPECT_EQ(
      Ids(jobs), (std::vector<std::string>{
                     "2013.com.example::disk/read",
                     "2013.com.example::disk/write",
                 }));
  for (const auto& job : jobs) {
    EXPECT_EQ(job->provider(), provider.get());
  }
}

TEST_F(ProviderTest, FileUnitsDescribeEveryLoadedFile) {
  auto provider = MakeProvider();
  const auto& path_map = provider->path_map();

  auto role_of = [&](const fs::path& relative) -> std::string {
    auto it = path_map.find((TestDir() / relative).string());
    if (it == path_map.end()) {
      return "";
    }
    return it->second.front()->GetRecordValue("role").value_or("");
  };
  EXPECT_EQ(role_of("units/disk.pxu"), "unit-source");
  EXPECT_EQ(role_of("whitelists/old.whitelist"), "legacy-whitelist");
  EXPECT_EQ(role_of("bin/tool"), "script");
  EXPECT_EQ(role_of("build/bin/helper"), "binary");
  EXPECT_EQ(role_of("COPYING"), "legal");
  EXPECT_EQ(role_of("manage.py"), "");
  EXPECT_EQ(role_of("src/EXECUTABLES"), "");
}

TEST_F(ProviderTest, WhitelistBecomesVirtualTestPlan) {
  auto provider = MakeProvider();
  const auto& id_map = provider->id_map();
  auto it = id_map.find("2013.com.example::old");
  ASSERT_NE(it, id_map.end());
  ASSERT_EQ(it->second.size(), 1U);
  EXPECT_EQ(it->second.front()->Kind(), unit::UnitKind::kTestPlan);
  EXPECT_TRUE(it->second.front()->is_virtual());
  EXPECT_TRUE(id_map.contains("2013.com.example::plan"));
  EXPECT_TRUE(id_map.contains("2013.com.example::disk"));
}

TEST_F(ProviderTest, SelectionListsSortedByName) {
  auto provider = MakeProvider();
  auto lists = provider->GetSelectionLists();
  ASSERT_EQ(lists.size(), 2U);
  EXPECT_EQ(lists[0].name(), "old");
  EXPECT_EQ(lists[1].name(), "plan");
  EXPECT_TRUE(lists[0].Matches("2013.com.example::disk/read"));
  EXPECT_FALSE(lists[0].Matches("2013.com.example::disk/write"));
}

TEST_F(ProviderTest, ReloadIsIdempotent) {
  auto provider = MakeProvider();
  auto first = provider->unit_list().size();
  provider->Load();
  provider->Load();
  EXPECT_EQ(provider->unit_list().size(), first);
  EXPECT_EQ(provider->id_map().at("2013.com.example::disk/read").size(), 1U);
}

TEST_F(ProviderTest, ProblemsDoNotHideOtherContent) {
  WriteFile("units/broken.pxu", "id: broken\nno colon here\n");
  auto provider = MakeProvider();
  auto [jobs, problems] = provider->LoadAllJobs();
  EXPECT_EQ(jobs.size(), 2U);
  ASSERT_EQ(problems.size(), 1U);
  EXPECT_EQ(problems.front().primary.failure, LoadFailure::kSyntax);
}

TEST_F(ProviderTest, UnlistableDirectoryFailsLoad) {
  auto not_a_dir = WriteFile("plain", "not a directory\n");
  Provider provider(
      ProviderInfo{.name = kProviderName, .version = "1.0"},
      ProviderDirs{.units = not_a_dir});
  EXPECT_THROW(provider.Load(), fs::filesystem_error);
}

TEST_F(ProviderTest, BuiltinJobsThrowOnProblems) {
  auto provider = MakeProvider();
  EXPECT_EQ(provider->GetBuiltinJobs().size(), 2U);

  WriteFile("units/broken.pxu", "id: broken\nno colon here\n");
  provider->Load();
  EXPECT_THROW(
      { [[maybe_unused]] auto jobs = provider->GetBuiltinJobs(); },
      DiagnosticException);
}

TEST_F(ProviderTest, LoadOptionsAreKept) {
  WriteFile("units/odd.pxu", "id: odd\nplugin: teleport\n");
  auto provider = MakeProvider();
  EXPECT_EQ(provider->problem_list().size(), 1U);

  provider->Load(LoadOptions{.validate = false});
  EXPECT_TRUE(provider->problem_list().empty());
  provider->Load();
  EXPECT_TRUE(provider->problem_list().empty());
}

TEST_F(ProviderTest, InjectedEnumerator) {
  auto enumerator = std::make_unique<InMemoryContentEnumerator>();
  enumerator->AddFile("/p/units/a.pxu", "id: a\nplugin: manual\n");
  Provider provider(
      ProviderInfo{.name = kProviderName, .version = "1.0"},
      ProviderDirs{.units = "/p/units"}, LoadOptions{}, std::move(enumerator));

  auto [jobs, problems] = provider.LoadAllJobs();
  EXPECT_TRUE(problems.empty());
  EXPECT_EQ(Ids(jobs), std::vector<std::string>{"2013.com.example::a"});
}

// =============================================================================
// Executables
// =============================================================================

TEST_F(ProviderTest, AllExecutables) {
  auto provider = MakeProvider();
  EXPECT_EQ(
      provider->GetAllExecutables(), (std::vector<fs::path>{
                                         TestDir() / "bin" / "tool",
                                         TestDir() / "build" / "bin" / "helper",
                                     }));
}

TEST_F(ProviderTest, BuildExecutablesWithoutHint) {
  fs::remove(TestDir() / "src" / "EXECUTABLES");
  WriteFile("build/bin/notes", "not executable");
  auto provider = MakeProvider();
  auto executables = provider->GetAllExecutables();
  ASSERT_EQ(executables.size(), 2U);
  EXPECT_EQ(executables[1], TestDir() / "build" / "bin" / "helper");
}

TEST_F(ProviderTest, MissingDirectoriesHaveNoExecutables) {
  Provider provider(
      ProviderInfo{.name = kProviderName, .version = "1.0"},
      ProviderDirs{.bin = TestDir() / "nowhere"});
  EXPECT_TRUE(provider.GetAllExecutables().empty());
}

// =============================================================================
// Definitions
// =============================================================================

TEST_F(ProviderTest, FromDefinitionFile) {
  auto path = WriteFile(
      "smoke.provider.toml",
      fmt::format(
          "[provider]\n"
          "name = \"{}\"\n"
          "version = \"1.0\"\n"
          "location = \"{}\"\n",
          kProviderName, TestDir().string()));

  auto secure = Provider::FromDefinitionFile(path, {TestDir()});
  ASSERT_TRUE(secure.has_value()) << FormatDiagnostic(secure.error());
  EXPECT_TRUE((*secure)->secure());
  EXPECT_EQ((*secure)->dirs().base, TestDir());
  EXPECT_EQ((*secure)->dirs().units, TestDir() / "units");
  EXPECT_FALSE((*secure)->dirs().data.has_value());
  EXPECT_EQ((*secure)->LoadAllJobs().units.size(), 2U);

  auto insecure = Provider::FromDefinitionFile(path, {TestDir() / "other"});
  ASSERT_TRUE(insecure.has_value());
  EXPECT_FALSE((*insecure)->secure());
}

TEST_F(ProviderTest, FromInvalidDefinitionFile) {
  auto path = WriteFile(
      "bad.provider.toml", "[provider]\nname = \"bad\"\nversion = \"1.0\"\n");
  auto result = Provider::FromDefinitionFile(path, {});
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(
      result.error().primary.message,
      "Problem in provider definition, field 'name': must look like RFC3720 "
      "IQN");
}

}  // namespace
}  // namespace pxu::provider
