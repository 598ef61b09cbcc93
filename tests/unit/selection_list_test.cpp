#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "pxu/common/diagnostic/diagnostic.hpp"
#include "pxu/common/origin.hpp"
#include "pxu/unit/selection_list.hpp"
#include "tests/unit/temp_dir_fixture.hpp"

namespace pxu::unit {
namespace {

class SelectionListTest : public test::TempDirFixture {
 protected:
  static auto Parse(
      std::string_view text,
      std::optional<std::string> implicit_namespace = std::nullopt)
      -> SelectionList {
    auto list = SelectionList::FromString(
        text, "smoke", Origin(FileTextSource{.filename = "smoke.whitelist"}),
        std::move(implicit_namespace));
    EXPECT_TRUE(list.has_value());
    if (!list) {
      ADD_FAILURE() << FormatDiagnostic(list.error());
      return *SelectionList::FromString("", "empty", Origin());
    }
    return *std::move(list);
  }
};

TEST_F(SelectionListTest, CommentsAndBlankLinesAreSkipped) {
  auto list = Parse("# header\n\ndisk/read   # trailing\n  usb/.*  \n");
  EXPECT_EQ(list.name(), "smoke");
  EXPECT_EQ(
      list.patterns(), (std::vector<std::string>{"disk/read", "usb/.*"}));
}

TEST_F(SelectionListTest, ImplicitNamespaceQualifiesPatterns) {
  auto list = Parse("disk/read\nother::net\n", "2013.com.example");
  EXPECT_EQ(
      list.patterns(),
      (std::vector<std::string>{"2013.com.example::disk/read", "other::net"}));
}

TEST_F(SelectionListTest, MatchesWholeIdentifier) {
  auto list = Parse("disk/read\nusb/.*\n", "ns");
  EXPECT_TRUE(list.Matches("ns::disk/read"));
  EXPECT_TRUE(list.Matches("ns::usb/insert"));
  EXPECT_FALSE(list.Matches("ns::disk/read-all"));
  EXPECT_FALSE(list.Matches("disk/read"));
  EXPECT_FALSE(list.Matches("other::usb/insert"));
}

TEST_F(SelectionListTest, InvalidPatternNamesItsLine) {
  auto list = SelectionList::FromString(
      "ok\n\ndisk/[\n", "bad",
      Origin(FileTextSource{.filename = "bad.whitelist"}));
  ASSERT_FALSE(list.has_value());
  EXPECT_EQ(list.error().primary.kind, DiagKind::kSyntaxError);
  EXPECT_EQ(
      std::get<Origin>(list.error().primary.span),
      Origin(FileTextSource{.filename = "bad.whitelist"}, 3, 3));
  EXPECT_NE(
      list.error().primary.message.find("invalid pattern 'disk/['"),
      std::string::npos);
}

TEST_F(SelectionListTest, FromFileUsesStemAsName) {
  auto path = WriteFile("whitelists/default.whitelist", "disk/.*\n");
  auto list = SelectionList::FromFile(path);
  ASSERT_TRUE(list.has_value());
  EXPECT_EQ(list->name(), "default");
  EXPECT_EQ(list->origin().ToString(), path.string());
  EXPECT_TRUE(list->Matches("disk/read"));
}

TEST_F(SelectionListTest, FromMissingFileIsHostError) {
  auto list = SelectionList::FromFile(TestDir() / "missing.whitelist");
  ASSERT_FALSE(list.has_value());
  EXPECT_EQ(list.error().primary.kind, DiagKind::kHostError);
}

}  // namespace
}  // namespace pxu::unit
