#include <gtest/gtest.h>
#include <string>

#include "smoke/common/string_utils.hpp"

namespace smoke::common {
namespace {

TEST(StringUtilsTest, DashAndUnderscoreCaseAreInverse) {
  EXPECT_EQ(DashCase("core_pages"), "core-pages");
  EXPECT_EQ(UnderscoreCase("core-pages"), "core_pages");
  EXPECT_EQ(UnderscoreCase(DashCase("agency_seo_audit")), "agency_seo_audit");
}

TEST(StringUtilsTest, SlugifyCollapsesSeparators) {
  EXPECT_EQ(Slugify("Core Pages!"), "core_pages");
  EXPECT_EQ(Slugify("  --Search   API--  "), "search_api");
  EXPECT_EQ(Slugify("a/b\\c"), "a_b_c");
  EXPECT_EQ(Slugify("!!!"), "");
}

TEST(StringUtilsTest, HumanizeIdCapitalizesFirstWord) {
  EXPECT_EQ(HumanizeId("agency_seo"), "Agency seo");
  EXPECT_EQ(HumanizeId(""), "");
}

TEST(StringUtilsTest, StripAnsiRemovesColorSequences) {
  EXPECT_EQ(StripAnsi("\x1b[31mError:\x1b[0m boom"), "Error: boom");
  EXPECT_EQ(StripAnsi("\x1b[1;33mwarn\x1b[39m"), "warn");
  // Not an SGR sequence, kept as is
  EXPECT_EQ(StripAnsi("\x1b[2J"), "\x1b[2J");
}

TEST(StringUtilsTest, TruncateAppendsEllipsis) {
  EXPECT_EQ(Truncate("short", 10), "short");
  EXPECT_EQ(Truncate("exactly10!", 10), "exactly10!");
  EXPECT_EQ(Truncate("0123456789abc", 10), "0123456789...");
}

// Test: a cut never lands inside a multibyte UTF-8 sequence
TEST(StringUtilsTest, TruncateKeepsUtf8Sequences) {
  // "\xE2\x9C\x98" is one three-byte character straddling the limit
  const std::string text = "abcd\xE2\x9C\x98xyz";
  EXPECT_EQ(Utf8Prefix(text, 5), "abcd");
  EXPECT_EQ(Utf8Prefix(text, 6), "abcd");
  EXPECT_EQ(Utf8Prefix(text, 7), "abcd\xE2\x9C\x98");
  EXPECT_EQ(Utf8Prefix(text, 4), "abcd");
  EXPECT_EQ(Truncate(text, 6), "abcd...");
  EXPECT_EQ(Truncate("\xC3\xA9\xC3\xA9", 3), "\xC3\xA9...");
}

TEST(StringUtilsTest, TrimHandlesWhitespaceOnly) {
  EXPECT_EQ(Trim("  x y \n"), "x y");
  EXPECT_EQ(Trim(" \t\r\n"), "");
  EXPECT_EQ(TrimTrailingSlashes("https://site.test///"), "https://site.test");
}

TEST(StringUtilsTest, EscapeXmlEscapesAllFiveEntities) {
  EXPECT_EQ(
      EscapeXml("<a href=\"x\">&'</a>"),
      "&lt;a href=&quot;x&quot;&gt;&amp;&apos;&lt;/a&gt;");
}

TEST(StringUtilsTest, RemoveInvalidXmlCharsKeepsTabsAndNewlines) {
  std::string input = "a\x01\tb\nc\rd\x7f";
  EXPECT_EQ(RemoveInvalidXmlChars(input), "a\tb\nc\rd");
}

}  // namespace
}  // namespace smoke::common
