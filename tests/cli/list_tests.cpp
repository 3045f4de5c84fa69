#include <gtest/gtest.h>
#include <sstream>
#include <string>

#include "tests/cli/cli_test_fixture.hpp"

namespace smoke::test {
namespace {

class ListTest : public CliTestFixture {
 protected:
  // The output line for a suite id, or empty when it is not listed.
  static auto LineFor(const std::string& output, const std::string& id)
      -> std::string {
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
      if (line.starts_with(id + " ")) {
        return line;
      }
    }
    return "";
  }
};

TEST_F(ListTest, ListsBuiltInSuites) {
  WriteSmokeToml({});

  auto result = Run({"list"});

  ASSERT_TRUE(result.Success()) << result.output;
  for (const char* id : {"core_pages", "auth", "health", "webform"}) {
    EXPECT_FALSE(LineFor(result.output, id).empty()) << id;
  }
}

// Test: optional suites follow the configured capabilities
TEST_F(ListTest, ShowsDetectionStatus) {
  WriteSmokeToml({"webform"});

  auto result = Run({"list"});

  ASSERT_TRUE(result.Success()) << result.output;
  EXPECT_NE(LineFor(result.output, "webform").find("ready"), std::string::npos);
  EXPECT_NE(
      LineFor(result.output, "commerce").find("not detected"),
      std::string::npos);
}

TEST_F(ListTest, ShowsDisabledSuites) {
  WriteSmokeToml({}, "\n[suites.enabled]\nhealth = false\n");

  auto result = Run({"list"});

  ASSERT_TRUE(result.Success()) << result.output;
  EXPECT_NE(
      LineFor(result.output, "health").find("disabled"), std::string::npos);
  EXPECT_NE(LineFor(result.output, "auth").find("ready"), std::string::npos);
}

// Test: declared suites from a provider are listed once their spec exists
TEST_F(ListTest, ListsDeclaredSuites) {
  WriteSmokeToml({}, "\n[[suites.providers]]\nname = \"agency\"\n"
                     "root = \"agency\"\n");
  WriteFile(
      "agency/smoke.suites.yml",
      "agency_seo:\n  label: Agency SEO\n  weight: 5\n");
  WriteFile("agency/playwright/suites/agency-seo.spec.ts", "// spec\n");

  auto result = Run({"list"});

  ASSERT_TRUE(result.Success()) << result.output;
  EXPECT_NE(
      LineFor(result.output, "agency_seo").find("Agency SEO"),
      std::string::npos);
}

TEST_F(ListTest, InvalidConfigFails) {
  WriteSmokeToml({}, "\n[suites.enabled]\nhealth = \"no\"\n");

  auto result = Run({"list"});

  EXPECT_EQ(result.exit_code, 1);
  EXPECT_NE(result.output.find("must be a boolean"), std::string::npos);
}

}  // namespace
}  // namespace smoke::test
