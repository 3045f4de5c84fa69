#include <gtest/gtest.h>
#include <string>

#include "tests/cli/cli_test_fixture.hpp"

namespace smoke::test {
namespace {

class StatusTest : public CliTestFixture {
 protected:
  void SetUp() override {
    CliTestFixture::SetUp();
    WriteSmokeToml({"webform"});
  }

  // Persisted state as left behind by a run of the auth suite.
  void WriteLastResults() {
    WriteFile(
        ".smoke/state.json",
        R"({
  "smoke.last_run": "2026-01-02T03:04:05+00:00",
  "smoke.last_results": {
    "ranAt": "2026-01-02T03:04:05+00:00",
    "exitCode": 1,
    "suites": {
      "auth": {
        "title": "auth.spec.ts",
        "tests": [
          {"title": "login works", "status": "passed", "duration": 100},
          {"title": "reset link", "status": "failed", "duration": 200,
           "error": "expected 200"}
        ]
      }
    }
  }
}
)");
  }
};

TEST_F(StatusTest, NoResultsYet) {
  auto result = Run({"status"});

  EXPECT_TRUE(result.Success()) << result.output;
  EXPECT_NE(result.output.find("not set up"), std::string::npos);
  EXPECT_NE(result.output.find("No results yet"), std::string::npos);
}

// Test: status replays the stored results and fails when they failed
TEST_F(StatusTest, ShowsLastResults) {
  WriteLastResults();

  auto result = Run({"status"});

  EXPECT_EQ(result.exit_code, 1) << result.output;
  EXPECT_NE(
      result.output.find("2026-01-02T03:04:05+00:00"), std::string::npos);
  EXPECT_NE(result.output.find("Authentication"), std::string::npos);
}

TEST_F(StatusTest, UnknownSuiteListsAvailable) {
  auto result = Run({"suite", "nope"});

  EXPECT_EQ(result.exit_code, 1);
  EXPECT_NE(result.output.find("unknown suite 'nope'"), std::string::npos);
  EXPECT_NE(result.output.find("core_pages"), std::string::npos);
  EXPECT_NE(result.output.find("webform"), std::string::npos);
}

TEST_F(StatusTest, UndetectedSuiteIsRejected) {
  auto result = Run({"suite", "commerce"});

  EXPECT_EQ(result.exit_code, 1);
  EXPECT_NE(result.output.find("not available"), std::string::npos);
}

TEST_F(StatusTest, ReportWithoutResultsFails) {
  auto result = Run({"report", "junit.xml"});

  EXPECT_EQ(result.exit_code, 1);
  EXPECT_NE(result.output.find("no results to export"), std::string::npos);
  EXPECT_FALSE(FileExists("junit.xml"));
}

TEST_F(StatusTest, ReportWithoutPathFails) {
  auto result = Run({"report"});

  EXPECT_EQ(result.exit_code, 1);
  EXPECT_NE(result.output.find("no output path"), std::string::npos);
}

// Test: report exports the stored results as JUnit XML
TEST_F(StatusTest, ReportWritesJUnit) {
  WriteLastResults();

  auto result = Run({"report", "out/junit.xml", "--name", "ci"});

  EXPECT_TRUE(result.Success()) << result.output;
  ASSERT_TRUE(FileExists("out/junit.xml"));
  auto xml = ReadFile("out/junit.xml");
  EXPECT_NE(xml.find("<testsuites name=\"ci\""), std::string::npos);
  EXPECT_NE(xml.find("reset link"), std::string::npos);
  EXPECT_NE(xml.find("<failure"), std::string::npos);
}

}  // namespace
}  // namespace smoke::test
