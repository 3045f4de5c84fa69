#include <gtest/gtest.h>
#include <string>

#include "smoke/report/error_classifier.hpp"
#include "smoke/report/run_result.hpp"

namespace smoke::report {
namespace {

TEST(ErrorClassifierTest, BrowserLaunchFailure) {
  auto error = Analyze("browserType.launch: Executable doesn't exist");

  EXPECT_EQ(error.code, ErrorCode::kBrowserLaunchFailed);
  EXPECT_NE(error.hint.find("install-deps"), std::string::npos);
  EXPECT_EQ(error.raw, "browserType.launch: Executable doesn't exist");
}

TEST(ErrorClassifierTest, SignatureTable) {
  EXPECT_EQ(Analyze("Failed to launch chromium").code,
            ErrorCode::kBrowserLaunchFailed);
  EXPECT_EQ(Analyze("spawn npx ENOENT").code, ErrorCode::kPlaywrightNotSetup);
  EXPECT_EQ(Analyze("Error: Cannot find module '@playwright/test'").code,
            ErrorCode::kPlaywrightNotSetup);
  EXPECT_EQ(Analyze("connect ETIMEDOUT 10.0.0.1:443").code,
            ErrorCode::kTimeout);
  EXPECT_EQ(Analyze("Timeout of 30000ms exceeded").code, ErrorCode::kTimeout);
  EXPECT_EQ(Analyze("connect ECONNREFUSED 127.0.0.1:80").code,
            ErrorCode::kTimeout);
  EXPECT_EQ(Analyze("page.goto: net::ERR_CONNECTION_REFUSED").code,
            ErrorCode::kTimeout);
  EXPECT_EQ(Analyze("could not read .smoke-config.json").code,
            ErrorCode::kConfigMissing);
  EXPECT_EQ(Analyze("error while loading shared libraries: libnss3.so").code,
            ErrorCode::kBrowserLaunchFailed);
  EXPECT_EQ(Analyze("libatk-1.0.so.0: cannot open shared object file").code,
            ErrorCode::kBrowserLaunchFailed);
}

// Test: the first matching signature wins when several are present
TEST(ErrorClassifierTest, FirstMatchWins) {
  auto error = Analyze("Cannot find module x\nbrowserType.launch failed");
  EXPECT_EQ(error.code, ErrorCode::kBrowserLaunchFailed);
  EXPECT_EQ(error.message, "Chromium browser could not be launched.");
}

TEST(ErrorClassifierTest, AnsiSequencesAreIgnored) {
  auto error = Analyze("\x1b[31mbrowserType\x1b[39m.launch: boom");
  EXPECT_EQ(error.code, ErrorCode::kBrowserLaunchFailed);

  auto colored = Analyze("\x1b[31mError:\x1b[0m Cannot find module 'x'");
  EXPECT_EQ(colored.code, ErrorCode::kPlaywrightNotSetup);
  EXPECT_EQ(colored.raw.find('\x1b'), std::string::npos);
}

// Test: unknown errors use the first line that is not a stack frame
TEST(ErrorClassifierTest, GenericFallback) {
  auto error =
      Analyze("\n   at Object.<anonymous> (x.js:1:1)\nSomething odd\nmore");
  EXPECT_EQ(error.code, ErrorCode::kUnknownError);
  EXPECT_EQ(error.message, "Something odd");
  EXPECT_NE(error.hint.find("--debug"), std::string::npos);

  EXPECT_EQ(Analyze("").message, "Playwright test execution failed.");
}

TEST(ErrorClassifierTest, RawIsTruncated) {
  auto error = Analyze(std::string(800, 'z'));
  EXPECT_EQ(error.raw, std::string(500, 'z') + "...");
}

// Test: the raw excerpt stays valid UTF-8 and serializes
TEST(ErrorClassifierTest, RawTruncationKeepsUtf8Valid) {
  auto error = Analyze(std::string(499, 'x') + "\xE2\x9C\x98 browser died", 1);

  EXPECT_EQ(error.raw, std::string(499, 'x') + "...");
  EXPECT_NO_THROW((void)ToJson(error).dump());
}

TEST(ErrorClassifierTest, AnalyzeIsPure) {
  const std::string input = "ECONNREFUSED somewhere\nat frame";
  EXPECT_EQ(Analyze(input), Analyze(input));
  EXPECT_EQ(Analyze(input, 1), Analyze(input, 2));
}

TEST(ErrorClassifierTest, FormatForCli) {
  StructuredError error{
      .code = ErrorCode::kTimeout,
      .message = "Could not connect to the site.",
      .hint = "Ensure the site is running.",
      .raw = "connect ECONNREFUSED",
  };
  EXPECT_EQ(
      FormatForCli(error),
      "[TIMEOUT] Could not connect to the site.\n\n"
      "Hint: Ensure the site is running.");
  EXPECT_EQ(
      FormatForCli(error, true),
      "[TIMEOUT] Could not connect to the site.\n\n"
      "Hint: Ensure the site is running.\n\n"
      "Details:\nconnect ECONNREFUSED");
}

TEST(ErrorClassifierTest, SetupErrors) {
  EXPECT_TRUE(IsSetupError(ErrorCode::kPlaywrightNotSetup));
  EXPECT_TRUE(IsSetupError(ErrorCode::kBrowserLaunchFailed));
  EXPECT_TRUE(IsSetupError(ErrorCode::kConfigMissing));
  EXPECT_FALSE(IsSetupError(ErrorCode::kTimeout));
  EXPECT_FALSE(IsSetupError(ErrorCode::kUnknownError));
  EXPECT_FALSE(IsSetupError(ErrorCode::kEnvironmentNotReady));
}

}  // namespace
}  // namespace smoke::report
