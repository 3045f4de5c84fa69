#include <chrono>
#include <filesystem>
#include <gtest/gtest.h>
#include <set>
#include <string>
#include <vector>

#include "smoke/bridge/config_bridge.hpp"
#include "smoke/config/project_config.hpp"
#include "smoke/report/run_result.hpp"
#include "smoke/runner/orchestrator.hpp"
#include "smoke/state/secret_store.hpp"
#include "smoke/state/state_store.hpp"
#include "smoke/suite/suite_declarations.hpp"
#include "smoke/suite/suite_registry.hpp"
#include "tests/common/fakes.hpp"

namespace smoke::runner {
namespace {

namespace fs = std::filesystem;

using report::ErrorCode;
using test::CannedRun;
using test::FakeSpec;
using test::PlaywrightReport;

class OrchestratorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    config_ = config::DefaultConfig(dir_.Path());
    fs::create_directories(config_.runner_dir);
  }

  auto RunnerDir() const -> fs::path {
    return dir_.Path() / "playwright";
  }

  auto Run(const std::string& suite_id, RunOptions options = {})
      -> report::RunResult {
    return orchestrator_.Run(
        RunRequest{
            .suite_id = suite_id,
            .target_url = std::nullopt,
            .credentials = std::nullopt,
            .options = options,
        });
  }

  static auto Passing(const std::string& title, int tests) -> std::string {
    std::vector<FakeSpec> specs;
    for (int i = 0; i < tests; ++i) {
      specs.push_back(
          {.title = title + " test " + std::to_string(i),
           .status = "passed",
           .duration_ms = 100,
           .error = ""});
    }
    return PlaywrightReport({{title, specs}});
  }

  void Enqueue(std::string artifact, int exit_code = 0) {
    adapter_.Enqueue(
        CannedRun{
            .artifact = std::move(artifact),
            .exit_code = exit_code,
            .stderr_output = "",
            .timed_out = false,
        });
  }

  void EnqueueCrash(std::string stderr_output) {
    adapter_.Enqueue(
        CannedRun{
            .artifact = std::nullopt,
            .exit_code = 1,
            .stderr_output = std::move(stderr_output),
            .timed_out = false,
        });
  }

  test::TempDir dir_;
  config::ProjectConfig config_;
  test::StaticFeatureDetector detector_{
      std::set<std::string, std::less<>>{"webform", "commerce"}};
  std::vector<suite::SuiteDeclaration> declarations_;
  suite::SuiteRegistry registry_{detector_, RunnerDir(), declarations_};
  test::InMemoryStateStore state_;
  state::StateSecretStore secrets_{state_};
  bridge::ConfigBridgeWriter bridge_{config_, registry_, secrets_};
  test::FakeRunnerAdapter adapter_{RunnerDir()};
  test::FakeRemediator remediator_;
  ProcessOrchestrator orchestrator_{
      adapter_, remediator_, bridge_, registry_, state_,
      std::chrono::seconds(300)};
};

// Test: two single-suite runs on fresh state accumulate both suites
TEST_F(OrchestratorTest, SequentialSuitesAccumulate) {
  Enqueue(Passing("webform.spec.ts", 2));
  auto first = Run("webform");
  ASSERT_FALSE(first.error.has_value());

  Enqueue(Passing("auth.spec.ts", 3));
  auto second = Run("auth");

  ASSERT_EQ(second.suites.size(), 2U);
  EXPECT_TRUE(second.suites.contains("webform"));
  EXPECT_TRUE(second.suites.contains("auth"));
  EXPECT_EQ(second.summary.total, 5);
  EXPECT_EQ(second.summary.passed, 5);
  EXPECT_EQ(second.summary.duration_ms, 500);

  auto stored = orchestrator_.GetLastResults();
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(*stored, second);
  EXPECT_EQ(orchestrator_.GetLastRunTime(), second.ran_at);
}

TEST_F(OrchestratorTest, RerunReplacesOnlyThatSuite) {
  Enqueue(Passing("webform.spec.ts", 2));
  Run("webform");
  Enqueue(Passing("auth.spec.ts", 3));
  Run("auth");

  Enqueue(
      PlaywrightReport(
          {{"webform.spec.ts",
            {{.title = "only", .status = "failed", .error = "broken"}}}}),
      1);
  auto result = Run("webform");

  EXPECT_EQ(result.suites.at("webform").tests.size(), 1U);
  EXPECT_EQ(result.suites.at("webform").failed, 1);
  EXPECT_EQ(result.suites.at("auth").passed, 3);
  EXPECT_EQ(result.summary.total, 4);
  EXPECT_EQ(result.exit_code, 1);
}

// Test: a failed precondition never spawns the runner
TEST_F(OrchestratorTest, EnvironmentErrorFailsFast) {
  adapter_.environment_error = report::StructuredError{
      .code = ErrorCode::kPlaywrightNotSetup,
      .message = "not installed",
      .hint = "smoke setup",
      .raw = "",
  };

  auto result = Run("auth");

  EXPECT_TRUE(adapter_.invocations.empty());
  EXPECT_EQ(remediator_.calls, 0);
  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(result.error->code, ErrorCode::kPlaywrightNotSetup);
  EXPECT_EQ(result.exit_code, 1);
  EXPECT_TRUE(orchestrator_.GetLastResults().has_value());
}

// Test: a launch failure with no results is remediated and retried once
TEST_F(OrchestratorTest, LaunchFailureRetriesOnce) {
  EnqueueCrash("browserType.launch: Executable doesn't exist");
  Enqueue(Passing("auth.spec.ts", 1));

  auto result = Run("auth");

  EXPECT_EQ(remediator_.calls, 1);
  EXPECT_EQ(adapter_.invocations.size(), 2U);
  EXPECT_FALSE(result.error.has_value());
  EXPECT_EQ(result.suites.at("auth").passed, 1);
}

TEST_F(OrchestratorTest, SecondLaunchFailureIsTerminal) {
  EnqueueCrash("Error: Cannot find module '@playwright/test'");

  auto result = Run("auth");

  EXPECT_EQ(remediator_.calls, 1);
  EXPECT_EQ(adapter_.invocations.size(), 2U);
  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(result.error->code, ErrorCode::kPlaywrightNotSetup);
  EXPECT_FALSE(result.suites.contains("auth"));
}

TEST_F(OrchestratorTest, FailedRemediationSkipsRetry) {
  test::FakeRemediator failing(false);
  ProcessOrchestrator orchestrator(
      adapter_, failing, bridge_, registry_, state_, std::chrono::seconds(300));
  EnqueueCrash("browserType.launch: boom");

  auto result = orchestrator.Run(
      {.suite_id = "auth",
       .target_url = std::nullopt,
       .credentials = std::nullopt,
       .options = {}});

  EXPECT_EQ(failing.calls, 1);
  EXPECT_EQ(adapter_.invocations.size(), 1U);
  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(result.error->code, ErrorCode::kBrowserLaunchFailed);
}

// Test: errors that setup cannot fix are reported without a retry
TEST_F(OrchestratorTest, NonSetupErrorIsNotRetried) {
  EnqueueCrash("connect ECONNREFUSED 127.0.0.1:443");

  auto result = Run("core_pages");

  EXPECT_EQ(remediator_.calls, 0);
  EXPECT_EQ(adapter_.invocations.size(), 1U);
  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(result.error->code, ErrorCode::kTimeout);
}

TEST_F(OrchestratorTest, TimeoutWithoutResultsIsLaunchClass) {
  adapter_.Enqueue(
      CannedRun{
          .artifact = std::nullopt,
          .exit_code = 137,
          .stderr_output = "",
          .timed_out = true,
      });

  auto result = Run("health");

  EXPECT_EQ(remediator_.calls, 1);
  EXPECT_EQ(adapter_.invocations.size(), 2U);
  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(result.error->code, ErrorCode::kTimeout);
  EXPECT_NE(result.error->message.find("300"), std::string::npos);
}

// Test: partial results written before a timeout are still parsed
TEST_F(OrchestratorTest, TimeoutWithResultsIsParsed) {
  adapter_.Enqueue(
      CannedRun{
          .artifact = Passing("health.spec.ts", 2),
          .exit_code = 137,
          .stderr_output = "",
          .timed_out = true,
      });

  auto result = Run("health");

  EXPECT_EQ(remediator_.calls, 0);
  EXPECT_FALSE(result.error.has_value());
  EXPECT_EQ(result.suites.at("health").passed, 2);
}

// Test: multibyte runner output at the excerpt limit still persists to disk
TEST_F(OrchestratorTest, MultibyteStderrPersistsToStateFile) {
  state::JsonFileStateStore store(dir_.Path() / ".smoke" / "state.json");
  ProcessOrchestrator orchestrator(
      adapter_, remediator_, bridge_, registry_, store,
      std::chrono::seconds(300));
  EnqueueCrash(std::string(499, 'x') + "\xE2\x9C\x98 browser died");

  report::RunResult result;
  ASSERT_NO_THROW(
      result = orchestrator.Run(
          {.suite_id = "health",
           .target_url = std::nullopt,
           .credentials = std::nullopt,
           .options = {}}));

  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(result.error->raw, std::string(499, 'x') + "...");
  auto stored = orchestrator.GetLastResults();
  ASSERT_TRUE(stored.has_value());
  ASSERT_TRUE(stored->error.has_value());
  EXPECT_EQ(stored->error->raw, result.error->raw);
}

// Test: a non-zero exit with results is ordinary test failure data
TEST_F(OrchestratorTest, FailingTestsAreData) {
  Enqueue(
      PlaywrightReport(
          {{"sitemap.spec.ts",
            {{.title = "valid xml", .status = "failed", .error = "bad"},
             {.title = "has urls", .status = "passed"}}}}),
      1);

  auto result = Run("sitemap");

  EXPECT_EQ(remediator_.calls, 0);
  EXPECT_FALSE(result.error.has_value());
  EXPECT_EQ(result.suites.at("sitemap").failed, 1);
  EXPECT_EQ(result.suites.at("sitemap").passed, 1);
  EXPECT_EQ(result.exit_code, 1);
}

// Test: a browser launch error inside test results triggers the retry too
TEST_F(OrchestratorTest, LaunchFailureInTestResultsRetries) {
  Enqueue(
      PlaywrightReport(
          {{"auth.spec.ts",
            {{.title = "login",
              .status = "failed",
              .error = "browserType.launch: Host system is missing "
                       "dependencies"}}}}),
      1);
  Enqueue(Passing("auth.spec.ts", 1));

  auto result = Run("auth");

  EXPECT_EQ(remediator_.calls, 1);
  EXPECT_EQ(adapter_.invocations.size(), 2U);
  EXPECT_FALSE(result.error.has_value());
  EXPECT_EQ(result.suites.at("auth").passed, 1);
}

TEST_F(OrchestratorTest, StaleArtifactIsRemoved) {
  dir_.Write("playwright/results.json", Passing("auth.spec.ts", 5));
  adapter_.Enqueue(
      CannedRun{
          .artifact = std::nullopt,
          .exit_code = 0,
          .stderr_output = "",
          .timed_out = false,
      });

  auto result = Run("auth");

  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(result.error->code, ErrorCode::kParseFailed);
  EXPECT_FALSE(result.suites.contains("auth"));
}

// Test: run options become environment toggles and the bridge is written
TEST_F(OrchestratorTest, InvocationCarriesToggles) {
  Enqueue(Passing("auth.spec.ts", 1));
  RunOptions options{
      .parallel = true,
      .verbose = true,
      .html_path = dir_.Path() / "report.html",
  };

  Run("auth", options);

  ASSERT_EQ(adapter_.invocations.size(), 1U);
  const auto& invocation = adapter_.invocations[0];
  EXPECT_EQ(invocation.env.at("SMOKE_PARALLEL"), "1");
  EXPECT_EQ(invocation.env.at("SMOKE_VERBOSE"), "1");
  EXPECT_EQ(
      invocation.env.at("SMOKE_HTML_PATH"),
      (dir_.Path() / "report.html").string());
  EXPECT_TRUE(invocation.stream_output);
  EXPECT_EQ(invocation.timeout, std::chrono::seconds(300));
  EXPECT_EQ(invocation.target, "suites/auth.spec.ts");
  EXPECT_TRUE(fs::exists(RunnerDir() / ".smoke-config.json"));
}

TEST_F(OrchestratorTest, DefaultOptionsSetNoToggles) {
  Enqueue(Passing("core-pages.spec.ts", 1));
  Run("core_pages");

  const auto& invocation = adapter_.invocations.at(0);
  EXPECT_TRUE(invocation.env.empty());
  EXPECT_FALSE(invocation.stream_output);
  EXPECT_EQ(invocation.target, "suites/core-pages.spec.ts");
}

TEST_F(OrchestratorTest, InTreeSuiteDirectoryIsTargetedRelative) {
  fs::create_directories(RunnerDir() / "suites" / "core-pages");
  Enqueue(Passing("core-pages.spec.ts", 1));

  Run("core_pages");

  EXPECT_EQ(adapter_.invocations.at(0).target, "suites/core-pages");
}

// Test: a declared suite outside the runner tree is staged for the run only
TEST_F(OrchestratorTest, ExternalSuiteIsStagedAndRemoved) {
  dir_.Write("agency/playwright/suites/agency-seo.spec.ts", "// spec");
  declarations_.push_back(
      suite::SuiteDeclaration{
          .id = "agency_seo",
          .label = "Agency SEO",
          .description = "",
          .weight = 0,
          .dependencies = {},
          .spec_path = std::nullopt,
          .provider_id = "agency",
          .provider_root = dir_.Path() / "agency",
      });
  suite::SuiteRegistry registry(detector_, RunnerDir(), declarations_);
  bridge::ConfigBridgeWriter bridge(config_, registry, secrets_);
  ProcessOrchestrator orchestrator(
      adapter_, remediator_, bridge, registry, state_,
      std::chrono::seconds(300));

  const fs::path staged =
      RunnerDir() / "suites" / "agency-seo" / "agency-seo.spec.ts";
  bool staged_during_run = false;
  adapter_.on_invoke = [&](const Invocation& /*invocation*/) {
    staged_during_run = fs::exists(staged);
  };
  Enqueue(Passing("agency-seo.spec.ts", 2));

  auto result = orchestrator.Run(
      {.suite_id = "agency_seo",
       .target_url = std::nullopt,
       .credentials = std::nullopt,
       .options = {}});

  EXPECT_TRUE(staged_during_run);
  EXPECT_FALSE(fs::exists(RunnerDir() / "suites" / "agency-seo"));
  EXPECT_EQ(
      adapter_.invocations.at(0).target,
      "suites/agency-seo/agency-seo.spec.ts");
  EXPECT_EQ(result.suites.at("agency_seo").passed, 2);
}

// Test: results under unexpected titles are collapsed into the requested id
TEST_F(OrchestratorTest, UnmatchedTitlesCollapseIntoRequestedSuite) {
  Enqueue(
      PlaywrightReport(
          {{"Checkout", {{.title = "a", .status = "passed"}}},
           {"Catalog", {{.title = "b", .status = "passed"}}}}));

  auto result = Run("commerce");

  ASSERT_EQ(result.suites.size(), 1U);
  EXPECT_EQ(result.suites.at("commerce").tests.size(), 2U);
}

// Test: a full run replaces the stored results wholesale
TEST_F(OrchestratorTest, FullRunPersistsWholesale) {
  Enqueue(Passing("webform.spec.ts", 2));
  Run("webform");

  Enqueue(
      PlaywrightReport(
          {{"auth.spec.ts", {{.title = "a", .status = "passed"}}},
           {"health.spec.ts", {{.title = "b", .status = "skipped"}}}}));
  auto result = orchestrator_.Run({});

  EXPECT_FALSE(adapter_.invocations.back().target.has_value());
  EXPECT_EQ(result.suites.size(), 2U);
  EXPECT_FALSE(result.suites.contains("webform"));
  EXPECT_EQ(result.summary.skipped, 1);
}

TEST_F(OrchestratorTest, ClearLastResults) {
  Enqueue(Passing("auth.spec.ts", 1));
  Run("auth");
  ASSERT_TRUE(orchestrator_.GetLastResults().has_value());

  orchestrator_.ClearLastResults();
  EXPECT_FALSE(orchestrator_.GetLastResults().has_value());
  EXPECT_TRUE(orchestrator_.GetLastRunTime().has_value());
}

TEST_F(OrchestratorTest, IsSetupDelegatesToAdapter) {
  EXPECT_TRUE(orchestrator_.IsSetup());
  adapter_.setup = false;
  EXPECT_FALSE(orchestrator_.IsSetup());
}

}  // namespace
}  // namespace smoke::runner
