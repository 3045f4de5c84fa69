#pragma once

#include <filesystem>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace smoke::test {

// Result of running a CLI command
struct CliResult {
  int exit_code;
  std::string output;  // stdout + stderr interleaved

  [[nodiscard]] auto Success() const -> bool {
    return exit_code == 0;
  }
};

// Test fixture for CLI integration tests
//
// Runs the smoke binary inside a fresh scratch directory, which acts as the
// project root. The binary comes from SMOKE_BIN_PATH, falling back to
// `smoke` on PATH.
//
// Usage:
//   TEST_F(CliTest, MyTest) {
//     auto result = Run({"init"});
//     EXPECT_TRUE(result.Success());
//   }
//
class CliTestFixture : public ::testing::Test {
 protected:
  void SetUp() override;
  void TearDown() override;

  auto Run(std::initializer_list<std::string> args) -> CliResult;
  auto Run(const std::vector<std::string>& args) -> CliResult;

  // Create a file in the test directory
  void WriteFile(
      const std::filesystem::path& relative_path, const std::string& content);

  // Write smoke.toml with the given capabilities and extra TOML appended
  void WriteSmokeToml(
      const std::vector<std::string>& capabilities,
      const std::string& extra = "");

  [[nodiscard]] auto TestDir() const -> const std::filesystem::path& {
    return test_dir_;
  }

  [[nodiscard]] auto FileExists(
      const std::filesystem::path& relative_path) const -> bool;

  [[nodiscard]] auto ReadFile(const std::filesystem::path& relative_path) const
      -> std::string;

 private:
  std::filesystem::path test_dir_;
  std::filesystem::path smoke_bin_;

  auto RunImpl(
      const std::filesystem::path& working_dir,
      const std::vector<std::string>& args) -> CliResult;
};

}  // namespace smoke::test
