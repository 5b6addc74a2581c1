#pragma once

#include <filesystem>
#include <gtest/gtest.h>
#include <initializer_list>
#include <memory>
#include <string>
#include <vector>

#include "tests/common/script_workspace.hpp"

namespace slotest::test {

// Result of running the slotest binary
struct CliResult {
  int exit_code;
  std::string combined_output;  // stdout + stderr interleaved

  [[nodiscard]] auto Success() const -> bool {
    return exit_code == 0;
  }

  [[nodiscard]] auto Contains(const std::string& needle) const -> bool {
    return combined_output.find(needle) != std::string::npos;
  }
};

// Test fixture for CLI integration tests
//
// Provides utilities for:
// - Running the slotest binary with arguments
// - A scratch workspace with a stand-in interpreter at bin/cslo
// - Creating scripts, golden files and slotest.toml
//
// The binary is taken from SLOTEST_BIN (set by CTest), falling back to
// `slotest` on PATH.
//
// Usage:
//   TEST_F(RunCliTest, MyTest) {
//     WriteScript("ok.slo", "echo 42\n");
//     auto result = Run({"slo", "-i", Interpreter().string()});
//     EXPECT_TRUE(result.Success());
//   }
//
class CliTestFixture : public ::testing::Test {
 protected:
  void SetUp() override;
  void TearDown() override;

  // Run slotest with given arguments from the workspace root
  auto Run(std::initializer_list<std::string> args) -> CliResult;
  auto Run(const std::vector<std::string>& args) -> CliResult;

  // Run slotest from a specific directory
  auto RunIn(
      const std::filesystem::path& dir, const std::vector<std::string>& args)
      -> CliResult;

  // Create a file under slo/ (the default scan root of these tests)
  void WriteScript(
      const std::filesystem::path& relative_path, const std::string& content);

  // Create a file relative to the workspace root
  void WriteFile(
      const std::filesystem::path& relative_path, const std::string& content);

  [[nodiscard]] auto TestDir() const -> const std::filesystem::path& {
    return workspace_->Root();
  }

  [[nodiscard]] auto Interpreter() const -> const std::filesystem::path& {
    return interpreter_;
  }

  [[nodiscard]] auto FileExists(
      const std::filesystem::path& relative_path) const -> bool;

  [[nodiscard]] auto ReadFile(const std::filesystem::path& relative_path) const
      -> std::string;

 private:
  std::unique_ptr<ScriptWorkspace> workspace_;
  std::filesystem::path interpreter_;
  std::filesystem::path slotest_bin_;
};

}  // namespace slotest::test
