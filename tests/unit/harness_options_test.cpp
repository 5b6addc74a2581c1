#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include "slotest/common/diagnostic.hpp"
#include "slotest/config/harness_options.hpp"
#include "tests/common/script_workspace.hpp"

namespace slotest::config {
namespace {

namespace fs = std::filesystem;

class HarnessOptionsTest : public ::testing::Test {
 protected:
  test::ScriptWorkspace workspace_;
};

TEST_F(HarnessOptionsTest, Defaults) {
  HarnessOptions options;
  EXPECT_EQ(options.root_directory, fs::path("tests/slo"));
  EXPECT_EQ(options.interpreter, fs::path("build/cslo"));
  EXPECT_FALSE(options.verify_output);
  EXPECT_FALSE(options.parallel);
  EXPECT_EQ(options.jobs, 4U);
  EXPECT_EQ(options.script_extension, ".slo");
  EXPECT_EQ(options.golden_extension, ".out");
  EXPECT_EQ(options.expected_error_marker, "# slo: exp error");
  EXPECT_EQ(options.timeout, std::chrono::seconds(0));
  EXPECT_TRUE(options.expected_errors.empty());
  EXPECT_FALSE(options.report_path.has_value());
  EXPECT_TRUE(ValidateOptions(options).has_value());
}

// =============================================================================
// FindConfig
// =============================================================================

TEST_F(HarnessOptionsTest, FindConfigWalksUpward) {
  auto config = workspace_.Write("slotest.toml", "");
  fs::create_directories(workspace_.Root() / "a/b/c");

  auto found = FindConfig(workspace_.Root() / "a/b/c");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(fs::canonical(*found), fs::canonical(config));
}

TEST_F(HarnessOptionsTest, FindConfigPrefersNearest) {
  workspace_.Write("slotest.toml", "");
  auto nearer = workspace_.Write("a/slotest.toml", "");
  fs::create_directories(workspace_.Root() / "a/b");

  auto found = FindConfig(workspace_.Root() / "a/b");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(fs::canonical(*found), fs::canonical(nearer));
}

TEST_F(HarnessOptionsTest, FindConfigSkipsUnresolvableAncestors) {
  auto config = workspace_.Write("slotest.toml", "");
  // A self-referencing link makes every lookup below it fail with ELOOP
  fs::create_directory_symlink("loop", workspace_.Root() / "loop");

  auto found = FindConfig(workspace_.Root() / "loop" / "a");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(fs::canonical(*found), fs::canonical(config));
}

// =============================================================================
// LoadConfig
// =============================================================================

TEST_F(HarnessOptionsTest, LoadsAllSections) {
  auto path = workspace_.Write(
      "proj/slotest.toml",
      "[harness]\n"
      "root = \"scripts\"\n"
      "interpreter = \"../bin/cslo\"\n"
      "parallel = true\n"
      "check_output = true\n"
      "jobs = 8\n"
      "timeout = 30\n"
      "\n"
      "[files]\n"
      "script_extension = \".cslo\"\n"
      "golden_extension = \".expected\"\n"
      "marker = \"// expect error\"\n"
      "expected_errors = [\"a.cslo\", \"b.cslo\"]\n"
      "\n"
      "[report]\n"
      "json = \"out/report.json\"\n");

  auto loaded = LoadConfig(path);
  ASSERT_TRUE(loaded.has_value()) << loaded.error().Format();
  auto proj = fs::absolute(workspace_.Root() / "proj").lexically_normal();
  EXPECT_EQ(loaded->root_directory, proj / "scripts");
  EXPECT_EQ(
      loaded->interpreter,
      fs::absolute(workspace_.Root() / "bin/cslo").lexically_normal());
  EXPECT_TRUE(loaded->parallel);
  EXPECT_TRUE(loaded->verify_output);
  EXPECT_EQ(loaded->jobs, 8U);
  EXPECT_EQ(loaded->timeout, std::chrono::seconds(30));
  EXPECT_EQ(loaded->script_extension, ".cslo");
  EXPECT_EQ(loaded->golden_extension, ".expected");
  EXPECT_EQ(loaded->expected_error_marker, "// expect error");
  EXPECT_EQ(
      loaded->expected_errors,
      (std::vector<std::string>{"a.cslo", "b.cslo"}));
  ASSERT_TRUE(loaded->report_path.has_value());
  EXPECT_EQ(*loaded->report_path, proj / "out/report.json");
  ASSERT_TRUE(loaded->config_dir.has_value());
}

TEST_F(HarnessOptionsTest, EmptyFileKeepsBase) {
  auto path = workspace_.Write("slotest.toml", "");
  HarnessOptions base;
  base.jobs = 2;
  base.expected_errors = {"keep.slo"};

  auto loaded = LoadConfig(path, base);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->jobs, 2U);
  EXPECT_EQ(loaded->root_directory, fs::path("tests/slo"));
  EXPECT_EQ(loaded->expected_errors, std::vector<std::string>{"keep.slo"});
}

TEST_F(HarnessOptionsTest, ExpectedErrorsAppendToBase) {
  auto path = workspace_.Write(
      "slotest.toml", "[files]\nexpected_errors = [\"file.slo\"]\n");
  HarnessOptions base;
  base.expected_errors = {"base.slo"};

  auto loaded = LoadConfig(path, base);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(
      loaded->expected_errors,
      (std::vector<std::string>{"base.slo", "file.slo"}));
}

TEST_F(HarnessOptionsTest, AbsolutePathsKept) {
  auto path = workspace_.Write(
      "slotest.toml", "[harness]\ninterpreter = \"/usr/local/bin/cslo\"\n");
  auto loaded = LoadConfig(path);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->interpreter, fs::path("/usr/local/bin/cslo"));
}

TEST_F(HarnessOptionsTest, MalformedTomlIsConfigError) {
  auto path = workspace_.Write("slotest.toml", "[harness\nroot = \n");
  auto loaded = LoadConfig(path);
  ASSERT_FALSE(loaded.has_value());
  EXPECT_EQ(loaded.error().kind, DiagKind::kConfig);
  EXPECT_NE(loaded.error().message.find("failed to parse"), std::string::npos);
}

TEST_F(HarnessOptionsTest, ZeroJobsRejected) {
  auto path = workspace_.Write("slotest.toml", "[harness]\njobs = 0\n");
  auto loaded = LoadConfig(path);
  ASSERT_FALSE(loaded.has_value());
  EXPECT_EQ(loaded.error().kind, DiagKind::kConfig);
}

TEST_F(HarnessOptionsTest, NegativeTimeoutRejected) {
  auto path = workspace_.Write("slotest.toml", "[harness]\ntimeout = -1\n");
  EXPECT_FALSE(LoadConfig(path).has_value());
}

TEST_F(HarnessOptionsTest, OversizedTimeoutRejected) {
  auto path = workspace_.Write(
      "slotest.toml", "[harness]\ntimeout = 9223372036854775\n");
  auto loaded = LoadConfig(path);
  ASSERT_FALSE(loaded.has_value());
  EXPECT_NE(loaded.error().message.find("harness.timeout"), std::string::npos);
}

TEST_F(HarnessOptionsTest, LargestTimeoutAccepted) {
  auto path = workspace_.Write(
      "slotest.toml", "[harness]\ntimeout = 2147483647\n");
  auto loaded = LoadConfig(path);
  ASSERT_TRUE(loaded.has_value()) << loaded.error().Format();
  EXPECT_EQ(loaded->timeout, kMaxTimeout);
}

TEST_F(HarnessOptionsTest, NonStringExpectedErrorRejected) {
  auto path = workspace_.Write(
      "slotest.toml", "[files]\nexpected_errors = [\"a.slo\", 3]\n");
  auto loaded = LoadConfig(path);
  ASSERT_FALSE(loaded.has_value());
  EXPECT_NE(
      loaded.error().message.find("files.expected_errors"), std::string::npos);
}

// =============================================================================
// ValidateOptions
// =============================================================================

TEST_F(HarnessOptionsTest, ValidateRejectsBadExtensions) {
  HarnessOptions options;
  options.script_extension = "slo";
  EXPECT_FALSE(ValidateOptions(options).has_value());

  options.script_extension = ".";
  EXPECT_FALSE(ValidateOptions(options).has_value());

  options.script_extension = ".out";
  EXPECT_FALSE(ValidateOptions(options).has_value());
}

TEST_F(HarnessOptionsTest, ValidateRejectsBadMarker) {
  HarnessOptions options;
  options.expected_error_marker = "";
  EXPECT_FALSE(ValidateOptions(options).has_value());

  options.expected_error_marker = "two\nlines";
  EXPECT_FALSE(ValidateOptions(options).has_value());
}

TEST_F(HarnessOptionsTest, ValidateRejectsOutOfRangeTimeout) {
  HarnessOptions options;
  options.timeout = kMaxTimeout + std::chrono::seconds(1);
  EXPECT_FALSE(ValidateOptions(options).has_value());

  options.timeout = std::chrono::seconds(-1);
  EXPECT_FALSE(ValidateOptions(options).has_value());

  options.timeout = kMaxTimeout;
  EXPECT_TRUE(ValidateOptions(options).has_value());
}

TEST_F(HarnessOptionsTest, ValidateRejectsZeroJobs) {
  HarnessOptions options;
  options.jobs = 0;
  auto valid = ValidateOptions(options);
  ASSERT_FALSE(valid.has_value());
  EXPECT_EQ(valid.error().kind, DiagKind::kConfig);
}

}  // namespace
}  // namespace slotest::config
