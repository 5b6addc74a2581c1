#include "tests/common/script_workspace.hpp"

#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <ios>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

#include <unistd.h>

namespace slotest::test {

namespace fs = std::filesystem;

namespace {

auto MakeUniqueTempPath() -> fs::path {
  static std::atomic<uint64_t> counter{0};
  auto unique_suffix = std::to_string(getpid()) + "_" +
                       std::to_string(counter.fetch_add(1));
  return fs::temp_directory_path() / "slotest_test" / unique_suffix;
}

}  // namespace

ScriptWorkspace::ScriptWorkspace() : root_(MakeUniqueTempPath()) {
  fs::remove_all(root_);
  fs::create_directories(root_);
}

ScriptWorkspace::~ScriptWorkspace() noexcept {
  if (std::getenv("SLOTEST_TEST_KEEP_TMP") != nullptr) {
    return;
  }
  std::error_code ec;
  fs::remove_all(root_, ec);
}

auto ScriptWorkspace::Write(
    const fs::path& relative_path, std::string_view content) const
    -> fs::path {
  auto full_path = root_ / relative_path;
  fs::create_directories(full_path.parent_path());
  std::ofstream out(full_path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw std::runtime_error("Failed to create file: " + full_path.string());
  }
  out.write(content.data(), static_cast<std::streamsize>(content.size()));
  return full_path;
}

auto ScriptWorkspace::WriteInterpreter(std::string_view name) const
    -> fs::path {
  auto path = Write(
      fs::path("bin") / std::string(name), "#!/bin/sh\nexec /bin/sh \"$1\"\n");
  fs::permissions(
      path,
      fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
          fs::perms::others_read | fs::perms::others_exec,
      fs::perm_options::replace);
  return path;
}

auto ScriptWorkspace::Read(const fs::path& relative_path) const
    -> std::string {
  auto full_path = root_ / relative_path;
  std::ifstream in(full_path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("Failed to read file: " + full_path.string());
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

auto ScriptWorkspace::Exists(const fs::path& relative_path) const -> bool {
  return fs::exists(root_ / relative_path);
}

}  // namespace slotest::test
