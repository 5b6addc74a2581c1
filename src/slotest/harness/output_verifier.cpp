#include "slotest/harness/output_verifier.hpp"

#include <expected>
#include <filesystem>
#include <fstream>
#include <ios>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "slotest/common/diagnostic.hpp"
#include "slotest/common/utf8.hpp"

namespace slotest::harness {

namespace fs = std::filesystem;

OutputVerifier::OutputVerifier(std::string golden_extension)
    : golden_extension_(std::move(golden_extension)) {
}

auto OutputVerifier::GoldenPathFor(const fs::path& script) const -> fs::path {
  fs::path golden = script;
  golden.replace_extension(golden_extension_);
  return golden;
}

auto OutputVerifier::MatchesExpected(
    const fs::path& script, std::string_view actual) const -> Result<bool> {
  auto golden_path = GoldenPathFor(script);

  std::error_code ec;
  if (!fs::exists(golden_path, ec)) {
    // Nothing to verify against
    return true;
  }

  std::ifstream in(golden_path, std::ios::binary);
  if (!in) {
    return std::unexpected(
        Diagnostic::IoError(golden_path, "cannot open golden file"));
  }
  std::string expected(
      (std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    return std::unexpected(
        Diagnostic::IoError(golden_path, "read error in golden file"));
  }
  if (!common::IsValidUtf8(expected)) {
    return std::unexpected(
        Diagnostic::IoError(golden_path, "golden file is not valid UTF-8"));
  }

  return expected == actual;
}

auto OutputVerifier::RecordGolden(
    const fs::path& script, std::string_view actual) const -> Result<bool> {
  auto golden_path = GoldenPathFor(script);

  std::error_code ec;
  if (fs::exists(golden_path, ec)) {
    return false;
  }

  std::ofstream out(golden_path, std::ios::binary);
  out.write(actual.data(), static_cast<std::streamsize>(actual.size()));
  out.close();
  if (!out) {
    return std::unexpected(
        Diagnostic::IoError(golden_path, "failed to write golden file"));
  }
  return true;
}

}  // namespace slotest::harness
