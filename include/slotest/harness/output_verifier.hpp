#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "slotest/common/diagnostic.hpp"

namespace slotest::harness {

// Compares captured interpreter output against the script's golden file: the
// sibling with the same stem and the golden extension (ok.slo -> ok.out).
class OutputVerifier {
 public:
  explicit OutputVerifier(std::string golden_extension = ".out");

  [[nodiscard]] auto GoldenPathFor(const std::filesystem::path& script) const
      -> std::filesystem::path;

  // True when there is no golden file, or when it equals `actual` byte for
  // byte. An unreadable or non-UTF-8 golden file is a kIo diagnostic.
  [[nodiscard]] auto MatchesExpected(
      const std::filesystem::path& script, std::string_view actual) const
      -> Result<bool>;

  // Write `actual` as the golden file when none exists yet. Returns false,
  // and leaves the file alone, when a golden file is already there.
  [[nodiscard]] auto RecordGolden(
      const std::filesystem::path& script, std::string_view actual) const
      -> Result<bool>;

 private:
  std::string golden_extension_;
};

}  // namespace slotest::harness
