#pragma once

#include <cstddef>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

#include "slotest/common/diagnostic.hpp"

namespace slotest::harness {

// Decides whether a script is expected to make the interpreter fail.
//
// Two independent predicates, OR-combined:
//   - one of the first kMarkerWindow lines is exactly the marker line
//     (terminated by "\n", "\r\n" or a lone "\r"; an unterminated last line
//     never matches)
//   - the script's file name is in the allow-list
//
// Pure apart from reading the script. The script must be readable and its
// inspected lines valid UTF-8; otherwise a kIo diagnostic is returned.
class ErrorClassifier {
 public:
  static constexpr std::size_t kMarkerWindow = 5;

  explicit ErrorClassifier(
      std::string marker, const std::vector<std::string>& allow_list = {});

  [[nodiscard]] auto IsExpectedError(const std::filesystem::path& script) const
      -> Result<bool>;

  // Marker check only; no allow-list
  [[nodiscard]] auto HasMarker(const std::filesystem::path& script) const
      -> Result<bool>;

  [[nodiscard]] auto IsAllowListed(const std::filesystem::path& script) const
      -> bool;

 private:
  std::string marker_;
  std::set<std::string> allow_list_;
};

}  // namespace slotest::harness
