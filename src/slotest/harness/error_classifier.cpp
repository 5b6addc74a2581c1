#include "slotest/harness/error_classifier.hpp"

#include <cstddef>
#include <expected>
#include <filesystem>
#include <fstream>
#include <istream>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "slotest/common/diagnostic.hpp"
#include "slotest/common/utf8.hpp"

namespace slotest::harness {

namespace {

// Splits lines the way a text-mode read does: "\n", "\r\n" and a lone "\r"
// all end a line. `terminated` is false for a final line with no ending.
auto ReadLine(std::istream& in, std::string& line, bool& terminated) -> bool {
  using Traits = std::istream::traits_type;
  line.clear();
  terminated = false;
  for (auto c = in.get(); !Traits::eq_int_type(c, Traits::eof());
       c = in.get()) {
    if (c == '\n') {
      terminated = true;
      return true;
    }
    if (c == '\r') {
      if (in.peek() == '\n') {
        in.get();
      }
      terminated = true;
      return true;
    }
    line.push_back(Traits::to_char_type(c));
  }
  return !line.empty();
}

}  // namespace

ErrorClassifier::ErrorClassifier(
    std::string marker, const std::vector<std::string>& allow_list)
    : marker_(std::move(marker)),
      allow_list_(allow_list.begin(), allow_list.end()) {
}

auto ErrorClassifier::IsExpectedError(
    const std::filesystem::path& script) const -> Result<bool> {
  auto marked = HasMarker(script);
  if (!marked) {
    return std::unexpected(std::move(marked.error()));
  }
  return *marked || IsAllowListed(script);
}

auto ErrorClassifier::HasMarker(const std::filesystem::path& script) const
    -> Result<bool> {
  std::ifstream in(script, std::ios::binary);
  if (!in) {
    return std::unexpected(
        Diagnostic::IoError(script, "cannot open script for reading"));
  }

  std::string line;
  bool terminated = false;
  for (std::size_t line_number = 1; line_number <= kMarkerWindow;
       ++line_number) {
    if (!ReadLine(in, line, terminated)) {
      break;
    }
    if (!common::IsValidUtf8(line)) {
      return std::unexpected(
          Diagnostic::IoError(
              script,
              fmt::format("line {} is not valid UTF-8", line_number)));
    }
    if (terminated && line == marker_) {
      return true;
    }
  }

  if (in.bad()) {
    return std::unexpected(
        Diagnostic::IoError(script, "read error while scanning for marker"));
  }
  return false;
}

auto ErrorClassifier::IsAllowListed(const std::filesystem::path& script) const
    -> bool {
  return allow_list_.contains(script.filename().string());
}

}  // namespace slotest::harness
