#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>

namespace slotest {

// Category of a harness-level diagnostic
enum class DiagKind : uint8_t {
  kConfig,  // Bad configuration (missing root, malformed slotest.toml)
  kIo,      // File could not be read or is not valid UTF-8
};

// A harness diagnostic, optionally attached to the file it concerns.
struct Diagnostic {
  DiagKind kind;
  std::string message;
  std::optional<std::filesystem::path> file;

  auto operator==(const Diagnostic&) const -> bool = default;

  static auto ConfigError(std::string msg) -> Diagnostic {
    return Diagnostic{
        .kind = DiagKind::kConfig,
        .message = std::move(msg),
        .file = std::nullopt,
    };
  }

  static auto IoError(std::filesystem::path file, std::string msg)
      -> Diagnostic {
    return Diagnostic{
        .kind = DiagKind::kIo,
        .message = std::move(msg),
        .file = std::move(file),
    };
  }

  // Render as "<file>: <message>" when a file is attached
  [[nodiscard]] auto Format() const -> std::string {
    if (file) {
      return file->string() + ": " + message;
    }
    return message;
  }
};

template <typename T>
using Result = std::expected<T, Diagnostic>;

}  // namespace slotest
