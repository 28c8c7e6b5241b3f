#pragma once

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace witkit {

enum class DiagKind : uint8_t {
  kError,      // Malformed metadata or argument text
  kHostError,  // I/O, missing files, bad configuration
  kNote,       // Auxiliary message
};

// Where in an input document a diagnostic points. Both parts are optional:
// JSON typed into the editor has no file, and some yaml-cpp nodes carry no
// mark.
struct DiagLocation {
  std::string file;
  std::optional<uint32_t> line;  // 1-based

  auto operator==(const DiagLocation&) const -> bool = default;
};

struct DiagItem {
  DiagKind kind;
  std::optional<DiagLocation> location;
  std::string message;

  auto operator==(const DiagItem&) const -> bool = default;
};

struct Diagnostic {
  DiagItem primary;
  std::vector<DiagItem> notes;

  auto operator==(const Diagnostic&) const -> bool = default;

  static auto Error(std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kError,
             .location = std::nullopt,
             .message = std::move(msg)},
        .notes = {},
    };
  }

  static auto Error(DiagLocation location, std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kError,
             .location = std::move(location),
             .message = std::move(msg)},
        .notes = {},
    };
  }

  static auto HostError(std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kHostError,
             .location = std::nullopt,
             .message = std::move(msg)},
        .notes = {},
    };
  }

  auto WithNote(std::string msg) && -> Diagnostic {
    notes.push_back(
        DiagItem{
            .kind = DiagKind::kNote,
            .location = std::nullopt,
            .message = std::move(msg),
        });
    return std::move(*this);
  }
};

template <typename T>
using Result = std::expected<T, Diagnostic>;

class DiagnosticException : public std::exception {
 public:
  explicit DiagnosticException(Diagnostic diag) : diag_(std::move(diag)) {
  }

  [[nodiscard]] auto GetDiagnostic() const -> const Diagnostic& {
    return diag_;
  }
  [[nodiscard]] auto what() const noexcept -> const char* override {
    return diag_.primary.message.c_str();
  }

 private:
  Diagnostic diag_;
};

// "file:line: message", dropping whichever location parts are missing.
auto FormatDiagItem(const DiagItem& item) -> std::string;

}  // namespace witkit
