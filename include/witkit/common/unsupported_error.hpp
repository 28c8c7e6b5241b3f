#pragma once

#include <exception>
#include <string>

namespace witkit::common {

// Raised by the payload codec for a type it cannot normalize into a wire
// argument (Option, Result, Variant, or a tag the loader did not know).
// Distinct from:
// - DiagnosticException: malformed input documents
// - InternalError: witkit bug / invariant violation
class UnsupportedTypeError final : public std::exception {
 public:
  explicit UnsupportedTypeError(std::string tag);

  // Wire tag name of the rejected type, e.g. "Option".
  [[nodiscard]] auto Tag() const -> const std::string& {
    return tag_;
  }

  [[nodiscard]] auto what() const noexcept -> const char* override {
    return message_.c_str();
  }

 private:
  std::string tag_;
  std::string message_;
};

}  // namespace witkit::common
