#pragma once

#include <stdexcept>
#include <string>

#include <fmt/core.h>

namespace witkit::common {

// Raised for broken invariants inside witkit, never for bad user input.
class InternalError : public std::runtime_error {
 public:
  InternalError(const char* context, const std::string& detail)
      : std::runtime_error(
            fmt::format(
                "Internal error in {}: {}\n"
                "This is a bug in witkit, not in the component metadata.",
                context, detail)) {
  }
};

[[noreturn]] inline void ThrowInternalError(
    const char* context, const std::string& detail) {
  throw InternalError(context, detail);
}

}  // namespace witkit::common
