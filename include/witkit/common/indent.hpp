#pragma once

#include <string>

namespace witkit::common {

enum class FormatMode {
  kCompact,  // Single line, no whitespace between tokens
  kPretty    // One entry per line, nested levels indented
};

inline auto Indent(int level, int spaces_per_level = 2) -> std::string {
  // NOLINTNEXTLINE(modernize-return-braced-init-list)
  return std::string(static_cast<size_t>(level * spaces_per_level), ' ');
}

}  // namespace witkit::common
