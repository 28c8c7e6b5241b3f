#include "witkit/common/diagnostic.hpp"

#include <string>

#include <fmt/core.h>

namespace witkit {

auto FormatDiagItem(const DiagItem& item) -> std::string {
  if (!item.location) {
    return item.message;
  }
  const auto& loc = *item.location;
  if (loc.file.empty()) {
    if (loc.line) {
      return fmt::format("line {}: {}", *loc.line, item.message);
    }
    return item.message;
  }
  if (loc.line) {
    return fmt::format("{}:{}: {}", loc.file, *loc.line, item.message);
  }
  return fmt::format("{}: {}", loc.file, item.message);
}

}  // namespace witkit
