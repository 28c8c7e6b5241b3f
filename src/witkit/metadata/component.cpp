#include "witkit/metadata/component.hpp"

#include <cstdint>
#include <optional>
#include <string_view>

#include "witkit/common/string_utils.hpp"

namespace witkit::metadata {

namespace {

struct QualifiedName {
  std::string_view iface;
  std::string_view function;
};

// "iface.{function}" -> {iface, function}; plain names have an empty iface.
auto SplitQualifiedName(std::string_view name) -> QualifiedName {
  auto open = name.rfind(".{");
  if (open == std::string_view::npos || !name.ends_with('}')) {
    return {.iface = {}, .function = name};
  }
  return {
      .iface = name.substr(0, open),
      .function = name.substr(open + 2, name.size() - open - 3),
  };
}

auto MatchesFunctionName(const ExportedFunction& fn, std::string_view name)
    -> bool {
  return fn.name == name || common::KebabToCamel(fn.name) == name;
}

}  // namespace

auto ExportedFunction::ReturnType() const -> const Typ* {
  if (results.empty()) {
    return nullptr;
  }
  return &results.front().typ;
}

auto LatestVersion(const ComponentMetadata& component)
    -> const ComponentVersion* {
  const ComponentVersion* latest = nullptr;
  for (const auto& version : component.versions) {
    if (latest == nullptr || version.version > latest->version) {
      latest = &version;
    }
  }
  return latest;
}

auto FindVersion(const ComponentMetadata& component, uint64_t version)
    -> const ComponentVersion* {
  for (const auto& candidate : component.versions) {
    if (candidate.version == version) {
      return &candidate;
    }
  }
  return nullptr;
}

auto FindFunction(const ComponentVersion& version, std::string_view name)
    -> std::optional<FunctionRef> {
  auto qualified = SplitQualifiedName(name);
  for (const auto& iface : version.exports) {
    if (!qualified.iface.empty() && iface.name != qualified.iface) {
      continue;
    }
    for (const auto& fn : iface.functions) {
      if (MatchesFunctionName(fn, qualified.function)) {
        return FunctionRef{.iface = &iface, .function = &fn};
      }
    }
  }
  return std::nullopt;
}

}  // namespace witkit::metadata
