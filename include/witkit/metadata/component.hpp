#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "witkit/common/typ.hpp"

namespace witkit::metadata {

struct Parameter {
  std::string name;
  Typ typ;
};

struct FunctionResult {
  std::optional<std::string> name;  // Results are usually unnamed
  Typ typ;
};

struct ExportedFunction {
  std::string name;  // kebab-case, as declared in WIT
  std::vector<Parameter> parameters;
  std::vector<FunctionResult> results;

  // Only the first result is shown as the return type; nullptr if the
  // function returns nothing.
  [[nodiscard]] auto ReturnType() const -> const Typ*;
};

// One exported interface ("golem:api/store") and its functions.
struct ExportedInterface {
  std::string name;
  std::vector<ExportedFunction> functions;
};

struct ComponentVersion {
  uint64_t version = 0;
  std::vector<ExportedInterface> exports;
};

struct ComponentMetadata {
  std::string name;
  std::vector<ComponentVersion> versions;
};

// Highest version number, or nullptr when there are no versions.
auto LatestVersion(const ComponentMetadata& component)
    -> const ComponentVersion*;

auto FindVersion(const ComponentMetadata& component, uint64_t version)
    -> const ComponentVersion*;

struct FunctionRef {
  const ExportedInterface* iface;
  const ExportedFunction* function;
};

// Accepts the declared kebab-case name ("add-item"), its camelCase display
// name ("addItem"), or an interface-qualified name
// ("golem:api/store.{add-item}"). The first match in document order wins.
auto FindFunction(const ComponentVersion& version, std::string_view name)
    -> std::optional<FunctionRef>;

}  // namespace witkit::metadata
