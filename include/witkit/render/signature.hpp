#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "witkit/common/typ.hpp"
#include "witkit/metadata/component.hpp"

namespace witkit::render {

// Compact inline label plus the expanded, copyable declaration. For
// primitives the two are identical except Str ("string" / "String").
struct RenderedType {
  std::string short_form;
  std::string full;

  auto operator==(const RenderedType&) const -> bool = default;
};

// Total over every Typ, empty composites included. Never throws.
auto RenderType(const Typ& typ) -> RenderedType;

// Absent type (partially loaded metadata): {"null", "null"}.
auto RenderType(const Typ* typ) -> RenderedType;

struct RenderedParameter {
  std::string name;
  RenderedType type;
};

// One row of the export listing.
struct FunctionSignature {
  std::string package;       // Exported interface name
  std::string display_name;  // camelCase form of the WIT name
  std::string wit_name;      // Name as declared, used for invocation
  std::vector<RenderedParameter> parameters;
  std::optional<RenderedType> result;  // nullopt renders as "void"
};

auto RenderFunction(
    std::string_view package, const metadata::ExportedFunction& fn)
    -> FunctionSignature;

// Every function of every export, in document order.
auto RenderExports(const metadata::ComponentVersion& version)
    -> std::vector<FunctionSignature>;

// "addItem(item: record, count: u32) => result<string, string>"
auto FormatSignature(const FunctionSignature& sig) -> std::string;

// Case-insensitive substring match on the display name. An empty query
// keeps every signature.
auto FilterSignatures(
    const std::vector<FunctionSignature>& signatures, std::string_view query)
    -> std::vector<FunctionSignature>;

}  // namespace witkit::render
