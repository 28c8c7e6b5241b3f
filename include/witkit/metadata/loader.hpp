#pragma once

#include <filesystem>
#include <string_view>

#include "witkit/common/diagnostic.hpp"
#include "witkit/common/typ.hpp"
#include "witkit/metadata/component.hpp"

namespace witkit::metadata {

// Reads a component metadata document (YAML, or JSON which is a subset):
//
//   component: shopping-cart
//   versions:
//     - version: 1
//       exports:
//         - name: golem:it/api
//           functions:
//             - name: add-item
//               parameters:
//                 - name: item
//                   typ: {type: Record, fields: [...]}
//               results:
//                 - typ: {type: Str}
//
// A document with top-level `exports` (and optional `version`) is read as a
// single-version component. Type tags the loader does not know become
// TypKind::kUnknown instead of failing the whole document.
auto LoadComponentFile(const std::filesystem::path& path)
    -> Result<ComponentMetadata>;

auto ParseComponentMetadata(
    std::string_view text, std::string_view source_name = "<input>")
    -> Result<ComponentMetadata>;

// A single type in wire schema, e.g. "{type: List, inner: {type: Str}}".
auto ParseTypText(std::string_view text) -> Result<Typ>;

}  // namespace witkit::metadata
