#pragma once

#include <vector>

#include "witkit/common/typ.hpp"
#include "witkit/common/value.hpp"
#include "witkit/metadata/component.hpp"

namespace witkit::skeleton {

// Default value an argument editor starts from:
//   Str, Char, Enum      -> ""
//   Bool                 -> false
//   integers, floats     -> 0
//   Record               -> mapping of field name -> skeleton, field order
//   Tuple                -> sequence of element skeletons
//   List                 -> empty sequence
//   Option and the rest  -> null
// Total and deterministic.
auto BuildSkeleton(const Typ& typ) -> Value;

// One skeleton per parameter, in parameter order.
auto BuildArgumentSkeleton(const metadata::ExportedFunction& fn)
    -> std::vector<Value>;

}  // namespace witkit::skeleton
