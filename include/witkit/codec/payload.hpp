#pragma once

#include <span>
#include <vector>

#include "witkit/common/typ.hpp"
#include "witkit/common/value.hpp"
#include "witkit/metadata/component.hpp"

namespace witkit::codec {

// One invocation argument as the transport expects it.
struct EncodedArgument {
  Value value;
  Typ typ;
};

// Normalizes an edited value for its declared type:
//   primitives, Tuple, Record, Enum -> value unchanged
//   List                            -> value if already a sequence,
//                                      otherwise a one-element sequence
// Anything else (Option, Result, Variant, unknown tags) throws
// common::UnsupportedTypeError carrying the tag name.
auto EncodeArgument(Value value, const Typ& typ) -> EncodedArgument;

// Pairs values with fn's parameters by position. A missing trailing value
// is encoded as null; surplus values are ignored.
auto EncodePayload(
    std::span<const Value> values, const metadata::ExportedFunction& fn)
    -> std::vector<EncodedArgument>;

}  // namespace witkit::codec
