#pragma once

#include <string>
#include <vector>

#include "witkit/codec/payload.hpp"
#include "witkit/common/indent.hpp"
#include "witkit/common/typ.hpp"
#include "witkit/common/value.hpp"

namespace witkit::wire {

// Typ in the metadata/wire schema, e.g.
//   {"type": "List", "inner": {"type": "Str"}}
//   {"type": "Record", "fields": [{"name": "id", "typ": {"type": "U64"}}]}
auto TypToValue(const Typ& typ) -> Value;

// Invocation body: {"params": [{"value": ..., "typ": ...}, ...]}
auto PayloadToValue(const std::vector<codec::EncodedArgument>& arguments)
    -> Value;

auto SerializePayload(
    const std::vector<codec::EncodedArgument>& arguments,
    common::FormatMode mode) -> std::string;

}  // namespace witkit::wire
