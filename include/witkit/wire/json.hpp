#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "witkit/common/diagnostic.hpp"
#include "witkit/common/indent.hpp"
#include "witkit/common/value.hpp"

namespace witkit::wire {

// Parses strict JSON (RFC 8259) into a Value. Member order is kept and a
// repeated key within one object is an error.
auto ParseJson(std::string_view text) -> Result<Value>;

// kCompact: {"a":1,"b":[true]}
// kPretty:  two-space indentation, one member per line
auto ToJson(const Value& value, common::FormatMode mode) -> std::string;

// Pretty-prints text that parses as JSON; otherwise returns it unchanged so
// a half-edited argument is never lost.
auto FormatJsonText(std::string_view text) -> std::string;

// Edited argument list: the top level must be a sequence, one element per
// parameter.
auto ParseArguments(std::string_view text) -> Result<std::vector<Value>>;

}  // namespace witkit::wire
