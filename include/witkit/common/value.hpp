#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace witkit {

struct Value;

struct NullValue {
  auto operator==(const NullValue&) const -> bool = default;
};

using ValueSequence = std::vector<Value>;

// Ordered mapping: keys keep insertion order, which for a record skeleton is
// field declaration order.
using ValueMapping = std::vector<std::pair<std::string, Value>>;

// Untyped, JSON-shaped value exchanged with the argument editor. It mirrors
// a Typ structurally but carries no tags of its own.
struct Value {
  std::variant<
      NullValue, bool, int64_t, uint64_t, double, std::string, ValueSequence,
      ValueMapping>
      data;
};

// Structural equality. Numbers compare by value across the signed,
// unsigned and floating representations (0 == 0u == 0.0).
auto operator==(const Value& lhs, const Value& rhs) -> bool;

// Factory functions
auto MakeNull() -> Value;
auto MakeBool(bool value) -> Value;
auto MakeInteger(int64_t value) -> Value;
auto MakeUnsigned(uint64_t value) -> Value;
auto MakeNumber(double value) -> Value;
auto MakeString(std::string value) -> Value;
auto MakeSequence(ValueSequence elements) -> Value;
auto MakeMapping(ValueMapping entries) -> Value;

// Type checks
auto IsNull(const Value& v) -> bool;
auto IsBool(const Value& v) -> bool;
auto IsNumber(const Value& v) -> bool;
auto IsString(const Value& v) -> bool;
auto IsSequence(const Value& v) -> bool;
auto IsMapping(const Value& v) -> bool;

// Accessors (throw InternalError on shape mismatch)
auto AsBool(const Value& v) -> bool;
auto AsString(const Value& v) -> const std::string&;
auto AsSequence(const Value& v) -> const ValueSequence&;
auto AsSequence(Value& v) -> ValueSequence&;
auto AsMapping(const Value& v) -> const ValueMapping&;
auto AsMapping(Value& v) -> ValueMapping&;

// Mapping lookup by key; nullptr when absent or v is not a mapping.
auto FindEntry(const Value& v, std::string_view key) -> const Value*;

// Shape name for messages: "null", "bool", "number", "string", "sequence",
// "mapping".
auto ShapeName(const Value& v) -> const char*;

}  // namespace witkit
