#include "witkit/common/value.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include <fmt/core.h>

#include "witkit/common/internal_error.hpp"
#include "witkit/common/overloaded.hpp"

namespace witkit {

namespace {

// Numeric view used for cross-representation comparison.
struct NumberView {
  enum class Rep { kSigned, kUnsigned, kDouble } rep;
  int64_t s = 0;
  uint64_t u = 0;
  double d = 0.0;
};

auto AsNumberView(const Value& v) -> std::optional<NumberView> {
  return std::visit(
      Overloaded{
          [](int64_t s) -> std::optional<NumberView> {
            return NumberView{.rep = NumberView::Rep::kSigned, .s = s};
          },
          [](uint64_t u) -> std::optional<NumberView> {
            return NumberView{.rep = NumberView::Rep::kUnsigned, .u = u};
          },
          [](double d) -> std::optional<NumberView> {
            return NumberView{.rep = NumberView::Rep::kDouble, .d = d};
          },
          [](const auto&) -> std::optional<NumberView> {
            return std::nullopt;
          },
      },
      v.data);
}

auto ToDouble(const NumberView& n) -> double {
  switch (n.rep) {
    case NumberView::Rep::kSigned:
      return static_cast<double>(n.s);
    case NumberView::Rep::kUnsigned:
      return static_cast<double>(n.u);
    case NumberView::Rep::kDouble:
      return n.d;
  }
  return n.d;
}

auto SameNumber(const NumberView& a, const NumberView& b) -> bool {
  using Rep = NumberView::Rep;
  if (a.rep == Rep::kDouble || b.rep == Rep::kDouble) {
    return ToDouble(a) == ToDouble(b);
  }
  if (a.rep == Rep::kSigned && b.rep == Rep::kSigned) {
    return a.s == b.s;
  }
  if (a.rep == Rep::kUnsigned && b.rep == Rep::kUnsigned) {
    return a.u == b.u;
  }
  const auto& signed_side = a.rep == Rep::kSigned ? a : b;
  const auto& unsigned_side = a.rep == Rep::kSigned ? b : a;
  return signed_side.s >= 0 &&
         static_cast<uint64_t>(signed_side.s) == unsigned_side.u;
}

}  // namespace

auto operator==(const Value& lhs, const Value& rhs) -> bool {
  auto lhs_num = AsNumberView(lhs);
  auto rhs_num = AsNumberView(rhs);
  if (lhs_num || rhs_num) {
    return lhs_num && rhs_num && SameNumber(*lhs_num, *rhs_num);
  }
  if (lhs.data.index() != rhs.data.index()) {
    return false;
  }
  return std::visit(
      Overloaded{
          [](const NullValue&, const NullValue&) { return true; },
          [](bool a, bool b) { return a == b; },
          [](const std::string& a, const std::string& b) { return a == b; },
          [](const ValueSequence& a, const ValueSequence& b) { return a == b; },
          [](const ValueMapping& a, const ValueMapping& b) { return a == b; },
          [](const auto&, const auto&) { return false; },
      },
      lhs.data, rhs.data);
}

auto MakeNull() -> Value {
  return Value{.data = NullValue{}};
}

auto MakeBool(bool value) -> Value {
  return Value{.data = value};
}

auto MakeInteger(int64_t value) -> Value {
  return Value{.data = value};
}

auto MakeUnsigned(uint64_t value) -> Value {
  return Value{.data = value};
}

auto MakeNumber(double value) -> Value {
  return Value{.data = value};
}

auto MakeString(std::string value) -> Value {
  return Value{.data = std::move(value)};
}

auto MakeSequence(ValueSequence elements) -> Value {
  return Value{.data = std::move(elements)};
}

auto MakeMapping(ValueMapping entries) -> Value {
  return Value{.data = std::move(entries)};
}

auto IsNull(const Value& v) -> bool {
  return std::holds_alternative<NullValue>(v.data);
}

auto IsBool(const Value& v) -> bool {
  return std::holds_alternative<bool>(v.data);
}

auto IsNumber(const Value& v) -> bool {
  return std::holds_alternative<int64_t>(v.data) ||
         std::holds_alternative<uint64_t>(v.data) ||
         std::holds_alternative<double>(v.data);
}

auto IsString(const Value& v) -> bool {
  return std::holds_alternative<std::string>(v.data);
}

auto IsSequence(const Value& v) -> bool {
  return std::holds_alternative<ValueSequence>(v.data);
}

auto IsMapping(const Value& v) -> bool {
  return std::holds_alternative<ValueMapping>(v.data);
}

auto AsBool(const Value& v) -> bool {
  if (!IsBool(v)) {
    common::ThrowInternalError(
        "AsBool", fmt::format("value is a {}", ShapeName(v)));
  }
  return std::get<bool>(v.data);
}

auto AsString(const Value& v) -> const std::string& {
  if (!IsString(v)) {
    common::ThrowInternalError(
        "AsString", fmt::format("value is a {}", ShapeName(v)));
  }
  return std::get<std::string>(v.data);
}

auto AsSequence(const Value& v) -> const ValueSequence& {
  if (!IsSequence(v)) {
    common::ThrowInternalError(
        "AsSequence", fmt::format("value is a {}", ShapeName(v)));
  }
  return std::get<ValueSequence>(v.data);
}

auto AsSequence(Value& v) -> ValueSequence& {
  if (!IsSequence(v)) {
    common::ThrowInternalError(
        "AsSequence", fmt::format("value is a {}", ShapeName(v)));
  }
  return std::get<ValueSequence>(v.data);
}

auto AsMapping(const Value& v) -> const ValueMapping& {
  if (!IsMapping(v)) {
    common::ThrowInternalError(
        "AsMapping", fmt::format("value is a {}", ShapeName(v)));
  }
  return std::get<ValueMapping>(v.data);
}

auto AsMapping(Value& v) -> ValueMapping& {
  if (!IsMapping(v)) {
    common::ThrowInternalError(
        "AsMapping", fmt::format("value is a {}", ShapeName(v)));
  }
  return std::get<ValueMapping>(v.data);
}

auto FindEntry(const Value& v, std::string_view key) -> const Value* {
  const auto* mapping = std::get_if<ValueMapping>(&v.data);
  if (mapping == nullptr) {
    return nullptr;
  }
  for (const auto& [entry_key, entry_value] : *mapping) {
    if (entry_key == key) {
      return &entry_value;
    }
  }
  return nullptr;
}

auto ShapeName(const Value& v) -> const char* {
  return std::visit(
      Overloaded{
          [](const NullValue&) { return "null"; },
          [](bool) { return "bool"; },
          [](int64_t) { return "number"; },
          [](uint64_t) { return "number"; },
          [](double) { return "number"; },
          [](const std::string&) { return "string"; },
          [](const ValueSequence&) { return "sequence"; },
          [](const ValueMapping&) { return "mapping"; },
      },
      v.data);
}

}  // namespace witkit
