#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>

namespace witkit {

// Tag of a component-model interface type. The order of the primitive
// block matters: IsInteger/IsFloat/IsPrimitive test ranges of it.
enum class TypKind : uint8_t {
  kBool,
  kS8,
  kS16,
  kS32,
  kS64,
  kU8,
  kU16,
  kU32,
  kU64,
  kF32,
  kF64,
  kChar,
  kStr,
  kList,
  kOption,
  kResult,
  kTuple,
  kRecord,
  kVariant,
  kEnum,
  kUnknown,  // Tag the metadata loader did not recognize
};

class Typ;

// Children are shared and immutable; a Typ tree is never mutated after
// construction, so subtrees can be reused freely.
using TypPtr = std::shared_ptr<const Typ>;

struct ListTyp {
  TypPtr inner;

  auto operator==(const ListTyp& other) const -> bool;
};

struct OptionTyp {
  TypPtr inner;

  auto operator==(const OptionTyp& other) const -> bool;
};

// Either side may be absent (result<_, E>, result<T>, bare result).
struct ResultTyp {
  TypPtr ok;
  TypPtr err;

  auto operator==(const ResultTyp& other) const -> bool;
};

struct TupleTyp {
  std::vector<TypPtr> elements;

  auto operator==(const TupleTyp& other) const -> bool;
};

struct RecordField {
  std::string name;
  TypPtr typ;

  auto operator==(const RecordField& other) const -> bool;
};

struct RecordTyp {
  std::vector<RecordField> fields;  // Declaration order is display order

  auto operator==(const RecordTyp& other) const -> bool = default;
};

struct VariantCase {
  std::string name;
  TypPtr typ;  // nullptr for a case without payload

  auto operator==(const VariantCase& other) const -> bool;
};

struct VariantTyp {
  std::vector<VariantCase> cases;

  auto operator==(const VariantTyp& other) const -> bool = default;
};

struct EnumTyp {
  std::vector<std::string> cases;

  auto operator==(const EnumTyp& other) const -> bool = default;
};

struct UnknownTyp {
  std::string tag;  // Tag text exactly as it appeared in the metadata

  auto operator==(const UnknownTyp& other) const -> bool = default;
};

using TypPayload = std::variant<
    std::monostate, ListTyp, OptionTyp, ResultTyp, TupleTyp, RecordTyp,
    VariantTyp, EnumTyp, UnknownTyp>;

class Typ {
 public:
  static auto Bool() -> Typ {
    return Primitive(TypKind::kBool);
  }
  static auto S8() -> Typ {
    return Primitive(TypKind::kS8);
  }
  static auto S16() -> Typ {
    return Primitive(TypKind::kS16);
  }
  static auto S32() -> Typ {
    return Primitive(TypKind::kS32);
  }
  static auto S64() -> Typ {
    return Primitive(TypKind::kS64);
  }
  static auto U8() -> Typ {
    return Primitive(TypKind::kU8);
  }
  static auto U16() -> Typ {
    return Primitive(TypKind::kU16);
  }
  static auto U32() -> Typ {
    return Primitive(TypKind::kU32);
  }
  static auto U64() -> Typ {
    return Primitive(TypKind::kU64);
  }
  static auto F32() -> Typ {
    return Primitive(TypKind::kF32);
  }
  static auto F64() -> Typ {
    return Primitive(TypKind::kF64);
  }
  static auto Char() -> Typ {
    return Primitive(TypKind::kChar);
  }
  static auto Str() -> Typ {
    return Primitive(TypKind::kStr);
  }

  // Throws std::runtime_error if kind carries a payload.
  static auto Primitive(TypKind kind) -> Typ;

  static auto List(Typ inner) -> Typ;
  static auto Option(Typ inner) -> Typ;
  static auto Result(Typ ok, Typ err) -> Typ;
  static auto Result(TypPtr ok, TypPtr err) -> Typ;
  static auto Tuple(std::vector<Typ> elements) -> Typ;

  // Record, Variant and Enum throw std::runtime_error on a repeated name.
  static auto Record(std::vector<RecordField> fields) -> Typ;
  static auto Variant(std::vector<VariantCase> cases) -> Typ;
  static auto Enum(std::vector<std::string> cases) -> Typ;

  static auto Unknown(std::string tag) -> Typ;

  [[nodiscard]] auto Kind() const -> TypKind {
    return kind_;
  }

  [[nodiscard]] auto IsPrimitive() const -> bool;
  [[nodiscard]] auto IsInteger() const -> bool;
  [[nodiscard]] auto IsFloat() const -> bool;

  // Accessors (throw InternalError on kind mismatch)
  [[nodiscard]] auto AsList() const -> const ListTyp&;
  [[nodiscard]] auto AsOption() const -> const OptionTyp&;
  [[nodiscard]] auto AsResult() const -> const ResultTyp&;
  [[nodiscard]] auto AsTuple() const -> const TupleTyp&;
  [[nodiscard]] auto AsRecord() const -> const RecordTyp&;
  [[nodiscard]] auto AsVariant() const -> const VariantTyp&;
  [[nodiscard]] auto AsEnum() const -> const EnumTyp&;
  [[nodiscard]] auto AsUnknown() const -> const UnknownTyp&;

  // Wire tag ("Str", "Record", ...); for kUnknown the original tag text.
  [[nodiscard]] auto TagName() const -> std::string;

  // Structural equality: children are compared by value, not by pointer.
  auto operator==(const Typ& other) const -> bool {
    return kind_ == other.kind_ && payload_ == other.payload_;
  }

 private:
  Typ(TypKind kind, TypPayload payload)
      : kind_(kind), payload_(std::move(payload)) {
  }

  TypKind kind_;
  TypPayload payload_;
};

auto MakeTypPtr(Typ typ) -> TypPtr;

// Builders for composite members, so trees read like their WIT source:
//   Typ::Record({Field("name", Typ::Str()), Field("age", Typ::U32())})
auto Field(std::string name, Typ typ) -> RecordField;
auto Case(std::string name, Typ typ) -> VariantCase;
auto Case(std::string name) -> VariantCase;

auto IsPrimitive(TypKind kind) -> bool;
auto IsInteger(TypKind kind) -> bool;
auto IsFloat(TypKind kind) -> bool;

// Wire tag for a kind. kUnknown maps to "Unknown".
auto ToString(TypKind kind) -> std::string_view;

// Inverse of ToString; also accepts "Char" as a spelling of "Chr".
auto TypKindFromTag(std::string_view tag) -> std::optional<TypKind>;

inline auto operator<<(std::ostream& os, TypKind kind) -> std::ostream& {
  return os << ToString(kind);
}

}  // namespace witkit

template <>
struct fmt::formatter<witkit::TypKind> {
  template <typename ParseContext>
  constexpr auto parse(ParseContext& ctx) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const witkit::TypKind& kind, FormatContext& ctx) const {
    return fmt::format_to(ctx.out(), "{}", witkit::ToString(kind));
  }
};
