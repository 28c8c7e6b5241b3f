#include "witkit/common/typ.hpp"

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <absl/container/flat_hash_set.h>
#include <fmt/core.h>

#include "witkit/common/internal_error.hpp"

namespace witkit {

namespace {

auto SameTyp(const TypPtr& lhs, const TypPtr& rhs) -> bool {
  if (lhs == nullptr || rhs == nullptr) {
    return lhs == rhs;
  }
  return *lhs == *rhs;
}

// Names inside one record/variant/enum must be unique. `what` names the
// member kind for the message ("field", "case").
template <typename Range, typename Proj>
void RejectDuplicateNames(
    const Range& members, Proj name_of, std::string_view composite,
    std::string_view what) {
  absl::flat_hash_set<std::string_view> seen;
  seen.reserve(members.size());
  for (const auto& member : members) {
    std::string_view name = name_of(member);
    if (!seen.insert(name).second) {
      throw std::runtime_error(
          fmt::format("duplicate {} name '{}' in {}", what, name, composite));
    }
  }
}

template <typename T>
auto Get(const TypPayload& payload, TypKind actual, const char* accessor)
    -> const T& {
  const auto* data = std::get_if<T>(&payload);
  if (data == nullptr) {
    common::ThrowInternalError(
        accessor, fmt::format("called on a {} type", actual));
  }
  return *data;
}

}  // namespace

auto ListTyp::operator==(const ListTyp& other) const -> bool {
  return SameTyp(inner, other.inner);
}

auto OptionTyp::operator==(const OptionTyp& other) const -> bool {
  return SameTyp(inner, other.inner);
}

auto ResultTyp::operator==(const ResultTyp& other) const -> bool {
  return SameTyp(ok, other.ok) && SameTyp(err, other.err);
}

auto TupleTyp::operator==(const TupleTyp& other) const -> bool {
  if (elements.size() != other.elements.size()) {
    return false;
  }
  for (size_t i = 0; i < elements.size(); ++i) {
    if (!SameTyp(elements[i], other.elements[i])) {
      return false;
    }
  }
  return true;
}

auto RecordField::operator==(const RecordField& other) const -> bool {
  return name == other.name && SameTyp(typ, other.typ);
}

auto VariantCase::operator==(const VariantCase& other) const -> bool {
  return name == other.name && SameTyp(typ, other.typ);
}

auto Typ::Primitive(TypKind kind) -> Typ {
  if (!witkit::IsPrimitive(kind)) {
    throw std::runtime_error(
        fmt::format("{} is not a primitive type", kind));
  }
  return Typ{kind, std::monostate{}};
}

auto Typ::List(Typ inner) -> Typ {
  return Typ{TypKind::kList, ListTyp{.inner = MakeTypPtr(std::move(inner))}};
}

auto Typ::Option(Typ inner) -> Typ {
  return Typ{
      TypKind::kOption, OptionTyp{.inner = MakeTypPtr(std::move(inner))}};
}

auto Typ::Result(Typ ok, Typ err) -> Typ {
  return Result(MakeTypPtr(std::move(ok)), MakeTypPtr(std::move(err)));
}

auto Typ::Result(TypPtr ok, TypPtr err) -> Typ {
  return Typ{
      TypKind::kResult, ResultTyp{.ok = std::move(ok), .err = std::move(err)}};
}

auto Typ::Tuple(std::vector<Typ> elements) -> Typ {
  TupleTyp data;
  data.elements.reserve(elements.size());
  for (auto& element : elements) {
    data.elements.push_back(MakeTypPtr(std::move(element)));
  }
  return Typ{TypKind::kTuple, std::move(data)};
}

auto Typ::Record(std::vector<RecordField> fields) -> Typ {
  RejectDuplicateNames(
      fields, [](const RecordField& f) -> std::string_view { return f.name; },
      "record", "field");
  return Typ{TypKind::kRecord, RecordTyp{.fields = std::move(fields)}};
}

auto Typ::Variant(std::vector<VariantCase> cases) -> Typ {
  RejectDuplicateNames(
      cases, [](const VariantCase& c) -> std::string_view { return c.name; },
      "variant", "case");
  return Typ{TypKind::kVariant, VariantTyp{.cases = std::move(cases)}};
}

auto Typ::Enum(std::vector<std::string> cases) -> Typ {
  RejectDuplicateNames(
      cases, [](const std::string& c) -> std::string_view { return c; }, "enum",
      "case");
  return Typ{TypKind::kEnum, EnumTyp{.cases = std::move(cases)}};
}

auto Typ::Unknown(std::string tag) -> Typ {
  return Typ{TypKind::kUnknown, UnknownTyp{.tag = std::move(tag)}};
}

auto Typ::IsPrimitive() const -> bool {
  return witkit::IsPrimitive(kind_);
}

auto Typ::IsInteger() const -> bool {
  return witkit::IsInteger(kind_);
}

auto Typ::IsFloat() const -> bool {
  return witkit::IsFloat(kind_);
}

auto Typ::AsList() const -> const ListTyp& {
  return Get<ListTyp>(payload_, kind_, "Typ::AsList");
}

auto Typ::AsOption() const -> const OptionTyp& {
  return Get<OptionTyp>(payload_, kind_, "Typ::AsOption");
}

auto Typ::AsResult() const -> const ResultTyp& {
  return Get<ResultTyp>(payload_, kind_, "Typ::AsResult");
}

auto Typ::AsTuple() const -> const TupleTyp& {
  return Get<TupleTyp>(payload_, kind_, "Typ::AsTuple");
}

auto Typ::AsRecord() const -> const RecordTyp& {
  return Get<RecordTyp>(payload_, kind_, "Typ::AsRecord");
}

auto Typ::AsVariant() const -> const VariantTyp& {
  return Get<VariantTyp>(payload_, kind_, "Typ::AsVariant");
}

auto Typ::AsEnum() const -> const EnumTyp& {
  return Get<EnumTyp>(payload_, kind_, "Typ::AsEnum");
}

auto Typ::AsUnknown() const -> const UnknownTyp& {
  return Get<UnknownTyp>(payload_, kind_, "Typ::AsUnknown");
}

auto Typ::TagName() const -> std::string {
  if (kind_ == TypKind::kUnknown) {
    return AsUnknown().tag;
  }
  return std::string(ToString(kind_));
}

auto MakeTypPtr(Typ typ) -> TypPtr {
  return std::make_shared<const Typ>(std::move(typ));
}

auto Field(std::string name, Typ typ) -> RecordField {
  return RecordField{.name = std::move(name), .typ = MakeTypPtr(std::move(typ))};
}

auto Case(std::string name, Typ typ) -> VariantCase {
  return VariantCase{.name = std::move(name), .typ = MakeTypPtr(std::move(typ))};
}

auto Case(std::string name) -> VariantCase {
  return VariantCase{.name = std::move(name), .typ = nullptr};
}

auto IsPrimitive(TypKind kind) -> bool {
  return kind >= TypKind::kBool && kind <= TypKind::kStr;
}

auto IsInteger(TypKind kind) -> bool {
  return kind >= TypKind::kS8 && kind <= TypKind::kU64;
}

auto IsFloat(TypKind kind) -> bool {
  return kind == TypKind::kF32 || kind == TypKind::kF64;
}

auto ToString(TypKind kind) -> std::string_view {
  switch (kind) {
    case TypKind::kBool:
      return "Bool";
    case TypKind::kS8:
      return "S8";
    case TypKind::kS16:
      return "S16";
    case TypKind::kS32:
      return "S32";
    case TypKind::kS64:
      return "S64";
    case TypKind::kU8:
      return "U8";
    case TypKind::kU16:
      return "U16";
    case TypKind::kU32:
      return "U32";
    case TypKind::kU64:
      return "U64";
    case TypKind::kF32:
      return "F32";
    case TypKind::kF64:
      return "F64";
    case TypKind::kChar:
      return "Chr";
    case TypKind::kStr:
      return "Str";
    case TypKind::kList:
      return "List";
    case TypKind::kOption:
      return "Option";
    case TypKind::kResult:
      return "Result";
    case TypKind::kTuple:
      return "Tuple";
    case TypKind::kRecord:
      return "Record";
    case TypKind::kVariant:
      return "Variant";
    case TypKind::kEnum:
      return "Enum";
    case TypKind::kUnknown:
      return "Unknown";
  }
  return "Unknown";
}

auto TypKindFromTag(std::string_view tag) -> std::optional<TypKind> {
  if (tag == "Char") {
    return TypKind::kChar;
  }
  for (auto raw = static_cast<uint8_t>(TypKind::kBool);
       raw < static_cast<uint8_t>(TypKind::kUnknown); ++raw) {
    auto kind = static_cast<TypKind>(raw);
    if (ToString(kind) == tag) {
      return kind;
    }
  }
  return std::nullopt;
}

}  // namespace witkit
