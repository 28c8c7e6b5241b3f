#include "witkit/render/signature.hpp"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <fmt/ranges.h>

#include "witkit/common/indent.hpp"
#include "witkit/common/string_utils.hpp"
#include "witkit/common/typ.hpp"

namespace witkit::render {

namespace {

auto Same(std::string text) -> RenderedType {
  return RenderedType{.short_form = text, .full = text};
}

auto RenderPrimitive(TypKind kind) -> RenderedType {
  switch (kind) {
    case TypKind::kBool:
      return Same("bool");
    case TypKind::kS8:
      return Same("i8");
    case TypKind::kS16:
      return Same("i16");
    case TypKind::kS32:
      return Same("i32");
    case TypKind::kS64:
      return Same("i64");
    case TypKind::kU8:
      return Same("u8");
    case TypKind::kU16:
      return Same("u16");
    case TypKind::kU32:
      return Same("u32");
    case TypKind::kU64:
      return Same("u64");
    case TypKind::kF32:
      return Same("f32");
    case TypKind::kF64:
      return Same("f64");
    case TypKind::kChar:
      return Same("char");
    case TypKind::kStr:
      return RenderedType{.short_form = "string", .full = "String"};
    default:
      return Same("unknown");
  }
}

// Record full form: a JSON object of field name -> full type text, two
// spaces per level. Nested multi-line declarations end up escaped inside
// the string value.
auto RenderRecordFull(const RecordTyp& record) -> std::string {
  if (record.fields.empty()) {
    return "{}";
  }
  std::vector<std::string> lines;
  lines.reserve(record.fields.size());
  for (const auto& field : record.fields) {
    lines.push_back(
        fmt::format(
            "{}\"{}\": \"{}\"", common::Indent(1),
            common::EscapeForJsonString(field.name),
            common::EscapeForJsonString(RenderType(field.typ.get()).full)));
  }
  return fmt::format("{{\n{}\n}}", fmt::join(lines, ",\n"));
}

auto RenderVariantFull(const VariantTyp& variant) -> std::string {
  if (variant.cases.empty()) {
    return "enum {}";
  }
  std::vector<std::string> cases;
  cases.reserve(variant.cases.size());
  for (const auto& c : variant.cases) {
    std::string payload = c.typ ? RenderType(*c.typ).full : std::string();
    cases.push_back(
        fmt::format(
            "{}{}({})", common::Indent(1), common::Capitalize(c.name),
            payload));
  }
  return fmt::format("enum {{\n{}\n}}", fmt::join(cases, ",\n"));
}

auto RenderEnumFull(const EnumTyp& enumeration) -> std::string {
  if (enumeration.cases.empty()) {
    return "enum ()";
  }
  std::vector<std::string> cases;
  cases.reserve(enumeration.cases.size());
  for (const auto& c : enumeration.cases) {
    cases.push_back(common::Indent(1) + common::Capitalize(c));
  }
  return fmt::format("enum (\n{}\n)", fmt::join(cases, ",\n"));
}

}  // namespace

auto RenderType(const Typ& typ) -> RenderedType {
  switch (typ.Kind()) {
    case TypKind::kBool:
    case TypKind::kS8:
    case TypKind::kS16:
    case TypKind::kS32:
    case TypKind::kS64:
    case TypKind::kU8:
    case TypKind::kU16:
    case TypKind::kU32:
    case TypKind::kU64:
    case TypKind::kF32:
    case TypKind::kF64:
    case TypKind::kChar:
    case TypKind::kStr:
      return RenderPrimitive(typ.Kind());

    case TypKind::kList: {
      auto inner = RenderType(typ.AsList().inner.get());
      return RenderedType{
          .short_form = fmt::format("list<{}>", inner.short_form),
          .full = fmt::format("list<{}>", inner.full)};
    }

    case TypKind::kOption: {
      auto inner = RenderType(typ.AsOption().inner.get());
      return RenderedType{
          .short_form = fmt::format("option<{}>", inner.short_form),
          .full = fmt::format("Option<{}>", inner.full)};
    }

    case TypKind::kResult: {
      const auto& result = typ.AsResult();
      auto ok = RenderType(result.ok.get());
      auto err = RenderType(result.err.get());
      return RenderedType{
          .short_form =
              fmt::format("result<{}, {}>", ok.short_form, err.short_form),
          .full = fmt::format("Result<{}, {}>", ok.full, err.full)};
    }

    case TypKind::kTuple: {
      std::vector<std::string> shorts;
      std::vector<std::string> fulls;
      for (const auto& element : typ.AsTuple().elements) {
        auto rendered = RenderType(element.get());
        shorts.push_back(std::move(rendered.short_form));
        fulls.push_back(std::move(rendered.full));
      }
      return RenderedType{
          .short_form = fmt::format("tuple<{}>", fmt::join(shorts, ", ")),
          .full = fmt::format("({})", fmt::join(fulls, ", "))};
    }

    case TypKind::kRecord:
      return RenderedType{
          .short_form = "record", .full = RenderRecordFull(typ.AsRecord())};

    case TypKind::kVariant:
      return RenderedType{
          .short_form = "variant",
          .full = RenderVariantFull(typ.AsVariant())};

    case TypKind::kEnum:
      return RenderedType{
          .short_form = "enum", .full = RenderEnumFull(typ.AsEnum())};

    case TypKind::kUnknown:
      return Same("unknown");
  }
  return Same("unknown");
}

auto RenderType(const Typ* typ) -> RenderedType {
  if (typ == nullptr) {
    return Same("null");
  }
  return RenderType(*typ);
}

auto RenderFunction(
    std::string_view package, const metadata::ExportedFunction& fn)
    -> FunctionSignature {
  FunctionSignature sig{
      .package = std::string(package),
      .display_name = common::KebabToCamel(fn.name),
      .wit_name = fn.name,
      .parameters = {},
      .result = std::nullopt,
  };
  sig.parameters.reserve(fn.parameters.size());
  for (const auto& param : fn.parameters) {
    sig.parameters.push_back(
        RenderedParameter{.name = param.name, .type = RenderType(param.typ)});
  }
  if (const auto* ret = fn.ReturnType()) {
    sig.result = RenderType(*ret);
  }
  return sig;
}

auto RenderExports(const metadata::ComponentVersion& version)
    -> std::vector<FunctionSignature> {
  std::vector<FunctionSignature> signatures;
  for (const auto& iface : version.exports) {
    for (const auto& fn : iface.functions) {
      signatures.push_back(RenderFunction(iface.name, fn));
    }
  }
  return signatures;
}

auto FormatSignature(const FunctionSignature& sig) -> std::string {
  std::vector<std::string> params;
  params.reserve(sig.parameters.size());
  for (const auto& param : sig.parameters) {
    params.push_back(fmt::format("{}: {}", param.name, param.type.short_form));
  }
  return fmt::format(
      "{}({}) => {}", sig.display_name, fmt::join(params, ", "),
      sig.result ? sig.result->short_form : "void");
}

auto FilterSignatures(
    const std::vector<FunctionSignature>& signatures, std::string_view query)
    -> std::vector<FunctionSignature> {
  std::vector<FunctionSignature> matches;
  for (const auto& sig : signatures) {
    if (common::ContainsIgnoreCase(sig.display_name, query)) {
      matches.push_back(sig);
    }
  }
  return matches;
}

}  // namespace witkit::render
