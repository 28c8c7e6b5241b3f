#include "witkit/wire/payload.hpp"

#include <string>
#include <utility>
#include <vector>

#include "witkit/codec/payload.hpp"
#include "witkit/common/typ.hpp"
#include "witkit/common/value.hpp"
#include "witkit/wire/json.hpp"

namespace witkit::wire {

namespace {

auto TagEntry(const Typ& typ) -> std::pair<std::string, Value> {
  return {"type", MakeString(typ.TagName())};
}

auto ChildToValue(const TypPtr& typ) -> Value {
  if (typ == nullptr) {
    return MakeNull();
  }
  return TypToValue(*typ);
}

}  // namespace

auto TypToValue(const Typ& typ) -> Value {
  ValueMapping node;
  node.push_back(TagEntry(typ));

  switch (typ.Kind()) {
    case TypKind::kList:
      node.emplace_back("inner", ChildToValue(typ.AsList().inner));
      break;

    case TypKind::kOption:
      node.emplace_back("inner", ChildToValue(typ.AsOption().inner));
      break;

    case TypKind::kResult: {
      const auto& result = typ.AsResult();
      if (result.ok) {
        node.emplace_back("ok", TypToValue(*result.ok));
      }
      if (result.err) {
        node.emplace_back("err", TypToValue(*result.err));
      }
      break;
    }

    case TypKind::kTuple: {
      ValueSequence fields;
      for (const auto& element : typ.AsTuple().elements) {
        ValueMapping field;
        field.emplace_back("typ", ChildToValue(element));
        fields.push_back(MakeMapping(std::move(field)));
      }
      node.emplace_back("fields", MakeSequence(std::move(fields)));
      break;
    }

    case TypKind::kRecord: {
      ValueSequence fields;
      for (const auto& record_field : typ.AsRecord().fields) {
        ValueMapping field;
        field.emplace_back("name", MakeString(record_field.name));
        field.emplace_back("typ", ChildToValue(record_field.typ));
        fields.push_back(MakeMapping(std::move(field)));
      }
      node.emplace_back("fields", MakeSequence(std::move(fields)));
      break;
    }

    case TypKind::kVariant: {
      ValueSequence cases;
      for (const auto& variant_case : typ.AsVariant().cases) {
        ValueMapping entry;
        entry.emplace_back("name", MakeString(variant_case.name));
        if (variant_case.typ) {
          entry.emplace_back("typ", TypToValue(*variant_case.typ));
        }
        cases.push_back(MakeMapping(std::move(entry)));
      }
      node.emplace_back("cases", MakeSequence(std::move(cases)));
      break;
    }

    case TypKind::kEnum: {
      ValueSequence cases;
      for (const auto& name : typ.AsEnum().cases) {
        cases.push_back(MakeString(name));
      }
      node.emplace_back("cases", MakeSequence(std::move(cases)));
      break;
    }

    default:
      break;
  }
  return MakeMapping(std::move(node));
}

auto PayloadToValue(const std::vector<codec::EncodedArgument>& arguments)
    -> Value {
  ValueSequence params;
  params.reserve(arguments.size());
  for (const auto& argument : arguments) {
    ValueMapping param;
    param.emplace_back("value", argument.value);
    param.emplace_back("typ", TypToValue(argument.typ));
    params.push_back(MakeMapping(std::move(param)));
  }
  ValueMapping body;
  body.emplace_back("params", MakeSequence(std::move(params)));
  return MakeMapping(std::move(body));
}

auto SerializePayload(
    const std::vector<codec::EncodedArgument>& arguments,
    common::FormatMode mode) -> std::string {
  return ToJson(PayloadToValue(arguments), mode);
}

}  // namespace witkit::wire
