#include "witkit/skeleton/skeleton.hpp"

#include <utility>
#include <vector>

#include "witkit/common/typ.hpp"
#include "witkit/common/value.hpp"

namespace witkit::skeleton {

namespace {

auto BuildChild(const TypPtr& typ) -> Value {
  if (typ == nullptr) {
    return MakeNull();
  }
  return BuildSkeleton(*typ);
}

}  // namespace

auto BuildSkeleton(const Typ& typ) -> Value {
  switch (typ.Kind()) {
    case TypKind::kStr:
    case TypKind::kChar:
    case TypKind::kEnum:
      return MakeString("");

    case TypKind::kBool:
      return MakeBool(false);

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
      return MakeInteger(0);

    case TypKind::kRecord: {
      ValueMapping entries;
      const auto& fields = typ.AsRecord().fields;
      entries.reserve(fields.size());
      for (const auto& field : fields) {
        entries.emplace_back(field.name, BuildChild(field.typ));
      }
      return MakeMapping(std::move(entries));
    }

    case TypKind::kTuple: {
      ValueSequence elements;
      const auto& types = typ.AsTuple().elements;
      elements.reserve(types.size());
      for (const auto& element : types) {
        elements.push_back(BuildChild(element));
      }
      return MakeSequence(std::move(elements));
    }

    case TypKind::kList:
      return MakeSequence({});

    // No default payload can be chosen without picking a case or a side.
    case TypKind::kOption:
    case TypKind::kResult:
    case TypKind::kVariant:
    case TypKind::kUnknown:
      return MakeNull();
  }
  return MakeNull();
}

auto BuildArgumentSkeleton(const metadata::ExportedFunction& fn)
    -> std::vector<Value> {
  std::vector<Value> arguments;
  arguments.reserve(fn.parameters.size());
  for (const auto& param : fn.parameters) {
    arguments.push_back(BuildSkeleton(param.typ));
  }
  return arguments;
}

}  // namespace witkit::skeleton
