#include "witkit/codec/payload.hpp"

#include <cstddef>
#include <span>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "witkit/common/typ.hpp"
#include "witkit/common/unsupported_error.hpp"
#include "witkit/common/value.hpp"

namespace witkit::codec {

auto EncodeArgument(Value value, const Typ& typ) -> EncodedArgument {
  switch (typ.Kind()) {
    case TypKind::kStr:
    case TypKind::kChar:
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
    case TypKind::kTuple:
    case TypKind::kRecord:
    case TypKind::kEnum:
      return EncodedArgument{.value = std::move(value), .typ = typ};

    case TypKind::kList: {
      if (IsSequence(value)) {
        return EncodedArgument{.value = std::move(value), .typ = typ};
      }
      ValueSequence wrapped;
      wrapped.push_back(std::move(value));
      return EncodedArgument{
          .value = MakeSequence(std::move(wrapped)), .typ = typ};
    }

    case TypKind::kOption:
    case TypKind::kResult:
    case TypKind::kVariant:
    case TypKind::kUnknown:
      break;
  }
  throw common::UnsupportedTypeError(typ.TagName());
}

auto EncodePayload(
    std::span<const Value> values, const metadata::ExportedFunction& fn)
    -> std::vector<EncodedArgument> {
  if (values.size() != fn.parameters.size()) {
    spdlog::debug(
        "encoding '{}': {} value(s) for {} parameter(s)", fn.name,
        values.size(), fn.parameters.size());
  }

  std::vector<EncodedArgument> payload;
  payload.reserve(fn.parameters.size());
  for (size_t i = 0; i < fn.parameters.size(); ++i) {
    const auto& param = fn.parameters[i];
    Value value = i < values.size() ? values[i] : MakeNull();
    spdlog::trace(
        "encoding parameter '{}' as {}", param.name, param.typ.TagName());
    payload.push_back(EncodeArgument(std::move(value), param.typ));
  }
  return payload;
}

}  // namespace witkit::codec
