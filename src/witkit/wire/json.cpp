#include "witkit/wire/json.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <absl/container/flat_hash_set.h>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "witkit/common/diagnostic.hpp"
#include "witkit/common/indent.hpp"
#include "witkit/common/internal_error.hpp"
#include "witkit/common/overloaded.hpp"
#include "witkit/common/value.hpp"

namespace witkit::wire {

namespace {

using common::FormatMode;
using Json = nlohmann::ordered_json;

auto LineOf(std::string_view text, std::size_t byte) -> uint32_t {
  auto end = std::min(byte, text.size());
  return static_cast<uint32_t>(
      1 + std::count(text.begin(), text.begin() + end, '\n'));
}

// "[json.exception.parse_error.101] parse error at ..." -> "parse error at ..."
auto StripExceptionId(std::string_view what) -> std::string {
  if (!what.empty() && what.front() == '[') {
    auto close = what.find("] ");
    if (close != std::string_view::npos) {
      what.remove_prefix(close + 2);
    }
  }
  return std::string(what);
}

auto FromJson(const Json& json) -> Value {
  switch (json.type()) {
    case Json::value_t::null:
    case Json::value_t::discarded:
      return MakeNull();
    case Json::value_t::boolean:
      return MakeBool(json.get<bool>());
    case Json::value_t::number_integer:
      return MakeInteger(json.get<int64_t>());
    case Json::value_t::number_unsigned: {
      auto u = json.get<uint64_t>();
      if (u <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return MakeInteger(static_cast<int64_t>(u));
      }
      return MakeUnsigned(u);
    }
    case Json::value_t::number_float:
      return MakeNumber(json.get<double>());
    case Json::value_t::string:
      return MakeString(json.get<std::string>());
    case Json::value_t::array: {
      ValueSequence elements;
      elements.reserve(json.size());
      for (const auto& element : json) {
        elements.push_back(FromJson(element));
      }
      return MakeSequence(std::move(elements));
    }
    case Json::value_t::object: {
      ValueMapping entries;
      entries.reserve(json.size());
      for (const auto& [key, member] : json.items()) {
        entries.emplace_back(key, FromJson(member));
      }
      return MakeMapping(std::move(entries));
    }
    case Json::value_t::binary:
      break;
  }
  throw common::InternalError("FromJson", "unexpected binary JSON value");
}

auto ToJsonValue(const Value& value) -> Json {
  return std::visit(
      Overloaded{
          [](const NullValue&) -> Json { return nullptr; },
          [](bool b) -> Json { return b; },
          [](int64_t s) -> Json { return s; },
          [](uint64_t u) -> Json { return u; },
          [](double d) -> Json {
            if (!std::isfinite(d)) {
              return nullptr;
            }
            return d;
          },
          [](const std::string& s) -> Json { return s; },
          [](const ValueSequence& elements) -> Json {
            auto array = Json::array();
            for (const auto& element : elements) {
              array.push_back(ToJsonValue(element));
            }
            return array;
          },
          [](const ValueMapping& entries) -> Json {
            auto object = Json::object();
            for (const auto& [key, member] : entries) {
              object[key] = ToJsonValue(member);
            }
            return object;
          },
      },
      value.data);
}

}  // namespace

auto ParseJson(std::string_view text) -> Result<Value> {
  // nlohmann keeps the last of two equal keys. Each open object tracks the
  // keys it has seen so a repeated one is rejected instead.
  std::vector<absl::flat_hash_set<std::string>> open_objects;
  std::optional<std::string> duplicate;
  Json::parser_callback_t track_keys =
      [&](int /*depth*/, Json::parse_event_t event, Json& parsed) -> bool {
    switch (event) {
      case Json::parse_event_t::object_start:
        open_objects.emplace_back();
        break;
      case Json::parse_event_t::object_end:
        open_objects.pop_back();
        break;
      case Json::parse_event_t::key:
        if (!duplicate && !open_objects.empty() &&
            !open_objects.back().insert(parsed.get<std::string>()).second) {
          duplicate = parsed.get<std::string>();
        }
        break;
      default:
        break;
    }
    return true;
  };

  Json json;
  try {
    json = Json::parse(text, track_keys);
  } catch (const Json::parse_error& e) {
    return std::unexpected(
        Diagnostic::Error(
            DiagLocation{.file = {}, .line = LineOf(text, e.byte)},
            StripExceptionId(e.what())));
  }
  if (duplicate) {
    return std::unexpected(
        Diagnostic::Error(fmt::format("duplicate object key '{}'", *duplicate)));
  }
  return FromJson(json);
}

auto ToJson(const Value& value, FormatMode mode) -> std::string {
  int indent = mode == FormatMode::kPretty ? 2 : -1;
  return ToJsonValue(value).dump(
      indent, ' ', false, Json::error_handler_t::replace);
}

auto FormatJsonText(std::string_view text) -> std::string {
  auto parsed = ParseJson(text);
  if (!parsed) {
    return std::string(text);
  }
  return ToJson(*parsed, FormatMode::kPretty);
}

auto ParseArguments(std::string_view text) -> Result<std::vector<Value>> {
  auto parsed = ParseJson(text);
  if (!parsed) {
    return std::unexpected(
        std::move(parsed.error()).WithNote("while reading the argument list"));
  }
  if (!IsSequence(*parsed)) {
    return std::unexpected(
        Diagnostic::Error(
            fmt::format(
                "arguments must be a JSON array, got a {}",
                ShapeName(*parsed))));
  }
  return std::move(AsSequence(*parsed));
}

}  // namespace witkit::wire
