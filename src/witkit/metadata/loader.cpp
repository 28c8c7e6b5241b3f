#include "witkit/metadata/loader.hpp"

#include <algorithm>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>
// NOLINTNEXTLINE(misc-include-cleaner): yaml.h is the public API
#include <yaml-cpp/yaml.h>

#include "witkit/common/diagnostic.hpp"
#include "witkit/common/typ.hpp"
#include "witkit/metadata/component.hpp"

namespace witkit::metadata {

namespace {

namespace fs = std::filesystem;

// Document-wide state for diagnostics.
struct ReadContext {
  std::string source;
};

[[noreturn]] void Fail(
    const ReadContext& ctx, const YAML::Node& node, std::string message) {
  std::optional<uint32_t> line;
  if (!node.Mark().is_null()) {
    line = static_cast<uint32_t>(node.Mark().line + 1);
  }
  throw DiagnosticException(
      Diagnostic::Error(
          DiagLocation{.file = ctx.source, .line = line}, std::move(message)));
}

void ValidateKeys(
    const ReadContext& ctx, const YAML::Node& node,
    std::initializer_list<std::string_view> allowed, std::string_view context) {
  if (!node.IsMap()) {
    return;
  }
  for (const auto& pair : node) {
    auto key = pair.first.as<std::string>();
    bool found = std::ranges::find(allowed, key) != allowed.end();
    if (!found) {
      Fail(
          ctx, pair.first,
          fmt::format("unknown field '{}' in {}", key, context));
    }
  }
}

auto RequireMap(
    const ReadContext& ctx, const YAML::Node& node, std::string_view context)
    -> const YAML::Node& {
  if (!node.IsMap()) {
    Fail(ctx, node, fmt::format("{} must be a mapping", context));
  }
  return node;
}

auto RequireString(
    const ReadContext& ctx, const YAML::Node& parent, const char* key,
    std::string_view context) -> std::string {
  const YAML::Node node = parent[key];
  if (!node || !node.IsScalar()) {
    Fail(
        ctx, parent,
        fmt::format("missing required string field '{}' in {}", key, context));
  }
  return node.as<std::string>();
}

// Optional sequence: absent means empty, anything but a sequence is an error.
auto OptionalSequence(
    const ReadContext& ctx, const YAML::Node& parent, const char* key,
    std::string_view context) -> YAML::Node {
  YAML::Node node = parent[key];
  if (!node || node.IsNull()) {
    return YAML::Node(YAML::NodeType::Sequence);
  }
  if (!node.IsSequence()) {
    Fail(ctx, node, fmt::format("'{}' in {} must be a sequence", key, context));
  }
  return node;
}

auto ReadTyp(const ReadContext& ctx, const YAML::Node& node) -> Typ;

auto ReadChild(
    const ReadContext& ctx, const YAML::Node& parent, const char* key,
    std::string_view tag) -> Typ {
  const YAML::Node child = parent[key];
  if (!child) {
    Fail(ctx, parent, fmt::format("{} type is missing '{}'", tag, key));
  }
  return ReadTyp(ctx, child);
}

auto ReadOptionalChild(
    const ReadContext& ctx, const YAML::Node& parent, const char* key)
    -> TypPtr {
  const YAML::Node child = parent[key];
  if (!child || child.IsNull()) {
    return nullptr;
  }
  return MakeTypPtr(ReadTyp(ctx, child));
}

// Record/Variant/Enum factories reject duplicate names with
// std::runtime_error; attach the document position to it.
template <typename Build>
auto BuildComposite(const ReadContext& ctx, const YAML::Node& node, Build build)
    -> Typ {
  try {
    return build();
  } catch (const std::runtime_error& e) {
    Fail(ctx, node, e.what());
  }
}

auto ReadTyp(const ReadContext& ctx, const YAML::Node& node) -> Typ {
  RequireMap(ctx, node, "type");
  auto tag = RequireString(ctx, node, "type", "type");
  auto kind = TypKindFromTag(tag);
  if (!kind) {
    spdlog::debug("{}: keeping unrecognized type tag '{}'", ctx.source, tag);
    return Typ::Unknown(tag);
  }

  switch (*kind) {
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
      return Typ::Primitive(*kind);

    case TypKind::kList:
      return Typ::List(ReadChild(ctx, node, "inner", tag));

    case TypKind::kOption:
      return Typ::Option(ReadChild(ctx, node, "inner", tag));

    case TypKind::kResult:
      return Typ::Result(
          ReadOptionalChild(ctx, node, "ok"),
          ReadOptionalChild(ctx, node, "err"));

    case TypKind::kTuple: {
      std::vector<Typ> elements;
      for (const auto& field : OptionalSequence(ctx, node, "fields", "Tuple")) {
        // Elements are {typ: ...}; a bare type is accepted as well.
        if (field.IsMap() && field["typ"]) {
          elements.push_back(ReadTyp(ctx, field["typ"]));
        } else {
          elements.push_back(ReadTyp(ctx, field));
        }
      }
      return Typ::Tuple(std::move(elements));
    }

    case TypKind::kRecord: {
      std::vector<RecordField> fields;
      for (const auto& field : OptionalSequence(ctx, node, "fields", "Record")) {
        RequireMap(ctx, field, "record field");
        ValidateKeys(ctx, field, {"name", "typ"}, "record field");
        fields.push_back(
            RecordField{
                .name = RequireString(ctx, field, "name", "record field"),
                .typ = MakeTypPtr(ReadChild(ctx, field, "typ", "record field")),
            });
      }
      return BuildComposite(
          ctx, node, [&] { return Typ::Record(std::move(fields)); });
    }

    case TypKind::kVariant: {
      std::vector<VariantCase> cases;
      for (const auto& entry : OptionalSequence(ctx, node, "cases", "Variant")) {
        RequireMap(ctx, entry, "variant case");
        ValidateKeys(ctx, entry, {"name", "typ"}, "variant case");
        cases.push_back(
            VariantCase{
                .name = RequireString(ctx, entry, "name", "variant case"),
                .typ = ReadOptionalChild(ctx, entry, "typ"),
            });
      }
      return BuildComposite(
          ctx, node, [&] { return Typ::Variant(std::move(cases)); });
    }

    case TypKind::kEnum: {
      std::vector<std::string> cases;
      for (const auto& entry : OptionalSequence(ctx, node, "cases", "Enum")) {
        if (!entry.IsScalar()) {
          Fail(ctx, entry, "enum cases must be strings");
        }
        cases.push_back(entry.as<std::string>());
      }
      return BuildComposite(
          ctx, node, [&] { return Typ::Enum(std::move(cases)); });
    }

    case TypKind::kUnknown:
      break;
  }
  return Typ::Unknown(tag);
}

auto ReadFunction(const ReadContext& ctx, const YAML::Node& node)
    -> ExportedFunction {
  RequireMap(ctx, node, "function");
  ValidateKeys(ctx, node, {"name", "parameters", "results"}, "function");

  ExportedFunction fn;
  fn.name = RequireString(ctx, node, "name", "function");
  auto context = fmt::format("function '{}'", fn.name);

  for (const auto& param : OptionalSequence(ctx, node, "parameters", context)) {
    RequireMap(ctx, param, "parameter");
    ValidateKeys(ctx, param, {"name", "typ"}, context);
    fn.parameters.push_back(
        Parameter{
            .name = RequireString(ctx, param, "name", context),
            .typ = ReadChild(ctx, param, "typ", "parameter"),
        });
  }

  for (const auto& result : OptionalSequence(ctx, node, "results", context)) {
    RequireMap(ctx, result, "result");
    ValidateKeys(ctx, result, {"name", "typ"}, context);
    std::optional<std::string> name;
    if (result["name"] && !result["name"].IsNull()) {
      name = result["name"].as<std::string>();
    }
    fn.results.push_back(
        FunctionResult{
            .name = std::move(name),
            .typ = ReadChild(ctx, result, "typ", "result"),
        });
  }
  return fn;
}

auto ReadExports(const ReadContext& ctx, const YAML::Node& node)
    -> std::vector<ExportedInterface> {
  std::vector<ExportedInterface> exports;
  for (const auto& entry : OptionalSequence(ctx, node, "exports", "version")) {
    RequireMap(ctx, entry, "export");
    ValidateKeys(ctx, entry, {"name", "functions"}, "export");
    ExportedInterface iface;
    iface.name = RequireString(ctx, entry, "name", "export");
    auto context = fmt::format("export '{}'", iface.name);
    for (const auto& fn : OptionalSequence(ctx, entry, "functions", context)) {
      iface.functions.push_back(ReadFunction(ctx, fn));
    }
    exports.push_back(std::move(iface));
  }
  return exports;
}

auto ReadVersion(const ReadContext& ctx, const YAML::Node& node)
    -> ComponentVersion {
  ComponentVersion version;
  if (const YAML::Node number = node["version"]) {
    try {
      version.version = number.as<uint64_t>();
    } catch (const YAML::BadConversion&) {
      Fail(ctx, number, "'version' must be a non-negative integer");
    }
  }
  version.exports = ReadExports(ctx, node);
  return version;
}

auto ReadComponent(const ReadContext& ctx, const YAML::Node& root)
    -> ComponentMetadata {
  RequireMap(ctx, root, "component metadata");
  ValidateKeys(
      ctx, root, {"component", "versions", "version", "exports"},
      "component metadata");

  ComponentMetadata component;
  if (const YAML::Node name = root["component"]) {
    component.name = name.as<std::string>();
  }

  if (root["exports"]) {
    if (root["versions"]) {
      Fail(ctx, root, "use either 'versions' or top-level 'exports', not both");
    }
    component.versions.push_back(ReadVersion(ctx, root));
  } else {
    for (const auto& entry :
         OptionalSequence(ctx, root, "versions", "component metadata")) {
      RequireMap(ctx, entry, "version");
      ValidateKeys(ctx, entry, {"version", "exports"}, "version");
      component.versions.push_back(ReadVersion(ctx, entry));
    }
  }

  size_t function_count = 0;
  for (const auto& version : component.versions) {
    for (const auto& iface : version.exports) {
      function_count += iface.functions.size();
    }
  }
  spdlog::debug(
      "{}: loaded {} version(s), {} function(s)", ctx.source,
      component.versions.size(), function_count);
  return component;
}

// Runs `read` against the parsed document, turning yaml-cpp and loader
// exceptions into a Diagnostic.
template <typename T, typename Read>
auto ParseDocument(
    const ReadContext& ctx, std::string_view text, Read read) -> Result<T> {
  try {
    // NOLINTNEXTLINE(misc-include-cleaner): Load is provided by yaml.h
    YAML::Node root = YAML::Load(std::string(text));
    return read(ctx, root);
  } catch (const DiagnosticException& e) {
    return std::unexpected(e.GetDiagnostic());
  } catch (const YAML::Exception& e) {
    std::optional<uint32_t> line;
    if (!e.mark.is_null()) {
      line = static_cast<uint32_t>(e.mark.line + 1);
    }
    return std::unexpected(
        Diagnostic::Error(
            DiagLocation{.file = ctx.source, .line = line}, e.msg));
  }
}

}  // namespace

auto LoadComponentFile(const fs::path& path) -> Result<ComponentMetadata> {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format("metadata file not found: {}", path.string())));
  }

  std::ifstream in(path);
  if (!in) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format("cannot read metadata file: {}", path.string())));
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return ParseComponentMetadata(buffer.str(), path.string());
}

auto ParseComponentMetadata(
    std::string_view text, std::string_view source_name)
    -> Result<ComponentMetadata> {
  ReadContext ctx{.source = std::string(source_name)};
  return ParseDocument<ComponentMetadata>(ctx, text, ReadComponent);
}

auto ParseTypText(std::string_view text) -> Result<Typ> {
  ReadContext ctx{.source = "<type>"};
  return ParseDocument<Typ>(ctx, text, ReadTyp);
}

}  // namespace witkit::metadata
