#include "commands.hpp"

#include <argparse/argparse.hpp>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "config.hpp"
#include "print.hpp"
#include "session.hpp"
#include "witkit/codec/payload.hpp"
#include "witkit/common/indent.hpp"
#include "witkit/common/unsupported_error.hpp"
#include "witkit/common/value.hpp"
#include "witkit/metadata/component.hpp"
#include "witkit/render/signature.hpp"
#include "witkit/skeleton/skeleton.hpp"
#include "witkit/wire/json.hpp"
#include "witkit/wire/payload.hpp"

namespace witkit::driver {

namespace {

auto ReadOverrides(const argparse::ArgumentParser& cmd) -> CliOverrides {
  CliOverrides cli;
  if (auto file = cmd.present<std::string>("--metadata")) {
    cli.metadata_file = std::filesystem::path(*file);
  }
  if (auto version = cmd.present<uint64_t>("--component-version")) {
    cli.version = *version;
  }
  cli.compact = cmd.get<bool>("--compact");
  cli.verbose = cmd.get<bool>("--verbose");
  return cli;
}

// Config + flags, with the log level applied. nullopt after an error has
// been printed.
auto PrepareOptions(const argparse::ArgumentParser& cmd)
    -> std::optional<SessionOptions> {
  auto config = LoadOptionalConfig();
  if (!config) {
    PrintDiagnostic(config.error());
    return std::nullopt;
  }
  auto options = MergeOptions(ReadOverrides(cmd), *config);
  ApplyLogLevel(options.log_level);
  return options;
}

auto PrepareSession(const argparse::ArgumentParser& cmd,
                    SessionOptions& options) -> std::optional<Session> {
  auto prepared = PrepareOptions(cmd);
  if (!prepared) {
    return std::nullopt;
  }
  options = *prepared;

  auto session = OpenSession(options);
  if (!session) {
    PrintDiagnostic(session.error());
    return std::nullopt;
  }
  return std::move(*session);
}

auto LookupFunction(const Session& session, const std::string& name)
    -> std::optional<metadata::FunctionRef> {
  auto found = metadata::FindFunction(session.Version(), name);
  if (!found) {
    PrintError(
        fmt::format(
            "no exported function '{}' in version {}", name,
            session.Version().version));
  }
  return found;
}

}  // namespace

auto ExportsCommand(const argparse::ArgumentParser& cmd) -> int {
  SessionOptions options;
  auto session = PrepareSession(cmd, options);
  if (!session) {
    return 1;
  }

  auto signatures = render::RenderExports(session->Version());
  if (auto query = cmd.present<std::string>("--search")) {
    signatures = render::FilterSignatures(signatures, *query);
  }

  if (signatures.empty()) {
    fmt::print("No exports found.\n");
    return 0;
  }

  for (const auto& sig : signatures) {
    fmt::print("{}  {}\n", sig.package, render::FormatSignature(sig));
  }
  return 0;
}

auto ShowCommand(const argparse::ArgumentParser& cmd) -> int {
  SessionOptions options;
  auto session = PrepareSession(cmd, options);
  if (!session) {
    return 1;
  }

  auto name = cmd.get<std::string>("function");
  auto found = LookupFunction(*session, name);
  if (!found) {
    return 1;
  }

  auto sig = render::RenderFunction(found->iface->name, *found->function);
  fmt::print("{}.{{{}}}\n", sig.package, sig.wit_name);
  fmt::print("{}\n", render::FormatSignature(sig));
  for (const auto& param : sig.parameters) {
    fmt::print("\n{}: {}\n", param.name, param.type.full);
  }
  fmt::print("\n=> {}\n", sig.result ? sig.result->full : "void");
  return 0;
}

auto SkeletonCommand(const argparse::ArgumentParser& cmd) -> int {
  SessionOptions options;
  auto session = PrepareSession(cmd, options);
  if (!session) {
    return 1;
  }

  auto found = LookupFunction(*session, cmd.get<std::string>("function"));
  if (!found) {
    return 1;
  }

  auto arguments = skeleton::BuildArgumentSkeleton(*found->function);
  fmt::print(
      "{}\n", wire::ToJson(MakeSequence(std::move(arguments)), options.mode));
  return 0;
}

auto EncodeCommand(const argparse::ArgumentParser& cmd) -> int {
  SessionOptions options;
  auto session = PrepareSession(cmd, options);
  if (!session) {
    return 1;
  }

  auto found = LookupFunction(*session, cmd.get<std::string>("function"));
  if (!found) {
    return 1;
  }

  auto text = ReadInputText(cmd.get<std::string>("input"));
  if (!text) {
    PrintDiagnostic(text.error());
    return 1;
  }

  auto values = wire::ParseArguments(*text);
  if (!values) {
    PrintDiagnostic(values.error());
    return 1;
  }

  std::vector<codec::EncodedArgument> payload;
  try {
    payload = codec::EncodePayload(*values, *found->function);
  } catch (const common::UnsupportedTypeError& e) {
    PrintError(e.what());
    return 1;
  }

  fmt::print("{}\n", wire::SerializePayload(payload, options.mode));
  return 0;
}

auto FormatCommand(const argparse::ArgumentParser& cmd) -> int {
  auto options = PrepareOptions(cmd);
  if (!options) {
    return 1;
  }

  auto text = ReadInputText(cmd.get<std::string>("input"));
  if (!text) {
    PrintDiagnostic(text.error());
    return 1;
  }

  // Text that is not JSON yet is echoed byte for byte.
  auto parsed = wire::ParseJson(*text);
  if (!parsed) {
    spdlog::debug("format: {}", parsed.error().primary.message);
    fmt::print("{}", *text);
    return 0;
  }
  fmt::print("{}\n", wire::ToJson(*parsed, common::FormatMode::kPretty));
  return 0;
}

}  // namespace witkit::driver
