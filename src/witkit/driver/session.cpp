#include "session.hpp"

#include <cstddef>
#include <expected>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <utility>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "config.hpp"
#include "witkit/common/diagnostic.hpp"
#include "witkit/common/indent.hpp"
#include "witkit/metadata/component.hpp"
#include "witkit/metadata/loader.hpp"

namespace witkit::driver {

auto MergeOptions(
    const CliOverrides& cli, const std::optional<ProjectConfig>& config)
    -> SessionOptions {
  SessionOptions options;

  if (config) {
    options.metadata_file = config->metadata_file;
    options.version = config->version;
    options.mode = config->pretty ? common::FormatMode::kPretty
                                  : common::FormatMode::kCompact;
    options.log_level = config->log_level;
  }

  if (cli.metadata_file) {
    options.metadata_file = std::filesystem::absolute(*cli.metadata_file);
  }
  if (cli.version) {
    options.version = cli.version;
  }
  if (cli.compact) {
    options.mode = common::FormatMode::kCompact;
  }
  if (cli.verbose) {
    options.log_level = "debug";
  }

  return options;
}

auto OpenSession(const SessionOptions& options) -> Result<Session> {
  if (!options.metadata_file) {
    return std::unexpected(
        Diagnostic::HostError("no component metadata file")
            .WithNote(
                fmt::format(
                    "pass --metadata <file> or set [metadata] file in {}",
                    kConfigFileName)));
  }

  auto component = metadata::LoadComponentFile(*options.metadata_file);
  if (!component) {
    return std::unexpected(std::move(component.error()));
  }

  const metadata::ComponentVersion* selected =
      options.version ? metadata::FindVersion(*component, *options.version)
                      : metadata::LatestVersion(*component);
  if (selected == nullptr) {
    if (options.version) {
      return std::unexpected(
          Diagnostic::HostError(
              fmt::format(
                  "component '{}' has no version {}", component->name,
                  *options.version)));
    }
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format("component '{}' has no versions", component->name)));
  }

  auto index =
      static_cast<std::size_t>(selected - component->versions.data());
  spdlog::debug(
      "using version {} of component '{}'", selected->version,
      component->name);
  return Session(std::move(*component), index);
}

void ApplyLogLevel(const std::string& level) {
  spdlog::set_level(spdlog::level::from_str(level));
}

auto ReadInputText(const std::string& path) -> Result<std::string> {
  std::ostringstream buffer;
  if (path == "-") {
    buffer << std::cin.rdbuf();
    return buffer.str();
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::unexpected(
        Diagnostic::HostError(fmt::format("cannot open '{}'", path)));
  }
  buffer << in.rdbuf();
  if (in.bad()) {
    return std::unexpected(
        Diagnostic::HostError(fmt::format("failed to read '{}'", path)));
  }
  return buffer.str();
}

}  // namespace witkit::driver
