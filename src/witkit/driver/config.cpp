#include "config.hpp"

#include <array>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>
#include <toml++/toml.hpp>

#include "witkit/common/diagnostic.hpp"

namespace witkit::driver {

namespace fs = std::filesystem;

namespace {

constexpr std::array<std::string_view, 7> kLogLevels = {
    "trace", "debug", "info", "warn", "error", "critical", "off"};

auto WrongType(
    const fs::path& config_path, std::string_view key, std::string_view expected)
    -> Diagnostic {
  return Diagnostic::HostError(
      fmt::format("{}: '{}' must be {}", config_path.string(), key, expected));
}

}  // namespace

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  fs::path dir = fs::absolute(start_dir);

  while (true) {
    fs::path config_path = dir / kConfigFileName;
    if (fs::exists(config_path)) {
      return config_path;
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      // Reached root
      return std::nullopt;
    }
    dir = parent;
  }
}

auto LoadConfig(const fs::path& config_path) -> Result<ProjectConfig> {
  ProjectConfig config;
  config.root_dir = config_path.parent_path();

  toml::table tbl;
  try {
    tbl = toml::parse_file(config_path.string());
  } catch (const toml::parse_error& e) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format(
                "failed to parse {}: {}", config_path.string(),
                e.description())));
  }

  // [metadata] section (optional)
  if (auto metadata = tbl["metadata"]) {
    if (auto file = metadata["file"].value<std::string>()) {
      fs::path file_path = *file;
      if (file_path.is_relative()) {
        file_path = config.root_dir / file_path;
      }
      config.metadata_file = file_path;
    } else if (metadata["file"]) {
      return std::unexpected(WrongType(config_path, "metadata.file", "a string"));
    }

    if (metadata["version"] && !metadata["version"].is_integer()) {
      return std::unexpected(
          WrongType(config_path, "metadata.version", "an integer"));
    }
    if (auto version = metadata["version"].value<int64_t>()) {
      if (*version < 0) {
        return std::unexpected(
            Diagnostic::HostError(
                fmt::format(
                    "{}: 'metadata.version' must not be negative",
                    config_path.string())));
      }
      config.version = static_cast<uint64_t>(*version);
    }
  }

  // [output] section (optional)
  if (auto output = tbl["output"]) {
    if (auto pretty = output["pretty"].value<bool>()) {
      config.pretty = *pretty;
    } else if (output["pretty"]) {
      return std::unexpected(WrongType(config_path, "output.pretty", "a boolean"));
    }
  }

  // [log] section (optional)
  if (auto log = tbl["log"]) {
    if (auto level = log["level"].value<std::string>()) {
      bool known = false;
      for (auto candidate : kLogLevels) {
        known = known || candidate == *level;
      }
      if (!known) {
        return std::unexpected(
            Diagnostic::HostError(
                fmt::format(
                    "{}: unknown log level '{}'", config_path.string(),
                    *level))
                .WithNote(
                    "expected one of trace, debug, info, warn, error, "
                    "critical, off"));
      }
      config.log_level = *level;
    } else if (log["level"]) {
      return std::unexpected(WrongType(config_path, "log.level", "a string"));
    }
  }

  return config;
}

auto LoadOptionalConfig(const fs::path& start_dir)
    -> Result<std::optional<ProjectConfig>> {
  auto config_path = FindConfig(start_dir);
  if (!config_path) {
    return std::optional<ProjectConfig>{};
  }
  auto config = LoadConfig(*config_path);
  if (!config) {
    return std::unexpected(std::move(config.error()));
  }
  return std::optional<ProjectConfig>{std::move(*config)};
}

}  // namespace witkit::driver
