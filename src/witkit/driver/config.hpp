#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "witkit/common/diagnostic.hpp"

namespace witkit::driver {

inline constexpr const char* kConfigFileName = "witkit.toml";

struct ProjectConfig {
  // [metadata]
  std::optional<std::filesystem::path> metadata_file;  // Absolute
  std::optional<uint64_t> version;

  // [output]
  bool pretty = true;

  // [log]
  std::string log_level = "warn";

  // Directory where witkit.toml was found
  std::filesystem::path root_dir;
};

// Search for witkit.toml starting from dir, going up to parent dirs.
// Returns nullopt if not found.
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse witkit.toml. Relative paths resolve against the file's directory.
auto LoadConfig(const std::filesystem::path& config_path)
    -> Result<ProjectConfig>;

// FindConfig + LoadConfig; nullopt when there is no config file.
auto LoadOptionalConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> Result<std::optional<ProjectConfig>>;

}  // namespace witkit::driver
