#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>

#include "config.hpp"
#include "witkit/common/diagnostic.hpp"
#include "witkit/common/indent.hpp"
#include "witkit/metadata/component.hpp"

namespace witkit::driver {

// Flags shared by every subcommand, as given on the command line.
struct CliOverrides {
  std::optional<std::filesystem::path> metadata_file;
  std::optional<uint64_t> version;
  bool compact = false;
  bool verbose = false;
};

// Settings after merging witkit.toml with the command line. Scalars from
// the command line win.
struct SessionOptions {
  std::optional<std::filesystem::path> metadata_file;
  std::optional<uint64_t> version;  // nullopt selects the latest version
  common::FormatMode mode = common::FormatMode::kPretty;
  std::string log_level = "warn";
};

auto MergeOptions(
    const CliOverrides& cli, const std::optional<ProjectConfig>& config)
    -> SessionOptions;

// Loaded component plus the version the user is working against.
class Session {
 public:
  Session(metadata::ComponentMetadata component, std::size_t version_index)
      : component_(std::move(component)), version_index_(version_index) {
  }

  [[nodiscard]] auto Component() const -> const metadata::ComponentMetadata& {
    return component_;
  }

  [[nodiscard]] auto Version() const -> const metadata::ComponentVersion& {
    return component_.versions[version_index_];
  }

 private:
  metadata::ComponentMetadata component_;
  std::size_t version_index_;
};

// Loads options.metadata_file and selects the requested version.
auto OpenSession(const SessionOptions& options) -> Result<Session>;

void ApplyLogLevel(const std::string& level);

// Reads a whole file, or stdin when path is "-".
auto ReadInputText(const std::string& path) -> Result<std::string>;

}  // namespace witkit::driver
