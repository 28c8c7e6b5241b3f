#include <argparse/argparse.hpp>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>

#include <fmt/core.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "commands.hpp"
#include "print.hpp"

namespace {

namespace fs = std::filesystem;

void AddSessionFlags(argparse::ArgumentParser& cmd) {
  cmd.add_argument("--metadata")
      .metavar("file")
      .help("Component metadata file (uses witkit.toml if not specified)");
  cmd.add_argument("--component-version")
      .metavar("n")
      .scan<'u', uint64_t>()
      .help("Component version (latest if not specified)");
  cmd.add_argument("--compact")
      .default_value(false)
      .implicit_value(true)
      .help("Print JSON on one line");
  cmd.add_argument("--verbose")
      .default_value(false)
      .implicit_value(true)
      .help("Debug logging on stderr");
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
  // stdout carries command output; logs go to stderr.
  spdlog::set_default_logger(spdlog::stderr_color_mt("witkit"));
  spdlog::set_level(spdlog::level::warn);

  argparse::ArgumentParser program("witkit", "0.1.0");
  program.add_description(
      "Inspect component exports and build invocation payloads");
  program.add_argument("-C").help("Run as if started in <dir>").metavar("dir");

  // Subcommand: exports
  argparse::ArgumentParser exports_cmd("exports");
  exports_cmd.add_description("List exported function signatures");
  exports_cmd.add_argument("--search")
      .metavar("query")
      .help("Case-insensitive filter on the function name");
  AddSessionFlags(exports_cmd);

  // Subcommand: show
  argparse::ArgumentParser show_cmd("show");
  show_cmd.add_description("Show the full parameter and result types");
  show_cmd.add_argument("function").help("Function name");
  AddSessionFlags(show_cmd);

  // Subcommand: skeleton
  argparse::ArgumentParser skeleton_cmd("skeleton");
  skeleton_cmd.add_description("Print default argument values as JSON");
  skeleton_cmd.add_argument("function").help("Function name");
  AddSessionFlags(skeleton_cmd);

  // Subcommand: encode
  argparse::ArgumentParser encode_cmd("encode");
  encode_cmd.add_description("Build the invocation payload for arguments");
  encode_cmd.add_argument("function").help("Function name");
  encode_cmd.add_argument("input").help("JSON argument array file, or -");
  AddSessionFlags(encode_cmd);

  // Subcommand: format
  argparse::ArgumentParser format_cmd("format");
  format_cmd.add_description("Pretty-print JSON, leaving invalid text as is");
  format_cmd.add_argument("input").help("JSON file, or -");
  AddSessionFlags(format_cmd);

  program.add_subparser(exports_cmd);
  program.add_subparser(show_cmd);
  program.add_subparser(skeleton_cmd);
  program.add_subparser(encode_cmd);
  program.add_subparser(format_cmd);

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& err) {
    witkit::driver::PrintError(err.what());
    std::cerr << program;
    return 1;
  }

  // Handle -C before dispatching subcommands
  if (auto dir = program.present("-C")) {
    std::error_code ec;
    fs::current_path(*dir, ec);
    if (ec) {
      witkit::driver::PrintError(
          fmt::format("cannot change to '{}': {}", *dir, ec.message()));
      return 1;
    }
  }

  if (program.is_subcommand_used("exports")) {
    return witkit::driver::ExportsCommand(exports_cmd);
  }
  if (program.is_subcommand_used("show")) {
    return witkit::driver::ShowCommand(show_cmd);
  }
  if (program.is_subcommand_used("skeleton")) {
    return witkit::driver::SkeletonCommand(skeleton_cmd);
  }
  if (program.is_subcommand_used("encode")) {
    return witkit::driver::EncodeCommand(encode_cmd);
  }
  if (program.is_subcommand_used("format")) {
    return witkit::driver::FormatCommand(format_cmd);
  }

  // No subcommand provided
  std::cout << program;
  return 0;
}
