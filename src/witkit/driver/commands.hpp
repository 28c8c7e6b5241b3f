#pragma once

#include <argparse/argparse.hpp>

namespace witkit::driver {

auto ExportsCommand(const argparse::ArgumentParser& cmd) -> int;
auto ShowCommand(const argparse::ArgumentParser& cmd) -> int;
auto SkeletonCommand(const argparse::ArgumentParser& cmd) -> int;
auto EncodeCommand(const argparse::ArgumentParser& cmd) -> int;
auto FormatCommand(const argparse::ArgumentParser& cmd) -> int;

}  // namespace witkit::driver
