#pragma once

#include <optional>

#include <argparse/argparse.hpp>

#include "config.hpp"

namespace posarg::driver {

// Options shared by every subcommand, resolved before dispatch.
struct GlobalOptions {
  int verbose = 0;
  std::optional<ProjectConfig> config;
};

auto EvalCommand(const argparse::ArgumentParser& cmd, const GlobalOptions& opts)
    -> int;
auto PackCommand(const argparse::ArgumentParser& cmd, const GlobalOptions& opts)
    -> int;
auto CheckCommand(
    const argparse::ArgumentParser& cmd, const GlobalOptions& opts) -> int;

}  // namespace posarg::driver
