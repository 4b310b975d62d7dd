#include <argparse/argparse.hpp>
#include <exception>
#include <filesystem>
#include <format>
#include <iostream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "commands.hpp"
#include "config.hpp"
#include "print.hpp"

namespace {

namespace fs = std::filesystem;

}  // namespace

auto main(int argc, char* argv[]) -> int {
  // Until posarg.toml is read
  posarg::driver::SetColorMode(posarg::driver::ColorMode::kAuto);

  argparse::ArgumentParser program("posarg", "0.1.0");
  program.add_description(
      "Decode typed values from positional argument lists");
  program.add_argument("-C").help("Run as if started in <dir>").metavar("dir");
  program.add_argument("-v", "--verbose")
      .default_value(false)
      .implicit_value(true)
      .help("Log phases to stderr");

  // Subcommand: eval
  argparse::ArgumentParser eval_cmd("eval");
  eval_cmd.add_description("Decode one position of a literal argument list");
  eval_cmd.add_argument("--as").required().help(
      "Target kind: bool, int, float, string, int_list, float_list, "
      "float_matrix, string_list, any, args, or args_list");
  eval_cmd.add_argument("--at").default_value(0).scan<'i', int>().help(
      "Position to decode (default 0)");
  eval_cmd.add_argument("--default")
      .append()
      .default_value(std::vector<std::string>{})
      .help("Default literal (repeatable; more than one is an error)");
  eval_cmd.add_argument("literals").remaining().help(
      "Argument list, one literal per argument (e.g. 42 foo '!default')");

  // Subcommand: pack
  argparse::ArgumentParser pack_cmd("pack");
  pack_cmd.add_description("Collapse a (payload, failure) pair");
  pack_cmd.add_argument("components").remaining().help(
      "Components as literals (e.g. '[1, 2]' '~')");

  // Subcommand: check
  argparse::ArgumentParser check_cmd("check");
  check_cmd.add_description("Run YAML case files");
  check_cmd.add_argument("paths").remaining().help(
      "Case files or directories (uses posarg.toml if not specified)");

  program.add_subparser(eval_cmd);
  program.add_subparser(pack_cmd);
  program.add_subparser(check_cmd);

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& err) {
    posarg::driver::PrintError(err.what());
    std::cerr << program;
    return 1;
  }

  // Handle -C before loading config or dispatching subcommands
  if (auto dir = program.present("-C")) {
    std::error_code ec;
    fs::current_path(*dir, ec);
    if (ec) {
      posarg::driver::PrintError(
          std::format("cannot change to '{}': {}", *dir, ec.message()));
      return 1;
    }
  }

  posarg::driver::GlobalOptions opts;
  opts.verbose = program.get<bool>("--verbose") ? 1 : 0;

  auto config = posarg::driver::LoadOptionalConfig();
  if (!config) {
    posarg::driver::PrintError(config.error());
    return 1;
  }
  opts.config = std::move(*config);
  posarg::driver::SetColorMode(
      opts.config ? opts.config->color : posarg::driver::ColorMode::kAuto);

  if (program.is_subcommand_used("eval")) {
    return posarg::driver::EvalCommand(eval_cmd, opts);
  }

  if (program.is_subcommand_used("pack")) {
    return posarg::driver::PackCommand(pack_cmd, opts);
  }

  if (program.is_subcommand_used("check")) {
    return posarg::driver::CheckCommand(check_cmd, opts);
  }

  // No subcommand provided
  std::cout << program;
  return 0;
}
