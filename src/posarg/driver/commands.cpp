#include "commands.hpp"

#include <cstddef>
#include <expected>
#include <filesystem>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <argparse/argparse.hpp>
#include <fmt/core.h>

#include "posarg/cases/case_loader.hpp"
#include "posarg/cases/case_runner.hpp"
#include "posarg/cases/decode_case.hpp"
#include "posarg/common/arg_error.hpp"
#include "posarg/literal/literal.hpp"
#include "posarg/value/value.hpp"
#include "print.hpp"
#include "verbose_logger.hpp"

namespace posarg::driver {
namespace {

namespace fs = std::filesystem;

auto ParseArgList(const std::vector<std::string>& texts, std::string_view what)
    -> std::expected<ArgList, std::string> {
  ArgList args;
  args.reserve(texts.size());
  for (std::size_t i = 0; i < texts.size(); ++i) {
    auto value = literal::ParseLiteral(texts[i]);
    if (!value) {
      return std::unexpected(
          std::format("{} {} '{}': {}", what, i, texts[i], value.error()));
    }
    args.push_back(std::move(*value));
  }
  return args;
}

auto ParseDefaults(
    const std::vector<std::string>& texts, cases::Extractor extractor)
    -> std::expected<std::vector<Value>, std::string> {
  std::vector<Value> defaults;
  if (texts.empty()) {
    return defaults;
  }
  if (!cases::SupportsDefaults(extractor)) {
    return std::unexpected(
        std::format("'--as {}' takes no default", ToString(extractor)));
  }
  auto kind = *cases::ResultKind(extractor);
  for (const auto& text : texts) {
    auto value = literal::ParseLiteralAs(text, kind);
    if (!value) {
      return std::unexpected(
          std::format("default '{}': {}", text, value.error()));
    }
    if (value->GetKind() != kind) {
      return std::unexpected(
          std::format(
              "default '{}' must be {} got {}", text, Value::KindName(kind),
              value->TypeName()));
    }
    defaults.push_back(std::move(*value));
  }
  return defaults;
}

// Print the outcome of one step. Returns the exit code.
auto Report(const Result<Value>& outcome) -> int {
  if (!outcome) {
    PrintArgError(outcome.error());
    return 1;
  }
  PrintValue(*outcome);
  return 0;
}

auto ResolveCheckPaths(
    const argparse::ArgumentParser& cmd, const GlobalOptions& opts)
    -> std::optional<std::vector<fs::path>> {
  auto paths = cmd.present<std::vector<std::string>>("paths");
  if (paths && !paths->empty()) {
    return std::vector<fs::path>(paths->begin(), paths->end());
  }
  if (opts.config && !opts.config->check_paths.empty()) {
    return opts.config->check_paths;
  }
  return std::nullopt;
}

}  // namespace

auto EvalCommand(const argparse::ArgumentParser& cmd, const GlobalOptions& opts)
    -> int {
  VerboseLogger vlog(opts.verbose);

  auto kind_name = cmd.get<std::string>("--as");
  auto extractor = cases::ParseExtractor(kind_name);
  if (!extractor) {
    PrintError(
        std::format(
            "unknown kind '{}', use bool, int, float, string, int_list, "
            "float_list, float_matrix, string_list, any, args, or args_list",
            kind_name));
    return 1;
  }

  auto position = cmd.get<int>("--at");
  if (position < 0) {
    PrintError(std::format("position must not be negative, got {}", position));
    return 1;
  }

  cases::ExtractStep step{
      .extractor = *extractor,
      .args = {},
      .position = static_cast<std::size_t>(position),
      .defaults = {},
  };

  {
    PhaseTimer timer(vlog, "parse");
    auto texts = cmd.present<std::vector<std::string>>("literals")
                     .value_or(std::vector<std::string>{});
    auto args = ParseArgList(texts, "argument");
    if (!args) {
      PrintError(args.error());
      return 1;
    }
    step.args = std::move(*args);

    auto defaults = ParseDefaults(
        cmd.get<std::vector<std::string>>("--default"), *extractor);
    if (!defaults) {
      PrintError(defaults.error());
      return 1;
    }
    step.defaults = std::move(*defaults);
  }

  PhaseTimer timer(vlog, "decode");
  return Report(cases::Evaluate(step));
}

auto PackCommand(const argparse::ArgumentParser& cmd, const GlobalOptions& opts)
    -> int {
  VerboseLogger vlog(opts.verbose);

  cases::PackStep step;
  {
    PhaseTimer timer(vlog, "parse");
    auto texts = cmd.present<std::vector<std::string>>("components")
                     .value_or(std::vector<std::string>{});
    auto components = ParseArgList(texts, "component");
    if (!components) {
      PrintError(components.error());
      return 1;
    }
    step.components = std::move(*components);
  }

  PhaseTimer timer(vlog, "pack");
  return Report(cases::Evaluate(step));
}

auto CheckCommand(
    const argparse::ArgumentParser& cmd, const GlobalOptions& opts) -> int {
  VerboseLogger vlog(opts.verbose);

  auto paths = ResolveCheckPaths(cmd, opts);
  if (!paths) {
    PrintError("no case paths (pass paths or set [check] paths in posarg.toml)");
    return 1;
  }

  std::vector<fs::path> files;
  {
    PhaseTimer timer(vlog, "discover");
    auto discovered = cases::DiscoverCaseFiles(*paths);
    if (!discovered) {
      PrintError(discovered.error());
      return 1;
    }
    files = std::move(*discovered);
    vlog.Detail("discover", std::format("{} case file(s)", files.size()));
  }
  if (files.empty()) {
    PrintWarning("no case files found");
  }

  std::size_t passed = 0;
  std::size_t failed = 0;
  std::size_t broken_files = 0;

  PhaseTimer timer(vlog, "run");
  for (const auto& file : files) {
    auto loaded = cases::LoadCaseFile(file);
    if (!loaded) {
      PrintError(loaded.error());
      ++broken_files;
      continue;
    }
    for (const auto& decode_case : *loaded) {
      auto report = cases::RunCase(decode_case);
      if (report.passed) {
        ++passed;
        if (vlog.Enabled(1)) {
          fmt::print("PASS {}/{}\n", decode_case.feature, decode_case.name);
        }
        continue;
      }
      ++failed;
      fmt::print(
          "FAIL {}/{} ({}:{}): {}\n", decode_case.feature, decode_case.name,
          decode_case.source_yaml, decode_case.line, report.detail);
    }
  }

  if (broken_files > 0) {
    fmt::print(
        "{} passed, {} failed, {} file(s) not loaded\n", passed, failed,
        broken_files);
  } else {
    fmt::print("{} passed, {} failed\n", passed, failed);
  }
  return (failed == 0 && broken_files == 0) ? 0 : 1;
}

}  // namespace posarg::driver
