#include "posarg/cases/case_loader.hpp"

#include <algorithm>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <format>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

// NOLINTNEXTLINE(misc-include-cleaner): yaml.h is the public API
#include <yaml-cpp/yaml.h>

#include "posarg/cases/decode_case.hpp"
#include "posarg/common/arg_error.hpp"
#include "posarg/literal/literal.hpp"
#include "posarg/value/value.hpp"

namespace posarg::cases {

namespace {

namespace fs = std::filesystem;

class CaseFileError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

auto Located(
    const std::string& file_path, const YAML::Node& node, std::string_view what)
    -> CaseFileError {
  auto mark = node.Mark();
  if (mark.is_null()) {
    return CaseFileError(std::format("{}: {}", file_path, what));
  }
  return CaseFileError(
      std::format("{}:{}: {}", file_path, mark.line + 1, what));
}

void ValidateKeys(
    const YAML::Node& node, std::initializer_list<std::string_view> allowed,
    std::string_view context, const std::string& file_path) {
  if (!node.IsMap()) {
    throw Located(file_path, node, std::format("{} must be a mapping", context));
  }
  for (const auto& pair : node) {
    auto key = pair.first.as<std::string>();
    bool found = std::ranges::find(allowed, key) != allowed.end();
    if (!found) {
      throw Located(
          file_path, pair.first,
          std::format("Unknown field '{}' in {}", key, context));
    }
  }
}

// Run a literal conversion, prefixing its errors with the file path.
template <typename Fn>
auto ConvertLiteral(const std::string& file_path, Fn&& convert)
    -> decltype(convert()) {
  try {
    return convert();
  } catch (const literal::LiteralError& e) {
    throw CaseFileError(std::format("{}: {}", file_path, e.what()));
  }
}

auto ParseExtractStep(
    const YAML::Node& node, const std::string& context,
    const std::string& path) -> ExtractStep {
  auto name = node["extract"].as<std::string>();
  auto extractor = ParseExtractor(name);
  if (!extractor) {
    throw Located(
        path, node["extract"],
        std::format("unknown extractor '{}' in {}", name, context));
  }

  ExtractStep step{.extractor = *extractor, .args = {}, .defaults = {}};

  if (node["args"]) {
    step.args = ConvertLiteral(
        path, [&] { return literal::ArgsFromYaml(node["args"]); });
  }

  if (node["position"]) {
    step.position = node["position"].as<std::size_t>();
  }

  if (node["defaults"]) {
    const auto defaults = node["defaults"];
    if (!SupportsDefaults(*extractor)) {
      throw Located(
          path, defaults,
          std::format("extractor '{}' takes no defaults", name));
    }
    if (!defaults.IsSequence()) {
      throw Located(path, defaults, "'defaults' must be a sequence");
    }
    auto kind = *ResultKind(*extractor);
    for (const auto& elem : defaults) {
      auto value = ConvertLiteral(
          path, [&] { return literal::FromYamlAs(elem, kind); });
      if (value.GetKind() != kind) {
        throw Located(
            path, elem,
            std::format(
                "default for '{}' must be {} got {}", name,
                Value::KindName(kind), value.TypeName()));
      }
      step.defaults.push_back(std::move(value));
    }
  }

  return step;
}

auto ParseExpectation(
    const YAML::Node& node, const std::variant<ExtractStep, PackStep>& step,
    const std::string& context, const std::string& path) -> Expectation {
  if (!node["expect"]) {
    throw Located(path, node, std::format("missing 'expect' in {}", context));
  }
  const auto expect = node["expect"];
  ValidateKeys(
      expect, {"value", "error", "message"},
      std::format("expect in {}", context), path);

  bool has_value = static_cast<bool>(expect["value"]);
  bool has_error = static_cast<bool>(expect["error"]);
  if (has_value == has_error) {
    throw Located(
        path, expect,
        std::format(
            "expect in {} needs exactly one of 'value' or 'error'", context));
  }

  if (has_value) {
    if (expect["message"]) {
      throw Located(
          path, expect["message"], "'message' applies to 'error' only");
    }
    const auto value = expect["value"];
    return ConvertLiteral(path, [&]() -> Value {
      if (std::holds_alternative<PackStep>(step)) {
        return literal::ArgsFromYaml(value);
      }
      auto kind = ResultKind(std::get<ExtractStep>(step).extractor);
      return kind ? literal::FromYamlAs(value, *kind)
                  : literal::FromYaml(value);
    });
  }

  auto kind_name = expect["error"].as<std::string>();
  auto kind = ParseArgErrorKind(kind_name);
  if (!kind) {
    throw Located(
        path, expect["error"],
        std::format("unknown error kind '{}' in {}", kind_name, context));
  }
  ExpectedError expected{.kind = *kind, .message = std::nullopt};
  if (expect["message"]) {
    expected.message = expect["message"].as<std::string>();
  }
  return expected;
}

auto ParseCase(
    const YAML::Node& node, const std::string& feature, const std::string& path)
    -> DecodeCase {
  if (!node.IsMap() || !node["name"]) {
    throw Located(path, node, "case must be a mapping with a 'name'");
  }

  DecodeCase dc;
  dc.name = node["name"].as<std::string>();
  dc.feature = feature;
  dc.source_yaml = path;
  dc.line = node.Mark().line + 1;

  auto context = std::format("case '{}'", dc.name);
  ValidateKeys(
      node,
      {"name", "description", "args", "extract", "position", "defaults",
       "pack", "expect"},
      context, path);

  bool has_extract = static_cast<bool>(node["extract"]);
  bool has_pack = static_cast<bool>(node["pack"]);
  if (has_extract == has_pack) {
    throw Located(
        path, node,
        std::format("{} needs exactly one of 'extract' or 'pack'", context));
  }

  if (has_extract) {
    dc.step = ParseExtractStep(node, context, path);
  } else {
    for (const auto* key : {"args", "position", "defaults"}) {
      if (node[key]) {
        throw Located(
            path, node[key],
            std::format("'{}' does not apply to pack {}", key, context));
      }
    }
    dc.step = PackStep{
        .components = ConvertLiteral(
            path, [&] { return literal::ArgsFromYaml(node["pack"]); }),
    };
  }

  dc.expect = ParseExpectation(node, dc.step, context, path);
  return dc;
}

}  // namespace

auto LoadCaseFile(const fs::path& path)
    -> std::expected<std::vector<DecodeCase>, std::string> {
  const std::string file_path = path.string();
  try {
    // NOLINTNEXTLINE(misc-include-cleaner): LoadFile is provided by yaml.h
    const auto root = YAML::LoadFile(file_path);
    ValidateKeys(root, {"feature", "description", "cases"}, "root", file_path);

    auto feature = root["feature"].as<std::string>(path.stem().string());

    std::vector<DecodeCase> cases;
    for (const auto& node : root["cases"]) {
      cases.push_back(ParseCase(node, feature, file_path));
    }
    return cases;
  } catch (const CaseFileError& e) {
    return std::unexpected(std::string(e.what()));
  } catch (const YAML::Exception& e) {
    return std::unexpected(std::format("{}: {}", file_path, e.what()));
  }
}

auto DiscoverCaseFiles(const std::vector<fs::path>& paths)
    -> std::expected<std::vector<fs::path>, std::string> {
  auto is_case_file = [](const fs::path& p) {
    auto ext = p.extension();
    return ext == ".yaml" || ext == ".yml";
  };

  std::vector<fs::path> files;
  for (const auto& path : paths) {
    std::error_code ec;
    if (fs::is_regular_file(path, ec)) {
      files.push_back(path);
      continue;
    }
    if (!fs::is_directory(path, ec)) {
      return std::unexpected(
          std::format("case path not found: {}", path.string()));
    }
    for (const auto& entry : fs::recursive_directory_iterator(path, ec)) {
      if (entry.is_regular_file() && is_case_file(entry.path())) {
        files.push_back(entry.path());
      }
    }
    if (ec) {
      return std::unexpected(
          std::format("cannot read {}: {}", path.string(), ec.message()));
    }
  }

  // Sort for deterministic order
  std::ranges::sort(files);
  return files;
}

}  // namespace posarg::cases
