#include "config.hpp"

#include <expected>
#include <filesystem>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <toml++/toml.hpp>

namespace posarg::driver {

namespace fs = std::filesystem;

auto ParseColorMode(std::string_view name) -> std::optional<ColorMode> {
  if (name == "auto") {
    return ColorMode::kAuto;
  }
  if (name == "always") {
    return ColorMode::kAlways;
  }
  if (name == "never") {
    return ColorMode::kNever;
  }
  return std::nullopt;
}

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  fs::path dir = fs::absolute(start_dir);

  while (true) {
    fs::path config_path = dir / "posarg.toml";
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

auto LoadConfig(const fs::path& config_path)
    -> std::expected<ProjectConfig, std::string> {
  ProjectConfig config;
  config.root_dir = config_path.parent_path();

  toml::table tbl;
  try {
    tbl = toml::parse_file(config_path.string());
  } catch (const toml::parse_error& e) {
    return std::unexpected(
        std::format("failed to parse {}: {}", config_path.string(), e.what()));
  }

  // [check] section (optional)
  if (auto check = tbl["check"]) {
    auto paths = check["paths"];
    if (paths && paths.as_array() == nullptr) {
      return std::unexpected(
          std::format(
              "{}: 'check.paths' must be an array of strings",
              config_path.string()));
    }
    if (auto* paths_arr = paths.as_array()) {
      for (const auto& elem : *paths_arr) {
        auto str = elem.value<std::string>();
        if (!str) {
          return std::unexpected(
              std::format(
                  "{}: 'check.paths' must be an array of strings",
                  config_path.string()));
        }
        // Resolve relative paths against config directory
        fs::path case_path = *str;
        if (case_path.is_relative()) {
          case_path = config.root_dir / case_path;
        }
        config.check_paths.push_back(case_path);
      }
    }
  }

  // [output] section (optional)
  if (auto output = tbl["output"]) {
    if (auto color = output["color"].value<std::string>()) {
      auto mode = ParseColorMode(*color);
      if (!mode) {
        return std::unexpected(
            std::format(
                "{}: unknown 'output.color' value '{}', use 'auto', "
                "'always', or 'never'",
                config_path.string(), *color));
      }
      config.color = *mode;
    }
  }

  return config;
}

auto LoadOptionalConfig()
    -> std::expected<std::optional<ProjectConfig>, std::string> {
  auto config_path = FindConfig();
  if (!config_path) {
    return std::optional<ProjectConfig>{};
  }
  return LoadConfig(*config_path).transform([](ProjectConfig config) {
    return std::optional<ProjectConfig>(std::move(config));
  });
}

}  // namespace posarg::driver
