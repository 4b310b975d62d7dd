#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace posarg::driver {

enum class ColorMode : uint8_t {
  kAuto,    // Color when stderr is a terminal
  kAlways,
  kNever,
};

auto ParseColorMode(std::string_view name) -> std::optional<ColorMode>;

struct ProjectConfig {
  // Case files or directories for `posarg check`, resolved against root_dir
  std::vector<std::filesystem::path> check_paths;
  ColorMode color = ColorMode::kAuto;

  // Directory where posarg.toml was found
  std::filesystem::path root_dir;
};

// Search for posarg.toml starting from dir, going up to parent dirs.
// Returns nullopt if not found.
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse posarg.toml. Every section is optional; unknown values for known
// keys are errors.
auto LoadConfig(const std::filesystem::path& config_path)
    -> std::expected<ProjectConfig, std::string>;

// FindConfig + LoadConfig. nullopt when there is no posarg.toml.
auto LoadOptionalConfig()
    -> std::expected<std::optional<ProjectConfig>, std::string>;

}  // namespace posarg::driver
