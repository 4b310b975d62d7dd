#include "print.hpp"

#include <cstdio>
#include <string>
#include <string_view>

#include <fmt/color.h>
#include <fmt/core.h>
#include <unistd.h>

#include "config.hpp"
#include "posarg/common/arg_error.hpp"
#include "posarg/value/value.hpp"

namespace posarg::driver {

namespace {

constexpr auto kToolColor = fmt::terminal_color::white;
constexpr auto kToolStyle = fmt::fg(kToolColor) | fmt::emphasis::bold;
constexpr auto kErrorStyle =
    fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;
constexpr auto kWarningStyle =
    fmt::fg(fmt::terminal_color::bright_yellow) | fmt::emphasis::bold;
constexpr auto kNoteStyle =
    fmt::fg(fmt::terminal_color::bright_cyan) | fmt::emphasis::bold;

bool g_color = true;

// An empty text_style prints the text without escape sequences.
auto Style(fmt::text_style style) -> fmt::text_style {
  return g_color ? style : fmt::text_style{};
}

void PrintTagged(
    std::string_view tag, fmt::text_style tag_style, std::string_view message,
    bool emphasize) {
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled("posarg", Style(kToolStyle)),
      fmt::styled(tag, Style(tag_style)),
      fmt::styled(
          message,
          emphasize ? Style(fmt::emphasis::bold) : fmt::text_style{}));
}

}  // namespace

void SetColorMode(ColorMode mode) {
  switch (mode) {
    case ColorMode::kAlways:
      g_color = true;
      return;
    case ColorMode::kNever:
      g_color = false;
      return;
    case ColorMode::kAuto:
      g_color = isatty(fileno(stderr)) != 0;
      return;
  }
}

void PrintError(const std::string& message) {
  PrintTagged("error:", kErrorStyle, message, true);
}

void PrintWarning(const std::string& message) {
  PrintTagged("warning:", kWarningStyle, message, true);
}

void PrintArgError(const ArgError& error) {
  PrintTagged(
      "error:", kErrorStyle,
      fmt::format("{}: {}", ToString(error.kind), error.message), true);
  for (const auto& note : error.notes) {
    PrintTagged("note:", kNoteStyle, note, false);
  }
}

void PrintValue(const Value& value) {
  fmt::print("{}\n", value);
}

}  // namespace posarg::driver
