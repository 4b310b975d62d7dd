#include "posarg/common/arg_error.hpp"

#include <cstddef>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace posarg {

auto ArgError::InsufficientArguments(std::size_t expected, std::size_t actual)
    -> ArgError {
  return ArgError{
      .kind = ArgErrorKind::kInsufficientArguments,
      .message = std::format("expected {} arg(s) got {}", expected, actual),
      .detail = CountDetail{.expected = expected, .actual = actual},
      .notes = {},
  };
}

auto ArgError::MissingDefault() -> ArgError {
  return ArgError{
      .kind = ArgErrorKind::kInsufficientArguments,
      .message = "expected 1 default got 0",
      .detail = CountDetail{.expected = 1, .actual = 0},
      .notes = {},
  };
}

auto ArgError::NilArgument() -> ArgError {
  return ArgError{
      .kind = ArgErrorKind::kInsufficientArguments,
      .message = "expected value got nil",
      .detail = TypeDetail{.expected = "value", .actual = "nil"},
      .notes = {},
  };
}

auto ArgError::TooManyDefaults(std::size_t actual) -> ArgError {
  return ArgError{
      .kind = ArgErrorKind::kTooManyArguments,
      .message = std::format("expected 1 default got {}", actual),
      .detail = CountDetail{.expected = 1, .actual = actual},
      .notes = {},
  };
}

auto ArgError::ArityMismatch(std::size_t expected, std::size_t actual)
    -> ArgError {
  return ArgError{
      .kind = actual > expected ? ArgErrorKind::kTooManyArguments
                                : ArgErrorKind::kInsufficientArguments,
      .message = std::format("expected {} got {}", expected, actual),
      .detail = CountDetail{.expected = expected, .actual = actual},
      .notes = {},
  };
}

auto ArgError::WrongArgumentType(std::string expected, std::string actual)
    -> ArgError {
  auto message = std::format("expected {} got {}", expected, actual);
  return ArgError{
      .kind = ArgErrorKind::kWrongArgumentType,
      .message = std::move(message),
      .detail =
          TypeDetail{.expected = std::move(expected), .actual = std::move(actual)},
      .notes = {},
  };
}

auto ArgError::CallFailed(std::string msg) -> ArgError {
  return ArgError{
      .kind = ArgErrorKind::kCallFailed,
      .message = std::move(msg),
      .detail = std::monostate{},
      .notes = {},
  };
}

auto ToString(ArgErrorKind kind) -> const char* {
  switch (kind) {
    case ArgErrorKind::kInsufficientArguments:
      return "insufficient arguments";
    case ArgErrorKind::kTooManyArguments:
      return "too many arguments";
    case ArgErrorKind::kWrongArgumentType:
      return "wrong argument type";
    case ArgErrorKind::kCallFailed:
      return "call failed";
  }
  return "unknown";
}

auto ToIdentifier(ArgErrorKind kind) -> const char* {
  switch (kind) {
    case ArgErrorKind::kInsufficientArguments:
      return "insufficient_arguments";
    case ArgErrorKind::kTooManyArguments:
      return "too_many_arguments";
    case ArgErrorKind::kWrongArgumentType:
      return "wrong_argument_type";
    case ArgErrorKind::kCallFailed:
      return "call_failed";
  }
  return "unknown";
}

auto ParseArgErrorKind(std::string_view name) -> std::optional<ArgErrorKind> {
  for (auto kind :
       {ArgErrorKind::kInsufficientArguments, ArgErrorKind::kTooManyArguments,
        ArgErrorKind::kWrongArgumentType, ArgErrorKind::kCallFailed}) {
    if (name == ToIdentifier(kind)) {
      return kind;
    }
  }
  return std::nullopt;
}

auto ToString(const ArgError& error) -> std::string {
  std::string out = std::format("{}: {}", ToString(error.kind), error.message);
  for (const auto& note : error.notes) {
    out += "; ";
    out += note;
  }
  return out;
}

}  // namespace posarg
