#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace posarg {

// Kind of decoding failure. All kinds are contract errors between the
// producer and the consumer of an argument list; none is retryable.
enum class ArgErrorKind : uint8_t {
  kInsufficientArguments,  // No usable value and no default to cover it
  kTooManyArguments,       // More defaults or components than allowed
  kWrongArgumentType,      // Value present, dynamic type does not match
  kCallFailed,             // Failure reported by the producer of a result
};

// Expected vs. actual element count.
struct CountDetail {
  std::size_t expected;
  std::size_t actual;

  auto operator==(const CountDetail&) const -> bool = default;
};

// Expected vs. actual dynamic type name.
struct TypeDetail {
  std::string expected;
  std::string actual;

  auto operator==(const TypeDetail&) const -> bool = default;
};

using ArgErrorDetail = std::variant<std::monostate, CountDetail, TypeDetail>;

struct ArgError {
  ArgErrorKind kind;
  std::string message;
  ArgErrorDetail detail;
  std::vector<std::string> notes;

  auto operator==(const ArgError&) const -> bool = default;

  // Factory: position not covered by the list
  static auto InsufficientArguments(std::size_t expected, std::size_t actual)
      -> ArgError;

  // Factory: placeholder found but no default was supplied
  static auto MissingDefault() -> ArgError;

  // Factory: slot present but nil where any non-nil value is acceptable
  static auto NilArgument() -> ArgError;

  // Factory: more than one default supplied
  static auto TooManyDefaults(std::size_t actual) -> ArgError;

  // Factory: arity check on a fixed-size input (packer)
  static auto ArityMismatch(std::size_t expected, std::size_t actual)
      -> ArgError;

  static auto WrongArgumentType(std::string expected, std::string actual)
      -> ArgError;

  // Factory: error raised by whoever produced a packed result
  static auto CallFailed(std::string msg) -> ArgError;

  // Add a context note (innermost first)
  auto WithNote(std::string note) && -> ArgError {
    notes.push_back(std::move(note));
    return std::move(*this);
  }

  [[nodiscard]] auto Is(ArgErrorKind k) const -> bool {
    return kind == k;
  }
};

template <typename T>
using Result = std::expected<T, ArgError>;

// Human-readable kind, e.g. "wrong argument type"
auto ToString(ArgErrorKind kind) -> const char*;

// Stable identifier used by case files, e.g. "wrong_argument_type"
auto ToIdentifier(ArgErrorKind kind) -> const char*;

// Inverse of ToIdentifier. Returns nullopt if the name is unknown.
auto ParseArgErrorKind(std::string_view name) -> std::optional<ArgErrorKind>;

// "<kind>: <message>" followed by "; note" for each note
auto ToString(const ArgError& error) -> std::string;

}  // namespace posarg
