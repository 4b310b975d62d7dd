#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "posarg/common/arg_error.hpp"
#include "posarg/value/value.hpp"

namespace posarg::cases {

// Extractor a case exercises. Opaque domain kinds have no literal form and
// are not reachable from case files.
enum class Extractor : uint8_t {
  kBool,
  kInt,
  kFloat,
  kString,
  kIntList,
  kFloatList,
  kFloatMatrix,
  kStringList,
  kAny,
  kArgs,
  kArgsList,
};

auto ToString(Extractor extractor) -> const char*;
auto ParseExtractor(std::string_view name) -> std::optional<Extractor>;

// Whether the extractor accepts a caller-supplied default.
auto SupportsDefaults(Extractor extractor) -> bool;

// Kind the extractor returns; nullopt for kAny.
auto ResultKind(Extractor extractor) -> std::optional<Value::Kind>;

struct ExtractStep {
  Extractor extractor;
  ArgList args;
  std::size_t position = 0;
  std::vector<Value> defaults;
};

struct PackStep {
  ArgList components;
};

struct ExpectedError {
  ArgErrorKind kind;
  std::optional<std::string> message;  // exact match when set
};

using Expectation = std::variant<Value, ExpectedError>;

struct DecodeCase {
  std::string name;
  std::string feature;
  std::string source_yaml;  // Path to YAML file for error reporting
  int line = 0;
  std::variant<ExtractStep, PackStep> step;
  Expectation expect;
};

// GTest printer for readable test names
inline void PrintTo(const DecodeCase& decode_case, std::ostream* os) {
  *os << decode_case.feature << "/" << decode_case.name;
}

}  // namespace posarg::cases
