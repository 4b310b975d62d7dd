#pragma once

#include <expected>
#include <stdexcept>
#include <string>
#include <string_view>

// NOLINTNEXTLINE(misc-include-cleaner): yaml.h is the public API
#include <yaml-cpp/yaml.h>

#include "posarg/value/value.hpp"

namespace posarg::literal {

// Malformed literal. The message carries the YAML line when known.
class LiteralError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Convert a YAML node, inferring the kind of untagged nodes:
//   ~ / null / empty          -> nil
//   42                        -> int
//   1.5, 1e3, .inf            -> float
//   true / false              -> bool
//   "quoted", other plain     -> string
//   [1, 2]                    -> int_list (likewise float_list, string_list)
//   [[1.0], [2.0]]            -> float_matrix
//   [!args [..], !args [..]]  -> args_list
//   anything else, []         -> args
// Tags force a kind: !default, !nil, !int, !float, !bool, !string,
// !int_list, !float_list, !float_matrix, !string_list, !args, !args_list,
// !error "message".
// Throws LiteralError.
auto FromYaml(const YAML::Node& node) -> Value;

// As FromYaml, but an untagged node is read as `kind`. Lets `[]` stand for
// an empty float_list where a float_list is expected. Null stays nil.
auto FromYamlAs(const YAML::Node& node, Value::Kind kind) -> Value;

// A YAML sequence read as an argument list: [1, 2] is two ints, not an
// int_list. Throws LiteralError.
auto ArgsFromYaml(const YAML::Node& node) -> ArgList;

// Parse one literal from text, e.g. "[1.0, 2.0]" or "!default".
auto ParseLiteral(std::string_view text) -> std::expected<Value, std::string>;

auto ParseLiteralAs(std::string_view text, Value::Kind kind)
    -> std::expected<Value, std::string>;

}  // namespace posarg::literal
