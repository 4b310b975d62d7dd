#include "posarg/cases/decode_case.hpp"

#include <array>
#include <optional>
#include <string_view>

#include "posarg/value/value.hpp"

namespace posarg::cases {

namespace {

constexpr std::array kExtractors = {
    Extractor::kBool,      Extractor::kInt,         Extractor::kFloat,
    Extractor::kString,    Extractor::kIntList,     Extractor::kFloatList,
    Extractor::kFloatMatrix, Extractor::kStringList, Extractor::kAny,
    Extractor::kArgs,      Extractor::kArgsList,
};

}  // namespace

auto ToString(Extractor extractor) -> const char* {
  switch (extractor) {
    case Extractor::kBool:
      return "bool";
    case Extractor::kInt:
      return "int";
    case Extractor::kFloat:
      return "float";
    case Extractor::kString:
      return "string";
    case Extractor::kIntList:
      return "int_list";
    case Extractor::kFloatList:
      return "float_list";
    case Extractor::kFloatMatrix:
      return "float_matrix";
    case Extractor::kStringList:
      return "string_list";
    case Extractor::kAny:
      return "any";
    case Extractor::kArgs:
      return "args";
    case Extractor::kArgsList:
      return "args_list";
  }
  return "unknown";
}

auto ParseExtractor(std::string_view name) -> std::optional<Extractor> {
  for (auto extractor : kExtractors) {
    if (name == ToString(extractor)) {
      return extractor;
    }
  }
  return std::nullopt;
}

auto SupportsDefaults(Extractor extractor) -> bool {
  switch (extractor) {
    case Extractor::kInt:
    case Extractor::kString:
    case Extractor::kFloatList:
    case Extractor::kFloatMatrix:
    case Extractor::kStringList:
      return true;
    default:
      return false;
  }
}

auto ResultKind(Extractor extractor) -> std::optional<Value::Kind> {
  switch (extractor) {
    case Extractor::kBool:
      return Value::Kind::kBool;
    case Extractor::kInt:
      return Value::Kind::kInt;
    case Extractor::kFloat:
      return Value::Kind::kFloat;
    case Extractor::kString:
      return Value::Kind::kString;
    case Extractor::kIntList:
      return Value::Kind::kIntList;
    case Extractor::kFloatList:
      return Value::Kind::kFloatList;
    case Extractor::kFloatMatrix:
      return Value::Kind::kFloatMatrix;
    case Extractor::kStringList:
      return Value::Kind::kStringList;
    case Extractor::kArgs:
      return Value::Kind::kArgs;
    case Extractor::kArgsList:
      return Value::Kind::kArgsList;
    case Extractor::kAny:
      return std::nullopt;
  }
  return std::nullopt;
}

}  // namespace posarg::cases
