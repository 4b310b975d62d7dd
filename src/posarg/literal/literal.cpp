#include "posarg/literal/literal.hpp"

#include <cstdint>
#include <expected>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// NOLINTNEXTLINE(misc-include-cleaner): yaml.h is the public API
#include <yaml-cpp/yaml.h>

#include "posarg/common/arg_error.hpp"
#include "posarg/value/value.hpp"

namespace posarg::literal {

namespace {

using Kind = Value::Kind;

auto Fail(const YAML::Node& node, std::string_view what) -> LiteralError {
  auto mark = node.Mark();
  if (mark.is_null()) {
    return LiteralError(std::string(what));
  }
  return LiteralError(std::format("line {}: {}", mark.line + 1, what));
}

// Kind named by an explicit local tag (!int, !default, ...), if any.
// Non-specific tags ("?" for plain, "!" for quoted) yield nullopt.
auto ExplicitKind(const YAML::Node& node) -> std::optional<Kind> {
  const std::string& tag = node.Tag();
  if (tag.size() < 2 || tag.front() != '!') {
    return std::nullopt;
  }
  auto kind = Value::ParseKind(std::string_view(tag).substr(1));
  if (!kind) {
    throw Fail(node, std::format("unknown tag '{}'", tag));
  }
  return kind;
}

auto IsQuoted(const YAML::Node& node) -> bool {
  return node.Tag() == "!";
}

auto ParseBool(std::string_view text) -> std::optional<bool> {
  if (text == "true" || text == "True" || text == "TRUE") {
    return true;
  }
  if (text == "false" || text == "False" || text == "FALSE") {
    return false;
  }
  return std::nullopt;
}

void RequireScalar(const YAML::Node& node, Kind kind) {
  if (!node.IsScalar() && !node.IsNull()) {
    throw Fail(
        node, std::format("expected {} scalar", Value::KindName(kind)));
  }
}

void RequireSequence(const YAML::Node& node, Kind kind) {
  if (!node.IsSequence()) {
    throw Fail(
        node, std::format("expected {} sequence", Value::KindName(kind)));
  }
}

template <typename T>
auto DecodeScalar(const YAML::Node& node, Kind kind) -> T {
  RequireScalar(node, kind);
  T out{};
  if (!YAML::convert<T>::decode(node, out)) {
    throw Fail(
        node, std::format(
                  "'{}' is not a valid {}", node.Scalar(),
                  Value::KindName(kind)));
  }
  return out;
}

template <typename T>
auto ElementsAs(const YAML::Node& node, Kind list_kind, Kind elem_kind)
    -> std::vector<T> {
  RequireSequence(node, list_kind);
  std::vector<T> out;
  out.reserve(node.size());
  for (const auto& elem : node) {
    Value value = FromYamlAs(elem, elem_kind);
    if (!value.Is<T>()) {
      throw Fail(
          elem, std::format(
                    "expected {} element in {} got {}",
                    Value::KindName(elem_kind), Value::KindName(list_kind),
                    value.TypeName()));
    }
    out.push_back(value.As<T>());
  }
  return out;
}

auto ConvertAs(const YAML::Node& node, Kind kind) -> Value {
  switch (kind) {
    case Kind::kNil:
      return Value{};
    case Kind::kDefault:
      RequireScalar(node, kind);
      return DefaultArg{};
    case Kind::kBool: {
      RequireScalar(node, kind);
      auto b = ParseBool(node.Scalar());
      if (!b) {
        throw Fail(node, std::format("'{}' is not a valid bool", node.Scalar()));
      }
      return *b;
    }
    case Kind::kInt:
      return DecodeScalar<int64_t>(node, kind);
    case Kind::kFloat:
      return DecodeScalar<double>(node, kind);
    case Kind::kString:
      RequireScalar(node, kind);
      return node.Scalar();
    case Kind::kIntList:
      return ElementsAs<int64_t>(node, kind, Kind::kInt);
    case Kind::kFloatList:
      return ElementsAs<double>(node, kind, Kind::kFloat);
    case Kind::kFloatMatrix:
      return ElementsAs<std::vector<double>>(node, kind, Kind::kFloatList);
    case Kind::kStringList:
      return ElementsAs<std::string>(node, kind, Kind::kString);
    case Kind::kArgs:
      return ArgsFromYaml(node);
    case Kind::kArgsList:
      return ElementsAs<ArgList>(node, kind, Kind::kArgs);
    case Kind::kError:
      RequireScalar(node, kind);
      return ArgError::CallFailed(node.Scalar());
    case Kind::kDistribution:
    case Kind::kFeature:
    case Kind::kFeatureList:
    case Kind::kFeatureSet:
      break;
  }
  throw Fail(
      node, std::format("{} has no literal form", Value::KindName(kind)));
}

auto InferScalar(const YAML::Node& node) -> Value {
  if (int64_t i = 0; YAML::convert<int64_t>::decode(node, i)) {
    return i;
  }
  if (double d = 0; YAML::convert<double>::decode(node, d)) {
    return d;
  }
  if (auto b = ParseBool(node.Scalar())) {
    return *b;
  }
  return node.Scalar();
}

// A sequence whose elements share one of these kinds collapses into the
// matching typed list; anything else stays an argument list.
auto ClassifySequence(ArgList elems) -> Value {
  if (elems.empty()) {
    return ArgList{};
  }
  Kind kind = elems.front().GetKind();
  for (const auto& e : elems) {
    if (e.GetKind() != kind) {
      return elems;
    }
  }

  auto collect = [&elems]<typename T>() {
    std::vector<T> out;
    out.reserve(elems.size());
    for (auto& e : elems) {
      out.push_back(e.As<T>());
    }
    return out;
  };

  switch (kind) {
    case Kind::kInt:
      return collect.operator()<int64_t>();
    case Kind::kFloat:
      return collect.operator()<double>();
    case Kind::kString:
      return collect.operator()<std::string>();
    case Kind::kFloatList:
      return collect.operator()<std::vector<double>>();
    case Kind::kArgs:
      return collect.operator()<ArgList>();
    default:
      return elems;
  }
}

auto Infer(const YAML::Node& node) -> Value {
  if (IsQuoted(node)) {
    return node.Scalar();
  }
  switch (node.Type()) {
    case YAML::NodeType::Null:
      return Value{};
    case YAML::NodeType::Scalar:
      return InferScalar(node);
    case YAML::NodeType::Sequence: {
      ArgList elems;
      elems.reserve(node.size());
      for (const auto& elem : node) {
        elems.push_back(FromYaml(elem));
      }
      return ClassifySequence(std::move(elems));
    }
    case YAML::NodeType::Map:
      throw Fail(node, "mappings are not argument values");
    case YAML::NodeType::Undefined:
      break;
  }
  throw Fail(node, "missing value");
}

// yaml-cpp reads a tag at the very end of its input as an untagged null.
// Give a lone tag such as "!default" an empty scalar to attach to.
auto IsLoneTag(std::string_view text) -> bool {
  return text.size() > 1 && text.front() == '!' &&
         text.find_first_of(" \t\r\n[{\"'") == std::string_view::npos;
}

template <typename Fn>
auto ParseWith(std::string_view text, Fn&& convert)
    -> std::expected<Value, std::string> {
  std::string source(text);
  if (IsLoneTag(text)) {
    source += " ''";
  }
  try {
    return convert(YAML::Load(source));
  } catch (const YAML::Exception& e) {
    return std::unexpected(std::string(e.what()));
  } catch (const LiteralError& e) {
    return std::unexpected(std::string(e.what()));
  }
}

}  // namespace

auto FromYaml(const YAML::Node& node) -> Value {
  if (auto kind = ExplicitKind(node)) {
    return ConvertAs(node, *kind);
  }
  return Infer(node);
}

auto FromYamlAs(const YAML::Node& node, Value::Kind kind) -> Value {
  if (auto explicit_kind = ExplicitKind(node)) {
    return ConvertAs(node, *explicit_kind);
  }
  if (node.IsNull()) {
    return Value{};
  }
  return ConvertAs(node, kind);
}

auto ArgsFromYaml(const YAML::Node& node) -> ArgList {
  RequireSequence(node, Kind::kArgs);
  ArgList args;
  args.reserve(node.size());
  for (const auto& elem : node) {
    args.push_back(FromYaml(elem));
  }
  return args;
}

auto ParseLiteral(std::string_view text) -> std::expected<Value, std::string> {
  return ParseWith(text, [](const YAML::Node& node) { return FromYaml(node); });
}

auto ParseLiteralAs(std::string_view text, Value::Kind kind)
    -> std::expected<Value, std::string> {
  return ParseWith(text, [kind](const YAML::Node& node) {
    return FromYamlAs(node, kind);
  });
}

}  // namespace posarg::literal
