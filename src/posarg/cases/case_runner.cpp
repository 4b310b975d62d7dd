#include "posarg/cases/case_runner.hpp"

#include <cstdint>
#include <format>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "posarg/cases/decode_case.hpp"
#include "posarg/common/arg_error.hpp"
#include "posarg/common/overloaded.hpp"
#include "posarg/extract/extract.hpp"
#include "posarg/pack/pack.hpp"
#include "posarg/value/value.hpp"

namespace posarg::cases {

namespace {

template <typename T>
auto Wrap(Result<T> result) -> Result<Value> {
  return std::move(result).transform([](T v) { return Value(std::move(v)); });
}

// Defaults go through DecodeArg<T> so that a list of two or more reaches
// the extractor unchanged.
template <typename T>
auto DecodeWithDefaults(const ExtractStep& step) -> Result<Value> {
  std::vector<T> defaults;
  defaults.reserve(step.defaults.size());
  for (const auto& value : step.defaults) {
    defaults.push_back(value.As<T>());
  }
  return Wrap(
      DecodeArg<T>(
          step.args, step.position, std::span<const T>(defaults)));
}

}  // namespace

auto Evaluate(const ExtractStep& step) -> Result<Value> {
  const auto& args = step.args;
  const auto pos = step.position;
  const bool has_defaults = !step.defaults.empty();

  switch (step.extractor) {
    case Extractor::kBool:
      return Wrap(ArgToBool(args, pos));
    case Extractor::kInt:
      return has_defaults ? DecodeWithDefaults<int64_t>(step)
                          : Wrap(ArgToInt(args, pos));
    case Extractor::kFloat:
      return Wrap(ArgToFloat64(args, pos));
    case Extractor::kString:
      return has_defaults ? DecodeWithDefaults<std::string>(step)
                          : Wrap(ArgToString(args, pos));
    case Extractor::kIntList:
      return Wrap(ArgToIntSlice(args, pos));
    case Extractor::kFloatList:
      return has_defaults ? DecodeWithDefaults<std::vector<double>>(step)
                          : Wrap(ArgToFloat64Slice(args, pos));
    case Extractor::kFloatMatrix:
      return has_defaults
                 ? DecodeWithDefaults<std::vector<std::vector<double>>>(step)
                 : Wrap(ArgToFloat64SliceSlice(args, pos));
    case Extractor::kStringList:
      return has_defaults ? DecodeWithDefaults<std::vector<std::string>>(step)
                          : Wrap(ArgToStringSlice(args, pos));
    case Extractor::kAny:
      return ArgToArg(args, pos);
    case Extractor::kArgs:
      return Wrap(ArgToArgs(args, pos));
    case Extractor::kArgsList:
      return Wrap(ArgToArgsList(args, pos));
  }
  std::unreachable();
}

auto Evaluate(const PackStep& step) -> Result<Value> {
  auto handles = ArgsToHandles(step.components);
  return Wrap(HandlesToArgs(handles));
}

auto Evaluate(const DecodeCase& decode_case) -> Result<Value> {
  return Match(
      decode_case.step,
      [](const ExtractStep& step) { return Evaluate(step); },
      [](const PackStep& step) { return Evaluate(step); });
}

auto RunCase(const DecodeCase& decode_case) -> CaseReport {
  auto outcome = Evaluate(decode_case);

  bool passed = Match(
      decode_case.expect,
      [&](const Value& expected) {
        return outcome.has_value() && *outcome == expected;
      },
      [&](const ExpectedError& expected) {
        if (outcome.has_value() || !outcome.error().Is(expected.kind)) {
          return false;
        }
        return !expected.message ||
               *expected.message == outcome.error().message;
      });

  if (passed) {
    return CaseReport{.passed = true, .detail = {}};
  }
  return CaseReport{
      .passed = false,
      .detail = std::format(
          "expected {}, got {}", Describe(decode_case.expect),
          Describe(outcome)),
  };
}

auto Describe(const Expectation& expect) -> std::string {
  return Match(
      expect,
      [](const Value& value) {
        return std::format("value {}", value.ToString());
      },
      [](const ExpectedError& error) {
        if (error.message) {
          return std::format(
              "error {} \"{}\"", ToIdentifier(error.kind), *error.message);
        }
        return std::format("error {}", ToIdentifier(error.kind));
      });
}

auto Describe(const Result<Value>& outcome) -> std::string {
  if (outcome) {
    return std::format("value {}", outcome->ToString());
  }
  return std::format(
      "error {} \"{}\"", ToIdentifier(outcome.error().kind),
      outcome.error().message);
}

}  // namespace posarg::cases
