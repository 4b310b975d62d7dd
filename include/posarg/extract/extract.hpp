#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "posarg/common/arg_error.hpp"
#include "posarg/extract/slot.hpp"
#include "posarg/value/domain.hpp"
#include "posarg/value/value.hpp"

namespace posarg {

// Decode args[index] as T.
//
// Order of checks:
//   1. more than one default          -> TooManyArguments
//   2. index out of range             -> default, else InsufficientArguments
//   3. placeholder (DefaultArg)       -> default, else InsufficientArguments
//   4. exact kind match               -> the value, else WrongArgumentType
//
// Nil at the position is a kind mismatch. With a default supplied, only (1)
// and (4) can fail.
template <typename T>
auto DecodeArg(
    const ArgList& args, std::size_t index, std::span<const T> defaults)
    -> Result<T> {
  if (auto count = CheckDefaultCount(defaults.size()); !count) {
    return std::unexpected(
        std::move(count.error()).WithNote(ArgumentNote(index)));
  }

  auto state = ClassifySlot(
      args, index, [](const Value& value) { return value.Is<T>(); });
  switch (state) {
    case SlotState::kAbsent:
    case SlotState::kPlaceholder:
      return ResolveDefault(state, args, index, defaults);
    case SlotState::kNil:
    case SlotState::kMismatch:
      return std::unexpected(
          ArgError::WrongArgumentType(
              std::string(Value::KindName(Value::KindOf<T>())),
              std::string(args[index].TypeName()))
              .WithNote(ArgumentNote(index)));
    case SlotState::kMatch:
      return args[index].As<T>();
  }
  std::unreachable();
}

template <typename T>
auto DecodeArg(const ArgList& args, std::size_t index) -> Result<T> {
  return DecodeArg<T>(args, index, std::span<const T>{});
}

template <typename T>
auto DecodeArg(
    const ArgList& args, std::size_t index, const std::optional<T>& def)
    -> Result<T> {
  if (def.has_value()) {
    return DecodeArg<T>(args, index, std::span<const T>(&*def, 1));
  }
  return DecodeArg<T>(args, index);
}

// Typed extractors. Those taking `def` return it for an absent or
// placeholder slot.

auto ArgToBool(const ArgList& args, std::size_t index) -> Result<bool>;

auto ArgToInt(
    const ArgList& args, std::size_t index,
    std::optional<int64_t> def = std::nullopt) -> Result<int64_t>;

auto ArgToFloat64(const ArgList& args, std::size_t index) -> Result<double>;

auto ArgToString(
    const ArgList& args, std::size_t index,
    std::optional<std::string> def = std::nullopt) -> Result<std::string>;

auto ArgToIntSlice(const ArgList& args, std::size_t index)
    -> Result<std::vector<int64_t>>;

auto ArgToFloat64Slice(
    const ArgList& args, std::size_t index,
    std::optional<std::vector<double>> def = std::nullopt)
    -> Result<std::vector<double>>;

auto ArgToFloat64SliceSlice(
    const ArgList& args, std::size_t index,
    std::optional<std::vector<std::vector<double>>> def = std::nullopt)
    -> Result<std::vector<std::vector<double>>>;

auto ArgToStringSlice(
    const ArgList& args, std::size_t index,
    std::optional<std::vector<std::string>> def = std::nullopt)
    -> Result<std::vector<std::string>>;

auto ArgToDistribution(const ArgList& args, std::size_t index)
    -> Result<DistributionPtr>;

auto ArgToFeature(const ArgList& args, std::size_t index)
    -> Result<FeaturePtr>;

auto ArgToFeatures(const ArgList& args, std::size_t index)
    -> Result<std::vector<FeaturePtr>>;

auto ArgToFeatureSet(const ArgList& args, std::size_t index)
    -> Result<FeatureSetPtr>;

// Any present, non-nil value, returned unchanged (a placeholder included).
// Absent and nil both fail with InsufficientArguments.
auto ArgToArg(const ArgList& args, std::size_t index) -> Result<Value>;

// Nested argument list. Shape check only; elements are not inspected. A
// placeholder or nil at the position is a WrongArgumentType.
auto ArgToArgs(const ArgList& args, std::size_t index) -> Result<ArgList>;

// List of argument lists. Shape check one level deep only.
auto ArgToArgsList(const ArgList& args, std::size_t index)
    -> Result<std::vector<ArgList>>;

}  // namespace posarg
