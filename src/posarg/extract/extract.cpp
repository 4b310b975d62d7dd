#include "posarg/extract/extract.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "posarg/common/arg_error.hpp"
#include "posarg/extract/slot.hpp"
#include "posarg/value/domain.hpp"
#include "posarg/value/value.hpp"

namespace posarg {

namespace {

// Shape-only decode for nested argument lists. Defaults do not apply, so a
// placeholder or nil is just another wrong shape.
template <typename T>
auto DecodeShape(const ArgList& args, std::size_t index) -> Result<T> {
  auto state = ClassifySlot(
      args, index, [](const Value& value) { return value.Is<T>(); });
  switch (state) {
    case SlotState::kAbsent:
      return std::unexpected(
          ArgError::InsufficientArguments(RequiredLength(index), args.size())
              .WithNote(ArgumentNote(index)));
    case SlotState::kPlaceholder:
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

}  // namespace

auto ArgToBool(const ArgList& args, std::size_t index) -> Result<bool> {
  return DecodeArg<bool>(args, index);
}

auto ArgToInt(
    const ArgList& args, std::size_t index, std::optional<int64_t> def)
    -> Result<int64_t> {
  return DecodeArg<int64_t>(args, index, def);
}

auto ArgToFloat64(const ArgList& args, std::size_t index) -> Result<double> {
  return DecodeArg<double>(args, index);
}

auto ArgToString(
    const ArgList& args, std::size_t index, std::optional<std::string> def)
    -> Result<std::string> {
  return DecodeArg<std::string>(args, index, def);
}

auto ArgToIntSlice(const ArgList& args, std::size_t index)
    -> Result<std::vector<int64_t>> {
  return DecodeArg<std::vector<int64_t>>(args, index);
}

auto ArgToFloat64Slice(
    const ArgList& args, std::size_t index,
    std::optional<std::vector<double>> def) -> Result<std::vector<double>> {
  return DecodeArg<std::vector<double>>(args, index, def);
}

auto ArgToFloat64SliceSlice(
    const ArgList& args, std::size_t index,
    std::optional<std::vector<std::vector<double>>> def)
    -> Result<std::vector<std::vector<double>>> {
  return DecodeArg<std::vector<std::vector<double>>>(args, index, def);
}

auto ArgToStringSlice(
    const ArgList& args, std::size_t index,
    std::optional<std::vector<std::string>> def)
    -> Result<std::vector<std::string>> {
  return DecodeArg<std::vector<std::string>>(args, index, def);
}

auto ArgToDistribution(const ArgList& args, std::size_t index)
    -> Result<DistributionPtr> {
  return DecodeArg<DistributionPtr>(args, index);
}

auto ArgToFeature(const ArgList& args, std::size_t index)
    -> Result<FeaturePtr> {
  return DecodeArg<FeaturePtr>(args, index);
}

auto ArgToFeatures(const ArgList& args, std::size_t index)
    -> Result<std::vector<FeaturePtr>> {
  return DecodeArg<std::vector<FeaturePtr>>(args, index);
}

auto ArgToFeatureSet(const ArgList& args, std::size_t index)
    -> Result<FeatureSetPtr> {
  return DecodeArg<FeatureSetPtr>(args, index);
}

auto ArgToArg(const ArgList& args, std::size_t index) -> Result<Value> {
  auto state = ClassifySlot(args, index, [](const Value&) { return true; });
  switch (state) {
    case SlotState::kAbsent:
      return std::unexpected(
          ArgError::InsufficientArguments(RequiredLength(index), args.size())
              .WithNote(ArgumentNote(index)));
    case SlotState::kNil:
      return std::unexpected(
          ArgError::NilArgument().WithNote(ArgumentNote(index)));
    case SlotState::kPlaceholder:
    case SlotState::kMismatch:
    case SlotState::kMatch:
      return args[index];
  }
  std::unreachable();
}

auto ArgToArgs(const ArgList& args, std::size_t index) -> Result<ArgList> {
  return DecodeShape<ArgList>(args, index);
}

auto ArgToArgsList(const ArgList& args, std::size_t index)
    -> Result<std::vector<ArgList>> {
  return DecodeShape<std::vector<ArgList>>(args, index);
}

}  // namespace posarg
