#include "posarg/pack/pack.hpp"

#include <expected>
#include <span>
#include <string>
#include <vector>

#include "posarg/common/arg_error.hpp"
#include "posarg/pack/value_handle.hpp"
#include "posarg/value/value.hpp"

namespace posarg {

auto ArgsToHandles(const ArgList& args) -> std::vector<ValueHandle> {
  std::vector<ValueHandle> handles;
  handles.reserve(args.size());
  for (const auto& arg : args) {
    handles.emplace_back(arg);
  }
  return handles;
}

auto HandlesToArgs(std::span<const ValueHandle> handles) -> Result<ArgList> {
  if (handles.size() != kPackedArity) {
    return std::unexpected(
        ArgError::ArityMismatch(kPackedArity, handles.size()));
  }

  const ValueHandle& payload = handles[0];
  const ValueHandle& failure = handles[1];

  if (!failure.IsValid() || failure.IsNil()) {
    if (!payload.IsValid() || !payload.Get().Is<ArgList>()) {
      return std::unexpected(
          ArgError::WrongArgumentType(
              std::string(Value::KindName(Value::Kind::kArgs)),
              std::string(payload.TypeName()))
              .WithNote("result payload"));
    }
    return payload.Get().As<ArgList>();
  }

  if (failure.Get().Is<ArgError>()) {
    return std::unexpected(failure.Get().As<ArgError>());
  }

  return std::unexpected(
      ArgError::WrongArgumentType(
          std::string(Value::KindName(Value::Kind::kError)),
          std::string(failure.TypeName()))
          .WithNote("result failure"));
}

}  // namespace posarg
