#pragma once

#include <cstddef>
#include <span>
#include <vector>

#include "posarg/common/arg_error.hpp"
#include "posarg/pack/value_handle.hpp"
#include "posarg/value/value.hpp"

namespace posarg {

// Number of components HandlesToArgs accepts: payload, then failure.
inline constexpr std::size_t kPackedArity = 2;

// One handle per argument, in order. The handles view `args`.
auto ArgsToHandles(const ArgList& args) -> std::vector<ValueHandle>;

// Collapse a (payload, failure) pair into an argument list.
//
// - arity other than 2: TooManyArguments / InsufficientArguments
// - failure not set or nil: the payload, which must hold an ArgList
//   (WrongArgumentType otherwise)
// - failure holds an ArgError: that error, payload discarded
// - failure holds anything else: WrongArgumentType
auto HandlesToArgs(std::span<const ValueHandle> handles) -> Result<ArgList>;

}  // namespace posarg
