#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>

#include "posarg/common/arg_error.hpp"
#include "posarg/value/value.hpp"

namespace posarg {

// What an extractor finds at its target position. Absent, placeholder and
// nil stay distinguishable even where they currently map to the same
// failure kind.
enum class SlotState : uint8_t {
  kAbsent,       // index >= args.size()
  kPlaceholder,  // DefaultArg
  kNil,          // present, holds no value
  kMismatch,     // present, wrong kind
  kMatch,        // present, expected kind
};

auto ToString(SlotState state) -> const char*;

// Classify args[index] using `matches` as the exact-kind predicate. The
// placeholder and nil checks run before the predicate.
template <typename Pred>
auto ClassifySlot(const ArgList& args, std::size_t index, Pred&& matches)
    -> SlotState {
  if (index >= args.size()) {
    return SlotState::kAbsent;
  }
  const Value& value = args[index];
  if (value.IsPlaceholder()) {
    return SlotState::kPlaceholder;
  }
  if (value.IsNil()) {
    return SlotState::kNil;
  }
  return matches(value) ? SlotState::kMatch : SlotState::kMismatch;
}

// At most one default may be supplied per extraction.
auto CheckDefaultCount(std::size_t count) -> Result<void>;

// List length needed for `index` to be present, saturating at SIZE_MAX.
auto RequiredLength(std::size_t index) -> std::size_t;

// Note attached to every extractor failure.
auto ArgumentNote(std::size_t index) -> std::string;

// Resolve an absent or placeholder slot: the single default if there is one,
// otherwise InsufficientArguments.
template <typename T>
auto ResolveDefault(
    SlotState state, const ArgList& args, std::size_t index,
    std::span<const T> defaults) -> Result<T> {
  if (!defaults.empty()) {
    return defaults.front();
  }
  if (state == SlotState::kAbsent) {
    return std::unexpected(
        ArgError::InsufficientArguments(RequiredLength(index), args.size())
            .WithNote(ArgumentNote(index)));
  }
  return std::unexpected(
      ArgError::MissingDefault().WithNote(ArgumentNote(index)));
}

}  // namespace posarg
