#include "posarg/extract/slot.hpp"

#include <cstddef>
#include <expected>
#include <format>
#include <limits>
#include <string>

#include "posarg/common/arg_error.hpp"

namespace posarg {

auto ToString(SlotState state) -> const char* {
  switch (state) {
    case SlotState::kAbsent:
      return "absent";
    case SlotState::kPlaceholder:
      return "placeholder";
    case SlotState::kNil:
      return "nil";
    case SlotState::kMismatch:
      return "mismatch";
    case SlotState::kMatch:
      return "match";
  }
  return "unknown";
}

auto CheckDefaultCount(std::size_t count) -> Result<void> {
  if (count > 1) {
    return std::unexpected(ArgError::TooManyDefaults(count));
  }
  return {};
}

auto RequiredLength(std::size_t index) -> std::size_t {
  if (index == std::numeric_limits<std::size_t>::max()) {
    return index;
  }
  return index + 1;
}

auto ArgumentNote(std::size_t index) -> std::string {
  return std::format("argument {}", index);
}

}  // namespace posarg
