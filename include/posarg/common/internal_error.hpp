#pragma once

#include <format>
#include <stdexcept>
#include <string>

namespace posarg {

// Exception type for internal errors (library bugs or misuse of an accessor
// whose precondition the caller was required to check, not bad input).
class InternalError : public std::runtime_error {
 public:
  InternalError(const char* context, const std::string& detail)
      : std::runtime_error(
            std::format("Internal error in {}: {}", context, detail)) {
  }
};

[[noreturn]] inline void ThrowInternalError(
    const char* context, const std::string& detail) {
  throw InternalError(context, detail);
}

}  // namespace posarg
