#pragma once

#include <string_view>

#include "posarg/common/internal_error.hpp"
#include "posarg/value/value.hpp"

namespace posarg {

// Non-owning reflective view of a Value. A default-constructed handle is
// invalid ("not set"), which is distinct from a valid handle to a nil value.
// Must not outlive the Value it views.
class ValueHandle {
 public:
  ValueHandle() = default;
  explicit ValueHandle(const Value& value) : value_(&value) {
  }

  [[nodiscard]] auto IsValid() const -> bool {
    return value_ != nullptr;
  }

  // False for an invalid handle.
  [[nodiscard]] auto IsNil() const -> bool {
    return value_ != nullptr && value_->IsNil();
  }

  // Requires IsValid().
  [[nodiscard]] auto Get() const -> const Value& {
    if (value_ == nullptr) {
      ThrowInternalError("ValueHandle::Get", "handle is not set");
    }
    return *value_;
  }

  [[nodiscard]] auto GetKind() const -> Value::Kind {
    return Get().GetKind();
  }

  // "invalid" for an invalid handle.
  [[nodiscard]] auto TypeName() const -> std::string_view {
    return value_ != nullptr ? value_->TypeName() : "invalid";
  }

 private:
  const Value* value_ = nullptr;
};

}  // namespace posarg
