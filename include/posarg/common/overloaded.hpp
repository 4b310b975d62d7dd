#pragma once

#include <utility>
#include <variant>

namespace posarg {

// Visitor helper for std::visit with multiple lambdas.
//
// Usage:
//   std::visit(Overloaded{
//       [](const TypeA& a) { ... },
//       [](const TypeB& b) { ... },
//   }, variant);
template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};

template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

template <typename Variant, typename... Matchers>
auto Match(Variant&& v, Matchers&&... matchers) -> decltype(auto) {
  return std::visit(
      Overloaded{std::forward<Matchers>(matchers)...},
      std::forward<Variant>(v));
}

}  // namespace posarg
