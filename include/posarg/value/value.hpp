#pragma once

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <format>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>
#include <fmt/format.h>

#include "posarg/common/arg_error.hpp"
#include "posarg/common/internal_error.hpp"
#include "posarg/value/domain.hpp"

namespace posarg {

// Placeholder marker: "use the default for this position". Distinct from the
// position being absent.
//
//   ArgList args{"foo", DefaultArg{}, "baz"};
//   auto s = ArgToString(args, 1, "bar");  // "bar"
struct DefaultArg {
  auto operator==(const DefaultArg&) const -> bool = default;
};

// A present slot that holds no usable value.
using Nil = std::monostate;

class Value;

namespace detail {

// Index of T among the alternatives of Variant, or variant_size if absent.
template <typename T, typename Variant, std::size_t I = 0>
constexpr auto AlternativeIndex() -> std::size_t {
  if constexpr (I == std::variant_size_v<Variant>) {
    return I;
  } else if constexpr (std::is_same_v<
                           T, std::variant_alternative_t<I, Variant>>) {
    return I;
  } else {
    return AlternativeIndex<T, Variant, I + 1>();
  }
}

}  // namespace detail

// Ordered, caller-owned sequence of loosely-typed values.
using ArgList = std::vector<Value>;

// One slot of an argument list. A closed set of payload kinds; the kind is
// fixed at construction and checked exactly on extraction (no numeric or
// text coercion).
class Value {
 public:
  // Order matches Storage alternatives.
  enum class Kind : uint8_t {
    kNil,
    kDefault,
    kBool,
    kInt,
    kFloat,
    kString,
    kIntList,
    kFloatList,
    kFloatMatrix,
    kStringList,
    kDistribution,
    kFeature,
    kFeatureList,
    kFeatureSet,
    kArgs,
    kArgsList,
    kError,
  };

  using Storage = std::variant<
      Nil, DefaultArg, bool, int64_t, double, std::string, std::vector<int64_t>,
      std::vector<double>, std::vector<std::vector<double>>,
      std::vector<std::string>, DistributionPtr, FeaturePtr,
      std::vector<FeaturePtr>, FeatureSetPtr, std::vector<Value>,
      std::vector<std::vector<Value>>, ArgError>;

  template <typename T>
  static constexpr bool kIsPayload =
      detail::AlternativeIndex<T, Storage>() < std::variant_size_v<Storage>;

  Value() = default;

  template <typename T>
    requires kIsPayload<std::remove_cvref_t<T>>
  Value(T&& v)  // NOLINT(google-explicit-constructor)
      : value_(std::in_place_type<std::remove_cvref_t<T>>, std::forward<T>(v)) {
  }

  // Integer literals of any width are stored as int64_t.
  template <std::integral I>
    requires(!std::same_as<I, bool> && !std::same_as<I, int64_t>)
  Value(I v)  // NOLINT(google-explicit-constructor)
      : value_(std::in_place_type<int64_t>, static_cast<int64_t>(v)) {
  }

  Value(float v)  // NOLINT(google-explicit-constructor)
      : value_(std::in_place_type<double>, static_cast<double>(v)) {
  }

  Value(const char* s)  // NOLINT(google-explicit-constructor)
      : value_(std::in_place_type<std::string>, s) {
  }

  template <typename T>
  static constexpr auto KindOf() -> Kind {
    static_assert(kIsPayload<T>, "not a Value payload type");
    return static_cast<Kind>(detail::AlternativeIndex<T, Storage>());
  }

  [[nodiscard]] auto GetKind() const -> Kind {
    return static_cast<Kind>(value_.index());
  }

  [[nodiscard]] auto TypeName() const -> std::string_view;

  template <typename T>
  [[nodiscard]] auto Is() const -> bool {
    return std::holds_alternative<T>(value_);
  }

  [[nodiscard]] auto IsNil() const -> bool {
    return Is<Nil>();
  }

  [[nodiscard]] auto IsPlaceholder() const -> bool {
    return Is<DefaultArg>();
  }

  // Requires Is<T>(); callers decide the kind first.
  template <typename T>
  [[nodiscard]] auto As() const -> const T& {
    if (const auto* p = std::get_if<T>(&value_)) {
      return *p;
    }
    ThrowInternalError(
        "Value::As",
        std::format(
            "requested {} but value holds {}", KindName(KindOf<T>()),
            TypeName()));
  }

  [[nodiscard]] auto Raw() const -> const Storage& {
    return value_;
  }

  // Literal notation, e.g. [1, 2], "text", !default
  [[nodiscard]] auto ToString() const -> std::string;

  auto operator==(const Value& other) const -> bool = default;

  static auto KindName(Kind kind) -> std::string_view;
  static auto ParseKind(std::string_view name) -> std::optional<Kind>;

 private:
  Storage value_;
};

static_assert(
    static_cast<std::size_t>(Value::Kind::kError) + 1 ==
        std::variant_size_v<Value::Storage>,
    "Value::Kind out of sync with Value::Storage");

inline auto operator<<(std::ostream& os, const Value& value) -> std::ostream& {
  return os << value.ToString();
}

}  // namespace posarg

template <>
struct fmt::formatter<posarg::Value> {
  template <typename ParseContext>
  constexpr auto parse(ParseContext& ctx) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const posarg::Value& value, FormatContext& ctx) const {
    return fmt::format_to(ctx.out(), "{}", value.ToString());
  }
};

template <>
struct fmt::formatter<posarg::ArgError> {
  template <typename ParseContext>
  constexpr auto parse(ParseContext& ctx) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const posarg::ArgError& error, FormatContext& ctx) const {
    return fmt::format_to(ctx.out(), "{}", posarg::ToString(error));
  }
};
