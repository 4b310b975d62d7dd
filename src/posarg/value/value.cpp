#include "posarg/value/value.hpp"

#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "posarg/common/overloaded.hpp"

namespace posarg {

namespace {

constexpr std::array<std::string_view, 17> kKindNames = {
    "nil",          "default",      "bool",        "int",
    "float",        "string",       "int_list",    "float_list",
    "float_matrix", "string_list",  "distribution", "feature",
    "feature_list", "feature_set",  "args",        "args_list",
    "error",
};

static_assert(kKindNames.size() == std::variant_size_v<Value::Storage>);

auto QuoteString(std::string_view s) -> std::string {
  std::string out = "\"";
  for (char c : s) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\t':
        out += "\\t";
        break;
      case '\r':
        out += "\\r";
        break;
      default:
        out += c;
        break;
    }
  }
  out += '"';
  return out;
}

// Always re-reads as a float: 1.0 prints as "1.0", not "1".
auto FormatFloat(double d) -> std::string {
  if (std::isnan(d)) {
    return ".nan";
  }
  if (std::isinf(d)) {
    return d < 0 ? "-.inf" : ".inf";
  }
  auto s = std::format("{}", d);
  if (s.find_first_of(".e") == std::string::npos) {
    s += ".0";
  }
  return s;
}

template <typename T, typename Fn>
auto JoinList(const std::vector<T>& elems, Fn&& fn) -> std::string {
  std::string out = "[";
  bool first = true;
  for (const auto& e : elems) {
    if (!first) {
      out += ", ";
    }
    first = false;
    out += fn(e);
  }
  out += ']';
  return out;
}

// Empty typed lists read back as `args` unless tagged.
template <typename T, typename Fn>
auto FormatTypedList(
    const std::vector<T>& elems, Value::Kind kind, Fn&& fn) -> std::string {
  if (elems.empty()) {
    return std::format("!{} []", Value::KindName(kind));
  }
  return JoinList(elems, std::forward<Fn>(fn));
}

// An untagged non-empty list whose elements all share one of these kinds
// reads back as a typed list, so such argument lists need the !args tag.
auto NeedsArgsTag(const ArgList& args) -> bool {
  if (args.empty()) {
    return false;
  }
  auto kind = args.front().GetKind();
  switch (kind) {
    case Value::Kind::kInt:
    case Value::Kind::kFloat:
    case Value::Kind::kString:
    case Value::Kind::kFloatList:
    case Value::Kind::kArgs:
      break;
    default:
      return false;
  }
  for (const auto& v : args) {
    if (v.GetKind() != kind) {
      return false;
    }
  }
  return true;
}

auto FormatArgs(const ArgList& args) -> std::string {
  auto body = JoinList(args, [](const Value& v) { return v.ToString(); });
  return NeedsArgsTag(args) ? "!args " + body : body;
}

auto FormatFeature(const FeaturePtr& f) -> std::string {
  if (!f) {
    return "<feature null>";
  }
  return std::format("<feature {}>", QuoteString(f->GetSequence()));
}

}  // namespace

auto Value::KindName(Kind kind) -> std::string_view {
  auto index = static_cast<std::size_t>(kind);
  if (index >= kKindNames.size()) {
    return "unknown";
  }
  return kKindNames.at(index);
}

auto Value::ParseKind(std::string_view name) -> std::optional<Kind> {
  for (std::size_t i = 0; i < kKindNames.size(); ++i) {
    if (kKindNames.at(i) == name) {
      return static_cast<Kind>(i);
    }
  }
  return std::nullopt;
}

auto Value::TypeName() const -> std::string_view {
  return KindName(GetKind());
}

auto Value::ToString() const -> std::string {
  return Match(
      value_, [](Nil) -> std::string { return "~"; },
      [](DefaultArg) -> std::string { return "!default"; },
      [](bool b) -> std::string { return b ? "true" : "false"; },
      [](int64_t i) -> std::string { return std::to_string(i); },
      [](double d) -> std::string { return FormatFloat(d); },
      [](const std::string& s) -> std::string { return QuoteString(s); },
      [](const std::vector<int64_t>& v) -> std::string {
        return FormatTypedList(
            v, Kind::kIntList, [](int64_t i) { return std::to_string(i); });
      },
      [](const std::vector<double>& v) -> std::string {
        return FormatTypedList(v, Kind::kFloatList, FormatFloat);
      },
      [](const std::vector<std::vector<double>>& m) -> std::string {
        return FormatTypedList(
            m, Kind::kFloatMatrix, [](const std::vector<double>& row) {
              return FormatTypedList(row, Kind::kFloatList, FormatFloat);
            });
      },
      [](const std::vector<std::string>& v) -> std::string {
        return FormatTypedList(
            v, Kind::kStringList,
            [](const std::string& s) { return QuoteString(s); });
      },
      [](const DistributionPtr& d) -> std::string {
        if (!d) {
          return "<distribution null>";
        }
        return std::format("<distribution {}>", QuoteString(d->GetName()));
      },
      [](const FeaturePtr& f) -> std::string { return FormatFeature(f); },
      [](const std::vector<FeaturePtr>& fs) -> std::string {
        return JoinList(fs, FormatFeature);
      },
      [](const FeatureSetPtr& fs) -> std::string {
        if (!fs) {
          return "<feature_set null>";
        }
        return std::format("<feature_set {}>", fs->GetFeatures().size());
      },
      [](const ArgList& args) -> std::string { return FormatArgs(args); },
      [](const std::vector<ArgList>& list) -> std::string {
        if (list.empty()) {
          return "!args_list []";
        }
        return JoinList(list, FormatArgs);
      },
      [](const ArgError& e) -> std::string {
        return "!error " + QuoteString(e.message);
      });
}

}  // namespace posarg
