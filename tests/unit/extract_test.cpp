#include <gtest/gtest.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <span>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "posarg/common/arg_error.hpp"
#include "posarg/extract/extract.hpp"
#include "posarg/value/domain.hpp"
#include "posarg/value/value.hpp"

namespace posarg {
namespace {

class FakeDistribution : public Distribution {
 public:
  [[nodiscard]] auto GetName() const -> std::string override {
    return "normal";
  }
  [[nodiscard]] auto GetVectors() const
      -> std::vector<std::vector<double>> override {
    return {{0.0, 1.0}};
  }
};

class FakeFeature : public Feature {
 public:
  explicit FakeFeature(std::string sequence) : sequence_(std::move(sequence)) {
  }
  [[nodiscard]] auto GetSequence() const -> std::string override {
    return sequence_;
  }
  [[nodiscard]] auto GetPositions() const
      -> std::vector<std::vector<double>> override {
    return {{1.0}, {4.0}};
  }
  [[nodiscard]] auto GetCount() const -> std::size_t override {
    return 2;
  }

 private:
  std::string sequence_;
};

class FakeFeatureSet : public FeatureSet {
 public:
  [[nodiscard]] auto GetFeatures() const
      -> std::vector<std::shared_ptr<Feature>> override {
    return {std::make_shared<FakeFeature>("ab")};
  }
};

class ExtractTest : public ::testing::Test {
 protected:
  static void ExpectError(
      const auto& result, ArgErrorKind kind, const std::string& message) {
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, kind) << ToString(result.error());
    EXPECT_EQ(result.error().message, message);
  }
};

// =============================================================================
// Defaults and placeholders
// =============================================================================

TEST_F(ExtractTest, PlaceholderUsesDefault) {
  ArgList args{"foo", DefaultArg{}, "baz"};
  auto r = ArgToString(args, 1, "bar");
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(*r, "bar");
}

TEST_F(ExtractTest, PresentValueIgnoresDefault) {
  ArgList args{"foo", DefaultArg{}, "baz"};
  auto r = ArgToString(args, 2, "bar");
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(*r, "baz");
}

TEST_F(ExtractTest, AbsentWithoutDefaultIsInsufficient) {
  ArgList args{"foo"};
  auto r = ArgToString(args, 1);
  ExpectError(
      r, ArgErrorKind::kInsufficientArguments, "expected 2 arg(s) got 1");
  ASSERT_EQ(r.error().notes.size(), 1U);
  EXPECT_EQ(r.error().notes[0], "argument 1");
}

TEST_F(ExtractTest, AbsentWithDefaultReturnsDefault) {
  ArgList args;
  for (std::size_t p = 0; p < 3; ++p) {
    auto r = ArgToInt(args, p, 9);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, 9);
  }
}

TEST_F(ExtractTest, EveryExtractorFailsPastTheEnd) {
  ArgList args{1, 2};
  auto insufficient = [](const auto& result) {
    return !result.has_value() &&
           result.error().Is(ArgErrorKind::kInsufficientArguments);
  };
  for (std::size_t p = 2; p < 5; ++p) {
    SCOPED_TRACE(p);
    EXPECT_TRUE(insufficient(ArgToBool(args, p)));
    EXPECT_TRUE(insufficient(ArgToInt(args, p)));
    EXPECT_TRUE(insufficient(ArgToFloat64(args, p)));
    EXPECT_TRUE(insufficient(ArgToString(args, p)));
    EXPECT_TRUE(insufficient(ArgToIntSlice(args, p)));
    EXPECT_TRUE(insufficient(ArgToFloat64Slice(args, p)));
    EXPECT_TRUE(insufficient(ArgToFloat64SliceSlice(args, p)));
    EXPECT_TRUE(insufficient(ArgToStringSlice(args, p)));
    EXPECT_TRUE(insufficient(ArgToDistribution(args, p)));
    EXPECT_TRUE(insufficient(ArgToFeature(args, p)));
    EXPECT_TRUE(insufficient(ArgToFeatures(args, p)));
    EXPECT_TRUE(insufficient(ArgToFeatureSet(args, p)));
    EXPECT_TRUE(insufficient(ArgToArg(args, p)));
    EXPECT_TRUE(insufficient(ArgToArgs(args, p)));
    EXPECT_TRUE(insufficient(ArgToArgsList(args, p)));
  }
}

TEST_F(ExtractTest, LastPositionDoesNotWrap) {
  constexpr auto kLast = std::numeric_limits<std::size_t>::max();
  ArgList args{Value()};
  auto r = ArgToInt(args, kLast);
  ASSERT_FALSE(r.has_value());
  EXPECT_TRUE(r.error().Is(ArgErrorKind::kInsufficientArguments));
  EXPECT_EQ(
      std::get<CountDetail>(r.error().detail),
      (CountDetail{.expected = kLast, .actual = 1}));

  auto any = ArgToArg(args, kLast);
  ASSERT_FALSE(any.has_value());
  EXPECT_EQ(std::get<CountDetail>(any.error().detail).expected, kLast);
}

TEST_F(ExtractTest, PlaceholderWithoutDefaultIsInsufficient) {
  ArgList args{DefaultArg{}};
  ExpectError(
      ArgToFloat64Slice(args, 0), ArgErrorKind::kInsufficientArguments,
      "expected 1 default got 0");
  ExpectError(
      ArgToBool(args, 0), ArgErrorKind::kInsufficientArguments,
      "expected 1 default got 0");
}

TEST_F(ExtractTest, TwoDefaultsAreTooMany) {
  ArgList args;
  std::array<int64_t, 2> defaults{5, 6};
  auto r = DecodeArg<int64_t>(args, 0, std::span<const int64_t>(defaults));
  ExpectError(r, ArgErrorKind::kTooManyArguments, "expected 1 default got 2");
}

TEST_F(ExtractTest, TwoDefaultsAreTooManyForEveryDefaultingKind) {
  auto too_many = [](const auto& result) {
    return !result.has_value() &&
           result.error().Is(ArgErrorKind::kTooManyArguments);
  };
  ArgList args{DefaultArg{}};

  std::array<int64_t, 2> ints{5, 6};
  EXPECT_TRUE(too_many(
      DecodeArg<int64_t>(args, 0, std::span<const int64_t>(ints))));

  std::array<std::string, 2> strings{"a", "b"};
  EXPECT_TRUE(too_many(
      DecodeArg<std::string>(args, 0, std::span<const std::string>(strings))));

  using FloatList = std::vector<double>;
  std::array<FloatList, 2> float_lists{FloatList{1.0}, FloatList{}};
  EXPECT_TRUE(too_many(
      DecodeArg<FloatList>(args, 0, std::span<const FloatList>(float_lists))));

  using FloatMatrix = std::vector<std::vector<double>>;
  std::array<FloatMatrix, 2> matrices{FloatMatrix{{1.0}}, FloatMatrix{}};
  EXPECT_TRUE(too_many(
      DecodeArg<FloatMatrix>(args, 0, std::span<const FloatMatrix>(matrices))));

  using StringList = std::vector<std::string>;
  std::array<StringList, 2> string_lists{StringList{"a"}, StringList{"b"}};
  EXPECT_TRUE(too_many(DecodeArg<StringList>(
      args, 0, std::span<const StringList>(string_lists))));
}

TEST_F(ExtractTest, TwoDefaultsFailEvenWhenValuePresent) {
  ArgList args{1};
  std::array<int64_t, 2> defaults{5, 6};
  auto r = DecodeArg<int64_t>(args, 0, std::span<const int64_t>(defaults));
  EXPECT_FALSE(r.has_value());
}

TEST_F(ExtractTest, EmptySliceDefaultIsReturned) {
  ArgList args{DefaultArg{}};
  auto r = ArgToFloat64Slice(args, 0, std::vector<double>{});
  ASSERT_TRUE(r.has_value());
  EXPECT_TRUE(r->empty());
}

TEST_F(ExtractTest, FloatMatrixDefault) {
  std::vector<std::vector<double>> def{{1.0, 2.0}, {3.0}};
  auto r = ArgToFloat64SliceSlice(ArgList{}, 0, def);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(*r, def);
}

// =============================================================================
// Type checks
// =============================================================================

TEST_F(ExtractTest, WrongTypeNamesExpectedAndActual) {
  ArgList args{"foo"};
  auto r = ArgToInt(args, 0);
  ExpectError(r, ArgErrorKind::kWrongArgumentType, "expected int got string");
  EXPECT_EQ(
      std::get<TypeDetail>(r.error().detail),
      (TypeDetail{.expected = "int", .actual = "string"}));
}

TEST_F(ExtractTest, NoNumericCoercion) {
  ArgList args{1, 1.0};
  ExpectError(
      ArgToFloat64(args, 0), ArgErrorKind::kWrongArgumentType,
      "expected float got int");
  ExpectError(
      ArgToInt(args, 1), ArgErrorKind::kWrongArgumentType,
      "expected int got float");
}

TEST_F(ExtractTest, NilIsATypeMismatch) {
  ArgList args{Value()};
  ExpectError(
      ArgToString(args, 0, "bar"), ArgErrorKind::kWrongArgumentType,
      "expected string got nil");
}

TEST_F(ExtractTest, WrongTypeIgnoresDefault) {
  ArgList args{42};
  EXPECT_FALSE(ArgToString(args, 0, "bar").has_value());
}

TEST_F(ExtractTest, ListKindsAreExact) {
  ArgList args{std::vector<int64_t>{1, 2}};
  EXPECT_TRUE(ArgToIntSlice(args, 0).has_value());
  ExpectError(
      ArgToFloat64Slice(args, 0), ArgErrorKind::kWrongArgumentType,
      "expected float_list got int_list");
}

// =============================================================================
// Typed success paths
// =============================================================================

TEST_F(ExtractTest, ScalarsAndSequences) {
  ArgList args{
      true,
      int64_t{-4},
      2.5,
      "s",
      std::vector<int64_t>{1},
      std::vector<double>{0.5},
      std::vector<std::string>{"a", "b"},
  };
  EXPECT_EQ(ArgToBool(args, 0).value(), true);
  EXPECT_EQ(ArgToInt(args, 1).value(), -4);
  EXPECT_EQ(ArgToFloat64(args, 2).value(), 2.5);
  EXPECT_EQ(ArgToString(args, 3).value(), "s");
  EXPECT_EQ(ArgToIntSlice(args, 4).value(), std::vector<int64_t>{1});
  EXPECT_EQ(ArgToFloat64Slice(args, 5).value(), std::vector<double>{0.5});
  EXPECT_EQ(
      ArgToStringSlice(args, 6).value(), (std::vector<std::string>{"a", "b"}));
}

TEST_F(ExtractTest, DomainObjectsPassThroughShared) {
  auto dist = std::make_shared<FakeDistribution>();
  auto feature = std::make_shared<FakeFeature>("abc");
  auto set = std::make_shared<FakeFeatureSet>();
  ArgList args{
      DistributionPtr(dist),
      FeaturePtr(feature),
      std::vector<FeaturePtr>{feature, feature},
      FeatureSetPtr(set),
  };

  EXPECT_EQ(ArgToDistribution(args, 0).value().get(), dist.get());
  EXPECT_EQ(ArgToFeature(args, 1).value().get(), feature.get());
  auto features = ArgToFeatures(args, 2);
  ASSERT_TRUE(features.has_value());
  ASSERT_EQ(features->size(), 2U);
  EXPECT_EQ((*features)[1]->GetSequence(), "abc");
  EXPECT_EQ(ArgToFeatureSet(args, 3).value().get(), set.get());

  ExpectError(
      ArgToFeature(args, 0), ArgErrorKind::kWrongArgumentType,
      "expected feature got distribution");
}

// =============================================================================
// Generic extractors
// =============================================================================

TEST_F(ExtractTest, ArgToArgReturnsAnyPresentValue) {
  ArgList args{"foo", DefaultArg{}, Value()};
  EXPECT_EQ(ArgToArg(args, 0).value(), Value("foo"));
  EXPECT_TRUE(ArgToArg(args, 1).value().IsPlaceholder());
  ExpectError(
      ArgToArg(args, 2), ArgErrorKind::kInsufficientArguments,
      "expected value got nil");
  ExpectError(
      ArgToArg(args, 3), ArgErrorKind::kInsufficientArguments,
      "expected 4 arg(s) got 3");
}

TEST_F(ExtractTest, ArgToArgsChecksShapeOnly) {
  ArgList nested{Value(), DefaultArg{}, "x"};
  ArgList args{Value(nested), 1};
  auto r = ArgToArgs(args, 0);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(*r, nested);
  ExpectError(
      ArgToArgs(args, 1), ArgErrorKind::kWrongArgumentType,
      "expected args got int");
}

TEST_F(ExtractTest, ArgToArgsRejectsPlaceholderAndNil) {
  ArgList args{DefaultArg{}, Value()};
  ExpectError(
      ArgToArgs(args, 0), ArgErrorKind::kWrongArgumentType,
      "expected args got default");
  ExpectError(
      ArgToArgs(args, 1), ArgErrorKind::kWrongArgumentType,
      "expected args got nil");
  ExpectError(
      ArgToArgsList(args, 0), ArgErrorKind::kWrongArgumentType,
      "expected args_list got default");
}

TEST_F(ExtractTest, ArgToArgsList) {
  std::vector<ArgList> lists{ArgList{1}, ArgList{"a", 2.0}};
  ArgList args{lists};
  auto r = ArgToArgsList(args, 0);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(*r, lists);
}

}  // namespace
}  // namespace posarg
