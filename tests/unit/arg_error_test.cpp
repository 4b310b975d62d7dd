#include <gtest/gtest.h>

#include <variant>

#include "posarg/common/arg_error.hpp"

namespace posarg {
namespace {

class ArgErrorTest : public ::testing::Test {};

// =============================================================================
// Factories
// =============================================================================

TEST_F(ArgErrorTest, InsufficientArgumentsCarriesCounts) {
  auto e = ArgError::InsufficientArguments(2, 1);
  EXPECT_EQ(e.kind, ArgErrorKind::kInsufficientArguments);
  EXPECT_EQ(e.message, "expected 2 arg(s) got 1");
  ASSERT_TRUE(std::holds_alternative<CountDetail>(e.detail));
  EXPECT_EQ(std::get<CountDetail>(e.detail).expected, 2U);
  EXPECT_EQ(std::get<CountDetail>(e.detail).actual, 1U);
  EXPECT_TRUE(e.notes.empty());
}

TEST_F(ArgErrorTest, MissingDefaultIsInsufficient) {
  auto e = ArgError::MissingDefault();
  EXPECT_TRUE(e.Is(ArgErrorKind::kInsufficientArguments));
  EXPECT_EQ(e.message, "expected 1 default got 0");
}

TEST_F(ArgErrorTest, NilArgumentIsInsufficient) {
  auto e = ArgError::NilArgument();
  EXPECT_TRUE(e.Is(ArgErrorKind::kInsufficientArguments));
  ASSERT_TRUE(std::holds_alternative<TypeDetail>(e.detail));
  EXPECT_EQ(std::get<TypeDetail>(e.detail).actual, "nil");
}

TEST_F(ArgErrorTest, TooManyDefaults) {
  auto e = ArgError::TooManyDefaults(3);
  EXPECT_TRUE(e.Is(ArgErrorKind::kTooManyArguments));
  EXPECT_EQ(e.message, "expected 1 default got 3");
}

TEST_F(ArgErrorTest, ArityMismatchPicksKindFromDirection) {
  EXPECT_TRUE(
      ArgError::ArityMismatch(2, 3).Is(ArgErrorKind::kTooManyArguments));
  EXPECT_TRUE(
      ArgError::ArityMismatch(2, 1).Is(ArgErrorKind::kInsufficientArguments));
  EXPECT_TRUE(
      ArgError::ArityMismatch(2, 0).Is(ArgErrorKind::kInsufficientArguments));
  EXPECT_EQ(ArgError::ArityMismatch(2, 3).message, "expected 2 got 3");
}

TEST_F(ArgErrorTest, WrongArgumentTypeNamesBothTypes) {
  auto e = ArgError::WrongArgumentType("int", "string");
  EXPECT_TRUE(e.Is(ArgErrorKind::kWrongArgumentType));
  EXPECT_EQ(e.message, "expected int got string");
  EXPECT_EQ(
      std::get<TypeDetail>(e.detail),
      (TypeDetail{.expected = "int", .actual = "string"}));
}

TEST_F(ArgErrorTest, CallFailedKeepsMessage) {
  auto e = ArgError::CallFailed("boom");
  EXPECT_TRUE(e.Is(ArgErrorKind::kCallFailed));
  EXPECT_EQ(e.message, "boom");
  EXPECT_TRUE(std::holds_alternative<std::monostate>(e.detail));
}

// =============================================================================
// Notes and rendering
// =============================================================================

TEST_F(ArgErrorTest, WithNoteAppendsInOrder) {
  auto e = ArgError::CallFailed("boom").WithNote("inner").WithNote("outer");
  ASSERT_EQ(e.notes.size(), 2U);
  EXPECT_EQ(e.notes[0], "inner");
  EXPECT_EQ(e.notes[1], "outer");
}

TEST_F(ArgErrorTest, ToStringJoinsKindMessageAndNotes) {
  auto e = ArgError::WrongArgumentType("int", "string").WithNote("argument 0");
  EXPECT_EQ(
      ToString(e), "wrong argument type: expected int got string; argument 0");
}

TEST_F(ArgErrorTest, IdentifiersRoundTrip) {
  for (auto kind :
       {ArgErrorKind::kInsufficientArguments, ArgErrorKind::kTooManyArguments,
        ArgErrorKind::kWrongArgumentType, ArgErrorKind::kCallFailed}) {
    auto parsed = ParseArgErrorKind(ToIdentifier(kind));
    ASSERT_TRUE(parsed.has_value()) << ToIdentifier(kind);
    EXPECT_EQ(*parsed, kind);
  }
  EXPECT_FALSE(ParseArgErrorKind("insufficient arguments").has_value());
}

TEST_F(ArgErrorTest, EqualityIncludesNotes) {
  auto a = ArgError::CallFailed("x");
  auto b = ArgError::CallFailed("x");
  EXPECT_EQ(a, b);
  EXPECT_NE(a, std::move(b).WithNote("n"));
}

}  // namespace
}  // namespace posarg
