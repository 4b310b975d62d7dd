#include <gtest/gtest.h>

#include <vector>

#include "posarg/common/arg_error.hpp"
#include "posarg/common/internal_error.hpp"
#include "posarg/pack/pack.hpp"
#include "posarg/pack/value_handle.hpp"
#include "posarg/value/value.hpp"

namespace posarg {
namespace {

class PackTest : public ::testing::Test {};

// =============================================================================
// ValueHandle
// =============================================================================

TEST_F(PackTest, DefaultHandleIsInvalid) {
  ValueHandle h;
  EXPECT_FALSE(h.IsValid());
  EXPECT_FALSE(h.IsNil());
  EXPECT_EQ(h.TypeName(), "invalid");
  EXPECT_THROW((void)h.Get(), InternalError);
}

TEST_F(PackTest, HandleToNilIsValid) {
  Value nil;
  ValueHandle h(nil);
  EXPECT_TRUE(h.IsValid());
  EXPECT_TRUE(h.IsNil());
  EXPECT_EQ(h.GetKind(), Value::Kind::kNil);
}

TEST_F(PackTest, ArgsToHandlesPreservesOrderAndCount) {
  ArgList args{1, "x", Value()};
  auto handles = ArgsToHandles(args);
  ASSERT_EQ(handles.size(), 3U);
  EXPECT_EQ(&handles[0].Get(), &args[0]);
  EXPECT_EQ(handles[1].TypeName(), "string");
  EXPECT_TRUE(handles[2].IsNil());
}

// =============================================================================
// HandlesToArgs
// =============================================================================

TEST_F(PackTest, PayloadWithNilFailureIsUnpacked) {
  ArgList payload{1, "two", 3.0};
  ArgList components{Value(payload), Value()};
  auto handles = ArgsToHandles(components);
  auto r = HandlesToArgs(handles);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(*r, payload);
}

TEST_F(PackTest, UnsetFailureHandleCountsAsNoFailure) {
  ArgList payload{"a"};
  Value packed(payload);
  std::vector<ValueHandle> handles{ValueHandle(packed), ValueHandle()};
  auto r = HandlesToArgs(handles);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(*r, payload);
}

TEST_F(PackTest, EmptyPayloadIsAnEmptyList) {
  ArgList components{Value(ArgList{}), Value()};
  auto r = HandlesToArgs(ArgsToHandles(components));
  ASSERT_TRUE(r.has_value());
  EXPECT_TRUE(r->empty());
}

TEST_F(PackTest, ErrorIsSurfacedUnchanged) {
  auto error = ArgError::CallFailed("boom").WithNote("producer");
  ArgList components{Value(ArgList{1}), Value(error)};
  auto r = HandlesToArgs(ArgsToHandles(components));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), error);
}

TEST_F(PackTest, ErrorWinsOverMalformedPayload) {
  ArgList components{Value(), Value(ArgError::CallFailed("boom"))};
  auto r = HandlesToArgs(ArgsToHandles(components));
  ASSERT_FALSE(r.has_value());
  EXPECT_TRUE(r.error().Is(ArgErrorKind::kCallFailed));
}

TEST_F(PackTest, ArityOtherThanTwo) {
  ArgList one{Value(ArgList{})};
  ArgList three{Value(ArgList{}), Value(), Value()};

  auto r1 = HandlesToArgs(ArgsToHandles(one));
  ASSERT_FALSE(r1.has_value());
  EXPECT_TRUE(r1.error().Is(ArgErrorKind::kInsufficientArguments));
  EXPECT_EQ(r1.error().message, "expected 2 got 1");

  auto r3 = HandlesToArgs(ArgsToHandles(three));
  ASSERT_FALSE(r3.has_value());
  EXPECT_TRUE(r3.error().Is(ArgErrorKind::kTooManyArguments));
  EXPECT_EQ(r3.error().message, "expected 2 got 3");

  auto r0 = HandlesToArgs({});
  ASSERT_FALSE(r0.has_value());
  EXPECT_TRUE(r0.error().Is(ArgErrorKind::kInsufficientArguments));
}

TEST_F(PackTest, NonListPayloadIsWrongType) {
  ArgList components{42, Value()};
  auto r = HandlesToArgs(ArgsToHandles(components));
  ASSERT_FALSE(r.has_value());
  EXPECT_TRUE(r.error().Is(ArgErrorKind::kWrongArgumentType));
  EXPECT_EQ(r.error().message, "expected args got int");
}

TEST_F(PackTest, NonErrorFailureIsWrongType) {
  ArgList components{Value(ArgList{}), "oops"};
  auto r = HandlesToArgs(ArgsToHandles(components));
  ASSERT_FALSE(r.has_value());
  EXPECT_TRUE(r.error().Is(ArgErrorKind::kWrongArgumentType));
  EXPECT_EQ(r.error().message, "expected error got string");
}

}  // namespace
}  // namespace posarg
