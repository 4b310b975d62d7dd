#include <gtest/gtest.h>

#include <string>

#include "tests/cli/cli_test_fixture.hpp"

namespace posarg::test {
namespace {

constexpr const char* kPassingCases = R"(feature: demo
cases:
  - name: placeholder_uses_default
    args: [foo, !default , baz]
    extract: string
    position: 1
    defaults: [bar]
    expect:
      value: bar
  - name: missing
    args: [foo]
    extract: string
    position: 1
    expect:
      error: insufficient_arguments
)";

constexpr const char* kFailingCase = R"(feature: broken
cases:
  - name: wrong_expectation
    args: [1]
    extract: int
    expect:
      value: 2
)";

class CheckTest : public CliTestFixture {};

TEST_F(CheckTest, PassingCases) {
  WriteFile("cases/demo.yaml", kPassingCases);

  auto result = Run({"check", "cases"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
  EXPECT_TRUE(result.Contains("2 passed, 0 failed")) << result.combined_output;
}

TEST_F(CheckTest, FailingCaseIsReported) {
  WriteFile("cases/demo.yaml", kPassingCases);
  WriteFile("cases/broken.yaml", kFailingCase);

  auto result = Run({"check", "cases"});

  EXPECT_EQ(result.exit_code, 1);
  EXPECT_TRUE(result.Contains("FAIL broken/wrong_expectation"))
      << result.combined_output;
  EXPECT_TRUE(result.Contains("expected value 2, got value 1"))
      << result.combined_output;
  EXPECT_TRUE(result.Contains("2 passed, 1 failed")) << result.combined_output;
}

TEST_F(CheckTest, MalformedFileFailsRun) {
  WriteFile("cases/bad.yaml", "cases:\n  - name: x\n    bogus: 1\n");

  auto result = Run({"check", "cases"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Contains("Unknown field 'bogus'"))
      << result.combined_output;
  EXPECT_TRUE(result.Contains("1 file(s) not loaded"))
      << result.combined_output;
}

TEST_F(CheckTest, MissingPathFails) {
  auto result = Run({"check", "nowhere"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Contains("case path not found")) << result.combined_output;
}

TEST_F(CheckTest, VerboseLogsPhases) {
  WriteFile("cases/demo.yaml", kPassingCases);

  auto result = Run({"-v", "check", "cases"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
  EXPECT_TRUE(result.Contains("[phase] run: begin")) << result.combined_output;
  EXPECT_TRUE(result.Contains("PASS demo/missing")) << result.combined_output;
}

}  // namespace
}  // namespace posarg::test
