#pragma once

#include <string>

#include "posarg/cases/decode_case.hpp"
#include "posarg/common/arg_error.hpp"
#include "posarg/value/value.hpp"

namespace posarg::cases {

// Run one extraction or pack step. Typed results are wrapped back into a
// Value.
auto Evaluate(const ExtractStep& step) -> Result<Value>;
auto Evaluate(const PackStep& step) -> Result<Value>;
auto Evaluate(const DecodeCase& decode_case) -> Result<Value>;

struct CaseReport {
  bool passed = false;
  std::string detail;  // Mismatch description; empty when passed
};

// Evaluate and compare against the expectation.
auto RunCase(const DecodeCase& decode_case) -> CaseReport;

// Text form of an expectation or outcome, for mismatch reports.
auto Describe(const Expectation& expect) -> std::string;
auto Describe(const Result<Value>& outcome) -> std::string;

}  // namespace posarg::cases
