#include "a11yscan/engine/scan_summary.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <vector>

using namespace a11yscan::engine;
using Catch::Matchers::WithinAbs;

namespace {

Finding make(Severity severity, Principle principle, int count = 1) {
  Finding f;
  f.rule_code = "R";
  f.severity = severity;
  f.principle = principle;
  f.count = count;
  return f;
}

}  // namespace

TEST_CASE("compute_score weights warnings at half", "[summary][score]") {
  CHECK_THAT(compute_score(10, 0, 10), WithinAbs(100.0, 1e-9));
  CHECK_THAT(compute_score(0, 0, 10), WithinAbs(0.0, 1e-9));
  CHECK_THAT(compute_score(7, 2, 10), WithinAbs(80.0, 1e-9));
  CHECK_THAT(compute_score(2, 1, 3), WithinAbs(83.3, 1e-9));
}

TEST_CASE("compute_score rounds halves to even", "[summary][score]") {
  // (0 + 0.5) / 8 * 100 = 6.25
  CHECK_THAT(compute_score(0, 1, 8), WithinAbs(6.2, 1e-9));
  // (1 + 0.5 * 3) / 16 * 100 = 15.625 -> 15.6
  CHECK_THAT(compute_score(1, 3, 16), WithinAbs(15.6, 1e-9));
}

TEST_CASE("compute_score of an empty scan is 100", "[summary][score]") {
  CHECK(compute_score(0, 0, 0) == 100.0);
  CHECK(summarize({}).score == 100.0);
  CHECK(summarize({}).total_checks == 0);
}

TEST_CASE("summarize counts findings, not occurrences", "[summary]") {
  const std::vector<Finding> findings = {
      make(Severity::kPass, Principle::kPerceivable),
      make(Severity::kFail, Principle::kPerceivable, 12),
      make(Severity::kWarning, Principle::kOperable, 3),
      make(Severity::kFail, Principle::kRobust),
      make(Severity::kPass, Principle::kRobust),
      make(Severity::kWarning, Principle::kUnderstandable),
  };

  const auto summary = summarize(findings);
  CHECK(summary.total_checks == 6);
  CHECK(summary.passed_checks == 2);
  CHECK(summary.warnings == 2);
  CHECK(summary.failures == 2);
  CHECK(summary.total_checks == summary.passed_checks + summary.warnings + summary.failures);

  CHECK(summary.principle_issues == PrincipleIssueCounts{1, 1, 1, 1});
  // (2 + 1) / 6 = 50.0
  CHECK_THAT(summary.score, WithinAbs(50.0, 1e-9));
}
