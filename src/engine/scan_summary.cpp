#include "a11yscan/engine/scan_summary.h"

#include <cmath>

namespace a11yscan::engine {

double compute_score(const int passed, const int warnings, const int total) {
  if (total <= 0) {
    return 100.0;
  }
  const double raw =
      ((static_cast<double>(passed) + 0.5 * static_cast<double>(warnings)) / total) * 100.0;
  // nearbyint honors the default round-to-nearest-even mode.
  return std::nearbyint(raw * 10.0) / 10.0;
}

ScanSummary summarize(const std::vector<Finding>& findings) {
  ScanSummary summary;
  for (const auto& finding : findings) {
    switch (finding.severity) {
      case Severity::kPass:
        ++summary.passed_checks;
        continue;
      case Severity::kWarning:
        ++summary.warnings;
        break;
      case Severity::kFail:
        ++summary.failures;
        break;
    }

    switch (finding.principle) {
      case Principle::kPerceivable:
        ++summary.principle_issues.perceivable;
        break;
      case Principle::kOperable:
        ++summary.principle_issues.operable;
        break;
      case Principle::kUnderstandable:
        ++summary.principle_issues.understandable;
        break;
      case Principle::kRobust:
        ++summary.principle_issues.robust;
        break;
    }
  }
  summary.total_checks = summary.passed_checks + summary.warnings + summary.failures;
  summary.score = compute_score(summary.passed_checks, summary.warnings, summary.total_checks);
  return summary;
}

}  // namespace a11yscan::engine
