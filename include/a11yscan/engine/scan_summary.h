#pragma once

#include "a11yscan/engine/finding.h"

#include <vector>

namespace a11yscan::engine {

// Warning and Fail findings per WCAG principle. Pass findings never count.
struct PrincipleIssueCounts {
  int perceivable{0};
  int operable{0};
  int understandable{0};
  int robust{0};

  bool operator==(const PrincipleIssueCounts&) const = default;
};

struct ScanSummary {
  int total_checks{0};
  int passed_checks{0};
  int warnings{0};
  int failures{0};
  PrincipleIssueCounts principle_issues;
  double score{100.0};

  bool operator==(const ScanSummary&) const = default;
};

// score = ((passed + 0.5 * warnings) / total) * 100, rounded half-to-even to one
// decimal place; exactly 100.0 when total is 0.
[[nodiscard]] double compute_score(int passed, int warnings, int total);

// Reduces findings into counters and score. Counts Findings, not occurrences.
[[nodiscard]] ScanSummary summarize(const std::vector<Finding>& findings);

}  // namespace a11yscan::engine
