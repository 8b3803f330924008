#pragma once

#include "a11yscan/core/time.h"
#include "a11yscan/domain/scan_record.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace a11yscan::domain {

inline constexpr std::size_t kDefaultTopIssues = 5;

// How often one rule code was reported as a Warning or Fail across scans.
struct IssueFrequency {
  std::string rule_code;  // NOLINT(readability-identifier-naming)
  int findings{0};        // number of Warning/Fail findings (ranking key)
  int occurrences{0};     // sum of their counts, informational only

  bool operator==(const IssueFrequency&) const = default;
};

struct ScanStatistics {
  int total_scans{0};                        // NOLINT(readability-identifier-naming)
  int scans_today{0};                        // created on the UTC day of `now`
  double average_score{0.0};                 // mean of scored records, one decimal
  std::vector<IssueFrequency> common_issues;  // findings desc, then rule_code asc

  bool operator==(const ScanStatistics&) const = default;
};

// Fleet-wide statistics derived from stored counters and findings only.
// No rule is re-run. common_issues holds at most top_n entries.
[[nodiscard]] ScanStatistics compute_scan_statistics(const std::vector<ScanRecord>& records,
                                                     core::Timestamp now,
                                                     std::size_t top_n = kDefaultTopIssues);

[[nodiscard]] nlohmann::json scan_statistics_to_json(const ScanStatistics& stats);

}  // namespace a11yscan::domain
