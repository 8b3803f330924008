#include "a11yscan/domain/scan_statistics.h"

#include <algorithm>
#include <cmath>
#include <map>
#include <utility>

namespace a11yscan::domain {

ScanStatistics compute_scan_statistics(const std::vector<ScanRecord>& records,
                                       const core::Timestamp now, const std::size_t top_n) {
  ScanStatistics stats;
  stats.total_scans = static_cast<int>(records.size());

  double score_sum = 0.0;
  int scored = 0;
  std::map<std::string, IssueFrequency> by_code;

  for (const auto& record : records) {
    if (core::same_utc_day(record.created_at, now)) {
      ++stats.scans_today;
    }
    if (record.score.has_value()) {
      score_sum += *record.score;
      ++scored;
    }
    for (const auto& finding : record.findings) {
      if (finding.severity == engine::Severity::kPass) {
        continue;
      }
      auto& entry = by_code[finding.rule_code];
      entry.rule_code = finding.rule_code;
      ++entry.findings;
      entry.occurrences += finding.count;
    }
  }

  if (scored > 0) {
    stats.average_score = std::nearbyint((score_sum / scored) * 10.0) / 10.0;
  }

  for (auto& item : by_code) {
    stats.common_issues.push_back(std::move(item.second));
  }
  // by_code iterates in rule_code order; stable sort keeps it as the tie-break.
  std::stable_sort(stats.common_issues.begin(), stats.common_issues.end(),
                   [](const IssueFrequency& a, const IssueFrequency& b) {
                     return a.findings > b.findings;
                   });
  if (stats.common_issues.size() > top_n) {
    stats.common_issues.resize(top_n);
  }
  return stats;
}

nlohmann::json scan_statistics_to_json(const ScanStatistics& stats) {
  nlohmann::json issues = nlohmann::json::array();
  for (const auto& issue : stats.common_issues) {
    issues.push_back({{"rule_code", issue.rule_code},
                      {"findings", issue.findings},
                      {"occurrences", issue.occurrences}});
  }

  nlohmann::json j;
  j["total_scans"] = stats.total_scans;
  j["scans_today"] = stats.scans_today;
  j["average_score"] = stats.average_score;
  j["common_issues"] = std::move(issues);
  return j;
}

}  // namespace a11yscan::domain
