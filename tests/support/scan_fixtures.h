#pragma once

#include "a11yscan/core/time.h"
#include "a11yscan/domain/scan_record.h"
#include "a11yscan/engine/finding.h"
#include "a11yscan/engine/scan_summary.h"

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace a11yscan::testing {

inline core::Timestamp at(const std::string& iso) { return core::parse_iso8601(iso).value(); }

inline engine::Finding finding(std::string rule_code, engine::Severity severity,
                               engine::Principle principle = engine::Principle::kPerceivable,
                               int count = 1) {
  engine::Finding f;
  f.rule_code = std::move(rule_code);
  f.severity = severity;
  f.message = "message";
  f.remediation = "remediation";
  f.wcag_reference = "1.1.1";
  f.principle = principle;
  f.count = count;
  return f;
}

// Scanning record, as stored by the orchestrator before any terminal update.
inline domain::ScanRecord scanning_record(const std::string& scan_id,
                                          const std::string& created_at = "2026-01-01T00:00:00Z") {
  auto record =
      domain::make_pending_record(scan_id, "https://example.com/" + scan_id, at(created_at), "1.0.0");
  domain::mark_scanning(record);
  return record;
}

inline domain::ScanRecord complete_record(const std::string& scan_id,
                                          std::vector<engine::Finding> findings,
                                          const std::string& created_at = "2026-01-01T00:00:00Z") {
  auto record = scanning_record(scan_id, created_at);
  const auto summary = engine::summarize(findings);
  domain::mark_complete(record, std::move(findings), summary,
                        at(created_at) + std::chrono::milliseconds(1500));
  return record;
}

inline domain::ScanRecord failed_record(const std::string& scan_id,
                                        const std::string& created_at = "2026-01-01T00:00:00Z") {
  auto record = scanning_record(scan_id, created_at);
  domain::mark_failed(record, "Timeout: request exceeded 10000 ms",
                      at(created_at) + std::chrono::milliseconds(10000));
  return record;
}

}  // namespace a11yscan::testing
