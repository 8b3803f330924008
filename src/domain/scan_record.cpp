#include "a11yscan/domain/scan_record.h"

#include <chrono>
#include <stdexcept>
#include <utility>

namespace a11yscan::domain {

namespace {

void require_transition(const ScanRecord& record, const ScanStatus to) {
  if (!can_transition(record.status, to)) {
    throw std::logic_error(std::string("Illegal scan transition ") +
                           scan_status_name(record.status) + " -> " + scan_status_name(to) +
                           " for scan " + record.scan_id);
  }
}

std::int64_t elapsed_ms(const core::Timestamp from, const core::Timestamp to) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(to - from).count();
}

}  // namespace

const char* scan_status_name(const ScanStatus status) noexcept {
  switch (status) {
    case ScanStatus::kPending:
      return "pending";
    case ScanStatus::kScanning:
      return "scanning";
    case ScanStatus::kComplete:
      return "complete";
    case ScanStatus::kFailed:
      return "failed";
  }
  return "pending";
}

std::optional<ScanStatus> scan_status_from_string(const std::string_view name) {
  if (name == "pending") {
    return ScanStatus::kPending;
  }
  if (name == "scanning") {
    return ScanStatus::kScanning;
  }
  if (name == "complete") {
    return ScanStatus::kComplete;
  }
  if (name == "failed") {
    return ScanStatus::kFailed;
  }
  return std::nullopt;
}

bool is_terminal(const ScanStatus status) noexcept {
  return status == ScanStatus::kComplete || status == ScanStatus::kFailed;
}

bool can_transition(const ScanStatus from, const ScanStatus to) noexcept {
  switch (from) {
    case ScanStatus::kPending:
      return to == ScanStatus::kScanning;
    case ScanStatus::kScanning:
      return to == ScanStatus::kComplete || to == ScanStatus::kFailed;
    case ScanStatus::kComplete:
    case ScanStatus::kFailed:
      return false;
  }
  return false;
}

ScanRecord make_pending_record(std::string scan_id, std::string url,
                               const core::Timestamp created_at,
                               std::string catalogue_version) {
  ScanRecord record;
  record.scan_id = std::move(scan_id);
  record.url = std::move(url);
  record.status = ScanStatus::kPending;
  record.created_at = created_at;
  record.catalogue_version = std::move(catalogue_version);
  return record;
}

void mark_scanning(ScanRecord& record) {
  require_transition(record, ScanStatus::kScanning);
  record.status = ScanStatus::kScanning;
}

void mark_complete(ScanRecord& record, std::vector<engine::Finding> findings,
                   const engine::ScanSummary& summary, const core::Timestamp completed_at) {
  require_transition(record, ScanStatus::kComplete);

  // Assemble the terminal state on a copy so the record changes all at once.
  ScanRecord done = record;
  done.status = ScanStatus::kComplete;
  done.findings = std::move(findings);
  done.total_checks = summary.total_checks;
  done.passed_checks = summary.passed_checks;
  done.warnings = summary.warnings;
  done.failures = summary.failures;
  done.principle_issues = summary.principle_issues;
  done.score = summary.score;
  done.completed_at = completed_at;
  done.scan_duration_ms = elapsed_ms(record.created_at, completed_at);
  done.error_message = std::nullopt;
  record = std::move(done);
}

void mark_failed(ScanRecord& record, std::string error_message,
                 const core::Timestamp completed_at) {
  require_transition(record, ScanStatus::kFailed);

  ScanRecord done = record;
  done.status = ScanStatus::kFailed;
  done.score = std::nullopt;
  done.findings.clear();
  done.total_checks = 0;
  done.passed_checks = 0;
  done.warnings = 0;
  done.failures = 0;
  done.principle_issues = {};
  done.error_message = std::move(error_message);
  done.completed_at = completed_at;
  done.scan_duration_ms = elapsed_ms(record.created_at, completed_at);
  record = std::move(done);
}

}  // namespace a11yscan::domain
