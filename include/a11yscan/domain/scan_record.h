#pragma once

#include "a11yscan/core/time.h"
#include "a11yscan/engine/finding.h"
#include "a11yscan/engine/scan_summary.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace a11yscan::domain {

// Pending -> Scanning -> {Complete, Failed}. Complete and Failed are final.
enum class ScanStatus {
  kPending,
  kScanning,
  kComplete,
  kFailed,
};

// "pending", "scanning", "complete", "failed"
[[nodiscard]] const char* scan_status_name(ScanStatus status) noexcept;
[[nodiscard]] std::optional<ScanStatus> scan_status_from_string(std::string_view name);

[[nodiscard]] bool is_terminal(ScanStatus status) noexcept;
[[nodiscard]] bool can_transition(ScanStatus from, ScanStatus to) noexcept;

// ScanRecord is the externally visible outcome of one scan.
//
// score is set only on Complete; error_message only on Failed. findings keep
// catalogue order, then per-rule emission order.
struct ScanRecord {
  std::string scan_id;                            // NOLINT(readability-identifier-naming)
  std::string url;                                // NOLINT(readability-identifier-naming)
  ScanStatus status{ScanStatus::kPending};        // NOLINT(readability-identifier-naming)
  std::optional<double> score;                    // NOLINT(readability-identifier-naming)
  std::vector<engine::Finding> findings;          // NOLINT(readability-identifier-naming)
  int total_checks{0};                            // == findings.size()
  int passed_checks{0};                           // NOLINT(readability-identifier-naming)
  int warnings{0};                                // NOLINT(readability-identifier-naming)
  int failures{0};                                // NOLINT(readability-identifier-naming)
  engine::PrincipleIssueCounts principle_issues;  // Warning + Fail findings only
  core::Timestamp created_at{};                   // NOLINT(readability-identifier-naming)
  std::optional<core::Timestamp> completed_at;    // NOLINT(readability-identifier-naming)
  std::optional<std::int64_t> scan_duration_ms;   // completed_at - created_at
  std::optional<std::string> error_message;       // NOLINT(readability-identifier-naming)
  std::string catalogue_version;                  // NOLINT(readability-identifier-naming)

  bool operator==(const ScanRecord&) const = default;
};

// New record in Pending state.
[[nodiscard]] ScanRecord make_pending_record(std::string scan_id, std::string url,
                                             core::Timestamp created_at,
                                             std::string catalogue_version);

// Transition helpers. Each throws std::logic_error if the current status does not
// allow the move.
void mark_scanning(ScanRecord& record);
void mark_complete(ScanRecord& record, std::vector<engine::Finding> findings,
                   const engine::ScanSummary& summary, core::Timestamp completed_at);
void mark_failed(ScanRecord& record, std::string error_message, core::Timestamp completed_at);

}  // namespace a11yscan::domain
