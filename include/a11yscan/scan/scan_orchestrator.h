#pragma once

#include "a11yscan/core/cancellation.h"
#include "a11yscan/core/clock.h"
#include "a11yscan/core/id_generator.h"
#include "a11yscan/domain/scan_record.h"
#include "a11yscan/engine/rule_engine.h"
#include "a11yscan/fetch/document_fetcher.h"
#include "a11yscan/storage/audit_log.h"
#include "a11yscan/storage/scan_repository.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace a11yscan::scan {

// ScanServices bundles the collaborators a scan writes to.
// Holds references; the entry point owns the concrete instances.
struct ScanServices {
  storage::IScanRepository& scans;   // NOLINT(readability-identifier-naming)
  storage::IAuditLog& audit_log;     // NOLINT(readability-identifier-naming)
  core::IIdGenerator& id_gen;        // NOLINT(readability-identifier-naming)
  core::IClock& clock;               // NOLINT(readability-identifier-naming)

  ScanServices(storage::IScanRepository& scans, storage::IAuditLog& audit_log,
               core::IIdGenerator& id_gen, core::IClock& clock)
      : scans(scans), audit_log(audit_log), id_gen(id_gen), clock(clock) {}

  ~ScanServices() = default;

  ScanServices(const ScanServices&) = delete;
  ScanServices& operator=(const ScanServices&) = delete;
  ScanServices(ScanServices&&) = delete;
  ScanServices& operator=(ScanServices&&) = delete;
};

// ScanOrchestrator sequences fetch -> parse -> rules -> aggregation for one scan and
// is the only writer of the Scan Record.
//
// State machine: the record is created Pending, moves to Scanning as work starts and
// is first stored in that state, then receives exactly one terminal update
// (Complete or Failed). Every fetch error, parse error, rule fault and audit failure
// ahead of the terminal update becomes a Failed record; callers never see a partially
// populated Complete record.
//
// Audit events (trace id = scan id): ScanStarted, FetchCompleted (fetch path only),
// ParseDegraded (lenient parse only), RulesEvaluated, then ScanCompleted or ScanFailed.
//
// Throws std::runtime_error when the repository refuses to store the record. An
// audit sink failure after the terminal update propagates from the sink.
class ScanOrchestrator {
 public:
  ScanOrchestrator(const fetch::IDocumentFetcher& fetcher, const engine::RuleEngine& engine,
                   ScanServices& services);

  // Fetch url and scan it. The URL is expected to have been admitted by the caller.
  [[nodiscard]] domain::ScanRecord run(const std::string& url);
  [[nodiscard]] domain::ScanRecord run(const std::string& url,
                                       const core::CancellationToken& cancel);

  // Scan already-retrieved HTML. source is recorded as the record's url.
  [[nodiscard]] domain::ScanRecord run_document(const std::string& source,
                                                std::string_view html_text);

 private:
  struct StageOutcome {
    std::vector<engine::Finding> findings;
    std::optional<std::string> error;  // set when the scan must fail
    std::string failed_stage;          // "fetch", "parse", "rules" or "internal"
    std::string rule_code;             // faulting rule, for "rules"
  };

  [[nodiscard]] domain::ScanRecord start(const std::string& source);
  void announce(const domain::ScanRecord& record, std::string_view mode);
  [[nodiscard]] static StageOutcome internal_failure(std::string_view what);
  [[nodiscard]] StageOutcome evaluate(const std::string& scan_id, std::string_view html,
                                      const std::optional<std::string>& encoding);
  [[nodiscard]] domain::ScanRecord finish(domain::ScanRecord record, StageOutcome outcome);

  void emit(const std::string& scan_id, const std::string& event_type,
            const nlohmann::json& payload);

  const fetch::IDocumentFetcher& fetcher_;
  const engine::RuleEngine& engine_;
  ScanServices& services_;
};

}  // namespace a11yscan::scan
