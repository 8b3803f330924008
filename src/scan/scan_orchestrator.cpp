#include "a11yscan/scan/scan_orchestrator.h"

#include "a11yscan/core/time.h"
#include "a11yscan/document/document.h"
#include "a11yscan/engine/scan_summary.h"
#include "a11yscan/fetch/fetch_error.h"

#include <nlohmann/json.hpp>

#include <exception>
#include <stdexcept>
#include <utility>

namespace a11yscan::scan {

ScanOrchestrator::ScanOrchestrator(const fetch::IDocumentFetcher& fetcher,
                                   const engine::RuleEngine& engine, ScanServices& services)
    : fetcher_(fetcher), engine_(engine), services_(services) {}

domain::ScanRecord ScanOrchestrator::run(const std::string& url) {
  const core::CancellationToken never_cancelled;
  return run(url, never_cancelled);
}

domain::ScanRecord ScanOrchestrator::run(const std::string& url,
                                         const core::CancellationToken& cancel) {
  domain::ScanRecord record = start(url);

  StageOutcome outcome;
  try {
    announce(record, "fetch");
    auto fetched = fetcher_.fetch(url, cancel);
    if (!fetched.has_value()) {
      outcome.error = fetch::describe(fetched.error());
      outcome.failed_stage = "fetch";
    } else {
      const fetch::FetchedDocument fetched_doc = fetched.take_value();
      emit(record.scan_id, "FetchCompleted",
           nlohmann::json{{"status_code", fetched_doc.status_code},
                          {"content_type", fetched_doc.content_type},
                          {"effective_url", fetched_doc.effective_url},
                          {"bytes", fetched_doc.body.size()}});
      outcome = evaluate(record.scan_id, fetched_doc.body, fetched_doc.charset);
    }
  } catch (const std::exception& e) {
    outcome = internal_failure(e.what());
  } catch (...) {
    outcome = internal_failure("non-standard exception");
  }

  return finish(std::move(record), std::move(outcome));
}

domain::ScanRecord ScanOrchestrator::run_document(const std::string& source,
                                                  const std::string_view html_text) {
  domain::ScanRecord record = start(source);

  StageOutcome outcome;
  try {
    announce(record, "document");
    outcome = evaluate(record.scan_id, html_text, std::nullopt);
  } catch (const std::exception& e) {
    outcome = internal_failure(e.what());
  } catch (...) {
    outcome = internal_failure("non-standard exception");
  }

  return finish(std::move(record), std::move(outcome));
}

domain::ScanRecord ScanOrchestrator::start(const std::string& source) {
  domain::ScanRecord record =
      domain::make_pending_record(services_.id_gen.next("scan"), source,
                                  services_.clock.now(), engine_.catalogue().version());
  domain::mark_scanning(record);

  const auto stored = services_.scans.insert(record);
  if (!stored.has_value()) {
    throw std::runtime_error("Failed to store scan " + record.scan_id + ": " + stored.error());
  }
  return record;
}

void ScanOrchestrator::announce(const domain::ScanRecord& record, const std::string_view mode) {
  emit(record.scan_id, "ScanStarted",
       nlohmann::json{{"url", record.url},
                      {"mode", std::string(mode)},
                      {"catalogue_id", engine_.catalogue().catalogue_id()},
                      {"catalogue_version", engine_.catalogue().version()}});
}

ScanOrchestrator::StageOutcome ScanOrchestrator::internal_failure(const std::string_view what) {
  StageOutcome outcome;
  outcome.error = "Internal error: " + std::string(what);
  outcome.failed_stage = "internal";
  return outcome;
}

ScanOrchestrator::StageOutcome ScanOrchestrator::evaluate(
    const std::string& scan_id, const std::string_view html,
    const std::optional<std::string>& encoding) {
  StageOutcome outcome;

  auto parsed = document::Document::parse(html, encoding);
  if (!parsed.has_value()) {
    outcome.error = "ParseError: " + parsed.error().message;
    outcome.failed_stage = "parse";
    return outcome;
  }
  const document::Document doc = parsed.take_value();

  if (doc.parse_mode() == document::ParseMode::kLenient) {
    emit(scan_id, "ParseDegraded",
         nlohmann::json{{"parse_mode", document::parse_mode_name(doc.parse_mode())}});
  }

  try {
    outcome.findings = engine_.run(doc);
  } catch (const engine::RuleEvaluationFault& fault) {
    outcome.error = fault.what();
    outcome.failed_stage = "rules";
    outcome.rule_code = fault.rule_code();
    return outcome;
  }

  emit(scan_id, "RulesEvaluated",
       nlohmann::json{{"rules", engine_.catalogue().size()},
                      {"findings", outcome.findings.size()},
                      {"parse_mode", document::parse_mode_name(doc.parse_mode())}});
  return outcome;
}

domain::ScanRecord ScanOrchestrator::finish(domain::ScanRecord record, StageOutcome outcome) {
  const core::Timestamp completed_at = services_.clock.now();

  if (outcome.error.has_value()) {
    domain::mark_failed(record, *outcome.error, completed_at);
  } else {
    const engine::ScanSummary summary = engine::summarize(outcome.findings);
    domain::mark_complete(record, std::move(outcome.findings), summary, completed_at);
  }

  const auto stored = services_.scans.update(record);
  if (!stored.has_value()) {
    throw std::runtime_error("Failed to store scan " + record.scan_id + ": " + stored.error());
  }

  if (record.status == domain::ScanStatus::kComplete) {
    emit(record.scan_id, "ScanCompleted",
         nlohmann::json{{"score", record.score.value_or(0.0)},
                        {"total_checks", record.total_checks},
                        {"passed_checks", record.passed_checks},
                        {"warnings", record.warnings},
                        {"failures", record.failures},
                        {"scan_duration_ms", record.scan_duration_ms.value_or(0)}});
  } else {
    nlohmann::json payload{{"stage", outcome.failed_stage},
                           {"error_message", record.error_message.value_or(std::string{})}};
    if (!outcome.rule_code.empty()) {
      payload["rule_code"] = outcome.rule_code;
    }
    emit(record.scan_id, "ScanFailed", payload);
  }
  return record;
}

void ScanOrchestrator::emit(const std::string& scan_id, const std::string& event_type,
                            const nlohmann::json& payload) {
  // Payloads can carry server or file-system bytes; invalid UTF-8 is replaced.
  services_.audit_log.append(
      {services_.id_gen.next("evt"),
       scan_id,
       event_type,
       payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
       core::format_iso8601(services_.clock.now()),
       {scan_id}});
}

}  // namespace a11yscan::scan
