#include "a11yscan/domain/scan_record_json.h"

#include <stdexcept>
#include <string>

namespace a11yscan::domain {

namespace {

using json = nlohmann::json;

template <typename T>
json nullable(const std::optional<T>& value) {
  if (value.has_value()) {
    return json(*value);
  }
  return json(nullptr);
}

core::Timestamp timestamp_from_json(const json& j, const char* field) {
  const auto parsed = core::parse_iso8601(j.at(field).get<std::string>());
  if (!parsed.has_value()) {
    throw std::invalid_argument(std::string("Malformed timestamp in field ") + field);
  }
  return *parsed;
}

}  // namespace

json finding_to_json(const engine::Finding& finding) {
  json j;
  j["rule_code"] = finding.rule_code;
  j["severity"] = engine::severity_name(finding.severity);
  j["message"] = finding.message;
  j["remediation"] = finding.remediation;
  j["element"] = nullable(finding.element);
  j["wcag_reference"] = finding.wcag_reference;
  j["wcag_level"] = engine::wcag_level_name(finding.wcag_level);
  j["principle"] = engine::principle_name(finding.principle);
  j["count"] = finding.count;
  return j;
}

engine::Finding finding_from_json(const json& j) {
  engine::Finding finding;
  finding.rule_code = j.at("rule_code").get<std::string>();

  const auto severity = engine::severity_from_string(j.at("severity").get<std::string>());
  if (!severity.has_value()) {
    throw std::invalid_argument("Unknown severity: " + j.at("severity").get<std::string>());
  }
  finding.severity = *severity;

  finding.message = j.at("message").get<std::string>();
  finding.remediation = j.at("remediation").get<std::string>();
  if (!j.at("element").is_null()) {
    finding.element = j.at("element").get<std::string>();
  }
  finding.wcag_reference = j.at("wcag_reference").get<std::string>();

  const auto level = engine::wcag_level_from_string(j.at("wcag_level").get<std::string>());
  if (!level.has_value()) {
    throw std::invalid_argument("Unknown WCAG level: " + j.at("wcag_level").get<std::string>());
  }
  finding.wcag_level = *level;

  const auto principle = engine::principle_from_string(j.at("principle").get<std::string>());
  if (!principle.has_value()) {
    throw std::invalid_argument("Unknown principle: " + j.at("principle").get<std::string>());
  }
  finding.principle = *principle;

  finding.count = j.at("count").get<int>();
  return finding;
}

json scan_record_to_json(const ScanRecord& record) {
  json findings = json::array();
  for (const auto& finding : record.findings) {
    findings.push_back(finding_to_json(finding));
  }

  json j;
  j["scan_id"] = record.scan_id;
  j["url"] = record.url;
  j["status"] = scan_status_name(record.status);
  j["score"] = nullable(record.score);
  j["findings"] = std::move(findings);
  j["total_checks"] = record.total_checks;
  j["passed_checks"] = record.passed_checks;
  j["warnings"] = record.warnings;
  j["failures"] = record.failures;
  j["perceivable_issues"] = record.principle_issues.perceivable;
  j["operable_issues"] = record.principle_issues.operable;
  j["understandable_issues"] = record.principle_issues.understandable;
  j["robust_issues"] = record.principle_issues.robust;
  j["created_at"] = core::format_iso8601(record.created_at);
  if (record.completed_at.has_value()) {
    j["completed_at"] = core::format_iso8601(*record.completed_at);
  } else {
    j["completed_at"] = nullptr;
  }
  j["scan_duration_ms"] = nullable(record.scan_duration_ms);
  j["error_message"] = nullable(record.error_message);
  j["catalogue_version"] = record.catalogue_version;
  return j;
}

ScanRecord scan_record_from_json(const json& j) {
  ScanRecord record;
  record.scan_id = j.at("scan_id").get<std::string>();
  record.url = j.at("url").get<std::string>();

  const auto status = scan_status_from_string(j.at("status").get<std::string>());
  if (!status.has_value()) {
    throw std::invalid_argument("Unknown scan status: " + j.at("status").get<std::string>());
  }
  record.status = *status;

  if (!j.at("score").is_null()) {
    record.score = j.at("score").get<double>();
  }
  for (const auto& finding_json : j.at("findings")) {
    record.findings.push_back(finding_from_json(finding_json));
  }
  record.total_checks = j.at("total_checks").get<int>();
  record.passed_checks = j.at("passed_checks").get<int>();
  record.warnings = j.at("warnings").get<int>();
  record.failures = j.at("failures").get<int>();
  record.principle_issues.perceivable = j.at("perceivable_issues").get<int>();
  record.principle_issues.operable = j.at("operable_issues").get<int>();
  record.principle_issues.understandable = j.at("understandable_issues").get<int>();
  record.principle_issues.robust = j.at("robust_issues").get<int>();
  record.created_at = timestamp_from_json(j, "created_at");
  if (!j.at("completed_at").is_null()) {
    record.completed_at = timestamp_from_json(j, "completed_at");
  }
  if (!j.at("scan_duration_ms").is_null()) {
    record.scan_duration_ms = j.at("scan_duration_ms").get<std::int64_t>();
  }
  if (!j.at("error_message").is_null()) {
    record.error_message = j.at("error_message").get<std::string>();
  }
  record.catalogue_version = j.at("catalogue_version").get<std::string>();
  return record;
}

}  // namespace a11yscan::domain
