#include "a11yscan/storage/sqlite/sqlite_scan_repository.h"

#include "a11yscan/domain/scan_record_json.h"

#include <nlohmann/json.hpp>

#include <sqlite3.h>

#include <stdexcept>
#include <utility>

namespace a11yscan::storage::sqlite {

namespace {

constexpr const char* kSelectColumns =
    "SELECT scan_id, url, status, score, findings_json, total_checks, passed_checks, warnings,"
    "       failures, perceivable_issues, operable_issues, understandable_issues, robust_issues,"
    "       created_at, completed_at, scan_duration_ms, error_message, catalogue_version"
    "  FROM scans";

std::string column_text(sqlite3_stmt* stmt, const int col) {
  const auto* raw = sqlite3_column_text(stmt, col);
  return raw != nullptr ? std::string(reinterpret_cast<const char*>(raw)) : std::string{};
}

bool column_is_null(sqlite3_stmt* stmt, const int col) {
  return sqlite3_column_type(stmt, col) == SQLITE_NULL;
}

core::Timestamp parse_stored_timestamp(const std::string& text) {
  const auto parsed = core::parse_iso8601(text);
  if (!parsed.has_value()) {
    throw std::runtime_error("Corrupt timestamp in scans table: " + text);
  }
  return *parsed;
}

void bind_record(PreparedStatement& stmt, const domain::ScanRecord& record) {
  nlohmann::json findings = nlohmann::json::array();
  for (const auto& finding : record.findings) {
    findings.push_back(domain::finding_to_json(finding));
  }

  stmt.bind_text(":scan_id", record.scan_id);
  stmt.bind_text(":url", record.url);
  stmt.bind_text(":status", domain::scan_status_name(record.status));
  if (record.score.has_value()) {
    stmt.bind_double(":score", *record.score);
  } else {
    stmt.bind_null(":score");
  }
  // Finding text quotes page content; invalid UTF-8 is replaced.
  stmt.bind_text(":findings_json",
                 findings.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
  stmt.bind_int64(":total_checks", record.total_checks);
  stmt.bind_int64(":passed_checks", record.passed_checks);
  stmt.bind_int64(":warnings", record.warnings);
  stmt.bind_int64(":failures", record.failures);
  stmt.bind_int64(":perceivable_issues", record.principle_issues.perceivable);
  stmt.bind_int64(":operable_issues", record.principle_issues.operable);
  stmt.bind_int64(":understandable_issues", record.principle_issues.understandable);
  stmt.bind_int64(":robust_issues", record.principle_issues.robust);
  stmt.bind_text(":created_at", core::format_iso8601(record.created_at));
  if (record.completed_at.has_value()) {
    stmt.bind_text(":completed_at", core::format_iso8601(*record.completed_at));
  } else {
    stmt.bind_null(":completed_at");
  }
  if (record.scan_duration_ms.has_value()) {
    stmt.bind_int64(":scan_duration_ms", *record.scan_duration_ms);
  } else {
    stmt.bind_null(":scan_duration_ms");
  }
  if (record.error_message.has_value()) {
    stmt.bind_text(":error_message", *record.error_message);
  } else {
    stmt.bind_null(":error_message");
  }
  stmt.bind_text(":catalogue_version", record.catalogue_version);
}

domain::ScanRecord row_to_record(sqlite3_stmt* stmt) {
  domain::ScanRecord record;
  record.scan_id = column_text(stmt, 0);
  record.url = column_text(stmt, 1);

  const auto status = domain::scan_status_from_string(column_text(stmt, 2));
  if (!status.has_value()) {
    throw std::runtime_error("Corrupt status in scans table for " + record.scan_id);
  }
  record.status = *status;

  if (!column_is_null(stmt, 3)) {
    record.score = sqlite3_column_double(stmt, 3);
  }
  for (const auto& finding_json : nlohmann::json::parse(column_text(stmt, 4))) {
    record.findings.push_back(domain::finding_from_json(finding_json));
  }
  record.total_checks = sqlite3_column_int(stmt, 5);
  record.passed_checks = sqlite3_column_int(stmt, 6);
  record.warnings = sqlite3_column_int(stmt, 7);
  record.failures = sqlite3_column_int(stmt, 8);
  record.principle_issues.perceivable = sqlite3_column_int(stmt, 9);
  record.principle_issues.operable = sqlite3_column_int(stmt, 10);
  record.principle_issues.understandable = sqlite3_column_int(stmt, 11);
  record.principle_issues.robust = sqlite3_column_int(stmt, 12);
  record.created_at = parse_stored_timestamp(column_text(stmt, 13));
  if (!column_is_null(stmt, 14)) {
    record.completed_at = parse_stored_timestamp(column_text(stmt, 14));
  }
  if (!column_is_null(stmt, 15)) {
    record.scan_duration_ms = sqlite3_column_int64(stmt, 15);
  }
  if (!column_is_null(stmt, 16)) {
    record.error_message = column_text(stmt, 16);
  }
  record.catalogue_version = column_text(stmt, 17);
  return record;
}

}  // namespace

SqliteScanRepository::SqliteScanRepository(std::shared_ptr<SqliteDb> db) : db_(std::move(db)) {}

WriteResult SqliteScanRepository::insert(const domain::ScanRecord& record) {
  const char* sql = R"(
    INSERT INTO scans
      (scan_id, url, status, score, findings_json, total_checks, passed_checks, warnings,
       failures, perceivable_issues, operable_issues, understandable_issues, robust_issues,
       created_at, completed_at, scan_duration_ms, error_message, catalogue_version)
    VALUES
      (:scan_id, :url, :status, :score, :findings_json, :total_checks, :passed_checks,
       :warnings, :failures, :perceivable_issues, :operable_issues, :understandable_issues,
       :robust_issues, :created_at, :completed_at, :scan_duration_ms, :error_message,
       :catalogue_version)
  )";

  std::lock_guard<std::mutex> lock(mutex_);
  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    return WriteResult::err("Failed to prepare scan insert: " + stmt.error());
  }
  bind_record(stmt, record);

  const int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_CONSTRAINT) {
    return WriteResult::err("Scan already exists: " + record.scan_id);
  }
  if (rc != SQLITE_DONE) {
    return WriteResult::err("Failed to insert scan: " + db_->last_error());
  }
  return WriteResult::ok(true);
}

WriteResult SqliteScanRepository::update(const domain::ScanRecord& record) {
  const char* sql = R"(
    UPDATE scans SET
      url = :url, status = :status, score = :score, findings_json = :findings_json,
      total_checks = :total_checks, passed_checks = :passed_checks, warnings = :warnings,
      failures = :failures, perceivable_issues = :perceivable_issues,
      operable_issues = :operable_issues, understandable_issues = :understandable_issues,
      robust_issues = :robust_issues, created_at = :created_at, completed_at = :completed_at,
      scan_duration_ms = :scan_duration_ms, error_message = :error_message,
      catalogue_version = :catalogue_version
    WHERE scan_id = :scan_id AND status IN ('pending', 'scanning')
  )";

  std::lock_guard<std::mutex> lock(mutex_);
  const auto stored = load(record.scan_id);
  if (!stored.has_value()) {
    return WriteResult::err("Scan not found: " + record.scan_id);
  }
  if (const std::string refusal = update_refusal(*stored, record.status); !refusal.empty()) {
    return WriteResult::err(refusal);
  }

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    return WriteResult::err("Failed to prepare scan update: " + stmt.error());
  }
  bind_record(stmt, record);

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    return WriteResult::err("Failed to update scan: " + db_->last_error());
  }
  if (sqlite3_changes(db_->connection()) != 1) {
    return WriteResult::err("Scan " + record.scan_id + " was finalized concurrently");
  }
  return WriteResult::ok(true);
}

std::optional<domain::ScanRecord> SqliteScanRepository::get(const std::string& scan_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return load(scan_id);
}

std::optional<domain::ScanRecord> SqliteScanRepository::load(const std::string& scan_id) const {
  PreparedStatement stmt(db_->connection(), std::string(kSelectColumns) + " WHERE scan_id = ?");
  if (!stmt.is_valid()) {
    return std::nullopt;
  }

  sqlite3_bind_text(stmt.get(), 1, scan_id.c_str(), -1, SQLITE_TRANSIENT);

  if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    return row_to_record(stmt.get());
  }
  return std::nullopt;
}

std::vector<domain::ScanRecord> SqliteScanRepository::list_all() const {
  std::lock_guard<std::mutex> lock(mutex_);
  PreparedStatement stmt(db_->connection(),
                         std::string(kSelectColumns) + " ORDER BY created_at, scan_id");
  if (!stmt.is_valid()) {
    return {};
  }

  std::vector<domain::ScanRecord> result;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    result.push_back(row_to_record(stmt.get()));
  }
  return result;
}

}  // namespace a11yscan::storage::sqlite
