#include "a11yscan/storage/sqlite/sqlite_audit_log.h"

#include <nlohmann/json.hpp>

#include <sqlite3.h>

#include <stdexcept>
#include <utility>

namespace a11yscan::storage::sqlite {

namespace {

std::string column_text(sqlite3_stmt* stmt, const int col) {
  const auto* raw = sqlite3_column_text(stmt, col);
  return raw != nullptr ? std::string(reinterpret_cast<const char*>(raw)) : std::string{};
}

}  // namespace

SqliteAuditLog::SqliteAuditLog(std::shared_ptr<SqliteDb> db) : db_(std::move(db)) {}

void SqliteAuditLog::append(const AuditEvent& event) {
  const char* sql = R"(
    INSERT INTO audit_events
      (event_id, trace_id, event_type, payload, created_at, refs_json, idx)
    VALUES (:event_id, :trace_id, :event_type, :payload, :created_at, :refs_json, :idx)
  )";

  std::lock_guard<std::mutex> lock(mutex_);
  const int idx = next_index(event.trace_id);

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    throw std::runtime_error("Failed to prepare audit insert: " + stmt.error());
  }

  const nlohmann::json refs_json = event.refs;
  stmt.bind_text(":event_id", event.event_id);
  stmt.bind_text(":trace_id", event.trace_id);
  stmt.bind_text(":event_type", event.event_type);
  stmt.bind_text(":payload", event.payload);
  stmt.bind_text(":created_at", event.created_at);
  stmt.bind_text(":refs_json", refs_json.dump());
  stmt.bind_int64(":idx", idx);

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    throw std::runtime_error("Failed to append audit event: " + db_->last_error());
  }
  trace_indices_[event.trace_id] = idx + 1;
}

std::vector<AuditEvent> SqliteAuditLog::query(const std::string& trace_id) const {
  const std::string sql = trace_id.empty()
                              ? "SELECT event_id, trace_id, event_type, payload, created_at,"
                                "       refs_json FROM audit_events ORDER BY trace_id, idx"
                              : "SELECT event_id, trace_id, event_type, payload, created_at,"
                                "       refs_json FROM audit_events WHERE trace_id = ?"
                                " ORDER BY idx";

  std::lock_guard<std::mutex> lock(mutex_);
  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    return {};
  }
  if (!trace_id.empty()) {
    sqlite3_bind_text(stmt.get(), 1, trace_id.c_str(), -1, SQLITE_TRANSIENT);
  }

  std::vector<AuditEvent> result;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    AuditEvent event;
    event.event_id = column_text(stmt.get(), 0);
    event.trace_id = column_text(stmt.get(), 1);
    event.event_type = column_text(stmt.get(), 2);
    event.payload = column_text(stmt.get(), 3);
    event.created_at = column_text(stmt.get(), 4);
    event.refs = nlohmann::json::parse(column_text(stmt.get(), 5)).get<std::vector<std::string>>();
    result.push_back(std::move(event));
  }
  return result;
}

std::vector<std::string> SqliteAuditLog::list_trace_ids() const {
  std::lock_guard<std::mutex> lock(mutex_);
  PreparedStatement stmt(db_->connection(),
                         "SELECT DISTINCT trace_id FROM audit_events ORDER BY trace_id");
  if (!stmt.is_valid()) {
    return {};
  }

  std::vector<std::string> ids;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    ids.push_back(column_text(stmt.get(), 0));
  }
  return ids;
}

int SqliteAuditLog::next_index(const std::string& trace_id) {
  auto it = trace_indices_.find(trace_id);
  if (it != trace_indices_.end()) {
    return it->second;
  }

  // New trace: query DB for existing max index
  PreparedStatement stmt(db_->connection(),
                         "SELECT MAX(idx) FROM audit_events WHERE trace_id = ?");
  int max_idx = -1;
  if (stmt.is_valid()) {
    sqlite3_bind_text(stmt.get(), 1, trace_id.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(stmt.get()) == SQLITE_ROW && sqlite3_column_type(stmt.get(), 0) != SQLITE_NULL) {
      max_idx = sqlite3_column_int(stmt.get(), 0);
    }
  }
  return max_idx + 1;
}

}  // namespace a11yscan::storage::sqlite
