#include "a11yscan/storage/sqlite/sqlite_db.h"

#include <sqlite3.h>

namespace a11yscan::storage::sqlite {

// Deleter implementations
void SqliteDb::SqliteDeleter::operator()(sqlite3* db) const {
  if (db != nullptr) {
    sqlite3_close(db);
  }
}

void PreparedStatement::StmtDeleter::operator()(sqlite3_stmt* stmt) const {
  if (stmt != nullptr) {
    sqlite3_finalize(stmt);
  }
}

// Embedded schema v1 SQL
constexpr const char* kSchemaV1 = R"(
CREATE TABLE IF NOT EXISTS schema_version (
  version INTEGER PRIMARY KEY,
  applied_at TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS scans (
  scan_id TEXT PRIMARY KEY,
  url TEXT NOT NULL,
  status TEXT NOT NULL
    CHECK(status IN ('pending', 'scanning', 'complete', 'failed')),
  score REAL,
  findings_json TEXT NOT NULL,
  total_checks INTEGER NOT NULL,
  passed_checks INTEGER NOT NULL,
  warnings INTEGER NOT NULL,
  failures INTEGER NOT NULL,
  perceivable_issues INTEGER NOT NULL,
  operable_issues INTEGER NOT NULL,
  understandable_issues INTEGER NOT NULL,
  robust_issues INTEGER NOT NULL,
  created_at TEXT NOT NULL,
  completed_at TEXT,
  scan_duration_ms INTEGER,
  error_message TEXT,
  catalogue_version TEXT NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_scans_created ON scans(created_at, scan_id);

CREATE TABLE IF NOT EXISTS audit_events (
  event_id TEXT PRIMARY KEY,
  trace_id TEXT NOT NULL,
  event_type TEXT NOT NULL,
  payload TEXT NOT NULL,
  created_at TEXT NOT NULL,
  refs_json TEXT NOT NULL,
  idx INTEGER NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_audit_events_trace ON audit_events(trace_id, idx);

INSERT OR IGNORE INTO schema_version (version, applied_at)
VALUES (1, datetime('now'));
)";

SqliteDb::SqliteDb(sqlite3* db) : db_(db) {}

core::Result<std::shared_ptr<SqliteDb>, std::string> SqliteDb::open(const std::string& path) {
  sqlite3* db = nullptr;
  const int rc = sqlite3_open(path.c_str(), &db);
  if (rc != SQLITE_OK) {
    std::string error = db != nullptr ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    return core::Result<std::shared_ptr<SqliteDb>, std::string>::err("Failed to open database: " +
                                                                     error);
  }

  // Concurrent scans may write while another connection holds a lock.
  sqlite3_busy_timeout(db, 5000);

  return core::Result<std::shared_ptr<SqliteDb>, std::string>::ok(
      std::shared_ptr<SqliteDb>(new SqliteDb(db)));
}

int SqliteDb::get_schema_version() const {
  PreparedStatement stmt(db_.get(),
                         "SELECT version FROM schema_version ORDER BY version DESC LIMIT 1");
  if (!stmt.is_valid()) {
    return 0;  // Table doesn't exist yet
  }

  int version = 0;
  if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    version = sqlite3_column_int(stmt.get(), 0);
  }
  return version;
}

core::Result<bool, std::string> SqliteDb::ensure_schema_v1() {
  if (get_schema_version() >= 1) {
    return core::Result<bool, std::string>::ok(true);
  }

  auto applied = exec(kSchemaV1);
  if (!applied.has_value()) {
    return core::Result<bool, std::string>::err("Failed to apply schema v1: " +
                                                applied.error());
  }
  return core::Result<bool, std::string>::ok(true);
}

core::Result<bool, std::string> SqliteDb::exec(const std::string& sql) {
  char* err_msg = nullptr;
  const int rc = sqlite3_exec(db_.get(), sql.c_str(), nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    std::string error = err_msg != nullptr ? err_msg : "Unknown error";
    sqlite3_free(err_msg);
    return core::Result<bool, std::string>::err(error);
  }
  return core::Result<bool, std::string>::ok(true);
}

std::string SqliteDb::last_error() const { return sqlite3_errmsg(db_.get()); }

PreparedStatement::PreparedStatement(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* raw_stmt = nullptr;
  const int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &raw_stmt, nullptr);
  if (rc != SQLITE_OK) {
    error_ = sqlite3_errmsg(db);
    sqlite3_finalize(raw_stmt);
  } else {
    stmt_.reset(raw_stmt);
  }
}

void PreparedStatement::bind_text(const char* name, const std::string& value) {
  const int index = sqlite3_bind_parameter_index(stmt_.get(), name);
  if (index > 0) {
    sqlite3_bind_text(stmt_.get(), index, value.c_str(), -1, SQLITE_TRANSIENT);
  }
}

void PreparedStatement::bind_int64(const char* name, const long long value) {
  const int index = sqlite3_bind_parameter_index(stmt_.get(), name);
  if (index > 0) {
    sqlite3_bind_int64(stmt_.get(), index, value);
  }
}

void PreparedStatement::bind_double(const char* name, const double value) {
  const int index = sqlite3_bind_parameter_index(stmt_.get(), name);
  if (index > 0) {
    sqlite3_bind_double(stmt_.get(), index, value);
  }
}

void PreparedStatement::bind_null(const char* name) {
  const int index = sqlite3_bind_parameter_index(stmt_.get(), name);
  if (index > 0) {
    sqlite3_bind_null(stmt_.get(), index);
  }
}

void PreparedStatement::reset() {
  if (stmt_) {
    sqlite3_reset(stmt_.get());
    sqlite3_clear_bindings(stmt_.get());
  }
}

}  // namespace a11yscan::storage::sqlite
