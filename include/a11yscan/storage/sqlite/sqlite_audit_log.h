#pragma once

#include "a11yscan/storage/audit_log.h"
#include "a11yscan/storage/sqlite/sqlite_db.h"

#include <map>
#include <memory>
#include <mutex>

namespace a11yscan::storage::sqlite {

// SqliteAuditLog implements IAuditLog with SQLite backend.
// Maintains append-only log with deterministic ordering via idx column.
// append() throws std::runtime_error when the event cannot be stored.
class SqliteAuditLog final : public IAuditLog {
 public:
  explicit SqliteAuditLog(std::shared_ptr<SqliteDb> db);

  void append(const AuditEvent& event) override;
  [[nodiscard]] std::vector<AuditEvent> query(const std::string& trace_id) const override;
  [[nodiscard]] std::vector<std::string> list_trace_ids() const override;

 private:
  // Next idx for trace_id; first use per trace resumes after the stored maximum.
  int next_index(const std::string& trace_id);

  std::shared_ptr<SqliteDb> db_;
  mutable std::mutex mutex_;
  std::map<std::string, int> trace_indices_;
};

}  // namespace a11yscan::storage::sqlite
