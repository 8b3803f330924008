#pragma once

#include "a11yscan/storage/scan_repository.h"
#include "a11yscan/storage/sqlite/sqlite_db.h"

#include <memory>
#include <mutex>

namespace a11yscan::storage::sqlite {

// SqliteScanRepository stores Scan Records in the `scans` table.
// Findings are stored as a JSON array; counters and timestamps as columns so that
// statistics can be queried without decoding findings.
// Requires schema v1 (SqliteDb::ensure_schema_v1).
class SqliteScanRepository final : public IScanRepository {
 public:
  explicit SqliteScanRepository(std::shared_ptr<SqliteDb> db);

  [[nodiscard]] WriteResult insert(const domain::ScanRecord& record) override;
  [[nodiscard]] WriteResult update(const domain::ScanRecord& record) override;
  [[nodiscard]] std::optional<domain::ScanRecord> get(const std::string& scan_id) const override;
  [[nodiscard]] std::vector<domain::ScanRecord> list_all() const override;

 private:
  [[nodiscard]] std::optional<domain::ScanRecord> load(const std::string& scan_id) const;

  std::shared_ptr<SqliteDb> db_;
  // Serializes the read-check-write sequence of update().
  mutable std::mutex mutex_;
};

}  // namespace a11yscan::storage::sqlite
