#include "storage_setup.h"

#include "a11yscan/storage/inmemory_scan_repository.h"
#include "a11yscan/storage/sqlite/sqlite_audit_log.h"
#include "a11yscan/storage/sqlite/sqlite_scan_repository.h"

#include <iostream>

std::optional<CliStorage> open_storage(const std::optional<std::string>& db_path) {
  CliStorage storage;

  if (!db_path.has_value()) {
    std::cerr << "WARNING: no --db given; scans are kept in memory and lost on exit\n";
    storage.scans = std::make_unique<a11yscan::storage::InMemoryScanRepository>();
    storage.audit_log = std::make_unique<a11yscan::storage::InMemoryAuditLog>();
    return storage;
  }

  auto db_result = a11yscan::storage::sqlite::SqliteDb::open(db_path.value());
  if (!db_result.has_value()) {
    std::cerr << "Failed to open database: " << db_result.error() << "\n";
    return std::nullopt;
  }
  auto db = db_result.value();
  auto schema_result = db->ensure_schema_v1();
  if (!schema_result.has_value()) {
    std::cerr << "Failed to initialize schema: " << schema_result.error() << "\n";
    return std::nullopt;
  }

  storage.db = db;
  storage.scans = std::make_unique<a11yscan::storage::sqlite::SqliteScanRepository>(db);
  storage.audit_log = std::make_unique<a11yscan::storage::sqlite::SqliteAuditLog>(db);
  return storage;
}
