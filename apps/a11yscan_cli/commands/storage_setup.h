#pragma once

#include "a11yscan/storage/audit_log.h"
#include "a11yscan/storage/scan_repository.h"
#include "a11yscan/storage/sqlite/sqlite_db.h"

#include <memory>
#include <optional>
#include <string>

// CliStorage owns the repositories a subcommand runs against.
// db is null for ephemeral in-memory storage.
struct CliStorage {
  std::shared_ptr<a11yscan::storage::sqlite::SqliteDb> db;
  std::unique_ptr<a11yscan::storage::IScanRepository> scans;
  std::unique_ptr<a11yscan::storage::IAuditLog> audit_log;
};

// open_storage: SQLite-backed storage when db_path is set (schema v1 applied),
// otherwise in-memory storage with a warning on stderr.
// Prints the error and returns nullopt if the database cannot be opened.
std::optional<CliStorage> open_storage(const std::optional<std::string>& db_path);
