#include "a11yscan/storage/audit_log.h"
#include "a11yscan/storage/sqlite/sqlite_audit_log.h"
#include "a11yscan/storage/sqlite/sqlite_db.h"

#include <catch2/catch_test_macros.hpp>

using namespace a11yscan;

TEST_CASE("SqliteAuditLog append and query", "[sqlite][audit]") {
  auto db_result = storage::sqlite::SqliteDb::open(":memory:");
  REQUIRE(db_result.has_value());
  auto db = db_result.value();
  REQUIRE(db->ensure_schema_v1().has_value());

  storage::sqlite::SqliteAuditLog audit_log(db);

  const std::string trace_id = "scan-001";
  audit_log.append({"evt-001", trace_id, "ScanStarted", R"({"url":"https://example.com"})",
                    "2026-01-01T00:00:00.000Z", {trace_id}});
  audit_log.append({"evt-002", trace_id, "FetchCompleted", R"({"status_code":200})",
                    "2026-01-01T00:00:00.500Z", {trace_id}});
  audit_log.append({"evt-003", trace_id, "ScanCompleted", R"({"score":90.0})",
                    "2026-01-01T00:00:01.000Z", {}});

  const auto events = audit_log.query(trace_id);
  REQUIRE(events.size() == 3);

  // Insertion order is preserved
  CHECK(events[0].event_id == "evt-001");
  CHECK(events[1].event_id == "evt-002");
  CHECK(events[2].event_id == "evt-003");

  CHECK(events[0].event_type == "ScanStarted");
  CHECK(events[1].payload == R"({"status_code":200})");
  CHECK(events[0].refs.size() == 1);
  CHECK(events[0].refs[0] == trace_id);
  CHECK(events[2].refs.empty());
}

TEST_CASE("SqliteAuditLog separates traces", "[sqlite][audit]") {
  auto db_result = storage::sqlite::SqliteDb::open(":memory:");
  REQUIRE(db_result.has_value());
  auto db = db_result.value();
  REQUIRE(db->ensure_schema_v1().has_value());

  storage::sqlite::SqliteAuditLog audit_log(db);
  audit_log.append({"evt-1a", "scan-A", "ScanStarted", "{}", "2026-01-01T00:00:00.000Z", {}});
  audit_log.append({"evt-1b", "scan-B", "ScanStarted", "{}", "2026-01-01T00:00:00.000Z", {}});
  audit_log.append({"evt-2a", "scan-A", "ScanFailed", "{}", "2026-01-01T00:00:01.000Z", {}});

  const auto events_a = audit_log.query("scan-A");
  REQUIRE(events_a.size() == 2);
  CHECK(events_a[0].event_id == "evt-1a");
  CHECK(events_a[1].event_id == "evt-2a");

  CHECK(audit_log.query("scan-B").size() == 1);
  CHECK(audit_log.query("").size() == 3);

  const auto trace_ids = audit_log.list_trace_ids();
  REQUIRE(trace_ids.size() == 2);
  CHECK(trace_ids[0] == "scan-A");
  CHECK(trace_ids[1] == "scan-B");
}

TEST_CASE("InMemoryAuditLog keeps per-trace order", "[audit]") {
  storage::InMemoryAuditLog audit_log;
  audit_log.append({"evt-1", "scan-A", "ScanStarted", "{}", "2026-01-01T00:00:00.000Z", {}});
  audit_log.append({"evt-2", "scan-B", "ScanStarted", "{}", "2026-01-01T00:00:00.000Z", {}});
  audit_log.append({"evt-3", "scan-A", "ScanCompleted", "{}", "2026-01-01T00:00:01.000Z", {}});

  const auto events = audit_log.query("scan-A");
  REQUIRE(events.size() == 2);
  CHECK(events[0].event_type == "ScanStarted");
  CHECK(events[1].event_type == "ScanCompleted");
  CHECK(audit_log.query("").size() == 3);
  CHECK(audit_log.list_trace_ids().size() == 2);
}
