#include "a11yscan/storage/inmemory_scan_repository.h"

#include "support/scan_fixtures.h"

#include <catch2/catch_test_macros.hpp>

using namespace a11yscan;

TEST_CASE("InMemoryScanRepository insert and get", "[storage][inmemory]") {
  storage::InMemoryScanRepository repo;
  const auto record = testing::scanning_record("scan-1");

  REQUIRE(repo.insert(record).has_value());

  const auto loaded = repo.get("scan-1");
  REQUIRE(loaded.has_value());
  CHECK(loaded.value() == record);
  CHECK_FALSE(repo.get("scan-missing").has_value());
}

TEST_CASE("InMemoryScanRepository rejects a second insert", "[storage][inmemory]") {
  storage::InMemoryScanRepository repo;
  REQUIRE(repo.insert(testing::scanning_record("scan-1")).has_value());

  const auto again = repo.insert(testing::scanning_record("scan-1"));
  REQUIRE_FALSE(again.has_value());
  CHECK(again.error() == "Scan already exists: scan-1");
}

TEST_CASE("InMemoryScanRepository terminal records are write-once", "[storage][inmemory]") {
  storage::InMemoryScanRepository repo;
  REQUIRE(repo.insert(testing::scanning_record("scan-1")).has_value());

  const auto complete =
      testing::complete_record("scan-1", {testing::finding("A", engine::Severity::kPass)});
  REQUIRE(repo.update(complete).has_value());
  CHECK(repo.get("scan-1")->status == domain::ScanStatus::kComplete);

  const auto failed = testing::failed_record("scan-1");
  const auto refused = repo.update(failed);
  REQUIRE_FALSE(refused.has_value());
  CHECK(refused.error() == "Scan scan-1 is already complete and cannot be modified");
  CHECK(repo.get("scan-1").value() == complete);
}

TEST_CASE("InMemoryScanRepository refuses illegal transitions", "[storage][inmemory]") {
  storage::InMemoryScanRepository repo;
  const auto pending = domain::make_pending_record("scan-1", "https://example.com",
                                                   testing::at("2026-01-01T00:00:00Z"), "1.0.0");
  REQUIRE(repo.insert(pending).has_value());

  // Pending -> Complete skips Scanning
  const auto update = repo.update(testing::complete_record("scan-1", {}));
  CHECK_FALSE(update.has_value());

  CHECK_FALSE(repo.update(testing::scanning_record("scan-unknown")).has_value());
}

TEST_CASE("InMemoryScanRepository lists by creation time", "[storage][inmemory]") {
  storage::InMemoryScanRepository repo;
  REQUIRE(repo.insert(testing::scanning_record("scan-b", "2026-01-02T00:00:00Z")).has_value());
  REQUIRE(repo.insert(testing::scanning_record("scan-c", "2026-01-01T00:00:00Z")).has_value());
  REQUIRE(repo.insert(testing::scanning_record("scan-a", "2026-01-02T00:00:00Z")).has_value());

  const auto all = repo.list_all();
  REQUIRE(all.size() == 3);
  CHECK(all[0].scan_id == "scan-c");
  CHECK(all[1].scan_id == "scan-a");
  CHECK(all[2].scan_id == "scan-b");
}
