#include "a11yscan/domain/scan_record_json.h"

#include "support/scan_fixtures.h"

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

using namespace a11yscan;

TEST_CASE("Finding JSON uses lowercase severities and capitalized principles", "[json]") {
  auto f = testing::finding("IMG_ALT_MISSING", engine::Severity::kFail,
                            engine::Principle::kPerceivable, 3);
  f.element = R"(<img src="a.png">)";

  const auto j = domain::finding_to_json(f);
  CHECK(j["severity"] == "fail");
  CHECK(j["principle"] == "Perceivable");
  CHECK(j["wcag_level"] == "AA");
  CHECK(j["count"] == 3);
  CHECK(j["element"] == R"(<img src="a.png">)");

  CHECK(domain::finding_from_json(j) == f);
}

TEST_CASE("Finding JSON writes null for a missing element", "[json]") {
  const auto f = testing::finding("A", engine::Severity::kPass);
  const auto j = domain::finding_to_json(f);
  CHECK(j["element"].is_null());
  CHECK_FALSE(domain::finding_from_json(j).element.has_value());
}

TEST_CASE("Complete scan record JSON", "[json]") {
  const auto record = testing::complete_record(
      "scan-1", {testing::finding("A", engine::Severity::kPass),
                 testing::finding("B", engine::Severity::kFail, engine::Principle::kRobust)});

  const auto j = domain::scan_record_to_json(record);
  CHECK(j["status"] == "complete");
  CHECK(j["score"] == 50.0);
  CHECK(j["created_at"] == "2026-01-01T00:00:00.000Z");
  CHECK(j["completed_at"] == "2026-01-01T00:00:01.500Z");
  CHECK(j["scan_duration_ms"] == 1500);
  CHECK(j["robust_issues"] == 1);
  CHECK(j["error_message"].is_null());
  CHECK(j["findings"].size() == 2);

  CHECK(domain::scan_record_from_json(j) == record);
}

TEST_CASE("Failed scan record JSON has a null score", "[json]") {
  const auto record = testing::failed_record("scan-2");

  const auto j = domain::scan_record_to_json(record);
  CHECK(j["status"] == "failed");
  CHECK(j["score"].is_null());
  CHECK(j["findings"].empty());
  CHECK(j["error_message"] == "Timeout: request exceeded 10000 ms");

  CHECK(domain::scan_record_from_json(j) == record);
}

TEST_CASE("Unknown enum names are rejected", "[json]") {
  auto j = domain::finding_to_json(testing::finding("A", engine::Severity::kWarning));

  SECTION("severity") {
    j["severity"] = "critical";
    CHECK_THROWS_AS(domain::finding_from_json(j), std::invalid_argument);
  }

  SECTION("principle") {
    j["principle"] = "Usable";
    CHECK_THROWS_AS(domain::finding_from_json(j), std::invalid_argument);
  }

  SECTION("status") {
    auto record_json = domain::scan_record_to_json(testing::scanning_record("scan-3"));
    record_json["status"] = "queued";
    CHECK_THROWS_AS(domain::scan_record_from_json(record_json), std::invalid_argument);
  }
}
