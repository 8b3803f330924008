#include "a11yscan/engine/rules/duplicate_id_rule.h"

#include "support/document_helpers.h"

#include <catch2/catch_test_macros.hpp>

using namespace a11yscan;
using engine::Severity;

TEST_CASE("DuplicateIdRule passes without ids", "[rules][duplicate_id]") {
  const engine::rules::DuplicateIdRule rule;
  const auto findings = testing::evaluate(rule, "<body><p>Text</p></body>");

  REQUIRE(findings.size() == 1);
  CHECK(findings[0].severity == Severity::kPass);
  CHECK(findings[0].message == "No ID attributes found");
}

TEST_CASE("DuplicateIdRule passes unique ids", "[rules][duplicate_id]") {
  const engine::rules::DuplicateIdRule rule;
  const auto findings =
      testing::evaluate(rule, R"(<body><div id="a"></div><div id="b"></div><p id="c"></p></body>)");

  REQUIRE(findings.size() == 1);
  CHECK(findings[0].severity == Severity::kPass);
  CHECK(findings[0].message == "All 3 IDs are unique");
}

TEST_CASE("DuplicateIdRule reports each duplicated value once", "[rules][duplicate_id]") {
  const engine::rules::DuplicateIdRule rule;
  const auto findings = testing::evaluate(rule, R"(<body>
<div id="main"></div>
<span id="nav"></span>
<p id="main">x</p>
<section id="main"></section>
<em id="nav"></em>
<b id="solo"></b>
</body>)");

  REQUIRE(findings.size() == 1);
  const auto& finding = findings[0];
  CHECK(finding.rule_code == "DUPLICATE_ID");
  CHECK(finding.severity == Severity::kFail);
  CHECK(finding.count == 2);
  CHECK(finding.message == "2 duplicate IDs found: 'main', 'nav'");
  CHECK(finding.element == std::optional<std::string>(R"(<p id="main">x</p>)"));
  CHECK(finding.principle == engine::Principle::kRobust);
}
