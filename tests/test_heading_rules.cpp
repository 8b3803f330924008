#include "a11yscan/engine/rules/heading_hierarchy_rule.h"
#include "a11yscan/engine/rules/single_h1_rule.h"

#include "support/document_helpers.h"

#include <catch2/catch_test_macros.hpp>

using namespace a11yscan;
using engine::Severity;

TEST_CASE("HeadingHierarchyRule passes sequential headings", "[rules][headings]") {
  const engine::rules::HeadingHierarchyRule rule;
  const auto findings =
      testing::evaluate(rule, "<body><h1>A</h1><h2>B</h2><h3>C</h3><h2>D</h2><h2>E</h2></body>");

  REQUIRE(findings.size() == 1);
  CHECK(findings[0].severity == Severity::kPass);
  CHECK(findings[0].message == "Heading hierarchy is correct (5 headings)");
}

TEST_CASE("HeadingHierarchyRule passes a page without headings", "[rules][headings]") {
  const engine::rules::HeadingHierarchyRule rule;
  const auto findings = testing::evaluate(rule, "<body><p>Text</p></body>");

  REQUIRE(findings.size() == 1);
  CHECK(findings[0].severity == Severity::kPass);
  CHECK(findings[0].message == "No heading elements found on page");
}

TEST_CASE("HeadingHierarchyRule warns on skipped levels", "[rules][headings]") {
  const engine::rules::HeadingHierarchyRule rule;
  const auto findings = testing::evaluate(rule, "<body><h1>Title</h1><h3>Details</h3></body>");

  REQUIRE(findings.size() == 1);
  CHECK(findings[0].rule_code == "HEADING_SKIP_LEVEL");
  CHECK(findings[0].severity == Severity::kWarning);
  CHECK(findings[0].count == 1);
  CHECK(findings[0].message ==
        "Heading hierarchy has 1 issues (Skipped from 1 to 3 at heading: 'Details')");
  CHECK(findings[0].element == std::optional<std::string>("<h3>Details</h3>"));
}

TEST_CASE("HeadingHierarchyRule checks the first heading only for h1", "[rules][headings]") {
  const engine::rules::HeadingHierarchyRule rule;
  // h2 first is one issue; the later h1 -> h2 -> h4 jump is a second one.
  const auto findings =
      testing::evaluate(rule, "<body><h2>Intro</h2><h1>Main</h1><h2>Sub</h2><h4>Deep</h4></body>");

  REQUIRE(findings.size() == 1);
  CHECK(findings[0].severity == Severity::kWarning);
  CHECK(findings[0].count == 2);
  CHECK(findings[0].message ==
        "Heading hierarchy has 2 issues (First heading is h2, should start with h1)");
}

TEST_CASE("SingleH1Rule", "[rules][headings]") {
  const engine::rules::SingleH1Rule rule;

  SECTION("exactly one h1 passes") {
    const auto findings = testing::evaluate(rule, "<body><h1>Welcome</h1><h2>News</h2></body>");
    REQUIRE(findings.size() == 1);
    CHECK(findings[0].severity == Severity::kPass);
    CHECK(findings[0].message == "Page has one <h1>: 'Welcome'");
  }

  SECTION("no h1 warns") {
    const auto findings = testing::evaluate(rule, "<body><h2>News</h2></body>");
    REQUIRE(findings.size() == 1);
    CHECK(findings[0].severity == Severity::kWarning);
    CHECK(findings[0].message == "No <h1> element found on page");
  }

  SECTION("several h1 warn once with the total") {
    const auto findings =
        testing::evaluate(rule, "<body><h1>One</h1><h1>Two</h1><div><h1>Three</h1></div></body>");
    REQUIRE(findings.size() == 1);
    CHECK(findings[0].rule_code == "H1_MISSING_OR_MULTIPLE");
    CHECK(findings[0].severity == Severity::kWarning);
    CHECK(findings[0].count == 3);
    CHECK(findings[0].message == "Multiple <h1> elements found (3): One, Two, Three");
    CHECK(findings[0].element == std::optional<std::string>("<h1>Two</h1>"));
  }
}
