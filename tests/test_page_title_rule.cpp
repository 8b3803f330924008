#include "a11yscan/engine/rules/page_title_rule.h"

#include "support/document_helpers.h"

#include <catch2/catch_test_macros.hpp>

using namespace a11yscan;
using engine::Severity;

TEST_CASE("PageTitleRule grades the title", "[rules][page_title]") {
  const engine::rules::PageTitleRule rule;

  SECTION("descriptive title passes") {
    const auto findings =
        testing::evaluate(rule, "<html><head><title>Contact us</title></head></html>");
    REQUIRE(findings.size() == 1);
    CHECK(findings[0].severity == Severity::kPass);
    CHECK(findings[0].message == "Page has title: 'Contact us'");
  }

  SECTION("missing title fails") {
    const auto findings = testing::evaluate(rule, "<html><head></head><body></body></html>");
    REQUIRE(findings.size() == 1);
    CHECK(findings[0].severity == Severity::kFail);
    CHECK(findings[0].message == "Page has no <title> element");
    CHECK_FALSE(findings[0].element.has_value());
  }

  SECTION("blank title fails") {
    const auto findings = testing::evaluate(rule, "<html><head><title> </title></head></html>");
    REQUIRE(findings.size() == 1);
    CHECK(findings[0].severity == Severity::kFail);
    CHECK(findings[0].message == "Page title is empty");
  }

  SECTION("very short title warns") {
    const auto findings = testing::evaluate(rule, "<html><head><title>Hi</title></head></html>");
    REQUIRE(findings.size() == 1);
    CHECK(findings[0].severity == Severity::kWarning);
    CHECK(findings[0].element == std::optional<std::string>("<title>Hi</title>"));
  }

  SECTION("length counts characters, not bytes") {
    // Three code points, six bytes
    const auto findings = testing::evaluate(
        rule, "<html><head><meta charset=\"utf-8\"><title>\xC3\xA9\xC3\xA9\xC3\xA9</title></head></html>");
    REQUIRE(findings.size() == 1);
    CHECK(findings[0].severity == Severity::kPass);
  }
}
