#include "a11yscan/engine/rules/button_name_rule.h"

#include "support/document_helpers.h"

#include <catch2/catch_test_macros.hpp>

using namespace a11yscan;
using engine::Severity;

TEST_CASE("ButtonNameRule passes without buttons", "[rules][button_name]") {
  const engine::rules::ButtonNameRule rule;
  const auto findings = testing::evaluate(rule, "<body><a href=\"/\">Home</a></body>");

  REQUIRE(findings.size() == 1);
  CHECK(findings[0].severity == Severity::kPass);
  CHECK(findings[0].message == "No buttons found on page");
}

TEST_CASE("ButtonNameRule accepts text, value, aria-label and title", "[rules][button_name]") {
  const engine::rules::ButtonNameRule rule;
  const auto findings = testing::evaluate(rule, R"(<body>
<button>Save</button>
<input type="button" value="Open">
<button aria-label="Close"><svg></svg></button>
<button title="Help"></button>
</body>)");

  REQUIRE(findings.size() == 1);
  CHECK(findings[0].severity == Severity::kPass);
  CHECK(findings[0].message == "All 4 buttons have accessible names");
}

TEST_CASE("ButtonNameRule fails unnamed buttons", "[rules][button_name]") {
  const engine::rules::ButtonNameRule rule;
  const auto findings = testing::evaluate(rule, R"(<body>
<button>OK</button>
<button class="icon"></button>
<input type="button" value=" ">
</body>)");

  REQUIRE(findings.size() == 1);
  CHECK(findings[0].rule_code == "BUTTON_NAME_MISSING");
  CHECK(findings[0].severity == Severity::kFail);
  CHECK(findings[0].count == 2);
  CHECK(findings[0].message == "2 buttons missing accessible names");
  CHECK(findings[0].element == std::optional<std::string>(R"(<button class="icon"></button>)"));
}
