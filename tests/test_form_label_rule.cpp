#include "a11yscan/engine/rules/form_label_rule.h"

#include "support/document_helpers.h"

#include <catch2/catch_test_macros.hpp>

using namespace a11yscan;
using engine::Severity;

TEST_CASE("FormLabelRule passes when there are no inputs", "[rules][form_label]") {
  const engine::rules::FormLabelRule rule;
  const auto findings = testing::evaluate(rule, "<body><p>No forms</p></body>");

  REQUIRE(findings.size() == 1);
  CHECK(findings[0].severity == Severity::kPass);
  CHECK(findings[0].message == "No form inputs found on page");
}

TEST_CASE("FormLabelRule accepts every labelling technique", "[rules][form_label]") {
  const engine::rules::FormLabelRule rule;
  const auto findings = testing::evaluate(rule, R"(<body><form>
<label for="email">Email</label><input type="email" id="email">
<label>Name <input type="text"></label>
<input type="search" aria-label="Search">
<span id="hint">Phone</span><input type="tel" aria-labelledby="hint">
<textarea title="Comments"></textarea>
<input type="hidden" name="token">
<input type="submit" value="Send">
</form></body>)");

  REQUIRE(findings.size() == 1);
  CHECK(findings[0].severity == Severity::kPass);
  CHECK(findings[0].message == "All 5 form inputs have labels");
}

TEST_CASE("FormLabelRule counts unlabelled controls", "[rules][form_label]") {
  const engine::rules::FormLabelRule rule;
  const auto findings = testing::evaluate(rule, R"(<body><form>
<input type="text" name="first">
<input type="text" id="orphan"><label for="other">Other</label>
<select name="country"><option>NL</option></select>
<input type="text" aria-label="   ">
<input type="reset">
</form></body>)");

  REQUIRE(findings.size() == 1);
  const auto& finding = findings[0];
  CHECK(finding.rule_code == "FORM_LABEL_MISSING");
  CHECK(finding.severity == Severity::kFail);
  CHECK(finding.count == 4);
  CHECK(finding.message == "4 form inputs missing labels");
  CHECK(finding.element == std::optional<std::string>(R"(<input type="text" name="first">)"));
}
