#include "a11yscan/engine/rules/image_alt_text_rule.h"

#include "support/document_helpers.h"

#include <catch2/catch_test_macros.hpp>

using namespace a11yscan;
using engine::Severity;

TEST_CASE("ImageAltTextRule passes when the page has no images", "[rules][image_alt]") {
  const engine::rules::ImageAltTextRule rule;
  const auto findings = testing::evaluate(rule, "<html><body><p>Text</p></body></html>");

  REQUIRE(findings.size() == 1);
  CHECK(findings[0].severity == Severity::kPass);
  CHECK(findings[0].message == "No images found on page");
  CHECK(findings[0].remediation == "N/A - No images to check");
}

TEST_CASE("ImageAltTextRule fails once for all images without alt", "[rules][image_alt]") {
  const engine::rules::ImageAltTextRule rule;
  const auto findings = testing::evaluate(
      rule, R"(<body><img src="ok.png" alt="Logo"><img src="a.png"><img src="b.png"></body>)");

  REQUIRE(findings.size() == 1);
  const auto& finding = findings[0];
  CHECK(finding.rule_code == "IMG_ALT_MISSING");
  CHECK(finding.severity == Severity::kFail);
  CHECK(finding.count == 2);
  CHECK(finding.message == "2 images missing alt attribute");
  CHECK(finding.element == std::optional<std::string>(R"(<img src="a.png">)"));
  CHECK(finding.wcag_reference == "1.1.1");
  CHECK(finding.principle == engine::Principle::kPerceivable);
  CHECK(finding.wcag_level == engine::WcagLevel::kAA);
}

TEST_CASE("ImageAltTextRule accepts empty alt as decorative", "[rules][image_alt]") {
  const engine::rules::ImageAltTextRule rule;
  const auto findings =
      testing::evaluate(rule, R"(<body><img src="spacer.gif" alt=""><img src="x.png" alt="X"></body>)");

  REQUIRE(findings.size() == 1);
  CHECK(findings[0].severity == Severity::kPass);
  CHECK(findings[0].remediation == engine::kCheckPassedRemediation);
  CHECK_FALSE(findings[0].element.has_value());
}
