#include "a11yscan/engine/rule_catalogue.h"

#include "support/fake_rules.h"

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

using namespace a11yscan;

TEST_CASE("Default catalogue has ten rules in fixed order", "[catalogue]") {
  const auto catalogue = engine::make_default_catalogue();

  CHECK(catalogue.catalogue_id() == engine::kDefaultCatalogueId);
  CHECK(catalogue.version() == engine::kDefaultCatalogueVersion);
  REQUIRE(catalogue.size() == 10);

  const std::vector<std::string> expected = {
      "IMG_ALT_MISSING",    "HTML_LANG_MISSING",      "PAGE_TITLE_MISSING", "FORM_LABEL_MISSING",
      "BUTTON_NAME_MISSING", "LINK_TEXT_EMPTY",       "HEADING_SKIP_LEVEL",
      "H1_MISSING_OR_MULTIPLE", "DUPLICATE_ID",       "ARIA_ROLE_INVALID"};
  for (std::size_t i = 0; i < expected.size(); ++i) {
    CHECK(catalogue.rules()[i]->rule_code() == expected[i]);
  }
}

TEST_CASE("Default catalogue metadata is complete", "[catalogue]") {
  const auto catalogue = engine::make_default_catalogue();

  std::set<engine::Principle> principles;
  for (const auto& rule : catalogue.rules()) {
    CHECK_FALSE(rule->wcag_reference().empty());
    CHECK_FALSE(rule->description().empty());
    CHECK(engine::is_known_principle(rule->principle()));
    principles.insert(rule->principle());
  }
  // Every principle bucket is covered by at least one rule
  CHECK(principles.size() == 4);
}

TEST_CASE("Catalogue rejects invalid registrations", "[catalogue]") {
  engine::RuleCatalogue catalogue("custom", "0.1.0");

  SECTION("null rule") {
    CHECK_THROWS_AS(catalogue.add_rule(nullptr), std::invalid_argument);
  }

  SECTION("empty rule code") {
    CHECK_THROWS_AS(
        catalogue.add_rule(std::make_unique<testing::FixedRule>("", engine::Severity::kPass)),
        std::invalid_argument);
  }

  SECTION("principle outside the four buckets") {
    CHECK_THROWS_AS(catalogue.add_rule(std::make_unique<testing::FixedRule>(
                        "ODD", engine::Severity::kPass, static_cast<engine::Principle>(42))),
                    std::invalid_argument);
  }

  SECTION("duplicate rule code") {
    catalogue.add_rule(std::make_unique<testing::FixedRule>("SAME", engine::Severity::kPass));
    CHECK_THROWS_AS(
        catalogue.add_rule(std::make_unique<testing::FixedRule>("SAME", engine::Severity::kFail)),
        std::invalid_argument);
    CHECK(catalogue.size() == 1);
  }

  CHECK(catalogue.size() <= 1);
}
