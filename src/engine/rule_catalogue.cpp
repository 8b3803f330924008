#include "a11yscan/engine/rule_catalogue.h"

#include "a11yscan/engine/rules/aria_role_rule.h"
#include "a11yscan/engine/rules/button_name_rule.h"
#include "a11yscan/engine/rules/duplicate_id_rule.h"
#include "a11yscan/engine/rules/form_label_rule.h"
#include "a11yscan/engine/rules/heading_hierarchy_rule.h"
#include "a11yscan/engine/rules/html_lang_rule.h"
#include "a11yscan/engine/rules/image_alt_text_rule.h"
#include "a11yscan/engine/rules/link_text_rule.h"
#include "a11yscan/engine/rules/page_title_rule.h"
#include "a11yscan/engine/rules/single_h1_rule.h"

#include <stdexcept>
#include <utility>

namespace a11yscan::engine {

RuleCatalogue::RuleCatalogue(std::string catalogue_id, std::string version)
    : catalogue_id_(std::move(catalogue_id)), version_(std::move(version)) {}

void RuleCatalogue::add_rule(std::unique_ptr<const AccessibilityRule> rule) {
  if (!rule) {
    throw std::invalid_argument("Cannot register a null rule");
  }
  if (rule->rule_code().empty()) {
    throw std::invalid_argument("Rule code must not be empty");
  }
  if (!is_known_principle(rule->principle())) {
    throw std::invalid_argument("Rule " + std::string(rule->rule_code()) +
                                " declares an unknown WCAG principle");
  }
  for (const auto& existing : rules_) {
    if (existing->rule_code() == rule->rule_code()) {
      throw std::invalid_argument("Rule code already registered: " +
                                  std::string(rule->rule_code()));
    }
  }
  rules_.push_back(std::move(rule));
}

RuleCatalogue make_default_catalogue() {
  RuleCatalogue catalogue(kDefaultCatalogueId, kDefaultCatalogueVersion);

  // Fixed evaluation order
  catalogue.add_rule(std::make_unique<rules::ImageAltTextRule>());
  catalogue.add_rule(std::make_unique<rules::HtmlLangRule>());
  catalogue.add_rule(std::make_unique<rules::PageTitleRule>());
  catalogue.add_rule(std::make_unique<rules::FormLabelRule>());
  catalogue.add_rule(std::make_unique<rules::ButtonNameRule>());
  catalogue.add_rule(std::make_unique<rules::LinkTextRule>());
  catalogue.add_rule(std::make_unique<rules::HeadingHierarchyRule>());
  catalogue.add_rule(std::make_unique<rules::SingleH1Rule>());
  catalogue.add_rule(std::make_unique<rules::DuplicateIdRule>());
  catalogue.add_rule(std::make_unique<rules::AriaRoleRule>());

  return catalogue;
}

}  // namespace a11yscan::engine
