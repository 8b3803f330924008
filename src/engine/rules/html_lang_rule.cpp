#include "a11yscan/engine/rules/html_lang_rule.h"

#include "a11yscan/core/normalization.h"
#include "a11yscan/document/document.h"

namespace a11yscan::engine::rules {

std::vector<Finding> HtmlLangRule::evaluate(const document::Document& doc) const {
  const auto root = doc.root();
  if (!root.has_value()) {
    return {make_finding(Severity::kFail, "No <html> tag found",
                         "Ensure document has a valid <html> tag with lang attribute")};
  }

  const std::string lang = core::trim(root->attribute("lang").value_or(std::string{}));
  if (lang.empty()) {
    return {make_finding(Severity::kFail, "<html> tag missing lang attribute",
                         "Add lang attribute to <html> tag (e.g., <html lang='en'>)",
                         root->snippet())};
  }
  return {make_finding(Severity::kPass, "Page language is set to '" + lang + "'",
                       kCheckPassedRemediation)};
}

}  // namespace a11yscan::engine::rules
