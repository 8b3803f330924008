#include "a11yscan/engine/rules/aria_role_rule.h"

#include "a11yscan/core/normalization.h"
#include "a11yscan/document/document.h"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>

namespace a11yscan::engine::rules {

namespace {

constexpr std::size_t kListedRoles = 5;

// Concrete (non-abstract) roles defined by WAI-ARIA 1.2.
bool is_valid_role(const std::string& role) {
  static const std::unordered_set<std::string_view> kRoles = {
      "alert",        "alertdialog", "application",      "article",       "banner",
      "blockquote",   "button",      "caption",          "cell",          "checkbox",
      "code",         "columnheader", "combobox",        "complementary", "contentinfo",
      "definition",   "deletion",    "dialog",           "directory",     "document",
      "emphasis",     "feed",        "figure",           "form",          "generic",
      "grid",         "gridcell",    "group",            "heading",       "img",
      "insertion",    "link",        "list",             "listbox",       "listitem",
      "log",          "main",        "marquee",          "math",          "menu",
      "menubar",      "menuitem",    "menuitemcheckbox", "menuitemradio", "meter",
      "navigation",   "none",        "note",             "option",        "paragraph",
      "presentation", "progressbar", "radio",            "radiogroup",    "region",
      "row",          "rowgroup",    "rowheader",        "scrollbar",     "search",
      "searchbox",    "separator",   "slider",           "spinbutton",    "status",
      "strong",       "subscript",   "superscript",      "switch",        "tab",
      "table",        "tablist",     "tabpanel",         "term",          "textbox",
      "time",         "timer",       "toolbar",          "tooltip",       "tree",
      "treegrid",     "treeitem"};
  return kRoles.contains(role);
}

}  // namespace

std::vector<Finding> AriaRoleRule::evaluate(const document::Document& doc) const {
  const auto elements = doc.elements_with_attribute("role");
  if (elements.empty()) {
    return {make_finding(Severity::kPass, "No ARIA roles found", "N/A - No roles to check")};
  }

  int invalid = 0;
  std::string listed;
  std::optional<std::string> first_offender;
  for (const auto& element : elements) {
    const std::string role =
        core::normalize_ascii_lower(core::trim(element.attribute("role").value_or(std::string{})));
    if (role.empty() || is_valid_role(role)) {
      continue;
    }
    if (invalid == 0) {
      first_offender = element.snippet();
    }
    if (static_cast<std::size_t>(invalid) < kListedRoles) {
      listed += (invalid > 0 ? ", '" : "'") + role + "'";
    }
    ++invalid;
  }

  if (invalid > 0) {
    return {make_finding(Severity::kFail,
                         std::to_string(invalid) + " invalid ARIA roles found: " + listed,
                         "Use only valid ARIA 1.2 role values", first_offender, invalid)};
  }
  return {make_finding(Severity::kPass,
                       "All " + std::to_string(elements.size()) + " ARIA roles are valid",
                       kCheckPassedRemediation)};
}

}  // namespace a11yscan::engine::rules
