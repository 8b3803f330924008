#include "a11yscan/engine/rules/form_label_rule.h"

#include "a11yscan/core/normalization.h"
#include "a11yscan/document/document.h"

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace a11yscan::engine::rules {

namespace {

// Input types that are not labelled by the user.
bool is_unlabelled_type(const std::string& type) {
  static constexpr std::array<std::string_view, 4> kSkipped = {"hidden", "submit", "button",
                                                               "reset"};
  for (const auto& skipped : kSkipped) {
    if (type == skipped) {
      return true;
    }
  }
  return false;
}

bool has_non_empty(const document::Element& element, const std::string_view name) {
  const auto value = element.attribute(name);
  return value.has_value() && !core::trim(*value).empty();
}

bool has_label(const document::Document& doc, const document::Element& control) {
  const std::string id = control.attribute("id").value_or(std::string{});
  if (!id.empty() && doc.find_label_for(id).has_value()) {
    return true;
  }
  const auto parent = control.parent();
  if (parent.has_value() && parent->tag_name() == "label") {
    return true;
  }
  return has_non_empty(control, "aria-label") || has_non_empty(control, "aria-labelledby") ||
         has_non_empty(control, "title");
}

}  // namespace

std::vector<Finding> FormLabelRule::evaluate(const document::Document& doc) const {
  int checked = 0;
  int unlabelled = 0;
  std::optional<std::string> first_offender;

  for (const auto& control : doc.inputs()) {
    const std::string type =
        core::normalize_ascii_lower(core::trim(control.attribute("type").value_or("text")));
    if (is_unlabelled_type(type)) {
      continue;
    }
    ++checked;
    if (has_label(doc, control)) {
      continue;
    }
    if (unlabelled == 0) {
      first_offender = control.snippet();
    }
    ++unlabelled;
  }

  if (unlabelled > 0) {
    return {make_finding(Severity::kFail, std::to_string(unlabelled) + " form inputs missing labels",
                         "Add <label> elements with 'for' attribute, or use aria-label",
                         first_offender, unlabelled)};
  }
  if (checked > 0) {
    return {make_finding(Severity::kPass,
                         "All " + std::to_string(checked) + " form inputs have labels",
                         kCheckPassedRemediation)};
  }
  return {make_finding(Severity::kPass, "No form inputs found on page", "N/A - No inputs to check")};
}

}  // namespace a11yscan::engine::rules
