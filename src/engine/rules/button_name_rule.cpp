#include "a11yscan/engine/rules/button_name_rule.h"

#include "a11yscan/core/normalization.h"
#include "a11yscan/document/document.h"

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace a11yscan::engine::rules {

namespace {

bool has_accessible_name(const document::Element& button) {
  if (!button.text().empty()) {
    return true;
  }
  static constexpr std::array<std::string_view, 4> kNamingAttributes = {
      "value", "aria-label", "aria-labelledby", "title"};
  for (const auto& name : kNamingAttributes) {
    const auto value = button.attribute(name);
    if (value.has_value() && !core::trim(*value).empty()) {
      return true;
    }
  }
  return false;
}

}  // namespace

std::vector<Finding> ButtonNameRule::evaluate(const document::Document& doc) const {
  const auto buttons = doc.buttons();
  if (buttons.empty()) {
    return {make_finding(Severity::kPass, "No buttons found on page", "N/A - No buttons to check")};
  }

  int unnamed = 0;
  std::optional<std::string> first_offender;
  for (const auto& button : buttons) {
    if (has_accessible_name(button)) {
      continue;
    }
    if (unnamed == 0) {
      first_offender = button.snippet();
    }
    ++unnamed;
  }

  if (unnamed > 0) {
    return {make_finding(Severity::kFail,
                         std::to_string(unnamed) + " buttons missing accessible names",
                         "Add text content, value, aria-label, or title to buttons",
                         first_offender, unnamed)};
  }
  return {make_finding(Severity::kPass,
                       "All " + std::to_string(buttons.size()) + " buttons have accessible names",
                       kCheckPassedRemediation)};
}

}  // namespace a11yscan::engine::rules
