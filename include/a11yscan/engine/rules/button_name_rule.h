#pragma once

#include "a11yscan/engine/accessibility_rule.h"

namespace a11yscan::engine::rules {

// BUTTON_NAME_MISSING (4.1.2 Name, Role, Value)
class ButtonNameRule final : public AccessibilityRule {
 public:
  ButtonNameRule() = default;

  [[nodiscard]] std::string_view rule_code() const noexcept override { return "BUTTON_NAME_MISSING"; }
  [[nodiscard]] std::string_view wcag_reference() const noexcept override { return "4.1.2"; }
  [[nodiscard]] WcagLevel wcag_level() const noexcept override { return WcagLevel::kAA; }
  [[nodiscard]] Principle principle() const noexcept override { return Principle::kOperable; }
  [[nodiscard]] std::string_view description() const noexcept override {
    return "Buttons must have an accessible name";
  }

  [[nodiscard]] std::vector<Finding> evaluate(const document::Document& doc) const override;
};

}  // namespace a11yscan::engine::rules
