#pragma once

#include "a11yscan/engine/accessibility_rule.h"

namespace a11yscan::engine::rules {

// ARIA_ROLE_INVALID (4.1.2 Name, Role, Value)
// Role values are trimmed and lowercased before lookup; empty values are ignored.
class AriaRoleRule final : public AccessibilityRule {
 public:
  AriaRoleRule() = default;

  [[nodiscard]] std::string_view rule_code() const noexcept override { return "ARIA_ROLE_INVALID"; }
  [[nodiscard]] std::string_view wcag_reference() const noexcept override { return "4.1.2"; }
  [[nodiscard]] WcagLevel wcag_level() const noexcept override { return WcagLevel::kAA; }
  [[nodiscard]] Principle principle() const noexcept override { return Principle::kRobust; }
  [[nodiscard]] std::string_view description() const noexcept override {
    return "role attributes must name a valid ARIA 1.2 role";
  }

  [[nodiscard]] std::vector<Finding> evaluate(const document::Document& doc) const override;
};

}  // namespace a11yscan::engine::rules
