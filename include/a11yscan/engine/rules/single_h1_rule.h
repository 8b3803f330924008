#pragma once

#include "a11yscan/engine/accessibility_rule.h"

namespace a11yscan::engine::rules {

// H1_MISSING_OR_MULTIPLE (2.4.6 Headings and Labels)
class SingleH1Rule final : public AccessibilityRule {
 public:
  SingleH1Rule() = default;

  [[nodiscard]] std::string_view rule_code() const noexcept override { return "H1_MISSING_OR_MULTIPLE"; }
  [[nodiscard]] std::string_view wcag_reference() const noexcept override { return "2.4.6"; }
  [[nodiscard]] WcagLevel wcag_level() const noexcept override { return WcagLevel::kAA; }
  [[nodiscard]] Principle principle() const noexcept override { return Principle::kUnderstandable; }
  [[nodiscard]] std::string_view description() const noexcept override {
    return "The page should have exactly one <h1>";
  }

  [[nodiscard]] std::vector<Finding> evaluate(const document::Document& doc) const override;
};

}  // namespace a11yscan::engine::rules
