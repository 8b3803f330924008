#pragma once

#include "a11yscan/engine/accessibility_rule.h"

namespace a11yscan::engine::rules {

// FORM_LABEL_MISSING (3.3.2 Labels or Instructions)
// A control is labelled by <label for=id>, a wrapping <label>, or a non-empty
// aria-label, aria-labelledby or title. Hidden, submit, button and reset inputs are skipped.
class FormLabelRule final : public AccessibilityRule {
 public:
  FormLabelRule() = default;

  [[nodiscard]] std::string_view rule_code() const noexcept override { return "FORM_LABEL_MISSING"; }
  [[nodiscard]] std::string_view wcag_reference() const noexcept override { return "3.3.2"; }
  [[nodiscard]] WcagLevel wcag_level() const noexcept override { return WcagLevel::kAA; }
  [[nodiscard]] Principle principle() const noexcept override { return Principle::kOperable; }
  [[nodiscard]] std::string_view description() const noexcept override {
    return "Form controls must have an associated label";
  }

  [[nodiscard]] std::vector<Finding> evaluate(const document::Document& doc) const override;
};

}  // namespace a11yscan::engine::rules
