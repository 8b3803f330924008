#pragma once

#include "a11yscan/engine/accessibility_rule.h"

namespace a11yscan::engine::rules {

// LINK_TEXT_EMPTY (2.4.4 Link Purpose)
// Effective text is the link's own text, else aria-label, else the alt of the first
// contained image. Empty effective text fails; a vague phrase such as "click here"
// (case-insensitive exact match) warns. Both shapes share the rule code.
class LinkTextRule final : public AccessibilityRule {
 public:
  LinkTextRule() = default;

  [[nodiscard]] std::string_view rule_code() const noexcept override { return "LINK_TEXT_EMPTY"; }
  [[nodiscard]] std::string_view wcag_reference() const noexcept override { return "2.4.4"; }
  [[nodiscard]] WcagLevel wcag_level() const noexcept override { return WcagLevel::kAA; }
  [[nodiscard]] Principle principle() const noexcept override { return Principle::kOperable; }
  [[nodiscard]] std::string_view description() const noexcept override {
    return "Links must have meaningful text";
  }

  [[nodiscard]] std::vector<Finding> evaluate(const document::Document& doc) const override;
};

}  // namespace a11yscan::engine::rules
