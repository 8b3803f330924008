#pragma once

#include "a11yscan/engine/accessibility_rule.h"

namespace a11yscan::engine::rules {

// DUPLICATE_ID (4.1.1 Parsing)
// count is the number of distinct duplicated values, not of extra occurrences.
class DuplicateIdRule final : public AccessibilityRule {
 public:
  DuplicateIdRule() = default;

  [[nodiscard]] std::string_view rule_code() const noexcept override { return "DUPLICATE_ID"; }
  [[nodiscard]] std::string_view wcag_reference() const noexcept override { return "4.1.1"; }
  [[nodiscard]] WcagLevel wcag_level() const noexcept override { return WcagLevel::kAA; }
  [[nodiscard]] Principle principle() const noexcept override { return Principle::kRobust; }
  [[nodiscard]] std::string_view description() const noexcept override {
    return "id attribute values must be unique";
  }

  [[nodiscard]] std::vector<Finding> evaluate(const document::Document& doc) const override;
};

}  // namespace a11yscan::engine::rules
