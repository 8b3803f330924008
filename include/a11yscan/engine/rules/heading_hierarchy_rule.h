#pragma once

#include "a11yscan/engine/accessibility_rule.h"

namespace a11yscan::engine::rules {

// HEADING_SKIP_LEVEL (1.3.1 Info and Relationships)
// Issues: the first heading is not h1, or a heading is more than one level deeper
// than the heading before it. All issues are reported as one warning.
class HeadingHierarchyRule final : public AccessibilityRule {
 public:
  HeadingHierarchyRule() = default;

  [[nodiscard]] std::string_view rule_code() const noexcept override { return "HEADING_SKIP_LEVEL"; }
  [[nodiscard]] std::string_view wcag_reference() const noexcept override { return "1.3.1"; }
  [[nodiscard]] WcagLevel wcag_level() const noexcept override { return WcagLevel::kAA; }
  [[nodiscard]] Principle principle() const noexcept override { return Principle::kUnderstandable; }
  [[nodiscard]] std::string_view description() const noexcept override {
    return "Heading levels must not skip";
  }

  [[nodiscard]] std::vector<Finding> evaluate(const document::Document& doc) const override;
};

}  // namespace a11yscan::engine::rules
