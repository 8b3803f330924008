#pragma once

#include "a11yscan/engine/accessibility_rule.h"

namespace a11yscan::engine::rules {

// PAGE_TITLE_MISSING (2.4.2 Page Titled)
// Fails when <title> is missing or empty; warns when shorter than three characters.
class PageTitleRule final : public AccessibilityRule {
 public:
  PageTitleRule() = default;

  [[nodiscard]] std::string_view rule_code() const noexcept override { return "PAGE_TITLE_MISSING"; }
  [[nodiscard]] std::string_view wcag_reference() const noexcept override { return "2.4.2"; }
  [[nodiscard]] WcagLevel wcag_level() const noexcept override { return WcagLevel::kAA; }
  [[nodiscard]] Principle principle() const noexcept override { return Principle::kOperable; }
  [[nodiscard]] std::string_view description() const noexcept override {
    return "The page must have a descriptive <title>";
  }

  [[nodiscard]] std::vector<Finding> evaluate(const document::Document& doc) const override;
};

}  // namespace a11yscan::engine::rules
