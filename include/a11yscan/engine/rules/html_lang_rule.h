#pragma once

#include "a11yscan/engine/accessibility_rule.h"

namespace a11yscan::engine::rules {

// HTML_LANG_MISSING (3.1.1 Language of Page)
class HtmlLangRule final : public AccessibilityRule {
 public:
  HtmlLangRule() = default;

  [[nodiscard]] std::string_view rule_code() const noexcept override { return "HTML_LANG_MISSING"; }
  [[nodiscard]] std::string_view wcag_reference() const noexcept override { return "3.1.1"; }
  [[nodiscard]] WcagLevel wcag_level() const noexcept override { return WcagLevel::kAA; }
  [[nodiscard]] Principle principle() const noexcept override { return Principle::kUnderstandable; }
  [[nodiscard]] std::string_view description() const noexcept override {
    return "The <html> element must declare a non-empty lang";
  }

  [[nodiscard]] std::vector<Finding> evaluate(const document::Document& doc) const override;
};

}  // namespace a11yscan::engine::rules
