#pragma once

#include "a11yscan/engine/accessibility_rule.h"

namespace a11yscan::engine::rules {

// IMG_ALT_MISSING (1.1.1 Non-text Content): every <img> needs an alt attribute.
// alt="" is accepted as the marker for decorative images; only an absent alt fails.
class ImageAltTextRule final : public AccessibilityRule {
 public:
  ImageAltTextRule() = default;

  [[nodiscard]] std::string_view rule_code() const noexcept override { return "IMG_ALT_MISSING"; }
  [[nodiscard]] std::string_view wcag_reference() const noexcept override { return "1.1.1"; }
  [[nodiscard]] WcagLevel wcag_level() const noexcept override { return WcagLevel::kAA; }
  [[nodiscard]] Principle principle() const noexcept override { return Principle::kPerceivable; }
  [[nodiscard]] std::string_view description() const noexcept override {
    return "Images must carry an alt attribute";
  }

  [[nodiscard]] std::vector<Finding> evaluate(const document::Document& doc) const override;
};

}  // namespace a11yscan::engine::rules
