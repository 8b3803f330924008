#pragma once

#include "a11yscan/engine/finding.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace a11yscan::document {
class Document;
}

namespace a11yscan::engine {

inline constexpr char kCheckPassedRemediation[] = "N/A - Check passed";

// AccessibilityRule is the abstract base class for all catalogue rules.
//
// Rules are stateless and pure over an immutable Document. Every evaluation returns
// at least one Finding: a single kPass finding when nothing is wrong or nothing applies,
// otherwise one finding per distinct violation kind carrying an aggregate count.
class AccessibilityRule {
 public:
  virtual ~AccessibilityRule() = default;

  // Rule metadata
  [[nodiscard]] virtual std::string_view rule_code() const noexcept = 0;
  [[nodiscard]] virtual std::string_view wcag_reference() const noexcept = 0;
  [[nodiscard]] virtual WcagLevel wcag_level() const noexcept = 0;
  [[nodiscard]] virtual Principle principle() const noexcept = 0;
  [[nodiscard]] virtual std::string_view description() const noexcept = 0;

  [[nodiscard]] virtual std::vector<Finding> evaluate(const document::Document& doc) const = 0;

 protected:
  AccessibilityRule() = default;
  AccessibilityRule(const AccessibilityRule&) = default;
  AccessibilityRule& operator=(const AccessibilityRule&) = default;
  AccessibilityRule(AccessibilityRule&&) = default;
  AccessibilityRule& operator=(AccessibilityRule&&) = default;

  // Builds a Finding stamped with this rule's code and taxonomy metadata.
  [[nodiscard]] Finding make_finding(Severity severity, std::string message,
                                     std::string remediation,
                                     std::optional<std::string> element = std::nullopt,
                                     int count = 1) const;
};

}  // namespace a11yscan::engine
