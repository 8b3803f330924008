#include "a11yscan/engine/accessibility_rule.h"

#include <utility>

namespace a11yscan::engine {

Finding AccessibilityRule::make_finding(const Severity severity, std::string message,
                                        std::string remediation,
                                        std::optional<std::string> element,
                                        const int count) const {
  Finding finding;
  finding.rule_code = std::string(rule_code());
  finding.severity = severity;
  finding.message = std::move(message);
  finding.remediation = std::move(remediation);
  finding.element = std::move(element);
  finding.wcag_reference = std::string(wcag_reference());
  finding.wcag_level = wcag_level();
  finding.principle = principle();
  finding.count = count;
  return finding;
}

}  // namespace a11yscan::engine
