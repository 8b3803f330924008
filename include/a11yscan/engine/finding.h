#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace a11yscan::engine {

// Severity participates only in counting; no ordering between values is implied.
enum class Severity {
  kPass,
  kWarning,
  kFail,
};

// The four WCAG principles used to bucket issues.
enum class Principle {
  kPerceivable,
  kOperable,
  kUnderstandable,
  kRobust,
};

enum class WcagLevel {
  kA,
  kAA,
  kAAA,
};

// Finding is one rule's verdict on one document. A rule that detects N offending
// elements of the same kind reports a single Finding with count = N.
struct Finding {
  std::string rule_code;
  Severity severity{Severity::kPass};
  std::string message;
  std::string remediation;
  std::optional<std::string> element;  // bounded snippet of the first offender
  std::string wcag_reference;
  WcagLevel wcag_level{WcagLevel::kAA};
  Principle principle{Principle::kPerceivable};
  int count{1};

  bool operator==(const Finding&) const = default;
};

// "pass", "warning", "fail"
[[nodiscard]] const char* severity_name(Severity severity) noexcept;
[[nodiscard]] std::optional<Severity> severity_from_string(std::string_view name);

// "Perceivable", "Operable", "Understandable", "Robust"
[[nodiscard]] const char* principle_name(Principle principle) noexcept;
[[nodiscard]] std::optional<Principle> principle_from_string(std::string_view name);

// False for values cast from outside the enumeration.
[[nodiscard]] bool is_known_principle(Principle principle) noexcept;

// "A", "AA", "AAA"
[[nodiscard]] const char* wcag_level_name(WcagLevel level) noexcept;
[[nodiscard]] std::optional<WcagLevel> wcag_level_from_string(std::string_view name);

}  // namespace a11yscan::engine
