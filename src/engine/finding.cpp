#include "a11yscan/engine/finding.h"

namespace a11yscan::engine {

const char* severity_name(const Severity severity) noexcept {
  switch (severity) {
    case Severity::kPass:
      return "pass";
    case Severity::kWarning:
      return "warning";
    case Severity::kFail:
      return "fail";
  }
  return "fail";
}

std::optional<Severity> severity_from_string(const std::string_view name) {
  if (name == "pass") {
    return Severity::kPass;
  }
  if (name == "warning") {
    return Severity::kWarning;
  }
  if (name == "fail") {
    return Severity::kFail;
  }
  return std::nullopt;
}

const char* principle_name(const Principle principle) noexcept {
  switch (principle) {
    case Principle::kPerceivable:
      return "Perceivable";
    case Principle::kOperable:
      return "Operable";
    case Principle::kUnderstandable:
      return "Understandable";
    case Principle::kRobust:
      return "Robust";
  }
  return "Unknown";
}

std::optional<Principle> principle_from_string(const std::string_view name) {
  if (name == "Perceivable") {
    return Principle::kPerceivable;
  }
  if (name == "Operable") {
    return Principle::kOperable;
  }
  if (name == "Understandable") {
    return Principle::kUnderstandable;
  }
  if (name == "Robust") {
    return Principle::kRobust;
  }
  return std::nullopt;
}

bool is_known_principle(const Principle principle) noexcept {
  switch (principle) {
    case Principle::kPerceivable:
    case Principle::kOperable:
    case Principle::kUnderstandable:
    case Principle::kRobust:
      return true;
  }
  return false;
}

const char* wcag_level_name(const WcagLevel level) noexcept {
  switch (level) {
    case WcagLevel::kA:
      return "A";
    case WcagLevel::kAA:
      return "AA";
    case WcagLevel::kAAA:
      return "AAA";
  }
  return "AA";
}

std::optional<WcagLevel> wcag_level_from_string(const std::string_view name) {
  if (name == "A") {
    return WcagLevel::kA;
  }
  if (name == "AA") {
    return WcagLevel::kAA;
  }
  if (name == "AAA") {
    return WcagLevel::kAAA;
  }
  return std::nullopt;
}

}  // namespace a11yscan::engine
