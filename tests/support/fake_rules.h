#pragma once

#include "a11yscan/engine/accessibility_rule.h"

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace a11yscan::testing {

// Emits one Finding of a fixed severity. Principle and code are configurable so the
// catalogue's registration checks can be exercised.
class FixedRule final : public engine::AccessibilityRule {
 public:
  FixedRule(std::string code, engine::Severity severity,
            engine::Principle principle = engine::Principle::kRobust)
      : code_(std::move(code)), severity_(severity), principle_(principle) {}

  [[nodiscard]] std::string_view rule_code() const noexcept override { return code_; }
  [[nodiscard]] std::string_view wcag_reference() const noexcept override { return "9.9.9"; }
  [[nodiscard]] engine::WcagLevel wcag_level() const noexcept override {
    return engine::WcagLevel::kA;
  }
  [[nodiscard]] engine::Principle principle() const noexcept override { return principle_; }
  [[nodiscard]] std::string_view description() const noexcept override { return "fixed"; }

  [[nodiscard]] std::vector<engine::Finding> evaluate(const document::Document&) const override {
    return {make_finding(severity_, code_ + " evaluated", engine::kCheckPassedRemediation)};
  }

 private:
  std::string code_;
  engine::Severity severity_;
  engine::Principle principle_;
};

class ThrowingRule final : public engine::AccessibilityRule {
 public:
  [[nodiscard]] std::string_view rule_code() const noexcept override { return "THROWS"; }
  [[nodiscard]] std::string_view wcag_reference() const noexcept override { return "9.9.9"; }
  [[nodiscard]] engine::WcagLevel wcag_level() const noexcept override {
    return engine::WcagLevel::kA;
  }
  [[nodiscard]] engine::Principle principle() const noexcept override {
    return engine::Principle::kOperable;
  }
  [[nodiscard]] std::string_view description() const noexcept override { return "throws"; }

  [[nodiscard]] std::vector<engine::Finding> evaluate(const document::Document&) const override {
    throw std::runtime_error("selector exploded");
  }
};

// Throws a value that does not derive from std::exception.
class NonStandardThrowingRule final : public engine::AccessibilityRule {
 public:
  [[nodiscard]] std::string_view rule_code() const noexcept override { return "ODD"; }
  [[nodiscard]] std::string_view wcag_reference() const noexcept override { return "9.9.9"; }
  [[nodiscard]] engine::WcagLevel wcag_level() const noexcept override {
    return engine::WcagLevel::kA;
  }
  [[nodiscard]] engine::Principle principle() const noexcept override {
    return engine::Principle::kRobust;
  }
  [[nodiscard]] std::string_view description() const noexcept override { return "odd"; }

  [[nodiscard]] std::vector<engine::Finding> evaluate(const document::Document&) const override {
    throw 42;
  }
};

class SilentRule final : public engine::AccessibilityRule {
 public:
  [[nodiscard]] std::string_view rule_code() const noexcept override { return "SILENT"; }
  [[nodiscard]] std::string_view wcag_reference() const noexcept override { return "9.9.9"; }
  [[nodiscard]] engine::WcagLevel wcag_level() const noexcept override {
    return engine::WcagLevel::kA;
  }
  [[nodiscard]] engine::Principle principle() const noexcept override {
    return engine::Principle::kOperable;
  }
  [[nodiscard]] std::string_view description() const noexcept override { return "silent"; }

  [[nodiscard]] std::vector<engine::Finding> evaluate(const document::Document&) const override {
    return {};
  }
};

}  // namespace a11yscan::testing
