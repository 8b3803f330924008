#pragma once

#include "a11yscan/document/document.h"
#include "a11yscan/engine/accessibility_rule.h"
#include "a11yscan/engine/finding.h"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

namespace a11yscan::testing {

// Parses html and fails the current test if no tree could be built.
inline document::Document parse_html(const std::string& html) {
  auto result = document::Document::parse(html);
  REQUIRE(result.has_value());
  return result.take_value();
}

inline std::vector<engine::Finding> evaluate(const engine::AccessibilityRule& rule,
                                             const std::string& html) {
  return rule.evaluate(parse_html(html));
}

}  // namespace a11yscan::testing
