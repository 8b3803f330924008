#include "a11yscan/engine/rules/heading_hierarchy_rule.h"

#include "a11yscan/core/normalization.h"
#include "a11yscan/document/document.h"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>

namespace a11yscan::engine::rules {

namespace {

constexpr std::size_t kHeadingExcerptChars = 30;

// "h3" -> 3
int heading_level(const document::Element& heading) {
  return heading.tag_name()[1] - '0';
}

}  // namespace

std::vector<Finding> HeadingHierarchyRule::evaluate(const document::Document& doc) const {
  const auto headings = doc.headings();
  if (headings.empty()) {
    return {make_finding(Severity::kPass, "No heading elements found on page",
                         "N/A - No headings to check")};
  }

  int issues = 0;
  std::string first_issue;
  std::optional<std::string> first_offender;
  int previous = 0;
  for (std::size_t i = 0; i < headings.size(); ++i) {
    const int level = heading_level(headings[i]);
    std::string issue;
    if (i == 0) {
      if (level != 1) {
        issue = "First heading is " + headings[i].tag_name() + ", should start with h1";
      }
    } else if (level > previous + 1) {
      issue = "Skipped from " + std::to_string(previous) + " to " + std::to_string(level) +
              " at heading: '" + core::utf8_truncate(headings[i].text(), kHeadingExcerptChars) +
              "'";
    }
    if (!issue.empty()) {
      if (issues == 0) {
        first_issue = std::move(issue);
        first_offender = headings[i].snippet();
      }
      ++issues;
    }
    previous = level;
  }

  if (issues > 0) {
    return {make_finding(Severity::kWarning,
                         "Heading hierarchy has " + std::to_string(issues) + " issues (" +
                             first_issue + ")",
                         "Use sequential heading levels (h1 -> h2 -> h3) without skipping",
                         first_offender, issues)};
  }
  return {make_finding(Severity::kPass,
                       "Heading hierarchy is correct (" + std::to_string(headings.size()) +
                           " headings)",
                       kCheckPassedRemediation)};
}

}  // namespace a11yscan::engine::rules
