#include "a11yscan/engine/rules/single_h1_rule.h"

#include "a11yscan/core/normalization.h"
#include "a11yscan/document/document.h"

#include <algorithm>
#include <string>

namespace a11yscan::engine::rules {

namespace {

constexpr std::size_t kListedHeadings = 3;
constexpr std::size_t kListedHeadingChars = 30;
constexpr std::size_t kPassHeadingChars = 50;

}  // namespace

std::vector<Finding> SingleH1Rule::evaluate(const document::Document& doc) const {
  const auto h1s = doc.elements_by_tag("h1");
  if (h1s.empty()) {
    return {make_finding(Severity::kWarning, "No <h1> element found on page",
                         "Add a single <h1> element to serve as the main page heading")};
  }

  if (h1s.size() > 1) {
    std::string listed;
    for (std::size_t i = 0; i < std::min(h1s.size(), kListedHeadings); ++i) {
      if (i > 0) {
        listed += ", ";
      }
      listed += core::utf8_truncate(h1s[i].text(), kListedHeadingChars);
    }
    const int count = static_cast<int>(h1s.size());
    return {make_finding(Severity::kWarning,
                         "Multiple <h1> elements found (" + std::to_string(count) + "): " + listed,
                         "Use only one <h1> per page for the main heading", h1s[1].snippet(),
                         count)};
  }

  return {make_finding(Severity::kPass,
                       "Page has one <h1>: '" +
                           core::utf8_truncate(h1s.front().text(), kPassHeadingChars) + "'",
                       kCheckPassedRemediation)};
}

}  // namespace a11yscan::engine::rules
