#include "a11yscan/engine/rules/page_title_rule.h"

#include "a11yscan/core/normalization.h"
#include "a11yscan/document/document.h"

#include <cstddef>
#include <string>

namespace a11yscan::engine::rules {

namespace {

constexpr std::size_t kMinTitleChars = 3;

}  // namespace

std::vector<Finding> PageTitleRule::evaluate(const document::Document& doc) const {
  const auto title = doc.title();
  if (!title.has_value()) {
    return {make_finding(Severity::kFail, "Page has no <title> element",
                         "Add a descriptive <title> element in the <head> section")};
  }

  const std::string element = "<title>" + *title + "</title>";
  if (title->empty()) {
    return {make_finding(Severity::kFail, "Page title is empty",
                         "Provide a descriptive, meaningful page title", element)};
  }
  if (core::utf8_length(*title) < kMinTitleChars) {
    return {make_finding(Severity::kWarning, "Page title is very short: '" + *title + "'",
                         "Provide a more descriptive page title (at least a few words)",
                         element)};
  }
  return {make_finding(Severity::kPass, "Page has title: '" + *title + "'",
                       kCheckPassedRemediation)};
}

}  // namespace a11yscan::engine::rules
