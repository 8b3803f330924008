#include "a11yscan/engine/rules/duplicate_id_rule.h"

#include "a11yscan/document/document.h"

#include <optional>
#include <string>
#include <unordered_set>

namespace a11yscan::engine::rules {

namespace {

constexpr std::size_t kListedIds = 5;

}  // namespace

std::vector<Finding> DuplicateIdRule::evaluate(const document::Document& doc) const {
  const auto ids = doc.all_ids();
  if (ids.empty()) {
    return {make_finding(Severity::kPass, "No ID attributes found", "N/A - No IDs to check")};
  }

  std::unordered_set<std::string> seen;
  std::unordered_set<std::string> reported;
  std::vector<std::string> duplicates;  // distinct values, in order of first repetition
  std::optional<std::size_t> first_repeat_index;
  for (std::size_t i = 0; i < ids.size(); ++i) {
    if (seen.insert(ids[i]).second) {
      continue;
    }
    if (!first_repeat_index.has_value()) {
      first_repeat_index = i;
    }
    if (reported.insert(ids[i]).second) {
      duplicates.push_back(ids[i]);
    }
  }

  if (duplicates.empty()) {
    return {make_finding(Severity::kPass,
                         "All " + std::to_string(ids.size()) + " IDs are unique",
                         kCheckPassedRemediation)};
  }

  std::string listed;
  for (std::size_t i = 0; i < duplicates.size() && i < kListedIds; ++i) {
    if (i > 0) {
      listed += ", ";
    }
    listed += "'" + duplicates[i] + "'";
  }

  // all_ids() and elements_with_attribute("id") enumerate the same elements in order.
  std::optional<std::string> first_offender;
  const auto carriers = doc.elements_with_attribute("id");
  if (*first_repeat_index < carriers.size()) {
    first_offender = carriers[*first_repeat_index].snippet();
  }

  const int count = static_cast<int>(duplicates.size());
  return {make_finding(Severity::kFail,
                       std::to_string(count) + " duplicate IDs found: " + listed,
                       "Ensure all ID attributes are unique within the document", first_offender,
                       count)};
}

}  // namespace a11yscan::engine::rules
