#include "a11yscan/engine/rules/link_text_rule.h"

#include "a11yscan/core/normalization.h"
#include "a11yscan/document/document.h"

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace a11yscan::engine::rules {

namespace {

bool is_vague(const std::string& text) {
  static constexpr std::array<std::string_view, 5> kVaguePhrases = {"click here", "read more",
                                                                    "more", "here", "link"};
  for (const auto& phrase : kVaguePhrases) {
    if (text == phrase) {
      return true;
    }
  }
  return false;
}

// Own text, else aria-label, else alt of the first contained image. Lowercased.
std::string effective_text(const document::Element& link) {
  std::string text = link.text();
  if (text.empty()) {
    text = core::trim(link.attribute("aria-label").value_or(std::string{}));
  }
  if (text.empty()) {
    if (const auto image = link.first_descendant("img")) {
      text = core::trim(image->attribute("alt").value_or(std::string{}));
    }
  }
  return core::normalize_ascii_lower(text);
}

}  // namespace

std::vector<Finding> LinkTextRule::evaluate(const document::Document& doc) const {
  const auto links = doc.links();
  if (links.empty()) {
    return {make_finding(Severity::kPass, "No links found on page", "N/A - No links to check")};
  }

  int empty = 0;
  int vague = 0;
  std::optional<std::string> first_empty;
  std::optional<std::string> first_vague;
  for (const auto& link : links) {
    const std::string text = effective_text(link);
    if (text.empty()) {
      if (empty++ == 0) {
        first_empty = link.snippet();
      }
    } else if (is_vague(text)) {
      if (vague++ == 0) {
        first_vague = link.snippet();
      }
    }
  }

  std::vector<Finding> findings;
  if (empty > 0) {
    findings.push_back(make_finding(Severity::kFail,
                                    std::to_string(empty) +
                                        " links have no text or accessible name",
                                    "Add descriptive text or aria-label to links", first_empty,
                                    empty));
  }
  if (vague > 0) {
    findings.push_back(make_finding(
        Severity::kWarning, std::to_string(vague) + " links have vague text (e.g., 'click here')",
        "Use descriptive link text that makes sense out of context", first_vague, vague));
  }
  if (findings.empty()) {
    findings.push_back(make_finding(Severity::kPass,
                                    "All " + std::to_string(links.size()) +
                                        " links have meaningful text",
                                    kCheckPassedRemediation));
  }
  return findings;
}

}  // namespace a11yscan::engine::rules
