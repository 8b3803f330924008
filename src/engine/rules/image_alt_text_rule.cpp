#include "a11yscan/engine/rules/image_alt_text_rule.h"

#include "a11yscan/document/document.h"

#include <optional>
#include <string>

namespace a11yscan::engine::rules {

std::vector<Finding> ImageAltTextRule::evaluate(const document::Document& doc) const {
  const auto images = doc.images();
  if (images.empty()) {
    return {make_finding(Severity::kPass, "No images found on page", "N/A - No images to check")};
  }

  int missing = 0;
  std::optional<std::string> first_offender;
  for (const auto& image : images) {
    // alt="" marks a decorative image and is compliant.
    if (image.has_attribute("alt")) {
      continue;
    }
    if (missing == 0) {
      first_offender = image.snippet();
    }
    ++missing;
  }

  if (missing > 0) {
    return {make_finding(Severity::kFail, std::to_string(missing) + " images missing alt attribute",
                         "Add descriptive alt text to all images. Use alt='' for decorative images.",
                         first_offender, missing)};
  }
  return {make_finding(Severity::kPass, "All images have alt attributes", kCheckPassedRemediation)};
}

}  // namespace a11yscan::engine::rules
