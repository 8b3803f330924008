#pragma once

#include "a11yscan/engine/accessibility_rule.h"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace a11yscan::engine {

inline constexpr char kDefaultCatalogueId[] = "wcag21-aa-core";
inline constexpr char kDefaultCatalogueVersion[] = "1.0.0";

// RuleCatalogue holds an ordered, versioned list of rules.
// Evaluation order is registration order; nothing is discovered dynamically.
class RuleCatalogue {
 public:
  RuleCatalogue(std::string catalogue_id, std::string version);

  // Appends rule. Throws std::invalid_argument for a null rule, an empty rule code,
  // a code already registered, or a principle outside the four WCAG principles.
  void add_rule(std::unique_ptr<const AccessibilityRule> rule);

  [[nodiscard]] const std::string& catalogue_id() const noexcept { return catalogue_id_; }
  [[nodiscard]] const std::string& version() const noexcept { return version_; }
  [[nodiscard]] const std::vector<std::unique_ptr<const AccessibilityRule>>& rules()
      const noexcept {
    return rules_;
  }
  [[nodiscard]] std::size_t size() const noexcept { return rules_.size(); }

 private:
  std::string catalogue_id_;
  std::string version_;
  std::vector<std::unique_ptr<const AccessibilityRule>> rules_;
};

// The ten structural WCAG 2.1 AA checks, in fixed order.
RuleCatalogue make_default_catalogue();

}  // namespace a11yscan::engine
