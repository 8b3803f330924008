#pragma once

#include "a11yscan/engine/finding.h"
#include "a11yscan/engine/rule_catalogue.h"

#include <stdexcept>
#include <string>
#include <vector>

namespace a11yscan::document {
class Document;
}

namespace a11yscan::engine {

// Raised when a rule throws or breaks its contract of emitting at least one Finding.
// Fatal to the whole scan.
class RuleEvaluationFault : public std::runtime_error {
 public:
  RuleEvaluationFault(std::string rule_code, const std::string& detail);

  [[nodiscard]] const std::string& rule_code() const noexcept { return rule_code_; }

 private:
  std::string rule_code_;
};

// RuleEngine runs a catalogue against one document.
// Immutable after construction; run() may be called concurrently.
class RuleEngine {
 public:
  explicit RuleEngine(RuleCatalogue catalogue);

  // Executes every rule in catalogue order and concatenates their findings, keeping
  // each rule's emission order. Findings are never re-sorted.
  // Throws RuleEvaluationFault on the first faulting rule.
  [[nodiscard]] std::vector<Finding> run(const document::Document& doc) const;

  [[nodiscard]] const RuleCatalogue& catalogue() const noexcept { return catalogue_; }

 private:
  RuleCatalogue catalogue_;
};

}  // namespace a11yscan::engine
