#include "a11yscan/engine/rule_engine.h"

#include "a11yscan/document/document.h"

#include <exception>
#include <utility>

namespace a11yscan::engine {

RuleEvaluationFault::RuleEvaluationFault(std::string rule_code, const std::string& detail)
    : std::runtime_error("Rule " + rule_code + " failed: " + detail),
      rule_code_(std::move(rule_code)) {}

RuleEngine::RuleEngine(RuleCatalogue catalogue) : catalogue_(std::move(catalogue)) {}

std::vector<Finding> RuleEngine::run(const document::Document& doc) const {
  std::vector<Finding> all_findings;

  for (const auto& rule : catalogue_.rules()) {
    const std::string code(rule->rule_code());

    std::vector<Finding> findings;
    try {
      findings = rule->evaluate(doc);
    } catch (const std::exception& e) {
      throw RuleEvaluationFault(code, e.what());
    } catch (...) {
      throw RuleEvaluationFault(code, "non-standard exception");
    }

    if (findings.empty()) {
      throw RuleEvaluationFault(code, "rule emitted no findings");
    }
    all_findings.insert(all_findings.end(), std::make_move_iterator(findings.begin()),
                        std::make_move_iterator(findings.end()));
  }

  return all_findings;
}

}  // namespace a11yscan::engine
