#include "query_logic.h"

#include "a11yscan/domain/scan_record_json.h"
#include "a11yscan/domain/scan_statistics.h"
#include "a11yscan/engine/finding.h"

#include <nlohmann/json.hpp>

#include <iostream>
#include <string>

int execute_get_scan(const std::string& scan_id, const a11yscan::storage::IScanRepository& scans) {
  const auto record = scans.get(scan_id);
  if (!record.has_value()) {
    std::cerr << "Scan not found: " << scan_id << "\n";
    return 1;
  }

  std::cout << a11yscan::domain::scan_record_to_json(record.value())
                   .dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
            << "\n";
  return 0;
}

int execute_stats(const a11yscan::storage::IScanRepository& scans, a11yscan::core::IClock& clock,
                  std::size_t top) {
  const auto stats = a11yscan::domain::compute_scan_statistics(scans.list_all(), clock.now(), top);
  std::cout << a11yscan::domain::scan_statistics_to_json(stats)
                   .dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
            << "\n";
  return 0;
}

int execute_rules(const a11yscan::engine::RuleCatalogue& catalogue) {
  nlohmann::json out;
  out["catalogue_id"] = catalogue.catalogue_id();
  out["version"] = catalogue.version();
  out["rules"] = nlohmann::json::array();
  for (const auto& rule : catalogue.rules()) {
    out["rules"].push_back({
        {"rule_code", std::string(rule->rule_code())},
        {"wcag_reference", std::string(rule->wcag_reference())},
        {"wcag_level", a11yscan::engine::wcag_level_name(rule->wcag_level())},
        {"principle", a11yscan::engine::principle_name(rule->principle())},
        {"description", std::string(rule->description())},
    });
  }

  std::cout << out.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
  return 0;
}
