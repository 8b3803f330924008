#pragma once

#include "a11yscan/core/clock.h"
#include "a11yscan/engine/rule_catalogue.h"
#include "a11yscan/storage/scan_repository.h"

#include <cstddef>
#include <string>

// execute_get_scan: print one stored Scan Record as JSON, or fail if unknown.
// execute_stats: print fleet statistics over every stored record.
// execute_rules: print the catalogue, one entry per rule in evaluation order.
// Takes only interface types; no concrete storage headers may be included in this TU.
int execute_get_scan(const std::string& scan_id, const a11yscan::storage::IScanRepository& scans);
int execute_stats(const a11yscan::storage::IScanRepository& scans, a11yscan::core::IClock& clock,
                  std::size_t top);
int execute_rules(const a11yscan::engine::RuleCatalogue& catalogue);
