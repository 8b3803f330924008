#include "query.h"

#include "a11yscan/core/clock.h"
#include "a11yscan/engine/rule_catalogue.h"

#include "cli_options.h"
#include "query_logic.h"
#include "storage_setup.h"
#include <iostream>
#include <string>

int cmd_get_scan(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  auto parsed = a11yscan::apps::parse_options(argc, argv, cli_options(), 2);
  if (!parsed.ok) {
    return 1;
  }
  if (!parsed.config.scan_id.has_value()) {
    std::cerr << "Error: --scan-id <id> is required\n";
    return 1;
  }

  auto storage = open_storage(parsed.config.db_path);
  if (!storage.has_value()) {
    return 1;
  }
  return execute_get_scan(parsed.config.scan_id.value(), *storage->scans);
}

int cmd_stats(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  auto parsed = a11yscan::apps::parse_options(argc, argv, cli_options(), 2);
  if (!parsed.ok) {
    return 1;
  }

  auto storage = open_storage(parsed.config.db_path);
  if (!storage.has_value()) {
    return 1;
  }
  a11yscan::core::SystemClock clock;
  return execute_stats(*storage->scans, clock, parsed.config.top);
}

int cmd_rules(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  auto parsed = a11yscan::apps::parse_options(argc, argv, cli_options(), 2);
  if (!parsed.ok) {
    return 1;
  }
  const auto catalogue = a11yscan::engine::make_default_catalogue();
  return execute_rules(catalogue);
}
