#include "scan.h"

#include "a11yscan/core/clock.h"
#include "a11yscan/core/id_generator.h"
#include "a11yscan/engine/rule_catalogue.h"
#include "a11yscan/engine/rule_engine.h"
#include "a11yscan/fetch/curl_document_fetcher.h"
#include "a11yscan/scan/scan_orchestrator.h"

#include "cli_options.h"
#include "scan_logic.h"
#include "storage_setup.h"
#include <iostream>
#include <optional>
#include <string>

namespace {

enum class ScanInput { kUrl, kFile };

int run_scan_command(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                     ScanInput input) {
  const char* usage = input == ScanInput::kUrl ? "Usage: a11yscan_cli scan <url> [options]\n"
                                               : "Usage: a11yscan_cli check-file <path> [options]\n";

  auto parsed = a11yscan::apps::parse_options(argc, argv, cli_options(), 2);
  if (!parsed.ok) {
    return 1;
  }
  if (parsed.positionals.size() != 1) {
    std::cerr << usage;
    return 1;
  }
  const CliConfig& config = parsed.config;

  const std::string config_error = a11yscan::fetch::validate_fetch_config(config.fetch);
  if (!config_error.empty()) {
    std::cerr << "Invalid fetch configuration: " << config_error << "\n";
    return 1;
  }

  auto storage = open_storage(config.db_path);
  if (!storage.has_value()) {
    return 1;
  }

  a11yscan::core::SystemIdGenerator id_gen;
  a11yscan::core::SystemClock clock;
  a11yscan::scan::ScanServices services{*storage->scans, *storage->audit_log, id_gen, clock};

  const a11yscan::fetch::CurlDocumentFetcher fetcher(config.fetch);
  const a11yscan::engine::RuleEngine engine(a11yscan::engine::make_default_catalogue());
  a11yscan::scan::ScanOrchestrator orchestrator(fetcher, engine, services);

  if (input == ScanInput::kUrl) {
    return execute_scan(parsed.positionals.front(), orchestrator, *storage->audit_log,
                        config.print_trace);
  }
  return execute_check_file(parsed.positionals.front(), orchestrator, *storage->audit_log,
                            config.print_trace);
}

}  // namespace

int cmd_scan(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  return run_scan_command(argc, argv, ScanInput::kUrl);
}

int cmd_check_file(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  return run_scan_command(argc, argv, ScanInput::kFile);
}
