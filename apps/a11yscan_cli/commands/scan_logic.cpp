#include "scan_logic.h"

#include "a11yscan/domain/scan_record_json.h"
#include "a11yscan/fetch/url_policy.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

int execute_scan(const std::string& url, a11yscan::scan::ScanOrchestrator& orchestrator,
                 a11yscan::storage::IAuditLog& audit_log, bool print_trace) {
  const auto admitted = a11yscan::fetch::admit_scan_url(url);
  if (!admitted.has_value()) {
    std::cerr << "Rejected URL: " << admitted.error() << "\n";
    return 1;
  }

  std::cerr << "Scanning " << admitted.value() << "\n";
  const auto record = orchestrator.run(admitted.value());
  return report_scan(record, audit_log, print_trace);
}

int execute_check_file(const std::string& path, a11yscan::scan::ScanOrchestrator& orchestrator,
                       a11yscan::storage::IAuditLog& audit_log, bool print_trace) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    std::cerr << "Failed to open file: " << path << "\n";
    return 1;
  }
  std::ostringstream contents;
  contents << in.rdbuf();

  const auto record = orchestrator.run_document("file://" + path, contents.str());
  return report_scan(record, audit_log, print_trace);
}

int report_scan(const a11yscan::domain::ScanRecord& record,
                const a11yscan::storage::IAuditLog& audit_log, bool print_trace) {
  std::cout << a11yscan::domain::scan_record_to_json(record)
                   .dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
            << "\n";

  if (print_trace) {
    std::cerr << "\n--- Audit Trail (trace_id=" << record.scan_id << ") ---\n";
    for (const auto& event : audit_log.query(record.scan_id)) {
      std::cerr << event.created_at << " [" << event.event_type << "] " << event.payload << "\n";
    }
  }

  if (record.status == a11yscan::domain::ScanStatus::kComplete) {
    return 0;
  }
  std::cerr << "Scan failed: " << record.error_message.value_or("unknown error") << "\n";
  return 1;
}
