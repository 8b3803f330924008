#pragma once

#include "a11yscan/domain/scan_record.h"
#include "a11yscan/scan/scan_orchestrator.h"
#include "a11yscan/storage/audit_log.h"

#include <string>

// execute_scan: admit url, run a fetch scan and print the record.
// execute_check_file: read an HTML file and scan its contents.
// Both return 0 for a Complete record, 1 for a Failed record or a rejected input.
// Takes only interface types; no concrete storage headers may be included in this TU.
int execute_scan(const std::string& url, a11yscan::scan::ScanOrchestrator& orchestrator,
                 a11yscan::storage::IAuditLog& audit_log, bool print_trace);
int execute_check_file(const std::string& path, a11yscan::scan::ScanOrchestrator& orchestrator,
                       a11yscan::storage::IAuditLog& audit_log, bool print_trace);

// report_scan: print the record as JSON on stdout (and its audit trail on stderr
// when print_trace is set), returning the exit code for its status.
int report_scan(const a11yscan::domain::ScanRecord& record,
                const a11yscan::storage::IAuditLog& audit_log, bool print_trace);
