#pragma once

#include <string>
#include <vector>

namespace a11yscan::storage {

struct AuditEvent {
  std::string event_id;
  std::string trace_id;    // scan id
  std::string event_type;  // e.g. "ScanStarted"
  std::string payload;     // JSON object text
  std::string created_at;  // ISO 8601 UTC
  std::vector<std::string> refs;
};

}  // namespace a11yscan::storage
