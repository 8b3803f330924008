#pragma once

#include "a11yscan/storage/audit_event.h"

#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace a11yscan::storage {

// Append-only structured event log. Events of one trace are returned in append order.
class IAuditLog {
 public:
  virtual ~IAuditLog() = default;
  virtual void append(const AuditEvent& event) = 0;
  // All events of trace_id; every event when trace_id is empty.
  [[nodiscard]] virtual std::vector<AuditEvent> query(const std::string& trace_id) const = 0;
  [[nodiscard]] virtual std::vector<std::string> list_trace_ids() const = 0;
};

// Thread-safe in-process log for tests and ephemeral runs.
class InMemoryAuditLog final : public IAuditLog {
 public:
  void append(const AuditEvent& event) override;
  [[nodiscard]] std::vector<AuditEvent> query(const std::string& trace_id) const override;
  [[nodiscard]] std::vector<std::string> list_trace_ids() const override;

 private:
  mutable std::mutex mutex_;
  std::vector<AuditEvent> events_;
  // Events per trace; keys are exactly the distinct trace IDs present.
  std::map<std::string, int> trace_counts_;
};

}  // namespace a11yscan::storage
