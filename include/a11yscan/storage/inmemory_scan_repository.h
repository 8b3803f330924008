#pragma once

#include "a11yscan/storage/scan_repository.h"

#include <map>
#include <mutex>

namespace a11yscan::storage {

// InMemoryScanRepository keeps records in a std::map keyed by scan_id.
// Thread-safe; suitable for tests and runs without a database.
class InMemoryScanRepository final : public IScanRepository {
 public:
  [[nodiscard]] WriteResult insert(const domain::ScanRecord& record) override;
  [[nodiscard]] WriteResult update(const domain::ScanRecord& record) override;
  [[nodiscard]] std::optional<domain::ScanRecord> get(const std::string& scan_id) const override;
  [[nodiscard]] std::vector<domain::ScanRecord> list_all() const override;

 private:
  mutable std::mutex mutex_;
  std::map<std::string, domain::ScanRecord> records_;
};

}  // namespace a11yscan::storage
