#include "a11yscan/storage/inmemory_scan_repository.h"

#include <algorithm>

namespace a11yscan::storage {

WriteResult InMemoryScanRepository::insert(const domain::ScanRecord& record) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (records_.contains(record.scan_id)) {
    return WriteResult::err("Scan already exists: " + record.scan_id);
  }
  records_.emplace(record.scan_id, record);
  return WriteResult::ok(true);
}

WriteResult InMemoryScanRepository::update(const domain::ScanRecord& record) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(record.scan_id);
  if (it == records_.end()) {
    return WriteResult::err("Scan not found: " + record.scan_id);
  }
  if (const std::string refusal = update_refusal(it->second, record.status); !refusal.empty()) {
    return WriteResult::err(refusal);
  }
  it->second = record;
  return WriteResult::ok(true);
}

std::optional<domain::ScanRecord> InMemoryScanRepository::get(const std::string& scan_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(scan_id);
  if (it != records_.end()) {
    return it->second;
  }
  return std::nullopt;
}

std::vector<domain::ScanRecord> InMemoryScanRepository::list_all() const {
  std::vector<domain::ScanRecord> result;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    result.reserve(records_.size());
    for (const auto& [_, record] : records_) {
      result.push_back(record);
    }
  }
  // records_ is keyed by scan_id, so a stable sort on created_at keeps scan_id as tie-break.
  std::stable_sort(result.begin(), result.end(),
                   [](const domain::ScanRecord& a, const domain::ScanRecord& b) {
                     return a.created_at < b.created_at;
                   });
  return result;
}

}  // namespace a11yscan::storage
