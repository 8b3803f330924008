#pragma once

#include "a11yscan/core/result.h"
#include "a11yscan/domain/scan_record.h"

#include <optional>
#include <string>
#include <vector>

namespace a11yscan::storage {

using WriteResult = core::Result<bool, std::string>;

// Persistence boundary for Scan Records.
//
// update() is write-once for terminal states: once a stored record is Complete or
// Failed, further updates are refused. Updates must also follow the scan state
// machine (or keep the stored status).
class IScanRepository {
 public:
  virtual ~IScanRepository() = default;
  // Fails if a record with the same scan_id exists.
  [[nodiscard]] virtual WriteResult insert(const domain::ScanRecord& record) = 0;
  [[nodiscard]] virtual WriteResult update(const domain::ScanRecord& record) = 0;
  [[nodiscard]] virtual std::optional<domain::ScanRecord> get(
      const std::string& scan_id) const = 0;
  // Ordered by created_at, then scan_id.
  [[nodiscard]] virtual std::vector<domain::ScanRecord> list_all() const = 0;
};

// Shared update guard. Returns an empty string when stored may be replaced by an
// update moving to `next`, otherwise the reason.
[[nodiscard]] std::string update_refusal(const domain::ScanRecord& stored,
                                         domain::ScanStatus next);

}  // namespace a11yscan::storage
