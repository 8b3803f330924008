#include "a11yscan/storage/scan_repository.h"

namespace a11yscan::storage {

std::string update_refusal(const domain::ScanRecord& stored, const domain::ScanStatus next) {
  if (domain::is_terminal(stored.status)) {
    return "Scan " + stored.scan_id + " is already " + domain::scan_status_name(stored.status) +
           " and cannot be modified";
  }
  if (stored.status != next && !domain::can_transition(stored.status, next)) {
    return std::string("Illegal scan transition ") + domain::scan_status_name(stored.status) +
           " -> " + domain::scan_status_name(next) + " for scan " + stored.scan_id;
  }
  return {};
}

}  // namespace a11yscan::storage
