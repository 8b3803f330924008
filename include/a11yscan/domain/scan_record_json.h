#pragma once

#include "a11yscan/domain/scan_record.h"
#include "a11yscan/engine/finding.h"

#include <nlohmann/json.hpp>

namespace a11yscan::domain {

// JSON shape of a Finding. element is null when absent.
[[nodiscard]] nlohmann::json finding_to_json(const engine::Finding& finding);

// Throws nlohmann::json::exception on missing fields or type mismatches and
// std::invalid_argument on unknown severity, level or principle names.
[[nodiscard]] engine::Finding finding_from_json(const nlohmann::json& j);

// Timestamps are ISO 8601 UTC with millisecond precision; score, completed_at,
// scan_duration_ms and error_message are null when unset.
[[nodiscard]] nlohmann::json scan_record_to_json(const ScanRecord& record);

// Inverse of scan_record_to_json. Throws like finding_from_json, and
// std::invalid_argument on an unknown status or malformed timestamp.
[[nodiscard]] ScanRecord scan_record_from_json(const nlohmann::json& j);

}  // namespace a11yscan::domain
