#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace a11yscan::core {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

inline Timestamp now_utc() { return Clock::now(); }

inline std::int64_t to_unix_millis(const Timestamp ts) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

inline Timestamp from_unix_millis(const std::int64_t millis) {
  return Timestamp{std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds{millis})};
}

// Formats ts as ISO 8601 UTC with millisecond precision, e.g. "2026-01-01T00:00:00.000Z".
std::string format_iso8601(Timestamp ts);

// Parses "YYYY-MM-DDTHH:MM:SS[.fff]Z". Returns nullopt on any other shape.
std::optional<Timestamp> parse_iso8601(std::string_view text);

// True when both instants fall on the same UTC calendar day.
bool same_utc_day(Timestamp a, Timestamp b);

}  // namespace a11yscan::core
