#include "a11yscan/core/time.h"

#include <charconv>
#include <cstdio>

namespace a11yscan::core {

namespace {

using Days = std::chrono::sys_days;

bool parse_fixed(std::string_view text, std::size_t pos, std::size_t len, int& out) {
  if (pos + len > text.size()) {
    return false;
  }
  const char* first = text.data() + pos;
  const char* last = first + len;
  auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc{} && ptr == last;
}

}  // namespace

std::string format_iso8601(const Timestamp ts) {
  const auto millis_total = to_unix_millis(ts);
  const auto day_point = std::chrono::floor<std::chrono::days>(
      std::chrono::sys_time<std::chrono::milliseconds>{std::chrono::milliseconds{millis_total}});
  const std::chrono::year_month_day ymd{day_point};
  const auto in_day = std::chrono::milliseconds{millis_total} - day_point.time_since_epoch();
  const std::chrono::hh_mm_ss<std::chrono::milliseconds> hms{in_day};

  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02uT%02d:%02d:%02d.%03dZ",
                static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
                static_cast<unsigned>(ymd.day()), static_cast<int>(hms.hours().count()),
                static_cast<int>(hms.minutes().count()), static_cast<int>(hms.seconds().count()),
                static_cast<int>(hms.subseconds().count()));
  return buffer;
}

std::optional<Timestamp> parse_iso8601(std::string_view text) {
  // Fixed layout: YYYY-MM-DDTHH:MM:SS then optional .fff then Z
  if (text.size() < 20 || text[4] != '-' || text[7] != '-' || text[10] != 'T' ||
      text[13] != ':' || text[16] != ':' || text.back() != 'Z') {
    return std::nullopt;
  }

  int year = 0;
  int month = 0;
  int day = 0;
  int hour = 0;
  int minute = 0;
  int second = 0;
  if (!parse_fixed(text, 0, 4, year) || !parse_fixed(text, 5, 2, month) ||
      !parse_fixed(text, 8, 2, day) || !parse_fixed(text, 11, 2, hour) ||
      !parse_fixed(text, 14, 2, minute) || !parse_fixed(text, 17, 2, second)) {
    return std::nullopt;
  }

  int millis = 0;
  if (text.size() == 24) {
    if (text[19] != '.' || !parse_fixed(text, 20, 3, millis)) {
      return std::nullopt;
    }
  } else if (text.size() != 20) {
    return std::nullopt;
  }

  const std::chrono::year_month_day ymd{std::chrono::year{year},
                                        std::chrono::month{static_cast<unsigned>(month)},
                                        std::chrono::day{static_cast<unsigned>(day)}};
  if (!ymd.ok() || hour > 23 || minute > 59 || second > 59) {
    return std::nullopt;
  }

  const auto since_epoch = Days{ymd}.time_since_epoch() + std::chrono::hours{hour} +
                           std::chrono::minutes{minute} + std::chrono::seconds{second} +
                           std::chrono::milliseconds{millis};
  return Timestamp{std::chrono::duration_cast<Clock::duration>(since_epoch)};
}

bool same_utc_day(const Timestamp a, const Timestamp b) {
  return std::chrono::floor<std::chrono::days>(a) == std::chrono::floor<std::chrono::days>(b);
}

}  // namespace a11yscan::core
