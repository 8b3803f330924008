#pragma once

#include <string>

namespace a11yscan::fetch {

// Every kind is terminal for the fetch attempt. The fetcher never retries.
enum class FetchErrorKind {
  kTimeout,
  kTooManyRedirects,
  kHttpStatus,
  kUnsupportedContentType,
  kContentTooLarge,
  kNetwork,
  kCancelled,
};

struct FetchError {
  FetchErrorKind kind{FetchErrorKind::kNetwork};  // NOLINT(readability-identifier-naming)
  long http_status{0};                            // set for kHttpStatus only
  std::string detail;  // cause, offending content type, or size figures
};

// Stable identifier for a kind, e.g. "ContentTooLarge".
[[nodiscard]] const char* fetch_error_kind_name(FetchErrorKind kind) noexcept;

// Human-readable message suitable for ScanRecord::error_message.
[[nodiscard]] std::string describe(const FetchError& error);

}  // namespace a11yscan::fetch
