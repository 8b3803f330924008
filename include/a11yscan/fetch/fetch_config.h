#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace a11yscan::fetch {

// FetchConfig bounds a single document fetch. Passed by value into the fetcher so
// concurrent scans can run with different bounds.
struct FetchConfig {
  // Wall-clock budget for the whole exchange, redirects included.
  std::chrono::milliseconds timeout{10'000};  // NOLINT(readability-identifier-naming)
  // Redirect hops allowed before the fetch fails with kTooManyRedirects.
  long max_redirects{5};  // NOLINT(readability-identifier-naming)
  // Decoded body bytes allowed before the fetch fails with kContentTooLarge.
  std::size_t max_body_bytes{5U * 1024U * 1024U};  // NOLINT(readability-identifier-naming)
  std::string user_agent{                          // NOLINT(readability-identifier-naming)
                         "a11yscan/1.0 (WCAG Accessibility Checker)"};
  std::string accept{// NOLINT(readability-identifier-naming)
                     "text/html,application/xhtml+xml,application/xml;q=0.9,*/*;q=0.8"};
  std::string accept_language{"en-US,en;q=0.9,de;q=0.8"};  // NOLINT(readability-identifier-naming)
};

// Returns an empty string when config is usable, otherwise a human-readable reason.
[[nodiscard]] std::string validate_fetch_config(const FetchConfig& config);

}  // namespace a11yscan::fetch
