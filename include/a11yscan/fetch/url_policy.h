#pragma once

#include "a11yscan/core/result.h"

#include <cstddef>
#include <string>

namespace a11yscan::fetch {

inline constexpr std::size_t kMaxUrlLength = 2048;

// admit_scan_url decides whether a user-supplied URL may be scanned.
//
// Accepted: absolute http or https URLs of at most kMaxUrlLength characters whose
// host is a public name or address. Rejected hosts: localhost (and *.localhost),
// IPv4 loopback, private, link-local and unspecified ranges, and IPv6 loopback,
// unspecified, unique-local and link-local addresses (IPv4-mapped forms included).
//
// On success returns the URL as normalized by libcurl; on failure a reason.
[[nodiscard]] core::Result<std::string, std::string> admit_scan_url(const std::string& url);

}  // namespace a11yscan::fetch
