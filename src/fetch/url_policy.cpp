#include "a11yscan/fetch/url_policy.h"

#include "a11yscan/core/normalization.h"

#include <arpa/inet.h>
#include <curl/curl.h>
#include <netinet/in.h>

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace a11yscan::fetch {

namespace {

using Admission = core::Result<std::string, std::string>;

struct CurlUrlDeleter {
  void operator()(CURLU* handle) const noexcept { curl_url_cleanup(handle); }
};
using CurlUrlPtr = std::unique_ptr<CURLU, CurlUrlDeleter>;

struct CurlStringDeleter {
  void operator()(char* part) const noexcept { curl_free(part); }
};
using CurlStringPtr = std::unique_ptr<char, CurlStringDeleter>;

std::optional<std::string> url_part(CURLU* handle, CURLUPart part) {
  char* raw = nullptr;
  if (curl_url_get(handle, part, &raw, 0) != CURLUE_OK || raw == nullptr) {
    return std::nullopt;
  }
  CurlStringPtr owned(raw);
  return std::string(owned.get());
}

bool is_blocked_ipv4(const std::array<std::uint8_t, 4>& octets) {
  const auto a = octets[0];
  const auto b = octets[1];
  return a == 0 ||                            // 0.0.0.0/8
         a == 10 ||                           // 10.0.0.0/8
         a == 127 ||                          // 127.0.0.0/8
         (a == 169 && b == 254) ||            // 169.254.0.0/16
         (a == 172 && b >= 16 && b <= 31) ||  // 172.16.0.0/12
         (a == 192 && b == 168);              // 192.168.0.0/16
}

bool is_blocked_ipv6(const in6_addr& address) {
  const auto* bytes = address.s6_addr;
  bool all_zero_prefix = true;
  for (int i = 0; i < 15; ++i) {
    if (bytes[i] != 0) {
      all_zero_prefix = false;
      break;
    }
  }
  if (all_zero_prefix && (bytes[15] == 0 || bytes[15] == 1)) {
    return true;  // :: and ::1
  }
  if ((bytes[0] & 0xFEU) == 0xFCU) {
    return true;  // fc00::/7
  }
  if (bytes[0] == 0xFE && (bytes[1] & 0xC0U) == 0x80U) {
    return true;  // fe80::/10
  }
  bool mapped = true;
  for (int i = 0; i < 10; ++i) {
    if (bytes[i] != 0) {
      mapped = false;
      break;
    }
  }
  if (mapped && bytes[10] == 0xFF && bytes[11] == 0xFF) {
    return is_blocked_ipv4({bytes[12], bytes[13], bytes[14], bytes[15]});
  }
  return false;
}

std::optional<std::string> host_rejection(const std::string& raw_host) {
  const std::string host = core::normalize_ascii_lower(raw_host);
  if (host.empty()) {
    return "URL has no host";
  }
  if (host == "localhost" || host.ends_with(".localhost")) {
    return "Local addresses are not allowed";
  }

  if (host.front() == '[' && host.back() == ']') {
    const std::string literal = host.substr(1, host.size() - 2);
    in6_addr address{};
    if (inet_pton(AF_INET6, literal.c_str(), &address) == 1 && is_blocked_ipv6(address)) {
      return "Private or local IP addresses are not allowed";
    }
    return std::nullopt;
  }

  in_addr address{};
  if (inet_pton(AF_INET, host.c_str(), &address) == 1) {
    const auto* bytes = reinterpret_cast<const std::uint8_t*>(&address.s_addr);
    if (is_blocked_ipv4({bytes[0], bytes[1], bytes[2], bytes[3]})) {
      return "Private or local IP addresses are not allowed";
    }
  }
  return std::nullopt;
}

}  // namespace

core::Result<std::string, std::string> admit_scan_url(const std::string& url) {
  const std::string candidate = core::trim(url);
  if (candidate.empty()) {
    return Admission::err("URL is required");
  }
  if (candidate.size() > kMaxUrlLength) {
    return Admission::err("URL exceeds " + std::to_string(kMaxUrlLength) + " characters");
  }

  CurlUrlPtr handle(curl_url());
  if (!handle) {
    return Admission::err("Failed to allocate URL parser");
  }
  if (curl_url_set(handle.get(), CURLUPART_URL, candidate.c_str(), 0) != CURLUE_OK) {
    return Admission::err("Malformed URL");
  }

  const auto scheme = url_part(handle.get(), CURLUPART_SCHEME);
  if (!scheme.has_value() || (*scheme != "http" && *scheme != "https")) {
    return Admission::err("Only http and https URLs are allowed");
  }

  const auto host = url_part(handle.get(), CURLUPART_HOST);
  if (const auto rejection = host_rejection(host.value_or(std::string{}))) {
    return Admission::err(*rejection);
  }

  auto normalized = url_part(handle.get(), CURLUPART_URL);
  if (!normalized.has_value()) {
    return Admission::err("Malformed URL");
  }
  return Admission::ok(std::move(*normalized));
}

}  // namespace a11yscan::fetch
