#include "a11yscan/fetch/fetch_error.h"

namespace a11yscan::fetch {

const char* fetch_error_kind_name(const FetchErrorKind kind) noexcept {
  switch (kind) {
    case FetchErrorKind::kTimeout:
      return "Timeout";
    case FetchErrorKind::kTooManyRedirects:
      return "TooManyRedirects";
    case FetchErrorKind::kHttpStatus:
      return "HTTPStatusError";
    case FetchErrorKind::kUnsupportedContentType:
      return "UnsupportedContentType";
    case FetchErrorKind::kContentTooLarge:
      return "ContentTooLarge";
    case FetchErrorKind::kNetwork:
      return "NetworkError";
    case FetchErrorKind::kCancelled:
      return "Cancelled";
  }
  return "NetworkError";
}

std::string describe(const FetchError& error) {
  std::string message = fetch_error_kind_name(error.kind);
  switch (error.kind) {
    case FetchErrorKind::kTimeout:
      message += ": request timed out";
      break;
    case FetchErrorKind::kTooManyRedirects:
      message += ": redirect limit exceeded";
      break;
    case FetchErrorKind::kHttpStatus:
      message += ": HTTP " + std::to_string(error.http_status);
      break;
    case FetchErrorKind::kUnsupportedContentType:
      message += ": expected an HTML media type";
      break;
    case FetchErrorKind::kContentTooLarge:
      message += ": response body exceeds the size limit";
      break;
    case FetchErrorKind::kNetwork:
      message += ": failed to fetch URL";
      break;
    case FetchErrorKind::kCancelled:
      message += ": fetch cancelled by caller";
      break;
  }
  if (!error.detail.empty()) {
    message += " (" + error.detail + ")";
  }
  return message;
}

}  // namespace a11yscan::fetch
