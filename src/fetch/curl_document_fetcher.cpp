#include "a11yscan/fetch/curl_document_fetcher.h"

#include "a11yscan/fetch/content_type.h"

#include <curl/curl.h>

#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>

namespace a11yscan::fetch {

namespace {

constexpr char kAllowedProtocols[] = "http,https";
constexpr char kAcceptEncoding[] = "gzip, deflate";

struct CurlEasyDeleter {
  void operator()(CURL* handle) const noexcept { curl_easy_cleanup(handle); }
};
using CurlEasyPtr = std::unique_ptr<CURL, CurlEasyDeleter>;

struct CurlSlistDeleter {
  void operator()(curl_slist* list) const noexcept { curl_slist_free_all(list); }
};
using CurlSlistPtr = std::unique_ptr<curl_slist, CurlSlistDeleter>;

void ensure_curl_global_init() {
  static std::once_flag once;
  static CURLcode init_result = CURLE_OK;
  std::call_once(once, [] { init_result = curl_global_init(CURL_GLOBAL_DEFAULT); });
  if (init_result != CURLE_OK) {
    throw std::runtime_error(std::string("curl_global_init failed: ") +
                             curl_easy_strerror(init_result));
  }
}

// State shared with the libcurl callbacks for one transfer.
struct Transfer {
  CURL* handle{nullptr};
  const FetchConfig* config{nullptr};
  const core::CancellationToken* cancel{nullptr};
  std::string body;
  bool response_checked{false};
  // Set by a callback before it aborts the transfer.
  std::optional<FetchError> abort_reason;
};

long response_code_of(CURL* handle) {
  long status = 0;
  if (curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &status) != CURLE_OK) {
    return 0;
  }
  return status;
}

std::string content_type_of(CURL* handle) {
  char* content_type = nullptr;
  if (curl_easy_getinfo(handle, CURLINFO_CONTENT_TYPE, &content_type) != CURLE_OK ||
      content_type == nullptr) {
    return {};
  }
  return content_type;
}

FetchError unsupported_content_type(const std::string& content_type) {
  return FetchError{.kind = FetchErrorKind::kUnsupportedContentType,
                    .http_status = 0,
                    .detail = content_type.empty() ? "no Content-Type header" : content_type};
}

FetchError content_too_large(const std::size_t limit) {
  return FetchError{.kind = FetchErrorKind::kContentTooLarge,
                    .http_status = 0,
                    .detail = "limit " + std::to_string(limit) + " bytes"};
}

FetchError cancelled() {
  return FetchError{.kind = FetchErrorKind::kCancelled, .http_status = 0, .detail = {}};
}

// Checks status and media type of the final response before any body byte is kept.
std::optional<FetchError> check_final_response(CURL* handle) {
  const long status = response_code_of(handle);
  if (status < 200 || status >= 300) {
    return FetchError{.kind = FetchErrorKind::kHttpStatus, .http_status = status, .detail = {}};
  }
  const std::string content_type = content_type_of(handle);
  if (!is_html_media_type(content_type)) {
    return unsupported_content_type(content_type);
  }
  return std::nullopt;
}

std::size_t on_body_chunk(char* data, std::size_t size, std::size_t nmemb, void* userdata) {
  auto* transfer = static_cast<Transfer*>(userdata);
  const std::size_t length = size * nmemb;

  if (transfer->cancel->is_cancelled()) {
    transfer->abort_reason = cancelled();
    return 0;
  }

  const long status = response_code_of(transfer->handle);
  if (status >= 300 && status < 400) {
    // Body of a redirect hop; libcurl is about to follow Location.
    return length;
  }

  if (!transfer->response_checked) {
    transfer->response_checked = true;
    if (auto failure = check_final_response(transfer->handle)) {
      transfer->abort_reason = std::move(failure);
      return 0;
    }
  }

  if (transfer->body.size() + length > transfer->config->max_body_bytes) {
    transfer->abort_reason = content_too_large(transfer->config->max_body_bytes);
    return 0;
  }
  transfer->body.append(data, length);
  return length;
}

int on_progress(void* clientp, curl_off_t /*dltotal*/, curl_off_t /*dlnow*/,
                curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
  auto* transfer = static_cast<Transfer*>(clientp);
  if (transfer->cancel->is_cancelled()) {
    transfer->abort_reason = cancelled();
    return 1;
  }
  return 0;
}

FetchError map_curl_failure(const CURLcode code, const char* error_buffer) {
  switch (code) {
    case CURLE_OPERATION_TIMEDOUT:
      return FetchError{.kind = FetchErrorKind::kTimeout, .http_status = 0, .detail = {}};
    case CURLE_TOO_MANY_REDIRECTS:
      return FetchError{
          .kind = FetchErrorKind::kTooManyRedirects, .http_status = 0, .detail = {}};
    case CURLE_ABORTED_BY_CALLBACK:
      return cancelled();
    default:
      break;
  }
  std::string cause = (error_buffer != nullptr && error_buffer[0] != '\0')
                          ? std::string(error_buffer)
                          : std::string(curl_easy_strerror(code));
  return FetchError{.kind = FetchErrorKind::kNetwork, .http_status = 0, .detail = cause};
}

}  // namespace

CurlDocumentFetcher::CurlDocumentFetcher(FetchConfig config) : config_(std::move(config)) {
  if (const std::string problem = validate_fetch_config(config_); !problem.empty()) {
    throw std::invalid_argument(problem);
  }
  ensure_curl_global_init();
}

FetchResult CurlDocumentFetcher::fetch(const std::string& url,
                                       const core::CancellationToken& cancel) const {
  if (cancel.is_cancelled()) {
    return FetchResult::err(cancelled());
  }

  CurlEasyPtr handle(curl_easy_init());
  if (!handle) {
    return FetchResult::err(FetchError{
        .kind = FetchErrorKind::kNetwork, .http_status = 0, .detail = "curl_easy_init failed"});
  }

  CurlSlistPtr headers;
  for (const std::string& header :
       {"Accept: " + config_.accept, "Accept-Language: " + config_.accept_language}) {
    curl_slist* extended = curl_slist_append(headers.get(), header.c_str());
    if (extended == nullptr) {
      return FetchResult::err(FetchError{.kind = FetchErrorKind::kNetwork,
                                         .http_status = 0,
                                         .detail = "failed to build request headers"});
    }
    static_cast<void>(headers.release());
    headers.reset(extended);
  }

  Transfer transfer;
  transfer.handle = handle.get();
  transfer.config = &config_;
  transfer.cancel = &cancel;

  char error_buffer[CURL_ERROR_SIZE] = {};
  CURL* h = handle.get();
  CURLcode setup = CURLE_OK;
  const auto set = [&setup, h](CURLoption option, auto value) {
    if (setup == CURLE_OK) {
      setup = curl_easy_setopt(h, option, value);
    }
  };
  set(CURLOPT_URL, url.c_str());
  set(CURLOPT_ERRORBUFFER, static_cast<char*>(error_buffer));
  set(CURLOPT_NOSIGNAL, 1L);
  set(CURLOPT_PROTOCOLS_STR, kAllowedProtocols);
  set(CURLOPT_REDIR_PROTOCOLS_STR, kAllowedProtocols);
  set(CURLOPT_FOLLOWLOCATION, 1L);
  set(CURLOPT_MAXREDIRS, config_.max_redirects);
  set(CURLOPT_TIMEOUT_MS, static_cast<long>(config_.timeout.count()));
  set(CURLOPT_MAXFILESIZE_LARGE, static_cast<curl_off_t>(config_.max_body_bytes));
  set(CURLOPT_ACCEPT_ENCODING, kAcceptEncoding);
  set(CURLOPT_USERAGENT, config_.user_agent.c_str());
  set(CURLOPT_HTTPHEADER, headers.get());
  set(CURLOPT_WRITEFUNCTION, &on_body_chunk);
  set(CURLOPT_WRITEDATA, static_cast<void*>(&transfer));
  set(CURLOPT_XFERINFOFUNCTION, &on_progress);
  set(CURLOPT_XFERINFODATA, static_cast<void*>(&transfer));
  set(CURLOPT_NOPROGRESS, 0L);
  if (setup != CURLE_OK) {
    return FetchResult::err(FetchError{.kind = FetchErrorKind::kNetwork,
                                       .http_status = 0,
                                       .detail = std::string("curl_easy_setopt failed: ") +
                                                 curl_easy_strerror(setup)});
  }

  const CURLcode code = curl_easy_perform(h);
  if (transfer.abort_reason.has_value()) {
    return FetchResult::err(*transfer.abort_reason);
  }
  if (code == CURLE_FILESIZE_EXCEEDED) {
    return FetchResult::err(content_too_large(config_.max_body_bytes));
  }
  if (code != CURLE_OK) {
    return FetchResult::err(map_curl_failure(code, error_buffer));
  }

  // An empty body never reaches the write callback.
  if (auto failure = check_final_response(h)) {
    return FetchResult::err(*failure);
  }

  FetchedDocument document;
  document.body = std::move(transfer.body);
  document.content_type = content_type_of(h);
  document.charset = charset_of(document.content_type);
  document.status_code = response_code_of(h);
  char* effective_url = nullptr;
  if (curl_easy_getinfo(h, CURLINFO_EFFECTIVE_URL, &effective_url) == CURLE_OK &&
      effective_url != nullptr) {
    document.effective_url = effective_url;
  } else {
    document.effective_url = url;
  }
  return FetchResult::ok(std::move(document));
}

}  // namespace a11yscan::fetch
