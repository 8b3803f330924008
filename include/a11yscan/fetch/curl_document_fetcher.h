#pragma once

#include "a11yscan/fetch/document_fetcher.h"
#include "a11yscan/fetch/fetch_config.h"

namespace a11yscan::fetch {

// CurlDocumentFetcher performs HTTP(S) GET requests with libcurl.
//
// Each fetch() call owns a fresh easy handle, so one instance is safe to share across
// threads. Behavior:
// - only http and https are allowed, for the initial URL and for every redirect hop
// - redirects are followed up to config.max_redirects
// - gzip and deflate bodies are decoded before the size limit is applied
// - the final response must be 2xx with an HTML media type
//
// Throws std::runtime_error from the constructor if libcurl cannot be initialized or
// std::invalid_argument if config is unusable.
class CurlDocumentFetcher final : public IDocumentFetcher {
 public:
  explicit CurlDocumentFetcher(FetchConfig config = {});
  ~CurlDocumentFetcher() override = default;

  CurlDocumentFetcher(const CurlDocumentFetcher&) = default;
  CurlDocumentFetcher& operator=(const CurlDocumentFetcher&) = default;
  CurlDocumentFetcher(CurlDocumentFetcher&&) = default;
  CurlDocumentFetcher& operator=(CurlDocumentFetcher&&) = default;

  [[nodiscard]] FetchResult fetch(const std::string& url,
                                  const core::CancellationToken& cancel) const override;

  [[nodiscard]] const FetchConfig& config() const noexcept { return config_; }

 private:
  FetchConfig config_;
};

}  // namespace a11yscan::fetch
