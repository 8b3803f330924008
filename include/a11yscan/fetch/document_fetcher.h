#pragma once

#include "a11yscan/core/cancellation.h"
#include "a11yscan/core/result.h"
#include "a11yscan/fetch/fetch_error.h"

#include <optional>
#include <string>

namespace a11yscan::fetch {

// Raw document as delivered by the server, after transfer decoding.
struct FetchedDocument {
  std::string body;                    // NOLINT(readability-identifier-naming)
  std::string content_type;            // NOLINT(readability-identifier-naming)
  std::optional<std::string> charset;  // declared charset parameter, if any
  std::string effective_url;           // URL after redirects
  long status_code{0};                 // NOLINT(readability-identifier-naming)
};

using FetchResult = core::Result<FetchedDocument, FetchError>;

// IDocumentFetcher retrieves one document per call. Implementations are stateless
// across calls so one instance may serve concurrent scans.
class IDocumentFetcher {
 public:
  virtual ~IDocumentFetcher() = default;

  // Fetch url. The transfer is aborted with kCancelled once cancel is signalled.
  [[nodiscard]] virtual FetchResult fetch(const std::string& url,
                                          const core::CancellationToken& cancel) const = 0;

 protected:
  IDocumentFetcher() = default;
  IDocumentFetcher(const IDocumentFetcher&) = default;
  IDocumentFetcher& operator=(const IDocumentFetcher&) = default;
  IDocumentFetcher(IDocumentFetcher&&) = default;
  IDocumentFetcher& operator=(IDocumentFetcher&&) = default;
};

}  // namespace a11yscan::fetch
