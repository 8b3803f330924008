#include "a11yscan/fetch/curl_document_fetcher.h"

#include "support/loopback_http_server.h"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

using namespace a11yscan::fetch;
using a11yscan::core::CancellationToken;
using a11yscan::testing::CannedResponse;
using a11yscan::testing::LoopbackHttpServer;

namespace {

constexpr char kPage[] =
    "<!DOCTYPE html><html lang=\"en\"><head><title>Home</title></head>"
    "<body><h1>Hello</h1></body></html>";

CannedResponse site(const std::string& path) {
  if (path == "/") {
    return CannedResponse{.status = 200,
                          .content_type = "text/html; charset=UTF-8",
                          .body = kPage,
                          .headers = {},
                          .delay = {}};
  }
  if (path == "/xhtml") {
    return CannedResponse{.status = 200,
                          .content_type = "application/xhtml+xml",
                          .body = kPage,
                          .headers = {},
                          .delay = {}};
  }
  if (path == "/plain") {
    return CannedResponse{
        .status = 200, .content_type = "text/plain", .body = "hi", .headers = {}, .delay = {}};
  }
  if (path == "/untyped") {
    return CannedResponse{
        .status = 200, .content_type = "", .body = kPage, .headers = {}, .delay = {}};
  }
  if (path == "/empty") {
    return CannedResponse{
        .status = 200, .content_type = "text/html", .body = "", .headers = {}, .delay = {}};
  }
  if (path == "/moved") {
    return CannedResponse{.status = 301,
                          .content_type = "",
                          .body = "",
                          .headers = {{"Location", "/"}},
                          .delay = {}};
  }
  if (path == "/loop") {
    return CannedResponse{.status = 302,
                          .content_type = "",
                          .body = "",
                          .headers = {{"Location", "/loop"}},
                          .delay = {}};
  }
  if (path == "/broken") {
    return CannedResponse{.status = 500,
                          .content_type = "text/html",
                          .body = "<p>oops</p>",
                          .headers = {},
                          .delay = {}};
  }
  if (path == "/big") {
    return CannedResponse{.status = 200,
                          .content_type = "text/html",
                          .body = std::string(4096, 'x'),
                          .headers = {},
                          .delay = {}};
  }
  if (path == "/slow") {
    return CannedResponse{.status = 200,
                          .content_type = "text/html",
                          .body = kPage,
                          .headers = {},
                          .delay = std::chrono::milliseconds(1500)};
  }
  return CannedResponse{
      .status = 404, .content_type = "text/html", .body = "", .headers = {}, .delay = {}};
}

FetchConfig quick_config() {
  FetchConfig config;
  config.timeout = std::chrono::milliseconds(5000);
  return config;
}

}  // namespace

TEST_CASE("CurlDocumentFetcher rejects unusable configuration", "[fetch][curl]") {
  FetchConfig config;
  config.max_body_bytes = 0;
  CHECK_THROWS_AS(CurlDocumentFetcher(config), std::invalid_argument);

  config = FetchConfig{};
  config.timeout = std::chrono::milliseconds(0);
  CHECK_THROWS_AS(CurlDocumentFetcher(config), std::invalid_argument);
}

TEST_CASE("CurlDocumentFetcher returns the body of an HTML page", "[fetch][curl]") {
  LoopbackHttpServer server(site);
  const CurlDocumentFetcher fetcher(quick_config());
  const CancellationToken cancel;

  auto result = fetcher.fetch(server.url("/"), cancel);
  REQUIRE(result.has_value());
  const FetchedDocument& document = result.value();
  CHECK(document.body == kPage);
  CHECK(document.status_code == 200);
  CHECK(document.content_type == "text/html; charset=UTF-8");
  REQUIRE(document.charset.has_value());
  CHECK(*document.charset == "UTF-8");
  CHECK(document.effective_url == server.url("/"));
}

TEST_CASE("CurlDocumentFetcher accepts XHTML", "[fetch][curl]") {
  LoopbackHttpServer server(site);
  const CurlDocumentFetcher fetcher(quick_config());
  const CancellationToken cancel;

  auto result = fetcher.fetch(server.url("/xhtml"), cancel);
  REQUIRE(result.has_value());
  CHECK_FALSE(result.value().charset.has_value());
}

TEST_CASE("CurlDocumentFetcher follows redirects to the final document", "[fetch][curl]") {
  LoopbackHttpServer server(site);
  const CurlDocumentFetcher fetcher(quick_config());
  const CancellationToken cancel;

  auto result = fetcher.fetch(server.url("/moved"), cancel);
  REQUIRE(result.has_value());
  CHECK(result.value().body == kPage);
  CHECK(result.value().effective_url == server.url("/"));
}

TEST_CASE("CurlDocumentFetcher stops after the redirect limit", "[fetch][curl]") {
  LoopbackHttpServer server(site);
  FetchConfig config = quick_config();
  config.max_redirects = 2;
  const CurlDocumentFetcher fetcher(config);
  const CancellationToken cancel;

  auto result = fetcher.fetch(server.url("/loop"), cancel);
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().kind == FetchErrorKind::kTooManyRedirects);
}

TEST_CASE("CurlDocumentFetcher reports non-2xx final status", "[fetch][curl]") {
  LoopbackHttpServer server(site);
  const CurlDocumentFetcher fetcher(quick_config());
  const CancellationToken cancel;

  SECTION("404 with an empty body") {
    auto result = fetcher.fetch(server.url("/missing"), cancel);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().kind == FetchErrorKind::kHttpStatus);
    CHECK(result.error().http_status == 404);
    CHECK(describe(result.error()) == "HTTPStatusError: HTTP 404");
  }

  SECTION("500 with a body") {
    auto result = fetcher.fetch(server.url("/broken"), cancel);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().kind == FetchErrorKind::kHttpStatus);
    CHECK(result.error().http_status == 500);
  }
}

TEST_CASE("CurlDocumentFetcher refuses non-HTML media types", "[fetch][curl]") {
  LoopbackHttpServer server(site);
  const CurlDocumentFetcher fetcher(quick_config());
  const CancellationToken cancel;

  auto plain = fetcher.fetch(server.url("/plain"), cancel);
  REQUIRE_FALSE(plain.has_value());
  CHECK(plain.error().kind == FetchErrorKind::kUnsupportedContentType);
  CHECK(plain.error().detail == "text/plain");

  auto untyped = fetcher.fetch(server.url("/untyped"), cancel);
  REQUIRE_FALSE(untyped.has_value());
  CHECK(untyped.error().kind == FetchErrorKind::kUnsupportedContentType);
  CHECK(untyped.error().detail == "no Content-Type header");
}

TEST_CASE("CurlDocumentFetcher accepts an empty HTML body", "[fetch][curl]") {
  LoopbackHttpServer server(site);
  const CurlDocumentFetcher fetcher(quick_config());
  const CancellationToken cancel;

  auto result = fetcher.fetch(server.url("/empty"), cancel);
  REQUIRE(result.has_value());
  CHECK(result.value().body.empty());
}

TEST_CASE("CurlDocumentFetcher enforces the body size limit", "[fetch][curl]") {
  LoopbackHttpServer server(site);
  FetchConfig config = quick_config();
  config.max_body_bytes = 1024;
  const CurlDocumentFetcher fetcher(config);
  const CancellationToken cancel;

  auto result = fetcher.fetch(server.url("/big"), cancel);
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().kind == FetchErrorKind::kContentTooLarge);
  CHECK(result.error().detail == "limit 1024 bytes");
}

TEST_CASE("CurlDocumentFetcher times out on a slow server", "[fetch][curl]") {
  LoopbackHttpServer server(site);
  FetchConfig config = quick_config();
  config.timeout = std::chrono::milliseconds(200);
  const CurlDocumentFetcher fetcher(config);
  const CancellationToken cancel;

  auto result = fetcher.fetch(server.url("/slow"), cancel);
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().kind == FetchErrorKind::kTimeout);
}

TEST_CASE("CurlDocumentFetcher maps connection failures to network errors", "[fetch][curl]") {
  std::string closed_url;
  {
    LoopbackHttpServer server(site);
    closed_url = server.url("/");
  }
  const CurlDocumentFetcher fetcher(quick_config());
  const CancellationToken cancel;

  auto result = fetcher.fetch(closed_url, cancel);
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().kind == FetchErrorKind::kNetwork);
  CHECK_FALSE(result.error().detail.empty());
}

TEST_CASE("CurlDocumentFetcher only speaks http and https", "[fetch][curl]") {
  const CurlDocumentFetcher fetcher(quick_config());
  const CancellationToken cancel;

  auto result = fetcher.fetch("ftp://127.0.0.1/index.html", cancel);
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().kind == FetchErrorKind::kNetwork);
}

TEST_CASE("CurlDocumentFetcher honours cancellation", "[fetch][curl]") {
  LoopbackHttpServer server(site);
  const CurlDocumentFetcher fetcher(quick_config());

  SECTION("already cancelled: no request is made") {
    CancellationToken cancel;
    cancel.cancel();
    auto result = fetcher.fetch(server.url("/"), cancel);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().kind == FetchErrorKind::kCancelled);
    CHECK(server.requests_served() == 0);
  }

  SECTION("cancelled while waiting for the response") {
    CancellationToken cancel;
    std::thread canceller([&cancel] {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
      cancel.cancel();
    });
    auto result = fetcher.fetch(server.url("/slow"), cancel);
    canceller.join();
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().kind == FetchErrorKind::kCancelled);
  }
}
