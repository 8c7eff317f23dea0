#pragma once

#include <memory>
#include <string>

#include <trantor/net/EventLoopThread.h>

#include <pastekeep/scraper/source.hpp>

namespace pastekeep::scraper {

/** Result of a blocking HTTP GET. */
struct HttpResult {
  bool ok = false;   // transport succeeded and status was 200
  int status = 0;    // HTTP status, 0 if no response
  std::string body;
  std::string error;
};

/**
 * Split "scheme://host[:port]/path?query" into the base ("scheme://host[:port]")
 * and the remainder ("/path?query", "/" when empty). Returns false if the URL
 * has no http(s) scheme or no host.
 */
bool SplitUrl(const std::string& url, std::string* base, std::string* path_and_query);

/**
 * Blocking GET helper on top of drogon::HttpClient.
 *
 * Owns a private trantor event loop thread, so it works without a running
 * drogon application. Get() must not be called from that loop's thread.
 */
class HttpFetcher {
 public:
  explicit HttpFetcher(double timeout_seconds);
  ~HttpFetcher();

  HttpFetcher(const HttpFetcher&) = delete;
  HttpFetcher& operator=(const HttpFetcher&) = delete;

  HttpResult Get(const std::string& url);

 private:
  double timeout_seconds_;
  std::unique_ptr<trantor::EventLoopThread> loop_thread_;
};

/** Fetches the paste listing from the scraping API. */
class HttpPasteSource : public PasteSource {
 public:
  HttpPasteSource(HttpFetcher* fetcher, std::string listing_url);

  FetchResult Fetch() override;

 private:
  HttpFetcher* fetcher_;
  std::string listing_url_;
};

}  // namespace pastekeep::scraper
