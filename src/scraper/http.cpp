#include <pastekeep/scraper/http.hpp>

#include <drogon/HttpClient.h>
#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>

#include <sstream>

namespace pastekeep::scraper {

namespace {

const char* ReqResultName(drogon::ReqResult result) {
  switch (result) {
    case drogon::ReqResult::Ok:
      return "ok";
    case drogon::ReqResult::BadResponse:
      return "bad response";
    case drogon::ReqResult::NetworkFailure:
      return "network failure";
    case drogon::ReqResult::BadServerAddress:
      return "bad server address";
    case drogon::ReqResult::Timeout:
      return "timeout";
    default:
      return "request failed";
  }
}

// "a=1&b=2" -> setParameter("a", "1"), setParameter("b", "2")
void ApplyQuery(const std::string& query, const drogon::HttpRequestPtr& req) {
  std::istringstream in(query);
  std::string pair;
  while (std::getline(in, pair, '&')) {
    if (pair.empty()) continue;
    size_t eq = pair.find('=');
    if (eq == std::string::npos) {
      req->setParameter(pair, "");
    } else {
      req->setParameter(pair.substr(0, eq), pair.substr(eq + 1));
    }
  }
}

}  // namespace

bool SplitUrl(const std::string& url, std::string* base, std::string* path_and_query) {
  size_t scheme_end = url.find("://");
  if (scheme_end == std::string::npos) return false;

  const std::string scheme = url.substr(0, scheme_end);
  if (scheme != "http" && scheme != "https") return false;

  size_t host_start = scheme_end + 3;
  size_t path_start = url.find_first_of("/?", host_start);
  if (path_start == host_start) return false;

  if (path_start == std::string::npos) {
    *base = url;
    *path_and_query = "/";
    return true;
  }

  *base = url.substr(0, path_start);
  *path_and_query = url.substr(path_start);
  if ((*path_and_query)[0] == '?') path_and_query->insert(0, "/");
  return true;
}

HttpFetcher::HttpFetcher(double timeout_seconds)
    : timeout_seconds_(timeout_seconds),
      loop_thread_(std::make_unique<trantor::EventLoopThread>("pastekeep-http")) {
  loop_thread_->run();
}

HttpFetcher::~HttpFetcher() = default;

HttpResult HttpFetcher::Get(const std::string& url) {
  HttpResult result;

  std::string base;
  std::string target;
  if (!SplitUrl(url, &base, &target)) {
    result.error = "invalid URL: " + url;
    return result;
  }

  auto client = drogon::HttpClient::newHttpClient(base, loop_thread_->getLoop());

  auto req = drogon::HttpRequest::newHttpRequest();
  req->setMethod(drogon::Get);
  size_t q = target.find('?');
  if (q == std::string::npos) {
    req->setPath(target);
  } else {
    req->setPath(target.substr(0, q));
    ApplyQuery(target.substr(q + 1), req);
  }

  auto [req_result, resp] = client->sendRequest(req, timeout_seconds_);
  if (req_result != drogon::ReqResult::Ok || !resp) {
    result.error = std::string("could not access ") + url + ": " + ReqResultName(req_result);
    return result;
  }

  result.status = static_cast<int>(resp->getStatusCode());
  result.body = std::string(resp->body());
  if (result.status != 200) {
    result.error = "received HTTP error " + std::to_string(result.status) + " from " + url;
    return result;
  }

  result.ok = true;
  return result;
}

HttpPasteSource::HttpPasteSource(HttpFetcher* fetcher, std::string listing_url)
    : fetcher_(fetcher), listing_url_(std::move(listing_url)) {}

FetchResult HttpPasteSource::Fetch() {
  FetchResult out;

  HttpResult resp = fetcher_->Get(listing_url_);
  if (!resp.ok) {
    out.error = resp.error;
    return out;
  }

  std::string parse_error;
  if (!ParsePasteList(resp.body, &out.pastes, &parse_error)) {
    // Keep a bounded slice of the payload for the log line.
    constexpr size_t kMaxEcho = 256;
    out.error = "could not parse list of pastes: " + parse_error + " (body: " +
                resp.body.substr(0, kMaxEcho) + ")";
    return out;
  }

  out.ok = true;
  return out;
}

}  // namespace pastekeep::scraper
