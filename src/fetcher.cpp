#include <rulemerge/fetcher.hpp>
#include <rulemerge/internal.hpp>
#include <rulemerge/version.hpp>

#include <drogon/HttpClient.h>
#include <trantor/net/EventLoopThread.h>
#include <trantor/utils/Logger.h>

#include <fstream>
#include <sstream>

namespace rulemerge {

namespace {

bool StartsWith(std::string_view s, std::string_view prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool IsRedirect(int code) {
  return code == 301 || code == 302 || code == 303 || code == 307 || code == 308;
}

bool IsRetryable(const FetchResult& r) {
  if (r.status == FetchStatus::kNetworkError || r.status == FetchStatus::kTimeout) {
    return true;
  }
  return r.status == FetchStatus::kHttpError && r.http_status >= 500;
}

FetchResult FromReqResult(drogon::ReqResult result) {
  switch (result) {
    case drogon::ReqResult::Ok:
      break;
    case drogon::ReqResult::Timeout:
      return FetchResult::Failure(FetchStatus::kTimeout, "request timed out");
    case drogon::ReqResult::BadServerAddress:
      return FetchResult::Failure(FetchStatus::kNetworkError, "bad server address");
    case drogon::ReqResult::BadResponse:
      return FetchResult::Failure(FetchStatus::kNetworkError, "bad response");
    case drogon::ReqResult::HandshakeError:
      return FetchResult::Failure(FetchStatus::kNetworkError, "TLS handshake failed");
    case drogon::ReqResult::InvalidCertificate:
      return FetchResult::Failure(FetchStatus::kNetworkError, "invalid certificate");
    default:
      return FetchResult::Failure(FetchStatus::kNetworkError, "network failure");
  }
  return FetchResult::Failure(FetchStatus::kNetworkError, "network failure");
}

}  // namespace

std::string_view FetchStatusName(FetchStatus status) {
  switch (status) {
    case FetchStatus::kOk: return "ok";
    case FetchStatus::kEmpty: return "empty";
    case FetchStatus::kInvalidUrl: return "invalid_url";
    case FetchStatus::kTimeout: return "timeout";
    case FetchStatus::kNetworkError: return "network_error";
    case FetchStatus::kHttpError: return "http_error";
    case FetchStatus::kIoError: return "io_error";
  }
  return "unknown";
}

// --- HttpFetcher ---

HttpFetcher::HttpFetcher(FetchOptions options)
    : options_(std::move(options)),
      loop_thread_(std::make_unique<trantor::EventLoopThread>("rulemerge-fetch")) {
  if (options_.user_agent.empty()) {
    options_.user_agent = std::string("rulemerge/") + Version();
  }
  if (options_.max_attempts == 0) {
    options_.max_attempts = 1;
  }
  loop_thread_->run();
}

HttpFetcher::~HttpFetcher() = default;

FetchResult HttpFetcher::Fetch(const std::string& url) {
  internal::UrlParts parts;
  if (!internal::SplitUrl(url, &parts)) {
    return FetchResult::Failure(FetchStatus::kInvalidUrl, "unsupported URL: " + url);
  }
  if (parts.scheme == "file") {
    auto result = FetchFile(parts.target);
    result.attempts = 1;
    return result;
  }

  FetchResult result;
  for (uint32_t attempt = 1; attempt <= options_.max_attempts; ++attempt) {
    result = FetchHttp(url);
    result.attempts = attempt;
    if (!IsRetryable(result) || attempt == options_.max_attempts) {
      break;
    }
    LOG_DEBUG << "Retrying " << url << " after " << result.message
              << " (attempt " << attempt << "/" << options_.max_attempts << ")";
  }
  return result;
}

FetchResult HttpFetcher::FetchHttp(const std::string& url) {
  std::string current = url;
  const double timeout_s = options_.timeout_ms / 1000.0;

  for (uint32_t hop = 0; hop <= options_.max_redirects; ++hop) {
    internal::UrlParts parts;
    if (!internal::SplitUrl(current, &parts) || parts.scheme == "file") {
      return FetchResult::Failure(FetchStatus::kInvalidUrl,
                                  "unsupported redirect target: " + current);
    }

    auto client = drogon::HttpClient::newHttpClient(parts.origin, loop_thread_->getLoop());
    client->setUserAgent(options_.user_agent);

    auto req = drogon::HttpRequest::newHttpRequest();
    req->setMethod(drogon::Get);
    req->setPathEncode(false);
    req->setPath(parts.target);

    auto [req_result, resp] = client->sendRequest(req, timeout_s);
    if (req_result != drogon::ReqResult::Ok || !resp) {
      return FromReqResult(req_result);
    }

    const int code = static_cast<int>(resp->statusCode());
    if (IsRedirect(code)) {
      const std::string& location = resp->getHeader("location");
      if (location.empty()) {
        FetchResult r = FetchResult::Failure(FetchStatus::kHttpError,
                                             "redirect without Location header");
        r.http_status = code;
        return r;
      }
      current = internal::ResolveRedirect(parts, location);
      continue;
    }

    if (code < 200 || code >= 300) {
      FetchResult r = FetchResult::Failure(FetchStatus::kHttpError,
                                           "HTTP status " + std::to_string(code));
      r.http_status = code;
      return r;
    }

    FetchResult r = FetchResult::Success(std::string(resp->body()));
    r.http_status = code;
    return r;
  }

  return FetchResult::Failure(
      FetchStatus::kHttpError,
      "too many redirects (" + std::to_string(options_.max_redirects) + ")");
}

FetchResult HttpFetcher::FetchFile(const std::string& path) {
  std::ifstream file(path, std::ios::in | std::ios::binary);
  if (!file.is_open()) {
    return FetchResult::Failure(FetchStatus::kIoError, "cannot open " + path);
  }
  std::ostringstream buf;
  buf << file.rdbuf();
  return FetchResult::Success(buf.str());
}

// --- FetchAll ---

std::vector<FetchResult> FetchAll(Fetcher& fetcher,
                                  const std::vector<std::string>& urls,
                                  size_t concurrency,
                                  MetricsSink* metrics) {
  std::vector<FetchResult> results(urls.size());
  internal::ParallelFor(urls.size(), concurrency, [&](size_t i) {
    const uint64_t start = internal::NowMicros();
    results[i] = fetcher.Fetch(urls[i]);
    results[i].latency_ms = (internal::NowMicros() - start) / 1000;

    if (metrics) {
      metrics->Counter("rulemerge_fetches_total", 1);
      if (!results[i].ok()) {
        metrics->Counter("rulemerge_fetch_failures_total", 1);
      }
      metrics->Histogram("rulemerge_fetch_latency_ms", results[i].latency_ms);
    }
  });
  return results;
}

namespace internal {

bool SplitUrl(std::string_view url, UrlParts* out) {
  size_t scheme_end = url.find("://");
  if (scheme_end == std::string_view::npos || scheme_end == 0) return false;

  std::string scheme;
  for (char c : url.substr(0, scheme_end)) {
    scheme += static_cast<char>((c >= 'A' && c <= 'Z') ? c - 'A' + 'a' : c);
  }
  std::string_view rest = url.substr(scheme_end + 3);

  if (scheme == "file") {
    if (rest.empty()) return false;
    out->scheme = scheme;
    out->origin.clear();
    out->target = std::string(rest);
    return true;
  }
  if (scheme != "http" && scheme != "https") return false;

  size_t path_start = rest.find_first_of("/?");
  std::string_view authority = rest.substr(0, path_start);
  if (authority.empty()) return false;

  out->scheme = scheme;
  out->origin = scheme + "://" + std::string(authority);
  if (path_start == std::string_view::npos) {
    out->target = "/";
  } else if (rest[path_start] == '?') {
    out->target = "/" + std::string(rest.substr(path_start));
  } else {
    out->target = std::string(rest.substr(path_start));
  }
  // Fragments are never sent to the server.
  size_t hash = out->target.find('#');
  if (hash != std::string::npos) out->target.erase(hash);
  return true;
}

std::string ResolveRedirect(const UrlParts& base, std::string_view location) {
  if (location.find("://") != std::string_view::npos) {
    return std::string(location);
  }
  if (StartsWith(location, "//")) {
    return base.scheme + ":" + std::string(location);
  }
  if (StartsWith(location, "/")) {
    return base.origin + std::string(location);
  }
  // Relative to the directory of the current path.
  std::string dir = base.target.substr(0, base.target.find('?'));
  dir = dir.substr(0, dir.rfind('/') + 1);
  return base.origin + dir + std::string(location);
}

}  // namespace internal
}  // namespace rulemerge
