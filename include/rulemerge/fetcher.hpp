#pragma once

#include <rulemerge/metrics.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace trantor {
class EventLoopThread;
}  // namespace trantor

namespace rulemerge {

/** Outcome class of a single source fetch. */
enum class FetchStatus {
  kOk,
  kEmpty,          // Transfer succeeded but the body was empty
  kInvalidUrl,     // Unsupported scheme or unparsable URL
  kTimeout,
  kNetworkError,   // DNS, connect, TLS or protocol failure
  kHttpError,      // Non-2xx response (after following redirects)
  kIoError         // file:// source could not be read
};

std::string_view FetchStatusName(FetchStatus status);

/**
 * Result of fetching one source URL.
 * Anything other than kOk means the source contributes no lines.
 */
struct FetchResult {
  FetchStatus status = FetchStatus::kNetworkError;
  int http_status = 0;
  std::string body;
  std::string message;  // Failure reason for logs; empty on success
  uint32_t attempts = 0;
  uint64_t latency_ms = 0;

  bool ok() const { return status == FetchStatus::kOk; }

  static FetchResult Success(std::string body) {
    FetchResult r;
    r.status = body.empty() ? FetchStatus::kEmpty : FetchStatus::kOk;
    r.body = std::move(body);
    if (r.body.empty()) r.message = "empty response body";
    return r;
  }

  static FetchResult Failure(FetchStatus status, std::string message) {
    FetchResult r;
    r.status = status;
    r.message = std::move(message);
    return r;
  }
};

/** Source retrieval collaborator. Implementations must be thread-safe. */
class Fetcher {
 public:
  virtual ~Fetcher() = default;

  virtual FetchResult Fetch(const std::string& url) = 0;
};

/** Options for HttpFetcher. */
struct FetchOptions {
  uint32_t timeout_ms = 30000;   // Per attempt
  uint32_t max_attempts = 1;     // Single attempt unless configured
  uint32_t max_redirects = 5;
  std::string user_agent;        // Empty = "rulemerge/<version>"
};

/**
 * Fetcher for http://, https:// and file:// URLs.
 *
 * HTTP(S) requests go through drogon's HttpClient, driven by an event loop
 * thread owned by this object; Fetch() blocks the calling thread and must not
 * be called from that loop. Redirects are followed up to max_redirects.
 * Network errors, timeouts and 5xx responses are retried up to max_attempts.
 */
class HttpFetcher : public Fetcher {
 public:
  explicit HttpFetcher(FetchOptions options);
  ~HttpFetcher() override;

  // Non-copyable, non-movable
  HttpFetcher(const HttpFetcher&) = delete;
  HttpFetcher& operator=(const HttpFetcher&) = delete;

  FetchResult Fetch(const std::string& url) override;

 private:
  FetchResult FetchHttp(const std::string& url);
  FetchResult FetchFile(const std::string& url);

  FetchOptions options_;
  std::unique_ptr<trantor::EventLoopThread> loop_thread_;
};

/**
 * Fetch every URL with at most `concurrency` requests in flight.
 * Results are returned in the order of `urls`. Fills latency_ms and reports
 * counters/histograms to `metrics` when it is non-null.
 */
std::vector<FetchResult> FetchAll(Fetcher& fetcher,
                                  const std::vector<std::string>& urls,
                                  size_t concurrency,
                                  MetricsSink* metrics = nullptr);

namespace internal {

/** Pieces of an absolute URL as drogon's HttpClient wants them. */
struct UrlParts {
  std::string scheme;  // "http", "https" or "file"
  std::string origin;  // "https://host[:port]"; empty for file
  std::string target;  // "/path?query", or the local path for file
};

bool SplitUrl(std::string_view url, UrlParts* out);

/** Resolve a Location header against the URL that produced it. */
std::string ResolveRedirect(const UrlParts& base, std::string_view location);

}  // namespace internal
}  // namespace rulemerge
