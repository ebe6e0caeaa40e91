#pragma once
#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <functional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <openssl/evp.h>

namespace rulemerge::internal {

// Monotonic timestamp helper for latency metrics (microseconds).
inline uint64_t NowMicros() {
  using namespace std::chrono;
  return static_cast<uint64_t>(
      duration_cast<microseconds>(steady_clock::now().time_since_epoch()).count());
}

// UTC ISO-8601 timestamp, e.g. "2026-10-19T08:00:00Z".
inline std::string UtcTimestamp(std::chrono::system_clock::time_point tp) {
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&t, &tm);
  char buf[32];
  size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return std::string(buf, n);
}

inline std::string UtcTimestamp() {
  return UtcTimestamp(std::chrono::system_clock::now());
}

// SHA-256 wrapper using OpenSSL's EVP API.
class Sha256 {
 public:
  static constexpr size_t kDigestBytes = 32;

  static std::array<uint8_t, kDigestBytes> Digest(std::string_view data) {
    std::array<uint8_t, kDigestBytes> out{};
    unsigned int len = 0;

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (ctx) {
      if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) &&
          EVP_DigestUpdate(ctx, data.data(), data.size()) &&
          EVP_DigestFinal_ex(ctx, out.data(), &len)) {
        // Success
      }
      EVP_MD_CTX_free(ctx);
    }

    return out;
  }

  static std::string HexDigest(std::string_view data) {
    static constexpr char kHex[] = "0123456789abcdef";
    auto digest = Digest(data);
    std::string out;
    out.reserve(kDigestBytes * 2);
    for (uint8_t b : digest) {
      out += kHex[b >> 4];
      out += kHex[b & 0x0F];
    }
    return out;
  }
};

// Split text into lines on '\n'. A trailing '\r' is left on the line; the
// canonicalizer trims it. A final line without newline is kept.
inline std::vector<std::string> SplitLines(std::string_view text) {
  std::vector<std::string> lines;
  size_t start = 0;
  while (start < text.size()) {
    size_t nl = text.find('\n', start);
    if (nl == std::string_view::npos) {
      lines.emplace_back(text.substr(start));
      break;
    }
    lines.emplace_back(text.substr(start, nl - start));
    start = nl + 1;
  }
  return lines;
}

// Run fn(0..count-1) on at most `workers` threads. Each index runs exactly
// once; fn must be safe to call concurrently for different indices.
inline void ParallelFor(size_t count, size_t workers,
                        const std::function<void(size_t)>& fn) {
  if (count == 0) return;
  workers = std::max<size_t>(1, std::min(workers, count));
  if (workers == 1) {
    for (size_t i = 0; i < count; ++i) fn(i);
    return;
  }

  std::atomic<size_t> next{0};
  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (size_t w = 0; w < workers; ++w) {
    threads.emplace_back([&]() {
      for (size_t i = next.fetch_add(1); i < count; i = next.fetch_add(1)) {
        fn(i);
      }
    });
  }
  for (auto& t : threads) t.join();
}

}  // namespace rulemerge::internal
