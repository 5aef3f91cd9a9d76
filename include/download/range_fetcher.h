#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "download/range_set.h"

namespace paca {

// Shared flag checked by the dispatcher and inside in-flight fetches.
class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }
    bool cancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

struct FetchRequest {
    std::string url;
    std::optional<ByteRange> range;  // std::nullopt for a full-stream GET
    uint64_t expected_size{0};       // body length of a full-stream GET (0 = unknown)
    uint64_t total_size{0};          // size of the remote file, checked against Content-Range (0 = unknown)
    std::chrono::milliseconds timeout{30000};
};

enum class FetchStatus {
    kOk,
    kRangeUnsupported,  // 200 to a ranged request; body not consumed
    kHttpError,
    kTransport,
    kTruncated,
    kCancelled,
    kSinkError,
    kRemoteChanged,  // Content-Range names another file size, or the entity tag changed
};

const char* to_string(FetchStatus status);

struct FetchResult {
    FetchStatus status{FetchStatus::kOk};
    int http_status{0};
    uint64_t bytes{0};  // body bytes handed to the sink
    std::string etag;   // X-Linked-Etag of any hop, else ETag of the final response
    std::string message;

    bool ok() const { return status == FetchStatus::kOk; }
};

// Receives consecutive body bytes. Returning false aborts the fetch with kSinkError.
using FetchSink = std::function<bool(const char* data, size_t len)>;

class RangeFetcher {
public:
    virtual ~RangeFetcher() = default;
    virtual FetchResult fetch(const FetchRequest& request, const FetchSink& sink, const CancellationToken& cancel) = 0;
};

// Bytes-per-second budget shared by every fetch to the same host.
class HostRateLimiter {
public:
    explicit HostRateLimiter(uint64_t bytes_per_sec);

    // Blocks until `bytes` fit into the host's budget (or cancel is set).
    void acquire(const std::string& host, size_t bytes, const CancellationToken& cancel);

    uint64_t bytesPerSec() const { return bytes_per_sec_; }

private:
    uint64_t bytes_per_sec_;
    std::mutex mutex_;
    std::unordered_map<std::string, std::chrono::steady_clock::time_point> next_free_;
};

// cpp-httplib implementation, one client per request.
class HttpRangeFetcher : public RangeFetcher {
public:
    HttpRangeFetcher(std::string registry_endpoint,
                     std::string token,
                     std::shared_ptr<HostRateLimiter> limiter = nullptr);

    FetchResult fetch(const FetchRequest& request, const FetchSink& sink, const CancellationToken& cancel) override;

private:
    std::string registry_endpoint_;
    std::string token_;
    std::shared_ptr<HostRateLimiter> limiter_;
};

struct ContentRange {
    uint64_t first{0};
    uint64_t last{0};               // inclusive
    std::optional<uint64_t> total;  // std::nullopt for "*"
};

// Parses "bytes s-e/total" (total may be "*").
std::optional<ContentRange> parseContentRange(const std::string& header);

// True when a Content-Range header value names exactly `range`.
bool contentRangeMatches(const std::string& header, const ByteRange& range);

// Entity tag without the weak marker and surrounding quotes.
std::string normalizeEtag(std::string value);

}  // namespace paca
