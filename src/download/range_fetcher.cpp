#include "download/range_fetcher.h"

#include <algorithm>
#include <regex>
#include <thread>
#include <spdlog/spdlog.h>

#include "utils/http_client.h"
#include "utils/string_utils.h"
#include "utils/url_utils.h"

namespace paca {

const char* to_string(FetchStatus status) {
    switch (status) {
        case FetchStatus::kOk:
            return "ok";
        case FetchStatus::kRangeUnsupported:
            return "range_unsupported";
        case FetchStatus::kHttpError:
            return "http_error";
        case FetchStatus::kTransport:
            return "transport";
        case FetchStatus::kTruncated:
            return "truncated";
        case FetchStatus::kCancelled:
            return "cancelled";
        case FetchStatus::kSinkError:
            return "sink_error";
        case FetchStatus::kRemoteChanged:
            return "remote_changed";
    }
    return "unknown";
}

std::optional<ContentRange> parseContentRange(const std::string& header) {
    static const std::regex re(R"(^\s*bytes\s+(\d+)-(\d+)/(\d+|\*)\s*$)", std::regex::icase);
    std::smatch match;
    if (!std::regex_match(header, match, re)) return std::nullopt;
    try {
        ContentRange out;
        out.first = std::stoull(match[1].str());
        out.last = std::stoull(match[2].str());
        if (match[3].str() != "*") out.total = std::stoull(match[3].str());
        if (out.last < out.first) return std::nullopt;
        return out;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

bool contentRangeMatches(const std::string& header, const ByteRange& range) {
    auto parsed = parseContentRange(header);
    return parsed && parsed->first == range.start && parsed->last + 1 == range.end;
}

std::string normalizeEtag(std::string value) {
    value = trimAscii(value);
    if (value.rfind("W/", 0) == 0) value.erase(0, 2);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        value = value.substr(1, value.size() - 2);
    }
    return value;
}

HostRateLimiter::HostRateLimiter(uint64_t bytes_per_sec) : bytes_per_sec_(bytes_per_sec) {}

void HostRateLimiter::acquire(const std::string& host, size_t bytes, const CancellationToken& cancel) {
    if (bytes_per_sec_ == 0 || bytes == 0) return;
    using clock = std::chrono::steady_clock;
    const auto cost = std::chrono::duration_cast<clock::duration>(
        std::chrono::duration<double>(static_cast<double>(bytes) / static_cast<double>(bytes_per_sec_)));

    clock::time_point slot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = clock::now();
        auto& next = next_free_[host];
        slot = next > now ? next : now;
        next = slot + cost;
    }
    while (!cancel.cancelled()) {
        auto now = clock::now();
        if (now >= slot) break;
        std::this_thread::sleep_for(std::min<clock::duration>(slot - now, std::chrono::milliseconds(100)));
    }
}

HttpRangeFetcher::HttpRangeFetcher(std::string registry_endpoint, std::string token,
                                   std::shared_ptr<HostRateLimiter> limiter)
    : registry_endpoint_(std::move(registry_endpoint)), token_(std::move(token)), limiter_(std::move(limiter)) {}

FetchResult HttpRangeFetcher::fetch(const FetchRequest& request, const FetchSink& sink,
                                    const CancellationToken& cancel) {
    FetchResult result;
    if (cancel.cancelled()) {
        result.status = FetchStatus::kCancelled;
        return result;
    }

    const uint64_t expected = request.range ? request.range->length() : request.expected_size;
    bool status_ok = false;
    bool sink_failed = false;
    bool overflow = false;
    bool range_ignored = false;
    bool remote_changed = false;
    bool too_many_redirects = false;

    HttpUrl url = parseUrl(request.url);
    httplib::Result res;
    for (int hop = 0;; ++hop) {
        auto client = makeClient(url, request.timeout);
        if (!client) {
            result.status = FetchStatus::kTransport;
            result.message = "cannot create HTTP client for " + url.origin() + url.path;
            return result;
        }
        // Rebuilt per hop: credentials for the registry never follow a redirect to a CDN.
        httplib::Headers headers = defaultHeaders(url, registry_endpoint_, token_);
        if (request.range) {
            headers.emplace("Range", request.range->toHttpHeader());
        }

        std::optional<HttpUrl> next;
        result.http_status = 0;
        res = client->Get(
            url.path, headers,
            [&](const httplib::Response& r) {
                result.http_status = r.status;
                if (cancel.cancelled()) return false;
                if (result.etag.empty() && r.has_header("X-Linked-Etag")) {
                    result.etag = normalizeEtag(r.get_header_value("X-Linked-Etag"));
                }
                next = redirectTarget(url, r.status, r.get_header_value("Location"));
                if (next) return false;
                if (result.etag.empty() && r.has_header("ETag")) {
                    result.etag = normalizeEtag(r.get_header_value("ETag"));
                }
                if (request.range) {
                    if (r.status == 200) {
                        range_ignored = true;
                        return false;
                    }
                    if (r.status != 206) return false;
                    if (r.has_header("Content-Range")) {
                        const std::string value = r.get_header_value("Content-Range");
                        auto content_range = parseContentRange(value);
                        if (!content_range || content_range->first != request.range->start ||
                            content_range->last + 1 != request.range->end) {
                            result.message = "unexpected Content-Range '" + value + "'";
                            return false;
                        }
                        if (content_range->total && request.total_size > 0 &&
                            *content_range->total != request.total_size) {
                            remote_changed = true;
                            result.message = "remote size is " + std::to_string(*content_range->total) +
                                             " bytes, expected " + std::to_string(request.total_size);
                            return false;
                        }
                    }
                } else if (r.status != 200) {
                    return false;
                }
                status_ok = true;
                return true;
            },
            [&](const char* data, size_t len) {
                if (cancel.cancelled()) return false;
                if (expected > 0 && result.bytes + len > expected) {
                    overflow = true;
                    return false;
                }
                if (!sink(data, len)) {
                    sink_failed = true;
                    return false;
                }
                result.bytes += len;
                if (limiter_) limiter_->acquire(url.host, len, cancel);
                return true;
            });

        if (!next || cancel.cancelled()) break;
        if (hop + 1 >= kMaxRedirects) {
            too_many_redirects = true;
            break;
        }
        spdlog::debug("RangeFetcher: following redirect status={} to host='{}'", result.http_status, next->host);
        url = *next;
    }

    if (cancel.cancelled()) {
        result.status = FetchStatus::kCancelled;
    } else if (sink_failed) {
        result.status = FetchStatus::kSinkError;
    } else if (range_ignored) {
        result.status = FetchStatus::kRangeUnsupported;
        spdlog::warn("RangeFetcher: server ignored Range header url='{}'", request.url);
    } else if (remote_changed) {
        result.status = FetchStatus::kRemoteChanged;
    } else if (too_many_redirects) {
        result.status = FetchStatus::kHttpError;
        result.message = "more than " + std::to_string(kMaxRedirects) + " redirects";
    } else if (overflow) {
        result.status = FetchStatus::kHttpError;
        result.message = "response body longer than " + std::to_string(expected) + " bytes";
    } else if (result.http_status != 0 && !status_ok) {
        result.status = FetchStatus::kHttpError;
        if (result.message.empty()) result.message = "unexpected status " + std::to_string(result.http_status);
    } else if (!res) {
        result.status = FetchStatus::kTransport;
        result.message = httplib::to_string(res.error());
    } else if (expected > 0 && result.bytes < expected) {
        result.status = FetchStatus::kTruncated;
        result.message = "received " + std::to_string(result.bytes) + " of " + std::to_string(expected) + " bytes";
    } else {
        result.status = FetchStatus::kOk;
    }

    if (!result.ok() && result.status != FetchStatus::kCancelled) {
        spdlog::debug("RangeFetcher: fetch failed url='{}' range='{}' status={} http={} msg='{}'", request.url,
                      request.range ? request.range->toHttpHeader() : "full", to_string(result.status),
                      result.http_status, result.message);
    }
    return result;
}

}  // namespace paca
