#include <gtest/gtest.h>
#include <httplib.h>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

#include "download/range_fetcher.h"

using namespace paca;

namespace {

std::string body() {
    std::string out;
    for (int i = 0; i < 4096; ++i) out.push_back(static_cast<char>('a' + i % 26));
    return out;
}

class FetchServer {
public:
    explicit FetchServer(int port) : port_(port) {
        svr_.Get("/acme/model/resolve/main/model.gguf", [this](const httplib::Request& req, httplib::Response& res) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                last_range_ = req.get_header_value("Range");
                last_auth_ = req.get_header_value("Authorization");
            }
            res.set_header("ETag", "W/\"rev-1\"");
            res.set_content(body(), "application/octet-stream");
        });
        svr_.Get("/acme/model/resolve/main/missing.gguf",
                 [](const httplib::Request&, httplib::Response& res) { res.status = 404; });
        thread_ = std::thread([this]() { svr_.listen("127.0.0.1", port_); });
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    ~FetchServer() {
        svr_.stop();
        thread_.join();
    }
    std::string url(const std::string& file) const {
        return "http://127.0.0.1:" + std::to_string(port_) + "/acme/model/resolve/main/" + file;
    }
    std::string lastRange() {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_range_;
    }
    std::string lastAuth() {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_auth_;
    }

private:
    int port_;
    httplib::Server svr_;
    std::thread thread_;
    std::mutex mutex_;
    std::string last_range_;
    std::string last_auth_;
};

// Listens on any loopback address; 127.0.0.2 stands in for a second host.
class LoopbackHost {
public:
    LoopbackHost(std::string address, int port) : address_(std::move(address)), port_(port) {}
    ~LoopbackHost() {
        svr_.stop();
        if (thread_.joinable()) thread_.join();
    }
    httplib::Server& server() { return svr_; }
    void start() {
        thread_ = std::thread([this]() { svr_.listen(address_, port_); });
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    std::string origin() const { return "http://" + address_ + ":" + std::to_string(port_); }
    void record(const httplib::Request& req) {
        std::lock_guard<std::mutex> lock(mutex_);
        auth_.push_back(req.get_header_value("Authorization"));
    }
    std::vector<std::string> authHeaders() {
        std::lock_guard<std::mutex> lock(mutex_);
        return auth_;
    }

private:
    std::string address_;
    int port_;
    httplib::Server svr_;
    std::thread thread_;
    std::mutex mutex_;
    std::vector<std::string> auth_;
};

}  // namespace

TEST(RangeFetcherTest, ContentRangeMustMatchRequest) {
    EXPECT_TRUE(contentRangeMatches("bytes 0-99/1000", {0, 100}));
    EXPECT_TRUE(contentRangeMatches("bytes 100-199/*", {100, 200}));
    EXPECT_FALSE(contentRangeMatches("bytes 0-98/1000", {0, 100}));
    EXPECT_FALSE(contentRangeMatches("bytes */1000", {0, 100}));
    EXPECT_FALSE(contentRangeMatches("garbage", {0, 100}));
}

TEST(RangeFetcherTest, ParsesContentRangeTotal) {
    auto known = parseContentRange("bytes 0-99/1000");
    ASSERT_TRUE(known.has_value());
    EXPECT_EQ(known->first, 0u);
    EXPECT_EQ(known->last, 99u);
    ASSERT_TRUE(known->total.has_value());
    EXPECT_EQ(*known->total, 1000u);

    auto unknown = parseContentRange("Bytes 5-9/*");
    ASSERT_TRUE(unknown.has_value());
    EXPECT_FALSE(unknown->total.has_value());

    auto big = parseContentRange("bytes 3999999000-3999999999/4000000000");
    ASSERT_TRUE(big.has_value());
    EXPECT_EQ(*big->total, 4000000000ull);

    EXPECT_FALSE(parseContentRange("bytes 9-5/10").has_value());
    EXPECT_FALSE(parseContentRange("bytes */10").has_value());
}

TEST(RangeFetcherTest, NormalizesEntityTags) {
    EXPECT_EQ(normalizeEtag("\"abc\""), "abc");
    EXPECT_EQ(normalizeEtag(" W/\"abc\" "), "abc");
    EXPECT_EQ(normalizeEtag("abc"), "abc");
    EXPECT_EQ(normalizeEtag("\""), "\"");
    EXPECT_EQ(normalizeEtag(""), "");
}

TEST(RangeFetcherTest, FetchesRequestedRange) {
    FetchServer server(18295);
    HttpRangeFetcher fetcher("http://127.0.0.1:18295", "hf_token");
    CancellationToken cancel;

    FetchRequest req;
    req.url = server.url("model.gguf");
    req.range = ByteRange{100, 1100};
    req.timeout = std::chrono::milliseconds(2000);
    std::string received;
    auto result = fetcher.fetch(
        req,
        [&](const char* data, size_t len) {
            received.append(data, len);
            return true;
        },
        cancel);

    ASSERT_TRUE(result.ok()) << to_string(result.status) << " " << result.message;
    EXPECT_EQ(result.http_status, 206);
    EXPECT_EQ(result.bytes, 1000u);
    EXPECT_EQ(received, body().substr(100, 1000));
    EXPECT_EQ(server.lastRange(), "bytes=100-1099");
    EXPECT_EQ(server.lastAuth(), "Bearer hf_token");
    EXPECT_EQ(result.etag, "rev-1");
}

TEST(RangeFetcherTest, FetchesWholeFile) {
    FetchServer server(18296);
    HttpRangeFetcher fetcher("https://huggingface.co", "hf_token");
    CancellationToken cancel;

    FetchRequest req;
    req.url = server.url("model.gguf");
    req.expected_size = 4096;
    req.timeout = std::chrono::milliseconds(2000);
    std::string received;
    auto result = fetcher.fetch(
        req,
        [&](const char* data, size_t len) {
            received.append(data, len);
            return true;
        },
        cancel);

    ASSERT_TRUE(result.ok()) << result.message;
    EXPECT_EQ(result.http_status, 200);
    EXPECT_EQ(received, body());
    EXPECT_TRUE(server.lastRange().empty());
    // The token only goes to the registry host.
    EXPECT_TRUE(server.lastAuth().empty());
}

TEST(RangeFetcherTest, ShortBodyIsTruncated) {
    FetchServer server(18297);
    HttpRangeFetcher fetcher("http://127.0.0.1:18297", "");
    CancellationToken cancel;

    FetchRequest req;
    req.url = server.url("model.gguf");
    req.expected_size = 5000;
    req.timeout = std::chrono::milliseconds(2000);
    auto result = fetcher.fetch(req, [](const char*, size_t) { return true; }, cancel);
    EXPECT_EQ(result.status, FetchStatus::kTruncated);
    EXPECT_EQ(result.bytes, 4096u);
}

TEST(RangeFetcherTest, ReportsHttpErrorsAndSinkFailures) {
    FetchServer server(18298);
    HttpRangeFetcher fetcher("http://127.0.0.1:18298", "");
    CancellationToken cancel;

    FetchRequest missing;
    missing.url = server.url("missing.gguf");
    missing.range = ByteRange{0, 10};
    missing.timeout = std::chrono::milliseconds(2000);
    auto result = fetcher.fetch(missing, [](const char*, size_t) { return true; }, cancel);
    EXPECT_EQ(result.status, FetchStatus::kHttpError);
    EXPECT_EQ(result.http_status, 404);

    FetchRequest req;
    req.url = server.url("model.gguf");
    req.range = ByteRange{0, 100};
    req.timeout = std::chrono::milliseconds(2000);
    result = fetcher.fetch(req, [](const char*, size_t) { return false; }, cancel);
    EXPECT_EQ(result.status, FetchStatus::kSinkError);
}

TEST(RangeFetcherTest, CancelledBeforeStartSendsNothing) {
    HttpRangeFetcher fetcher("http://127.0.0.1:1", "");
    CancellationToken cancel;
    cancel.cancel();
    FetchRequest req;
    req.url = "http://127.0.0.1:1/nothing";
    auto result = fetcher.fetch(req, [](const char*, size_t) { return true; }, cancel);
    EXPECT_EQ(result.status, FetchStatus::kCancelled);
    EXPECT_EQ(result.bytes, 0u);
}

TEST(RangeFetcherTest, ConnectionRefusedIsTransportError) {
    HttpRangeFetcher fetcher("http://127.0.0.1:1", "");
    CancellationToken cancel;
    FetchRequest req;
    req.url = "http://127.0.0.1:1/nothing";
    req.timeout = std::chrono::milliseconds(500);
    auto result = fetcher.fetch(req, [](const char*, size_t) { return true; }, cancel);
    EXPECT_EQ(result.status, FetchStatus::kTransport);
}

TEST(RangeFetcherTest, RateLimiterSpacesOutBytesPerHost) {
    HostRateLimiter limiter(10000);
    CancellationToken cancel;
    const auto start = std::chrono::steady_clock::now();
    limiter.acquire("a", 1000, cancel);  // first slot is immediate
    limiter.acquire("a", 1000, cancel);
    limiter.acquire("a", 1000, cancel);
    limiter.acquire("b", 1000, cancel);  // other hosts have their own budget
    const auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_GE(elapsed, std::chrono::milliseconds(190));
    EXPECT_LT(elapsed, std::chrono::milliseconds(1000));

    HostRateLimiter unlimited(0);
    unlimited.acquire("a", 1 << 30, cancel);
}

TEST(RangeFetcherTest, ContentRangeTotalMustMatchFileSize) {
    FetchServer server(18310);
    HttpRangeFetcher fetcher("http://127.0.0.1:18310", "");
    CancellationToken cancel;

    FetchRequest req;
    req.url = server.url("model.gguf");
    req.range = ByteRange{0, 100};
    req.total_size = 4096;
    req.timeout = std::chrono::milliseconds(2000);
    auto same = fetcher.fetch(req, [](const char*, size_t) { return true; }, cancel);
    EXPECT_TRUE(same.ok()) << same.message;

    req.total_size = 5000;
    size_t delivered = 0;
    auto changed = fetcher.fetch(
        req,
        [&](const char*, size_t len) {
            delivered += len;
            return true;
        },
        cancel);
    EXPECT_EQ(changed.status, FetchStatus::kRemoteChanged);
    EXPECT_NE(changed.message.find("4096"), std::string::npos);
    EXPECT_EQ(delivered, 0u);
}

TEST(RangeFetcherTest, RedirectToOtherHostDropsAuthorization) {
    const std::string linked = "5891b5b522d5df086d0ff0b110fbd9d21bb4fc7163af34d08286a2e846f6be03";
    LoopbackHost cdn("127.0.0.2", 18312);
    cdn.server().Get("/blobs/model", [&cdn](const httplib::Request& req, httplib::Response& res) {
        cdn.record(req);
        res.set_header("ETag", "\"cdn-object\"");
        res.set_content(body(), "application/octet-stream");
    });
    cdn.start();

    LoopbackHost registry("127.0.0.1", 18311);
    registry.server().Get("/acme/model/resolve/main/model.gguf",
                          [&registry, &cdn, &linked](const httplib::Request& req, httplib::Response& res) {
                              registry.record(req);
                              res.status = 302;
                              res.set_header("Location", cdn.origin() + "/blobs/model");
                              res.set_header("X-Linked-Etag", "\"" + linked + "\"");
                          });
    registry.server().Get("/acme/loop", [&registry](const httplib::Request& req, httplib::Response& res) {
        registry.record(req);
        res.status = 307;
        res.set_header("Location", "/acme/loop");
    });
    registry.start();

    HttpRangeFetcher fetcher(registry.origin(), "hf_token");
    CancellationToken cancel;
    FetchRequest req;
    req.url = registry.origin() + "/acme/model/resolve/main/model.gguf";
    req.range = ByteRange{0, 4096};
    req.total_size = 4096;
    req.timeout = std::chrono::milliseconds(2000);
    std::string received;
    auto result = fetcher.fetch(
        req,
        [&](const char* data, size_t len) {
            received.append(data, len);
            return true;
        },
        cancel);

    ASSERT_TRUE(result.ok()) << to_string(result.status) << " " << result.message;
    EXPECT_EQ(result.http_status, 206);
    EXPECT_EQ(received, body());
    EXPECT_EQ(result.etag, linked);
    ASSERT_EQ(registry.authHeaders().size(), 1u);
    EXPECT_EQ(registry.authHeaders()[0], "Bearer hf_token");
    ASSERT_EQ(cdn.authHeaders().size(), 1u);
    EXPECT_TRUE(cdn.authHeaders()[0].empty());

    FetchRequest loop;
    loop.url = registry.origin() + "/acme/loop";
    loop.timeout = std::chrono::milliseconds(2000);
    auto looped = fetcher.fetch(loop, [](const char*, size_t) { return true; }, cancel);
    EXPECT_EQ(looped.status, FetchStatus::kHttpError);
    EXPECT_NE(looped.message.find("redirects"), std::string::npos);
}
