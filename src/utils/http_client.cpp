#include "utils/http_client.h"

#include "utils/string_utils.h"
#include "utils/version.h"

namespace paca {

namespace {

bool isTokenHost(const std::string& host, const std::string& registry_endpoint) {
    HttpUrl registry = parseUrl(registry_endpoint);
    return registry.valid() && toLowerAscii(registry.host) == toLowerAscii(host);
}

}  // namespace

std::string userAgent() {
    return std::string("paca/") + version();
}

std::unique_ptr<httplib::Client> makeClient(const HttpUrl& url, std::chrono::milliseconds timeout) {
    if (!url.valid()) {
        return nullptr;
    }

#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
    if (url.scheme == "https") {
        return nullptr;  // HTTPS is not supported in this build
    }
#endif

    auto client = std::make_unique<httplib::Client>(url.origin());
    if (!client->is_valid()) {
        return nullptr;
    }
    const auto sec = static_cast<time_t>(timeout.count() / 1000);
    const auto usec = static_cast<time_t>((timeout.count() % 1000) * 1000);
    client->set_connection_timeout(sec, usec);
    client->set_read_timeout(sec, usec);
    client->set_write_timeout(sec, usec);
    client->set_follow_location(false);
    client->set_keep_alive(false);
    return client;
}

std::optional<HttpUrl> redirectTarget(const HttpUrl& from, int status, const std::string& location) {
    if (status < 300 || status >= 400 || status == 304 || location.empty()) return std::nullopt;
    HttpUrl target;
    if (location.rfind("//", 0) == 0) {
        target = parseUrl(from.scheme + ":" + location);
    } else if (location.front() == '/') {
        target = parseUrl(from.origin() + location);
    } else if (location.find("://") != std::string::npos) {
        target = parseUrl(location);
    } else {
        std::string dir = from.path.substr(0, from.path.find('?'));
        dir = dir.substr(0, dir.rfind('/') + 1);
        target = parseUrl(from.origin() + dir + location);
    }
    if (!target.valid() || (target.scheme != "http" && target.scheme != "https")) return std::nullopt;
    return target;
}

httplib::Headers defaultHeaders(const HttpUrl& url, const std::string& registry_endpoint,
                                const std::string& token) {
    httplib::Headers headers{{"User-Agent", userAgent()}};
    if (!token.empty() && isTokenHost(url.host, registry_endpoint)) {
        headers.emplace("Authorization", "Bearer " + token);
    }
    return headers;
}

}  // namespace paca
