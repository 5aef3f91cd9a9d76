#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <httplib.h>

#include "utils/url_utils.h"

namespace paca {

// Redirect hops followed per request (registry -> CDN takes one).
constexpr int kMaxRedirects = 10;

// "paca/<version>"
std::string userAgent();

// Build a client for scheme://host:port with connect/read/write timeouts.
// Redirects are not followed by the client: callers follow them with
// redirectTarget() so each hop gets its own defaultHeaders().
// Returns nullptr for invalid URLs or https without TLS support.
std::unique_ptr<httplib::Client> makeClient(const HttpUrl& url, std::chrono::milliseconds timeout);

// Target of a 3xx response with a Location header, resolved against `from`.
std::optional<HttpUrl> redirectTarget(const HttpUrl& from, int status, const std::string& location);

// User-Agent plus "Authorization: Bearer <token>" when token is non-empty and
// the host is the registry host. CDN hosts reached by redirect get no token.
httplib::Headers defaultHeaders(const HttpUrl& url, const std::string& registry_endpoint,
                                const std::string& token);

}  // namespace paca
