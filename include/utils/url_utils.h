#pragma once

#include <regex>
#include <string>

namespace paca {

struct HttpUrl {
    std::string scheme;
    std::string host;
    int port{0};
    std::string path;

    bool valid() const { return !scheme.empty() && !host.empty(); }

    // scheme://host[:port], the form httplib::Client accepts.
    std::string origin() const {
        std::string out = scheme + "://" + host;
        if (port != 0) out += ":" + std::to_string(port);
        return out;
    }
};

inline HttpUrl parseUrl(const std::string& url) {
    static const std::regex re(R"(^([a-zA-Z][a-zA-Z0-9+.-]*)://([^/:]+)(?::(\d+))?(.*)$)");
    std::smatch match;
    HttpUrl parsed;
    if (std::regex_match(url, match, re)) {
        parsed.scheme = match[1].str();
        parsed.host = match[2].str();
        parsed.port = match[3].matched ? std::stoi(match[3].str()) : (parsed.scheme == "https" ? 443 : 80);
        parsed.path = match[4].str().empty() ? "/" : match[4].str();
    }
    return parsed;
}

inline std::string trimTrailingSlash(std::string value) {
    while (!value.empty() && value.back() == '/') {
        value.pop_back();
    }
    return value;
}

inline std::string urlEncodePathSegment(const std::string& input) {
    static const char* kHex = "0123456789ABCDEF";
    std::string out;
    out.reserve(input.size());
    for (unsigned char c : input) {
        const bool unreserved =
            (c >= 'A' && c <= 'Z') ||
            (c >= 'a' && c <= 'z') ||
            (c >= '0' && c <= '9') ||
            c == '-' || c == '_' || c == '.' || c == '~';
        if (unreserved) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[(c >> 4) & 0x0F]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

// Percent-encode each '/'-separated segment, keeping the separators.
inline std::string encodePathSegments(const std::string& path) {
    std::string out;
    size_t start = 0;
    while (start <= path.size()) {
        size_t pos = path.find('/', start);
        const std::string segment = (pos == std::string::npos) ? path.substr(start)
                                                               : path.substr(start, pos - start);
        out += urlEncodePathSegment(segment);
        if (pos == std::string::npos) break;
        out.push_back('/');
        start = pos + 1;
    }
    return out;
}

}  // namespace paca
