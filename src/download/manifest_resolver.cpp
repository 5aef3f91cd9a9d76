#include "download/remote_manifest.h"

#include <algorithm>
#include <map>
#include <regex>
#include <set>
#include <thread>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "utils/http_client.h"
#include "utils/string_utils.h"
#include "utils/url_utils.h"

namespace paca {

namespace {

constexpr int kMaxTreePages = 100;
constexpr const char* kPathSeparators = "/-.";

std::string basenameOf(const std::string& path) {
    auto slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

bool isModelArtifact(const std::string& path) {
    if (!endsWithIgnoreCase(path, ".gguf")) return false;
    // Multimodal projectors ship beside the weights but are not a quant variant.
    return toLowerAscii(basenameOf(path)).find("mmproj") == std::string::npos;
}

std::string joinStrings(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

bool isQuantizationToken(const std::string& token) {
    if (token.empty()) return false;
    for (char c : token) {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_')) return false;
    }
    const std::string upper = toUpperAscii(token);
    auto starts_with_digit = [](const std::string& value) {
        return !value.empty() && std::isdigit(static_cast<unsigned char>(value[0]));
    };
    if (upper.rfind("IQ", 0) == 0) return starts_with_digit(upper.substr(2));
    if (upper.rfind("Q", 0) == 0) return starts_with_digit(upper.substr(1));
    if (upper.rfind("BF", 0) == 0) return starts_with_digit(upper.substr(2));
    if (upper.rfind("FP", 0) == 0) return starts_with_digit(upper.substr(2));
    if (upper.rfind("F", 0) == 0) return starts_with_digit(upper.substr(1));
    if (upper.rfind("MXFP", 0) == 0) return starts_with_digit(upper.substr(4));
    return false;
}

std::string normalizeBasePath(std::string path) {
    if (path == "/" || path.empty()) return "";
    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

// Extracts the target of `<url>; rel="next"` from a Link header.
std::optional<std::string> nextPageLink(const std::string& link_header) {
    static const std::regex re(R"(<([^>]+)>\s*;\s*rel="?next"?)");
    std::smatch match;
    if (std::regex_search(link_header, match, re)) {
        return match[1].str();
    }
    return std::nullopt;
}

// Every index 1..total present exactly once, all members agreeing on total.
bool checkShardSet(const std::string& key, const std::vector<std::string>& paths, DownloadError& error) {
    std::set<int> totals;
    std::set<int> seen;
    bool duplicate = false;
    for (const auto& path : paths) {
        auto shard = parseShardInfo(path);
        if (!shard) {
            totals.insert(0);
            continue;
        }
        totals.insert(shard->total);
        if (!seen.insert(shard->index).second) duplicate = true;
    }
    if (totals.size() != 1 || *totals.begin() <= 0) {
        std::vector<std::string> counts;
        for (int t : totals) counts.push_back(std::to_string(t));
        error = make_error(DownloadErrorCode::kIncompleteShardSet,
                           "shard set " + key + " disagrees on its part count (" + joinStrings(counts, ", ") + ")");
        return false;
    }
    const int total = *totals.begin();
    std::vector<std::string> missing;
    for (int i = 1; i <= total; ++i) {
        if (!seen.count(i)) missing.push_back(std::to_string(i));
    }
    const bool out_of_range = !seen.empty() && (*seen.begin() < 1 || *seen.rbegin() > total);
    if (duplicate || out_of_range || !missing.empty()) {
        std::string msg = "shard set " + key + " has " + std::to_string(seen.size()) + " of " +
                          std::to_string(total) + " parts";
        if (!missing.empty()) msg += " (missing: " + joinStrings(missing, ", ") + ")";
        error = make_error(DownloadErrorCode::kIncompleteShardSet, msg);
        return false;
    }
    return true;
}

RemoteFile toRemoteFile(const TreeEntry& entry, const std::string& endpoint, const ModelReference& ref) {
    RemoteFile file;
    file.path = entry.path;
    file.size_bytes = entry.size;
    file.content_hash = entry.hash;
    file.source_url = buildResolveUrl(endpoint, ref, entry.path);
    return file;
}

void sortByPath(std::vector<RemoteFile>& files) {
    std::sort(files.begin(), files.end(), [](const RemoteFile& a, const RemoteFile& b) { return a.path < b.path; });
}

std::string stripHashPrefix(std::string hash) {
    const std::string prefix = "sha256:";
    if (hash.rfind(prefix, 0) == 0) hash.erase(0, prefix.size());
    return toLowerAscii(hash);
}

}  // namespace

uint64_t RemoteManifest::totalBytes() const {
    uint64_t total = 0;
    for (const auto& f : files) total += f.size_bytes;
    return total;
}

std::optional<ShardInfo> parseShardInfo(const std::string& path) {
    static const std::regex re(R"(^(.*[-._])(part-)?(\d{1,6})-of-(\d{1,6})(\.[A-Za-z0-9]+)?$)",
                               std::regex::icase);
    std::smatch match;
    if (!std::regex_match(path, match, re)) return std::nullopt;
    ShardInfo info;
    info.index = std::stoi(match[3].str());
    info.total = std::stoi(match[4].str());
    if (info.total <= 0) return std::nullopt;
    // The part count stays out of the key so shards that disagree on it land in one group.
    info.group_key = match[1].str() + match[2].str() + "*-of-*" + match[5].str();
    return info;
}

std::optional<std::string> matchQuantFamily(const std::string& path, const std::string& tag, bool* exact) {
    const auto tokens = splitAny(path, kPathSeparators);
    const auto tag_tokens = splitAny(tag, kPathSeparators);
    if (tag_tokens.empty() || tokens.size() < tag_tokens.size()) return std::nullopt;

    std::optional<std::string> prefix_match;
    for (size_t i = 0; i + tag_tokens.size() <= tokens.size(); ++i) {
        bool leading_equal = true;
        for (size_t k = 0; k + 1 < tag_tokens.size(); ++k) {
            if (toUpperAscii(tokens[i + k]) != toUpperAscii(tag_tokens[k])) {
                leading_equal = false;
                break;
            }
        }
        if (!leading_equal) continue;

        const std::string last = toUpperAscii(tokens[i + tag_tokens.size() - 1]);
        const std::string want = toUpperAscii(tag_tokens.back());
        std::vector<std::string> family_tokens;
        for (size_t k = 0; k + 1 < tag_tokens.size(); ++k) family_tokens.push_back(toUpperAscii(tokens[i + k]));
        family_tokens.push_back(last);

        if (last == want) {
            if (exact) *exact = true;
            return joinStrings(family_tokens, "-");
        }
        if (!prefix_match && last.rfind(want + "_", 0) == 0) {
            prefix_match = joinStrings(family_tokens, "-");
        }
    }
    if (prefix_match && exact) *exact = false;
    return prefix_match;
}

std::optional<std::string> inferQuantFromFilename(const std::string& path) {
    if (!endsWithIgnoreCase(path, ".gguf")) return std::nullopt;
    std::string stem = basenameOf(path);
    stem.erase(stem.size() - 5);
    auto tokens = splitAny(stem, "-.");
    for (auto it = tokens.rbegin(); it != tokens.rend(); ++it) {
        if (isQuantizationToken(*it)) return toUpperAscii(*it);
    }
    return std::nullopt;
}

std::string buildResolveUrl(const std::string& endpoint, const ModelReference& ref, const std::string& path) {
    std::string out = trimTrailingSlash(endpoint);
    out += "/";
    out += encodePathSegments(ref.repo());
    out += "/resolve/main/";
    out += encodePathSegments(path);
    return out;
}

std::optional<RemoteManifest> selectManifest(const ModelReference& ref,
                                             const std::vector<TreeEntry>& entries,
                                             const std::string& endpoint,
                                             DownloadError& error) {
    error = {};
    if (!ref.quantTag()) {
        error = make_error(DownloadErrorCode::kQuantRequired, "no quant tag given for " + ref.repo());
        return std::nullopt;
    }
    const std::string& tag = *ref.quantTag();

    struct Candidate {
        const TreeEntry* entry;
        std::string family;
        bool exact;
        std::optional<ShardInfo> shard;
    };

    std::vector<Candidate> candidates;
    std::set<std::string> available;
    for (const auto& entry : entries) {
        if (!isModelArtifact(entry.path)) continue;
        if (auto q = inferQuantFromFilename(entry.path)) available.insert(*q);
        bool exact = false;
        auto family = matchQuantFamily(entry.path, tag, &exact);
        if (!family) continue;
        candidates.push_back({&entry, *family, exact, parseShardInfo(entry.path)});
    }

    if (candidates.empty()) {
        std::string msg = "no model file in " + ref.repo() + " matches quant '" + tag + "'";
        if (!available.empty()) {
            msg += " (available: " + joinStrings(std::vector<std::string>(available.begin(), available.end()), ", ") + ")";
        }
        error = make_error(DownloadErrorCode::kQuantNotFound, msg);
        return std::nullopt;
    }

    const bool any_exact = std::any_of(candidates.begin(), candidates.end(),
                                       [](const Candidate& c) { return c.exact; });
    if (any_exact) {
        candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
                                        [](const Candidate& c) { return !c.exact; }),
                         candidates.end());
    }

    std::set<std::string> families;
    for (const auto& c : candidates) families.insert(c.family);
    if (families.size() > 1) {
        error = make_error(DownloadErrorCode::kAmbiguousQuant,
                           "quant '" + tag + "' matches multiple quant families: " +
                               joinStrings(std::vector<std::string>(families.begin(), families.end()), ", "));
        return std::nullopt;
    }

    std::map<std::string, std::vector<const Candidate*>> artifacts;
    for (const auto& c : candidates) {
        artifacts[c.shard ? c.shard->group_key : c.entry->path].push_back(&c);
    }
    if (artifacts.size() > 1) {
        std::vector<std::string> names;
        for (const auto& kv : artifacts) names.push_back(kv.first);
        error = make_error(DownloadErrorCode::kAmbiguousQuant,
                           "quant '" + tag + "' matches multiple artifacts: " + joinStrings(names, ", "));
        return std::nullopt;
    }

    const auto& members = artifacts.begin()->second;
    if (members.front()->shard) {
        std::vector<std::string> paths;
        for (const auto* c : members) paths.push_back(c->entry->path);
        if (!checkShardSet(artifacts.begin()->first, paths, error)) return std::nullopt;
    }

    RemoteManifest manifest{ref, *families.begin(), {}};
    for (const auto* c : members) {
        manifest.files.push_back(toRemoteFile(*c->entry, endpoint, ref));
    }
    sortByPath(manifest.files);
    return manifest;
}

std::string defaultVariantFamily(const std::string& default_file) {
    if (auto q = inferQuantFromFilename(default_file)) return *q;
    // The quant may only appear in a directory name ("Q4_K_M/model.gguf").
    const auto tokens = splitAny(default_file, kPathSeparators);
    for (auto it = tokens.rbegin(); it != tokens.rend(); ++it) {
        if (isQuantizationToken(*it)) return toUpperAscii(*it);
    }
    return "latest";
}

std::optional<RemoteManifest> selectDefaultManifest(const ModelReference& ref,
                                                    const std::string& default_file,
                                                    const std::vector<TreeEntry>& entries,
                                                    const std::string& endpoint,
                                                    DownloadError& error) {
    error = {};
    auto found = std::find_if(entries.begin(), entries.end(),
                              [&](const TreeEntry& e) { return e.path == default_file; });
    if (found == entries.end()) {
        error = make_error(DownloadErrorCode::kQuantNotFound,
                           "default variant '" + default_file + "' is not in the file tree of " + ref.repo());
        return std::nullopt;
    }

    const std::string family = defaultVariantFamily(default_file);
    const ModelReference effective = ref.withQuantTag(family);
    RemoteManifest manifest{effective, family, {}};

    auto shard = parseShardInfo(default_file);
    if (!shard) {
        manifest.files.push_back(toRemoteFile(*found, endpoint, effective));
        return manifest;
    }
    std::vector<std::string> paths;
    for (const auto& e : entries) {
        auto s = parseShardInfo(e.path);
        if (!s || s->group_key != shard->group_key) continue;
        paths.push_back(e.path);
        manifest.files.push_back(toRemoteFile(e, endpoint, effective));
    }
    if (!checkShardSet(shard->group_key, paths, error)) return std::nullopt;
    sortByPath(manifest.files);
    return manifest;
}

std::optional<std::vector<TreeEntry>> parseTreeListing(const std::string& body, DownloadError& error) {
    auto j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_array()) {
        error = make_error(DownloadErrorCode::kNetworkTransient, "registry tree response is not a JSON array");
        return std::nullopt;
    }
    std::vector<TreeEntry> entries;
    for (const auto& item : j) {
        if (!item.is_object()) continue;
        if (item.contains("type") && item["type"].is_string() && item["type"].get<std::string>() != "file") {
            continue;
        }
        if (!item.contains("path") || !item["path"].is_string()) continue;

        TreeEntry entry;
        entry.path = item["path"].get<std::string>();
        if (item.contains("size") && item["size"].is_number_unsigned()) {
            entry.size = item["size"].get<uint64_t>();
        }
        if (item.contains("lfs") && item["lfs"].is_object()) {
            const auto& lfs = item["lfs"];
            if (lfs.contains("oid") && lfs["oid"].is_string()) {
                entry.hash = stripHashPrefix(lfs["oid"].get<std::string>());
            }
            if (lfs.contains("size") && lfs["size"].is_number_unsigned()) {
                entry.size = lfs["size"].get<uint64_t>();
            }
        }
        if (entry.hash.empty() && item.contains("oid") && item["oid"].is_string()) {
            entry.hash = stripHashPrefix(item["oid"].get<std::string>());
        }
        entries.push_back(std::move(entry));
    }
    return entries;
}

ManifestResolver::ManifestResolver(std::string endpoint, std::string token, std::chrono::milliseconds timeout,
                                   int max_retries, std::chrono::milliseconds backoff)
    : endpoint_(trimTrailingSlash(std::move(endpoint))),
      token_(std::move(token)),
      timeout_(timeout),
      max_retries_(max_retries),
      backoff_(backoff) {}

std::optional<ManifestResolver::Response> ManifestResolver::get(const std::string& path, DownloadError& error) {
    HttpUrl base = parseUrl(endpoint_);
    if (!makeClient(base, timeout_)) {
        error = make_error(DownloadErrorCode::kNetworkTransient, "failed to create HTTP client for " + endpoint_);
        spdlog::warn("ManifestResolver: failed to create HTTP client for '{}'", endpoint_);
        return std::nullopt;
    }
    HttpUrl start = base;
    start.path = normalizeBasePath(base.path) + path;
    // The registry only returns the GGUF manifest form to llama.cpp clients.
    const bool llama_agent = path.rfind("/v2/", 0) == 0;

    httplib::Result res;
    for (int attempt = 0; attempt <= max_retries_; ++attempt) {
        res = getFollowingRedirects(start, llama_agent);
        if (res && res->status < 500 && res->status != 429) break;
        if (attempt < max_retries_) {
            spdlog::warn("ManifestResolver: request failed ({}), retrying path='{}' attempt={}",
                         res ? "status=" + std::to_string(res->status) : httplib::to_string(res.error()),
                         start.path, attempt + 1);
            std::this_thread::sleep_for(backoff_ * (1 << std::min(attempt, 6)));
        }
    }
    if (!res) {
        error = make_error(DownloadErrorCode::kNetworkTransient,
                           "registry request failed (" + httplib::to_string(res.error()) + ") " + endpoint_ + start.path);
        return std::nullopt;
    }
    Response out;
    out.status = res->status;
    out.body = res->body;
    if (res->has_header("Link")) {
        if (auto next = nextPageLink(res->get_header_value("Link"))) {
            HttpUrl next_url = parseUrl(*next);
            out.next_path = next_url.valid() ? next_url.path : *next;
        }
    }
    return out;
}

httplib::Result ManifestResolver::getFollowingRedirects(HttpUrl url, bool llama_agent) const {
    httplib::Result res;
    for (int hop = 0; hop < kMaxRedirects; ++hop) {
        auto client = makeClient(url, timeout_);
        if (!client) break;
        // Headers are rebuilt per hop so the token stays with the registry host.
        httplib::Headers headers = defaultHeaders(url, endpoint_, token_);
        if (llama_agent) {
            headers.erase("User-Agent");
            headers.emplace("User-Agent", "llama-cpp");
        }
        res = client->Get(url.path, headers);
        if (!res) break;
        auto next = redirectTarget(url, res->status, res->get_header_value("Location"));
        if (!next) break;
        spdlog::debug("ManifestResolver: following redirect status={} to host='{}'", res->status, next->host);
        url = *next;
    }
    return res;
}

std::optional<std::vector<TreeEntry>> ManifestResolver::fetchTree(const ModelReference& ref, DownloadError& error) {
    error = {};
    std::string path = "/api/models/" + encodePathSegments(ref.repo()) + "/tree/main?recursive=true";
    spdlog::info("ManifestResolver: fetching repository tree repo='{}'", ref.repo());

    std::vector<TreeEntry> all;
    const std::string base_prefix = normalizeBasePath(parseUrl(endpoint_).path);
    for (int page = 0; page < kMaxTreePages && !path.empty(); ++page) {
        auto res = get(path, error);
        if (!res) return std::nullopt;
        if (res->status == 401 || res->status == 403) {
            error = make_error(DownloadErrorCode::kUnauthorized,
                               "gated model or unauthorized (status=" + std::to_string(res->status) +
                                   "); set HF_TOKEN");
            return std::nullopt;
        }
        if (res->status == 404) {
            error = make_error(DownloadErrorCode::kRepositoryNotFound, "repository not found: " + ref.repo());
            return std::nullopt;
        }
        if (res->status < 200 || res->status >= 300) {
            error = make_error(DownloadErrorCode::kNetworkTransient,
                               "registry tree request failed status=" + std::to_string(res->status));
            return std::nullopt;
        }
        auto entries = parseTreeListing(res->body, error);
        if (!entries) return std::nullopt;
        all.insert(all.end(), entries->begin(), entries->end());

        path = res->next_path;
        // Link targets are absolute; strip the endpoint's base path so get() can re-add it.
        if (!base_prefix.empty() && path.rfind(base_prefix, 0) == 0) {
            path.erase(0, base_prefix.size());
        }
    }
    spdlog::info("ManifestResolver: repository tree repo='{}' files={}", ref.repo(), all.size());
    return all;
}

std::optional<std::string> ManifestResolver::fetchDefaultVariant(const ModelReference& ref, DownloadError& error) {
    error = {};
    const std::string path = "/v2/" + encodePathSegments(ref.repo()) + "/manifests/latest";
    auto res = get(path, error);
    if (!res) return std::nullopt;
    if (res->status == 401 || res->status == 403) {
        error = make_error(DownloadErrorCode::kUnauthorized,
                           "gated model or unauthorized (status=" + std::to_string(res->status) + "); set HF_TOKEN");
        return std::nullopt;
    }
    if (res->status == 404 || res->status == 400) {
        return std::nullopt;
    }
    if (res->status < 200 || res->status >= 300) {
        error = make_error(DownloadErrorCode::kNetworkTransient,
                           "default variant request failed status=" + std::to_string(res->status));
        return std::nullopt;
    }
    auto j = nlohmann::json::parse(res->body, nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("ggufFile") || !j["ggufFile"].is_object()) {
        return std::nullopt;
    }
    const auto& gguf = j["ggufFile"];
    if (!gguf.contains("rfilename") || !gguf["rfilename"].is_string()) return std::nullopt;
    auto name = gguf["rfilename"].get<std::string>();
    if (name.empty()) return std::nullopt;
    return name;
}

std::optional<RemoteManifest> ManifestResolver::resolve(const ModelReference& ref, DownloadError& error) {
    error = {};
    std::optional<std::string> default_file;
    if (!ref.quantTag()) {
        default_file = fetchDefaultVariant(ref, error);
        if (!error.ok()) return std::nullopt;
        if (!default_file) {
            error = make_error(DownloadErrorCode::kQuantRequired,
                               ref.repo() + " marks no default variant; specify one as " + ref.repo() + ":<quant>");
            return std::nullopt;
        }
        spdlog::info("ManifestResolver: no quant given, registry default is '{}'", *default_file);
    }

    auto entries = fetchTree(ref, error);
    if (!entries) return std::nullopt;

    auto manifest = default_file ? selectDefaultManifest(ref, *default_file, *entries, endpoint_, error)
                                 : selectManifest(ref, *entries, endpoint_, error);
    if (!manifest) {
        spdlog::warn("ManifestResolver: resolution failed ref='{}' error='{}'", ref.toString(), error.describe());
        return std::nullopt;
    }
    spdlog::info("ManifestResolver: resolved ref='{}' family={} files={} bytes={}", manifest->reference.toString(),
                 manifest->quant_family, manifest->files.size(), manifest->totalBytes());
    return manifest;
}

}  // namespace paca
