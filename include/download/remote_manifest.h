#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <httplib.h>

#include "download/download_error.h"
#include "download/model_reference.h"
#include "utils/url_utils.h"

namespace paca {

struct RemoteFile {
    std::string path;          // path inside the repository, '/'-separated
    uint64_t size_bytes{0};
    std::string content_hash;  // lowercase hex (sha256 for LFS objects, git blob sha1 otherwise)
    std::string source_url;

    bool operator==(const RemoteFile& other) const {
        return path == other.path && size_bytes == other.size_bytes &&
               content_hash == other.content_hash && source_url == other.source_url;
    }
};

struct RemoteManifest {
    ModelReference reference;
    std::string quant_family;       // e.g. "Q4_K_M"
    std::vector<RemoteFile> files;  // ordered by path, never empty

    uint64_t totalBytes() const;
};

// One file entry of the registry tree listing.
struct TreeEntry {
    std::string path;
    uint64_t size{0};
    std::string hash;
};

// Shard position parsed from a "NNNN-of-MMMM" file name.
struct ShardInfo {
    int index{0};
    int total{0};
    std::string group_key;  // file path with the shard index and part count removed
};

// Returns the shard info for names such as "model-Q4.part-0001-of-0002.gguf"
// or "BF16/model-BF16-00001-of-00003.gguf"; std::nullopt for single files.
std::optional<ShardInfo> parseShardInfo(const std::string& path);

// Quant family a path carries for the requested tag (uppercase), or std::nullopt.
// Tokens are split on '/', '-' and '.'; a token matches when it equals the tag
// or starts with "<tag>_" (case-insensitive). exact is set when the token equals the tag.
std::optional<std::string> matchQuantFamily(const std::string& path, const std::string& tag, bool* exact = nullptr);

// Quant token carried by a file name (e.g. "Q4_K_M" in "model-Q4_K_M.gguf").
std::optional<std::string> inferQuantFromFilename(const std::string& path);

// "{endpoint}/{owner}/{name}/resolve/main/{path}" with percent-encoded segments.
std::string buildResolveUrl(const std::string& endpoint, const ModelReference& ref, const std::string& path);

// Pure selection step: filters the tree listing to the artifact the tag names.
// ref must carry a quant tag.
std::optional<RemoteManifest> selectManifest(const ModelReference& ref,
                                             const std::vector<TreeEntry>& entries,
                                             const std::string& endpoint,
                                             DownloadError& error);

// Quant family named by the registry's default file: the quant token of the file
// name, else of its directories, else "latest".
std::string defaultVariantFamily(const std::string& default_file);

// Pure selection step for a reference without a tag: the registry's default
// file, or the complete shard set it belongs to.
std::optional<RemoteManifest> selectDefaultManifest(const ModelReference& ref,
                                                    const std::string& default_file,
                                                    const std::vector<TreeEntry>& entries,
                                                    const std::string& endpoint,
                                                    DownloadError& error);

// Parse the JSON body of the tree API into entries (files only).
std::optional<std::vector<TreeEntry>> parseTreeListing(const std::string& body, DownloadError& error);

// Queries the registry's metadata endpoints. Performs read-only requests only.
class ManifestResolver {
public:
    ManifestResolver(std::string endpoint,
                     std::string token = {},
                     std::chrono::milliseconds timeout = std::chrono::milliseconds(30000),
                     int max_retries = 3,
                     std::chrono::milliseconds backoff = std::chrono::milliseconds(500));

    std::optional<RemoteManifest> resolve(const ModelReference& ref, DownloadError& error);

    // File tree of the repository (recursive).
    std::optional<std::vector<TreeEntry>> fetchTree(const ModelReference& ref, DownloadError& error);

    // Registry's default variant file name, std::nullopt when none is marked.
    std::optional<std::string> fetchDefaultVariant(const ModelReference& ref, DownloadError& error);

    const std::string& endpoint() const { return endpoint_; }

private:
    struct Response {
        int status{0};
        std::string body;
        std::string next_path;  // from a Link rel="next" header, empty on the last page
    };
    std::optional<Response> get(const std::string& path, DownloadError& error);
    httplib::Result getFollowingRedirects(HttpUrl url, bool llama_agent) const;

    std::string endpoint_;
    std::string token_;
    std::chrono::milliseconds timeout_;
    int max_retries_;
    std::chrono::milliseconds backoff_;
};

}  // namespace paca
