#pragma once

#include <filesystem>
#include <string>

#include "download/download_error.h"

namespace paca {

// Lowercase hex SHA-256 of a file; empty string on read failure.
std::string sha256_file(const std::filesystem::path& path);

// Lowercase hex git blob id: SHA-1 over "blob <size>\0" followed by the content.
std::string git_blob_sha1_file(const std::filesystem::path& path);

// An entity tag that is itself a content digest (the registry reports the
// sha256 of LFS objects and the git blob id of small files), lowercased.
// Empty when the tag is not a 40- or 64-digit hex string.
std::string digestFromEtag(const std::string& etag);

// Checks the full file against expected_hash (64 hex = SHA-256, 40 hex = git
// blob SHA-1, compared case-insensitively). An empty expected_hash is accepted.
// Returns kHashMismatch on mismatch, unknown digest length or read failure.
DownloadError verifyFile(const std::filesystem::path& path, const std::string& expected_hash);

}  // namespace paca
