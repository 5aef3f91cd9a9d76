#include "download/integrity_verifier.h"

#include <array>
#include <fstream>
#include <openssl/sha.h>
#include <spdlog/spdlog.h>

#include "utils/string_utils.h"

namespace paca {

namespace {

template <size_t N>
std::string toHex(const std::array<unsigned char, N>& digest) {
    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(N * 2);
    for (auto b : digest) {
        out.push_back(hex[(b >> 4) & 0x0F]);
        out.push_back(hex[b & 0x0F]);
    }
    return out;
}

bool isHex(const std::string& value) {
    for (char c : value) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

}  // namespace

std::string sha256_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return "";
    SHA256_CTX ctx;
    if (SHA256_Init(&ctx) != 1) return "";
    std::array<char, 1 << 16> buf{};
    while (file) {
        file.read(buf.data(), buf.size());
        std::streamsize n = file.gcount();
        if (n > 0) {
            if (SHA256_Update(&ctx, buf.data(), static_cast<size_t>(n)) != 1) return "";
        }
    }
    if (file.bad()) return "";
    std::array<unsigned char, SHA256_DIGEST_LENGTH> hash{};
    if (SHA256_Final(hash.data(), &ctx) != 1) return "";
    return toHex(hash);
}

std::string git_blob_sha1_file(const std::filesystem::path& path) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) return "";
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return "";

    SHA_CTX ctx;
    if (SHA1_Init(&ctx) != 1) return "";
    const std::string header = "blob " + std::to_string(size) + std::string(1, '\0');
    if (SHA1_Update(&ctx, header.data(), header.size()) != 1) return "";
    std::array<char, 1 << 16> buf{};
    while (file) {
        file.read(buf.data(), buf.size());
        std::streamsize n = file.gcount();
        if (n > 0) {
            if (SHA1_Update(&ctx, buf.data(), static_cast<size_t>(n)) != 1) return "";
        }
    }
    if (file.bad()) return "";
    std::array<unsigned char, SHA_DIGEST_LENGTH> hash{};
    if (SHA1_Final(hash.data(), &ctx) != 1) return "";
    return toHex(hash);
}

std::string digestFromEtag(const std::string& etag) {
    if (etag.size() != 40 && etag.size() != 64) return {};
    if (!isHex(etag)) return {};
    return toLowerAscii(etag);
}

DownloadError verifyFile(const std::filesystem::path& path, const std::string& expected_hash) {
    const std::string expected = toLowerAscii(trimAscii(expected_hash));
    if (expected.empty()) {
        spdlog::warn("IntegrityVerifier: no content hash published, accepting on size path='{}'", path.string());
        return {};
    }
    if (!isHex(expected) || (expected.size() != 64 && expected.size() != 40)) {
        return make_error(DownloadErrorCode::kHashMismatch,
                          "unsupported digest '" + expected_hash + "' (expected 64 or 40 hex digits)");
    }

    const std::string actual = expected.size() == 64 ? sha256_file(path) : git_blob_sha1_file(path);
    if (actual.empty()) {
        return make_error(DownloadErrorCode::kHashMismatch, "cannot read " + path.string() + " for hashing");
    }
    if (actual != expected) {
        spdlog::warn("IntegrityVerifier: hash mismatch path='{}' expected={} actual={}", path.string(), expected,
                     actual);
        return make_error(DownloadErrorCode::kHashMismatch,
                          path.filename().string() + ": expected " + expected + ", got " + actual);
    }
    return {};
}

}  // namespace paca
