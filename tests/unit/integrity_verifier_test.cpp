#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <unistd.h>

#include "download/integrity_verifier.h"

using namespace paca;
namespace fs = std::filesystem;

namespace {

const char* kHelloSha256 = "5891b5b522d5df086d0ff0b110fbd9d21bb4fc7163af34d08286a2e846f6be03";
const char* kHelloBlobSha1 = "ce013625030ba8dba906f756967f9e9ca394464a";

class TempFile {
public:
    explicit TempFile(const std::string& content) {
        path = fs::temp_directory_path() / ("paca-verify-" + std::to_string(::getpid()) + "-" +
                                            std::to_string(counter++) + ".bin");
        std::ofstream(path, std::ios::binary) << content;
    }
    ~TempFile() {
        std::error_code ec;
        fs::remove(path, ec);
    }
    fs::path path;
    static int counter;
};
int TempFile::counter = 0;

}  // namespace

TEST(IntegrityVerifierTest, ComputesDigests) {
    TempFile file("hello\n");
    EXPECT_EQ(sha256_file(file.path), kHelloSha256);
    EXPECT_EQ(git_blob_sha1_file(file.path), kHelloBlobSha1);
    EXPECT_EQ(sha256_file(file.path.string() + ".missing"), "");
}

TEST(IntegrityVerifierTest, AcceptsMatchingHashInEitherCase) {
    TempFile file("hello\n");
    EXPECT_TRUE(verifyFile(file.path, kHelloSha256).ok());
    EXPECT_TRUE(verifyFile(file.path, "5891B5B522D5DF086D0FF0B110FBD9D21BB4FC7163AF34D08286A2E846F6BE03").ok());
    EXPECT_TRUE(verifyFile(file.path, kHelloBlobSha1).ok());
}

TEST(IntegrityVerifierTest, ReportsMismatch) {
    TempFile file("hellO\n");
    auto err = verifyFile(file.path, kHelloSha256);
    EXPECT_EQ(err.code, DownloadErrorCode::kHashMismatch);
    EXPECT_NE(err.message.find(kHelloSha256), std::string::npos);
}

TEST(IntegrityVerifierTest, EmptyExpectedHashIsAccepted) {
    TempFile file("anything");
    EXPECT_TRUE(verifyFile(file.path, "").ok());
}

TEST(IntegrityVerifierTest, RejectsUnknownDigestAndUnreadableFile) {
    TempFile file("hello\n");
    EXPECT_EQ(verifyFile(file.path, "abc").code, DownloadErrorCode::kHashMismatch);
    EXPECT_EQ(verifyFile(file.path.string() + ".missing", kHelloSha256).code, DownloadErrorCode::kHashMismatch);
}

TEST(IntegrityVerifierTest, DigestFromEtagAcceptsOnlyHexDigests) {
    EXPECT_EQ(digestFromEtag("5891B5B522D5DF086D0FF0B110FBD9D21BB4FC7163AF34D08286A2E846F6BE03"), kHelloSha256);
    EXPECT_EQ(digestFromEtag(kHelloBlobSha1), kHelloBlobSha1);
    EXPECT_EQ(digestFromEtag(""), "");
    EXPECT_EQ(digestFromEtag("rev-1"), "");
    EXPECT_EQ(digestFromEtag(std::string(64, 'g')), "");
    EXPECT_EQ(digestFromEtag(std::string(kHelloSha256) + "0"), "");
}
