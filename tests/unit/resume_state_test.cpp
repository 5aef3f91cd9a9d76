#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

#include "download/resume_state.h"

using namespace paca;
namespace fs = std::filesystem;

namespace {

class TempDir {
public:
    TempDir() {
        auto base = fs::temp_directory_path() / "paca-resume-XXXXXX";
        std::string tmpl = base.string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        char* created = mkdtemp(buf.data());
        path = created ? fs::path(created) : fs::temp_directory_path();
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
    fs::path path;
};

ResumeState sampleState() {
    ResumeState state;
    state.path = "model-Q4_K_M.gguf";
    state.size = 1000;
    state.content_hash = "abc123";
    state.ranges.add({0, 100});
    state.ranges.add({500, 600});
    return state;
}

}  // namespace

TEST(ResumeStateTest, JsonKeepsEveryField) {
    auto state = sampleState();
    state.ranges_supported = false;
    state.etag = "rev-7";
    auto parsed = ResumeState::fromJson(state.toJson());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->path, state.path);
    EXPECT_EQ(parsed->size, 1000u);
    EXPECT_EQ(parsed->content_hash, "abc123");
    EXPECT_FALSE(parsed->ranges_supported);
    EXPECT_EQ(parsed->etag, "rev-7");
    EXPECT_EQ(parsed->ranges, state.ranges);
    EXPECT_FALSE(parsed->complete());
}

TEST(ResumeStateTest, RejectsRangesPastSize) {
    const char* text = R"({"version":1,"path":"a.gguf","size":10,"ranges":[[0,20]]})";
    EXPECT_FALSE(ResumeState::fromJson(text).has_value());
}

TEST(ResumeStateTest, RejectsUnknownVersionAndGarbage) {
    EXPECT_FALSE(ResumeState::fromJson(R"({"version":99,"path":"a","size":1,"ranges":[]})").has_value());
    EXPECT_FALSE(ResumeState::fromJson("not json").has_value());
    EXPECT_FALSE(ResumeState::fromJson(R"({"version":1,"size":1,"ranges":[]})").has_value());
}

TEST(ResumeStateTest, SaveThenLoad) {
    TempDir tmp;
    auto sidecar = tmp.path / "model.gguf.part.json";
    std::string err;
    ASSERT_TRUE(sampleState().save(sidecar, err)) << err;
    auto loaded = ResumeState::load(sidecar);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->ranges.covered(), 200u);
    // No temporary file is left behind by the durable write.
    size_t files = 0;
    for (const auto& entry : fs::directory_iterator(tmp.path)) {
        (void)entry;
        ++files;
    }
    EXPECT_EQ(files, 1u);
}

TEST(ResumeStateTest, LoadIgnoresMissingAndMalformedSidecars) {
    TempDir tmp;
    EXPECT_FALSE(ResumeState::load(tmp.path / "absent.json").has_value());
    std::ofstream(tmp.path / "broken.json") << "{\"version\":1,";
    EXPECT_FALSE(ResumeState::load(tmp.path / "broken.json").has_value());
}

TEST(ResumeStateTest, CompleteWhenAllBytesRecorded) {
    ResumeState state;
    state.size = 10;
    state.ranges.add({0, 10});
    EXPECT_TRUE(state.complete());
    ResumeState empty;
    EXPECT_TRUE(empty.complete());
}

TEST(ResumeStateTest, EtagIsOptional) {
    auto parsed = ResumeState::fromJson(R"({"version":1,"path":"a.gguf","size":10,"ranges":[[0,4]]})");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_TRUE(parsed->etag.empty());
    EXPECT_EQ(sampleState().toJson().find("etag"), std::string::npos);
}
