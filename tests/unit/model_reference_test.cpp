#include <gtest/gtest.h>

#include "download/model_reference.h"

using namespace paca;

TEST(ModelReferenceTest, ParsesOwnerNameAndTag) {
    DownloadError err;
    auto ref = parseModelReference("unsloth/GLM-4.7-Flash-GGUF:Q2_K_XL", err);
    ASSERT_TRUE(ref.has_value()) << err.describe();
    EXPECT_TRUE(err.ok());
    EXPECT_EQ(ref->owner(), "unsloth");
    EXPECT_EQ(ref->name(), "GLM-4.7-Flash-GGUF");
    ASSERT_TRUE(ref->quantTag().has_value());
    EXPECT_EQ(*ref->quantTag(), "Q2_K_XL");
    EXPECT_EQ(ref->repo(), "unsloth/GLM-4.7-Flash-GGUF");
}

TEST(ModelReferenceTest, TagIsOptional) {
    DownloadError err;
    auto ref = parseModelReference("acme/model", err);
    ASSERT_TRUE(ref.has_value());
    EXPECT_FALSE(ref->quantTag().has_value());
    EXPECT_EQ(ref->toString(), "acme/model");
}

TEST(ModelReferenceTest, ToStringRoundTrips) {
    DownloadError err;
    auto ref = parseModelReference("acme/model:BF16", err);
    ASSERT_TRUE(ref.has_value());
    auto again = parseModelReference(ref->toString(), err);
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(*ref, *again);
}

TEST(ModelReferenceTest, WithQuantTagKeepsRepository) {
    ModelReference ref("acme", "model", std::nullopt);
    auto tagged = ref.withQuantTag("Q4_K_M");
    EXPECT_EQ(tagged.repo(), "acme/model");
    EXPECT_EQ(tagged.toString(), "acme/model:Q4_K_M");
    EXPECT_NE(ref, tagged);
}

TEST(ModelReferenceTest, RejectsMalformedReferences) {
    const std::vector<std::string> bad = {
        "",
        "model",
        "acme/model/extra",
        "/model",
        "acme/",
        "acme/model:",
        "acme/model:Q4:K",
        "acme/..",
        "./model",
        "acme/mo del",
        "acme/model:Q4 K",
        "acme/model:Q4/K",
        "ac$me/model",
        ":Q4",
    };
    for (const auto& text : bad) {
        DownloadError err;
        auto ref = parseModelReference(text, err);
        EXPECT_FALSE(ref.has_value()) << "accepted '" << text << "'";
        EXPECT_EQ(err.code, DownloadErrorCode::kInvalidReference) << text;
        EXPECT_FALSE(err.message.empty());
    }
}

TEST(ModelReferenceTest, ErrorCodesHaveStableNames) {
    EXPECT_STREQ(to_string(DownloadErrorCode::kInvalidReference), "INVALID_REFERENCE");
    EXPECT_STREQ(to_string(DownloadErrorCode::kQuantRequired), "QUANT_REQUIRED");
    EXPECT_TRUE(is_resolution_error(DownloadErrorCode::kAmbiguousQuant));
    EXPECT_FALSE(is_resolution_error(DownloadErrorCode::kNetworkTransient));
    auto err = make_error(DownloadErrorCode::kHashMismatch, "bad");
    EXPECT_EQ(err.describe(), "HASH_MISMATCH: bad");
}
