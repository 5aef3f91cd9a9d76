#include <gtest/gtest.h>

#include "download/range_set.h"

using namespace paca;

TEST(RangeSetTest, AddMergesOverlappingAndTouchingRanges) {
    RangeSet set;
    set.add({10, 20});
    set.add({30, 40});
    set.add({20, 25});  // touches [10,20)
    ASSERT_EQ(set.ranges().size(), 2u);
    EXPECT_EQ(set.ranges()[0], (ByteRange{10, 25}));
    EXPECT_EQ(set.ranges()[1], (ByteRange{30, 40}));

    set.add({5, 35});
    ASSERT_EQ(set.ranges().size(), 1u);
    EXPECT_EQ(set.ranges()[0], (ByteRange{5, 40}));
    EXPECT_EQ(set.covered(), 35u);
}

TEST(RangeSetTest, OrderOfAddsDoesNotMatter) {
    RangeSet a;
    a.add({0, 4});
    a.add({8, 12});
    a.add({4, 8});
    RangeSet b;
    b.add({8, 12});
    b.add({4, 8});
    b.add({0, 4});
    EXPECT_EQ(a, b);
    EXPECT_TRUE(a.containsAll(12));
    EXPECT_FALSE(a.containsAll(13));
}

TEST(RangeSetTest, EmptyRangesAreIgnored) {
    RangeSet set;
    set.add({5, 5});
    EXPECT_TRUE(set.empty());
    EXPECT_TRUE(set.containsAll(0));
}

TEST(RangeSetTest, ComplementListsGapsInOrder) {
    RangeSet set({{0, 10}, {20, 30}});
    auto gaps = set.complement(40);
    ASSERT_EQ(gaps.size(), 2u);
    EXPECT_EQ(gaps[0], (ByteRange{10, 20}));
    EXPECT_EQ(gaps[1], (ByteRange{30, 40}));

    uint64_t covered = set.covered();
    for (const auto& g : gaps) covered += g.length();
    EXPECT_EQ(covered, 40u);

    EXPECT_TRUE(RangeSet().complement(0).empty());
    ASSERT_EQ(RangeSet().complement(7).size(), 1u);
}

TEST(RangeSetTest, ContainsChecksWholeRange) {
    RangeSet set({{0, 10}, {20, 30}});
    EXPECT_TRUE(set.contains({2, 8}));
    EXPECT_TRUE(set.contains({20, 30}));
    EXPECT_FALSE(set.contains({8, 22}));
    EXPECT_FALSE(set.contains({30, 31}));
}

TEST(RangeSetTest, SplitRangesHonoursChunkSize) {
    auto pieces = splitRanges({{0, 10}, {20, 25}}, 4);
    ASSERT_EQ(pieces.size(), 5u);
    EXPECT_EQ(pieces[0], (ByteRange{0, 4}));
    EXPECT_EQ(pieces[2], (ByteRange{8, 10}));
    EXPECT_EQ(pieces[3], (ByteRange{20, 24}));
    EXPECT_EQ(pieces[4], (ByteRange{24, 25}));
}

TEST(RangeSetTest, HttpHeaderUsesInclusiveEnd) {
    EXPECT_EQ((ByteRange{0, 100}).toHttpHeader(), "bytes=0-99");
    EXPECT_EQ((ByteRange{100, 101}).toHttpHeader(), "bytes=100-100");
}
