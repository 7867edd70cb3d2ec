#include <gtest/gtest.h>
#include <rho/bitset.hpp>

using rho::BitSet;

class BitSetTest : public ::testing::Test {};

TEST_F(BitSetTest, EmptyByDefault) {
    BitSet s;
    EXPECT_TRUE(s.empty());
    EXPECT_EQ(s.count(), 0u);
    EXPECT_FALSE(s.contains(0));
    EXPECT_EQ(s.to_string(), "{}");
}

TEST_F(BitSetTest, SetAndContainsAcrossWords) {
    BitSet s{0, 63, 64, 200};
    EXPECT_TRUE(s.contains(0));
    EXPECT_TRUE(s.contains(63));
    EXPECT_TRUE(s.contains(64));
    EXPECT_TRUE(s.contains(200));
    EXPECT_FALSE(s.contains(1));
    EXPECT_FALSE(s.contains(1000));
    EXPECT_EQ(s.count(), 4u);
    EXPECT_EQ(s.to_vector(), (std::vector<std::size_t>{0, 63, 64, 200}));
}

TEST_F(BitSetTest, ClearNormalizesForEquality) {
    BitSet a{1, 130};
    a.clear(130);
    EXPECT_EQ(a, BitSet{1});

    a.clear(1);
    EXPECT_TRUE(a.empty());
    EXPECT_EQ(a, BitSet{});
}

TEST_F(BitSetTest, UntilKeepsIndicesBelowLimit) {
    BitSet s{0, 2, 5, 70};
    EXPECT_EQ(s.until(0), BitSet{});
    EXPECT_EQ(s.until(3), (BitSet{0, 2}));
    EXPECT_EQ(s.until(6), (BitSet{0, 2, 5}));
    EXPECT_EQ(s.until(71), s);
    EXPECT_EQ(s.until(1000), s);
}

TEST_F(BitSetTest, UntilOnWordBoundary) {
    BitSet s{63, 64};
    EXPECT_EQ(s.until(64), BitSet{63});
}

TEST_F(BitSetTest, ShiftedDownDropsBinderIndices) {
    BitSet s{0, 1, 3, 66};
    EXPECT_EQ(s.shifted_down(0), s);
    EXPECT_EQ(s.shifted_down(2), (BitSet{1, 64}));
    EXPECT_EQ(s.shifted_down(64), BitSet{2});
    EXPECT_EQ(s.shifted_down(100), BitSet{});
}

TEST_F(BitSetTest, UnionMergesBothSides) {
    BitSet a{1, 3};
    BitSet b{3, 100};
    EXPECT_EQ(a | b, (BitSet{1, 3, 100}));

    a |= b;
    EXPECT_EQ(a.count(), 3u);
    EXPECT_NE(a, b);
}

TEST_F(BitSetTest, ToStringListsIndices) {
    EXPECT_EQ((BitSet{0, 2}).to_string(), "{0,2}");
}
