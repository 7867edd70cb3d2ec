#include <gtest/gtest.h>
#include <rho/canonicalization.hpp>
#include <rho/builders.hpp>
#include "test_helpers.hpp"
#include <functional>
#include <unordered_set>

using namespace rho;
using namespace test_utils;

class CanonicalizationTest : public ::testing::Test {
protected:
    Canonicalizer canonicalizer;

    Par sends_in_order(std::vector<int64_t> channels) {
        ParBuilder builder;
        for (int64_t ch : channels) {
            builder.add(make_send(quoted_int(ch), {gint_par(ch * 10)}));
        }
        return builder.build();
    }
};

TEST_F(CanonicalizationTest, ScoreTreeOrdersLeavesBeforeNodes) {
    ScoreTree n = ScoreTree::leaf(int64_t{5});
    ScoreTree s = ScoreTree::leaf(std::string("a"));
    ScoreTree node = ScoreTree::node(ScoreTag::Par);

    EXPECT_TRUE(n < s);
    EXPECT_TRUE(s < node);
    EXPECT_FALSE(node < n);
}

TEST_F(CanonicalizationTest, ScoreTreeComparesChildrenLexicographically) {
    ScoreTree shorter = ScoreTree::node(ScoreTag::EList).add(ScoreTree::leaf(int64_t{1}));
    ScoreTree longer = ScoreTree::node(ScoreTag::EList)
        .add(ScoreTree::leaf(int64_t{1}))
        .add(ScoreTree::leaf(int64_t{0}));
    ScoreTree bigger = ScoreTree::node(ScoreTag::EList).add(ScoreTree::leaf(int64_t{2}));

    EXPECT_TRUE(shorter < longer);
    EXPECT_TRUE(longer < bigger);
    EXPECT_EQ(shorter.compare(shorter), 0);
    EXPECT_EQ(shorter.to_string(), "(" + std::to_string(static_cast<int64_t>(ScoreTag::EList)) + " 1)");
}

TEST_F(CanonicalizationTest, ScoreTreeHashSeparatesShapes) {
    ScoreTree flat = ScoreTree::node(ScoreTag::EList)
        .add(ScoreTree::leaf(int64_t{1}))
        .add(ScoreTree::leaf(int64_t{2}));
    ScoreTree nested = ScoreTree::node(ScoreTag::EList)
        .add(ScoreTree::node(ScoreTag::EList).add(ScoreTree::leaf(int64_t{1})))
        .add(ScoreTree::leaf(int64_t{2}));

    EXPECT_EQ(flat.hash(), flat.hash());
    EXPECT_NE(flat.hash(), nested.hash());
}

TEST_F(CanonicalizationTest, ParChildOrderDoesNotMatter) {
    Par p1 = sends_in_order({3, 1, 2});
    Par p2 = sends_in_order({2, 3, 1});

    EXPECT_NE(p1, p2);
    EXPECT_EQ(canonicalizer.canonicalize(p1), canonicalizer.canonicalize(p2));
    EXPECT_TRUE(canonicalizer.equivalent(p1, p2));
    EXPECT_EQ(canonicalizer.hash(p1), canonicalizer.hash(p2));
}

TEST_F(CanonicalizationTest, CanonicalFormIsIdempotent) {
    Par p = ParBuilder()
        .add(make_send(quoted_int(2), {gint_par(1)}))
        .add(gint(7))
        .add(gstring("x"))
        .add(make_new(1, sends_in_order({5, 4})))
        .add(make_eval(chan_var(bound_var(0))))
        .add(make_private("id-b"))
        .add(make_private("id-a"))
        .build();

    Par once = canonicalizer.canonicalize(p);
    Par twice = canonicalizer.canonicalize(once);
    EXPECT_EQ(once, twice);
}

TEST_F(CanonicalizationTest, CanonicalizationIsDeep) {
    Par inner1 = sends_in_order({1, 2});
    Par inner2 = sends_in_order({2, 1});

    Par outer1 = make_par(make_new(2, inner1));
    Par outer2 = make_par(make_new(2, inner2));

    EXPECT_EQ(canonicalizer.canonicalize(outer1), canonicalizer.canonicalize(outer2));
}

TEST_F(CanonicalizationTest, QuotedChannelIsCanonicalized) {
    Channel c1 = quote(sends_in_order({1, 2}));
    Channel c2 = quote(sends_in_order({2, 1}));

    EXPECT_EQ(canonicalizer.canonicalize(c1), canonicalizer.canonicalize(c2));
}

TEST_F(CanonicalizationTest, SendDataKeepsOrder) {
    Par p1 = make_par(make_send(quoted_int(0), {gint_par(1), gint_par(2)}));
    Par p2 = make_par(make_send(quoted_int(0), {gint_par(2), gint_par(1)}));

    expect_canonical_different(p1, p2);
}

TEST_F(CanonicalizationTest, ListKeepsOrderSetDoesNot) {
    Par list1 = make_par(make_elist({gint_par(1), gint_par(2)}));
    Par list2 = make_par(make_elist({gint_par(2), gint_par(1)}));
    expect_canonical_different(list1, list2);

    Par set1 = make_par(make_eset({gint_par(1), gint_par(2)}));
    Par set2 = make_par(make_eset({gint_par(2), gint_par(1)}));
    expect_canonical_equal(set1, set2);
}

TEST_F(CanonicalizationTest, SetRemovesDuplicates) {
    Expr set = make_eset({gint_par(4), gint_par(1), gint_par(4)});
    Expr canonical = canonicalizer.canonicalize(set);

    const auto& elements = std::get<ESet>(canonical.instance).ps;
    ASSERT_EQ(elements.size(), 2u);
    EXPECT_EQ(elements[0], gint_par(1));
    EXPECT_EQ(elements[1], gint_par(4));
}

TEST_F(CanonicalizationTest, MapSortsByKeyAndLastDuplicateWins) {
    Expr map = make_emap({
        {gstring_par("b"), gint_par(1)},
        {gstring_par("a"), gint_par(2)},
        {gstring_par("b"), gint_par(3)}
    });
    Expr canonical = canonicalizer.canonicalize(map);

    const auto& kvs = std::get<EMap>(canonical.instance).kvs;
    ASSERT_EQ(kvs.size(), 2u);
    EXPECT_EQ(*kvs[0].key, gstring_par("a"));
    EXPECT_EQ(*kvs[0].value, gint_par(2));
    EXPECT_EQ(*kvs[1].key, gstring_par("b"));
    EXPECT_EQ(*kvs[1].value, gint_par(3));
}

TEST_F(CanonicalizationTest, BinaryOperandsKeepOrder) {
    Par minus1 = make_par(make_binary(BinaryOp::Minus, gint_par(5), gint_par(3)));
    Par minus2 = make_par(make_binary(BinaryOp::Minus, gint_par(3), gint_par(5)));

    expect_canonical_different(minus1, minus2);
}

TEST_F(CanonicalizationTest, MatchCasesKeepOrder) {
    Par m1 = make_par(make_match(gint_par(1), {
        make_case(gint_par(1), gstring_par("one"), 0),
        make_case(gint_par(2), gstring_par("two"), 0)}));
    Par m2 = make_par(make_match(gint_par(1), {
        make_case(gint_par(2), gstring_par("two"), 0),
        make_case(gint_par(1), gstring_par("one"), 0)}));

    expect_canonical_different(m1, m2);
}

TEST_F(CanonicalizationTest, BookkeepingIsNotScored) {
    Par p = gint_par(9);
    Par with_bookkeeping = p;
    with_bookkeeping.locally_free = BitSet{0, 4};
    with_bookkeeping.free_count = 2;

    EXPECT_NE(p, with_bookkeeping);
    expect_canonical_equal(p, with_bookkeeping);
}

TEST_F(CanonicalizationTest, DifferentKindsDiffer) {
    expect_canonical_different(gint_par(1), gstring_par("1"));
    expect_canonical_different(bound_par(0), make_par(make_eval(chan_var(bound_var(0)))));
    expect_canonical_different(
        make_par(make_send(quoted_int(0), {}, false)),
        make_par(make_send(quoted_int(0), {}, true)));
}

TEST_F(CanonicalizationTest, StdHashAgreesWithEquivalence) {
    std::hash<Par> hasher;
    EXPECT_EQ(hasher(sends_in_order({1, 2, 3})), hasher(sends_in_order({3, 2, 1})));

    std::unordered_set<Par> seen;
    seen.insert(sends_in_order({1, 2}));
    EXPECT_EQ(seen.count(sends_in_order({1, 2})), 1u);
}

TEST_F(CanonicalizationTest, UnforgeableNamesAreSorted) {
    Par p1 = ParBuilder().add(make_private("b")).add(make_private("a")).build();
    Par p2 = ParBuilder().add(make_private("a")).add(make_private("b")).build();

    Par canonical = canonicalizer.canonicalize(p1);
    ASSERT_EQ(canonical.ids.size(), 2u);
    EXPECT_EQ(canonical.ids[0].id, "a");
    EXPECT_EQ(canonical, canonicalizer.canonicalize(p2));
}
