#include <gtest/gtest.h>
#include <rho/substitute.hpp>
#include <rho/builders.hpp>
#include "test_helpers.hpp"

using namespace rho;
using namespace test_utils;

class ExprSubstitutionTest : public ::testing::Test {
protected:
    Substituter substituter;

    // b0 -> 40, b1 -> "k"
    Env env = Env::from_indices({{0, gint_par(40)}, {1, gstring_par("k")}});
};

TEST_F(ExprSubstitutionTest, GroundValuesPassThrough) {
    std::vector<Expr> ground = {gbool(true), gint(-3), gstring("s"), guri("rho:io:stdout")};
    for (const auto& e : ground) {
        EXPECT_EQ(substituter.substitute(e, env), e);
    }
}

TEST_F(ExprSubstitutionTest, BareVariableExpressionIsNotResolvedHere) {
    // Variable expressions are resolved by the enclosing Par, which splices them
    Expr e = evar(bound_var(0));
    EXPECT_EQ(substituter.substitute(e, env), e);
}

TEST_F(ExprSubstitutionTest, BinaryOperandsAreSubstituted) {
    Expr plus = make_binary(BinaryOp::Plus, bound_par(0), gint_par(2));

    Expr result = substituter.substitute(plus, env);

    const auto& binary = std::get<EBinary>(result.instance);
    EXPECT_EQ(binary.op, BinaryOp::Plus);
    EXPECT_EQ(*binary.p1, gint_par(40));
    EXPECT_EQ(*binary.p2, gint_par(2));
}

TEST_F(ExprSubstitutionTest, EveryBinaryOperatorIsRebuiltWithSameTag) {
    const BinaryOp ops[] = {
        BinaryOp::Mult, BinaryOp::Div, BinaryOp::Plus, BinaryOp::Minus,
        BinaryOp::Lt, BinaryOp::Lte, BinaryOp::Gt, BinaryOp::Gte,
        BinaryOp::Eq, BinaryOp::Neq, BinaryOp::And, BinaryOp::Or
    };

    for (BinaryOp op : ops) {
        Expr result = substituter.substitute(make_binary(op, gint_par(1), bound_par(0)), env);
        const auto& binary = std::get<EBinary>(result.instance);
        EXPECT_EQ(binary.op, op) << to_string(op);
        EXPECT_EQ(*binary.p2, gint_par(40)) << to_string(op);
    }
}

TEST_F(ExprSubstitutionTest, UnaryOperandIsSubstituted) {
    Expr negated = make_unary(UnaryOp::Neg, bound_par(0));
    Expr result = substituter.substitute(negated, env);

    const auto& unary = std::get<EUnary>(result.instance);
    EXPECT_EQ(unary.op, UnaryOp::Neg);
    EXPECT_EQ(*unary.p, gint_par(40));

    Expr inverted = substituter.substitute(make_unary(UnaryOp::Not, bound_par(5)), env);
    const Par& operand = *std::get<EUnary>(inverted.instance).p;
    ASSERT_EQ(operand.exprs.size(), 1u);
    EXPECT_EQ(operand.exprs[0], evar(bound_var(5)));
}

TEST_F(ExprSubstitutionTest, ListElementsKeepOrderAndMetadata) {
    Expr list = make_elist({bound_par(1), gint_par(7), bound_par(0)}, true);
    std::get<EList>(list.instance).free_count = 3;

    Expr result = substituter.substitute(list, env);

    const auto& elist = std::get<EList>(result.instance);
    ASSERT_EQ(elist.ps.size(), 3u);
    EXPECT_EQ(elist.ps[0], gstring_par("k"));
    EXPECT_EQ(elist.ps[1], gint_par(7));
    EXPECT_EQ(elist.ps[2], gint_par(40));
    EXPECT_EQ(elist.free_count, 3u);
    EXPECT_TRUE(elist.connective_used);
    EXPECT_TRUE(elist.locally_free.empty());
}

TEST_F(ExprSubstitutionTest, TupleElementsAreSubstituted) {
    Expr tuple = make_etuple({bound_par(0), bound_par(1)});
    Expr result = substituter.substitute(tuple, env);

    const auto& etuple = std::get<ETuple>(result.instance);
    ASSERT_EQ(etuple.ps.size(), 2u);
    EXPECT_EQ(etuple.ps[0], gint_par(40));
    EXPECT_EQ(etuple.ps[1], gstring_par("k"));
}

TEST_F(ExprSubstitutionTest, SetIsRecanonicalizedAfterSubstitution) {
    // b0 becomes 40, colliding with the literal 40
    Expr set = make_eset({bound_par(0), gint_par(40), gint_par(1)});
    Expr result = substituter.substitute(set, env);

    const auto& eset = std::get<ESet>(result.instance);
    ASSERT_EQ(eset.ps.size(), 2u);
    EXPECT_EQ(eset.ps[0], gint_par(1));
    EXPECT_EQ(eset.ps[1], gint_par(40));
}

TEST_F(ExprSubstitutionTest, MapKeysAndValuesAreSubstituted) {
    Expr map = make_emap({{bound_par(1), bound_par(0)}, {gstring_par("a"), gint_par(0)}});
    Expr result = substituter.substitute(map, env);

    const auto& emap = std::get<EMap>(result.instance);
    ASSERT_EQ(emap.kvs.size(), 2u);
    EXPECT_EQ(*emap.kvs[0].key, gstring_par("a"));
    EXPECT_EQ(*emap.kvs[0].value, gint_par(0));
    EXPECT_EQ(*emap.kvs[1].key, gstring_par("k"));
    EXPECT_EQ(*emap.kvs[1].value, gint_par(40));
}

TEST_F(ExprSubstitutionTest, CollectionLocallyFreeIsTrimmedToShift) {
    Expr list = make_elist({bound_par(0), bound_par(3)});
    ASSERT_EQ(std::get<EList>(list.instance).locally_free, (BitSet{0, 3}));

    Expr result = substituter.substitute(list, Env().shift(1));
    EXPECT_EQ(std::get<EList>(result.instance).locally_free, BitSet{0});
}

TEST_F(ExprSubstitutionTest, NestedExpressionsAreSubstitutedAllTheWayDown) {
    // [b0 * (b0 + 1)]
    Par sum = make_par(make_binary(BinaryOp::Plus, bound_par(0), gint_par(1)));
    Par product = make_par(make_binary(BinaryOp::Mult, bound_par(0), sum));
    Expr list = make_elist({product});

    Expr result = substituter.substitute(list, env);

    Par expected_sum = make_par(make_binary(BinaryOp::Plus, gint_par(40), gint_par(1)));
    Par expected = make_par(make_binary(BinaryOp::Mult, gint_par(40), expected_sum));
    const auto& elist = std::get<EList>(result.instance);
    ASSERT_EQ(elist.ps.size(), 1u);
    expect_canonical_equal(elist.ps[0], expected);
}

TEST_F(ExprSubstitutionTest, ExpressionInsideParIsSubstituted) {
    Par term = make_par(make_binary(BinaryOp::Eq, bound_par(1), gstring_par("k")));
    Par result = substituter.substitute(term, env);

    ASSERT_EQ(result.exprs.size(), 1u);
    const auto& eq = std::get<EBinary>(result.exprs[0].instance);
    EXPECT_EQ(*eq.p1, gstring_par("k"));
}

TEST_F(ExprSubstitutionTest, FreeVariableInsideCollectionIsIllegal) {
    Expr list = make_elist({make_par(evar(free_var(0)))});
    EXPECT_THROW(substituter.substitute(list, env), IllegalSubstitutionError);
}
