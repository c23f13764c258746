/**
 * @file test_select.cpp
 * @brief Oblivious select and boolean logic on secret booleans
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include <gtest/gtest.h>

#include "test_util.h"

using namespace mpcint;
using mpcint_test::all_types;
using mpcint_test::pow2;

class SelectTest : public mpcint_test::BackendTest {
protected:
    SecretBool secret_bool(bool v) {
        return validate_bool(be_, backend::encrypt_input_word(config_, v ? 1 : 0));
    }
};

// ============================================================================
// Integer Select
// ============================================================================

TEST_F(SelectTest, PicksByCondition) {
    for (const IntType& type : all_types()) {
        const mpz_class lo = min_value(type);
        const mpz_class hi = max_value(type);
        EXPECT_EQ(reveal(select(be_, secret_bool(true), secret(type, lo), secret(type, hi))), lo)
            << type.name();
        EXPECT_EQ(reveal(select(be_, secret_bool(false), secret(type, lo), secret(type, hi))), hi)
            << type.name();
    }
}

TEST_F(SelectTest, CallCountIndependentOfCondition) {
    WideValue a = secret(kInt256, min_value(kInt256));
    WideValue b = secret(kInt256, max_value(kInt256));
    SecretBool t = secret_bool(true);
    SecretBool f = secret_bool(false);

    be_.reset_stats();
    WideValue r1 = select(be_, t, a, b);
    const uint64_t cost_true = be_.stats().total();

    be_.reset_stats();
    WideValue r2 = select(be_, f, a, b);
    EXPECT_EQ(be_.stats().total(), cost_true);
    EXPECT_EQ(be_.stats().mux, 4u);

    EXPECT_EQ(reveal(r1), min_value(kInt256));
    EXPECT_EQ(reveal(r2), max_value(kInt256));
}

TEST_F(SelectTest, PublicBranches) {
    SecretBool c = secret_bool(true);
    EXPECT_EQ(reveal(select(be_, c, pub(kUint128, pow2(100)), secret(kUint128, 3))), pow2(100));
    EXPECT_EQ(reveal(select(be_, c, pub(kUint32, 5), pub(kUint32, 6))), 5);

    SecretBool n = secret_bool(false);
    EXPECT_EQ(reveal(select(be_, n, pub(kInt64, -1), pub(kInt64, -2))), -2);
}

TEST_F(SelectTest, MixedWidthBranchesPromote) {
    SecretBool c = secret_bool(false);
    WideValue r = select(be_, c, secret(kInt8, -3), secret(kInt128, -pow2(100)));
    EXPECT_EQ(r.type(), kInt128);
    EXPECT_EQ(reveal(r), -pow2(100));
}

// ============================================================================
// Boolean Logic
// ============================================================================

TEST_F(SelectTest, BooleanTruthTables) {
    for (int x = 0; x < 2; ++x) {
        for (int y = 0; y < 2; ++y) {
            SecretBool a = secret_bool(x != 0);
            SecretBool b = secret_bool(y != 0);
            EXPECT_EQ(reveal(bool_and(be_, a, b)), (x & y) != 0);
            EXPECT_EQ(reveal(bool_or(be_, a, b)), (x | y) != 0);
            EXPECT_EQ(reveal(bool_xor(be_, a, b)), (x ^ y) != 0);
            EXPECT_EQ(reveal(bool_eq(be_, a, b)), x == y);
            EXPECT_EQ(reveal(bool_ne(be_, a, b)), x != y);
            EXPECT_EQ(reveal(select(be_, a, b, bool_not(be_, b))), x ? y != 0 : y == 0);
        }
        EXPECT_EQ(reveal(bool_not(be_, secret_bool(x != 0))), x == 0);
    }
}

TEST_F(SelectTest, ComparisonResultsCompose) {
    WideValue a = secret(kInt64, -10);
    WideValue b = secret(kInt64, 20);
    SecretBool in_range = bool_and(be_, lt(be_, a, b), gt(be_, a, pub(kInt64, -11)));
    EXPECT_TRUE(reveal(in_range));
    EXPECT_EQ(reveal(select(be_, in_range, a, b)), -10);
}

TEST_F(SelectTest, NonzeroWordReadsAsTrue) {
    SecretBool b = validate_bool(be_, backend::encrypt_input_word(config_, 42));
    EXPECT_TRUE(reveal(b));
    EXPECT_EQ(reveal(bool_and(be_, b, secret_bool(true))), true);
}

TEST_F(SelectTest, PublicBool) {
    EXPECT_TRUE(reveal(set_public(be_, true)));
    EXPECT_FALSE(reveal(set_public(be_, false)));
}
