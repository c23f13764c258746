/**
 * @file test_division.cpp
 * @brief Width-dependent division and remainder
 *
 * 64-bit and narrower: one word primitive, zero divisor raises
 * DivisionByZero. 128-bit: word primitive when both operands provably fit
 * in one limb, otherwise the reduced-privacy reveal path where a zero
 * divisor yields 0. 256-bit: low 128-bit halves through the reveal path,
 * high half of the result is zero.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include <gtest/gtest.h>
#include <vector>

#include "test_util.h"

using namespace mpcint;
using mpcint_test::pow2;
using mpcint_test::tdiv_q;
using mpcint_test::tdiv_r;

class DivisionTest : public mpcint_test::BackendTest {};

// ============================================================================
// Word-Sized Types
// ============================================================================

TEST_F(DivisionTest, NarrowMatchesReference) {
    const IntType types[] = {kUint8, kUint16, kUint32, kUint64, kInt8, kInt16, kInt32, kInt64};
    for (const IntType& type : types) {
        for (int i = 0; i < 16; ++i) {
            const mpz_class x = sample_mixed(type);
            mpz_class y = sample_mixed(type);
            if (y == 0) {
                y = 3;
            }
            const mpz_class q = wrap_to(type, tdiv_q(x, y));
            const mpz_class r = tdiv_r(x, y);
            EXPECT_EQ(reveal(div(be_, secret(type, x), secret(type, y))), q)
                << type.name() << " " << x << " / " << y;
            EXPECT_EQ(reveal(rem(be_, secret(type, x), secret(type, y))), r)
                << type.name() << " " << x << " % " << y;
        }
    }
}

TEST_F(DivisionTest, SignedTruncatesTowardZero) {
    EXPECT_EQ(reveal(div(be_, secret(kInt32, -7), secret(kInt32, 2))), -3);
    EXPECT_EQ(reveal(rem(be_, secret(kInt32, -7), secret(kInt32, 2))), -1);
    EXPECT_EQ(reveal(div(be_, secret(kInt32, 7), secret(kInt32, -2))), -3);
    EXPECT_EQ(reveal(rem(be_, secret(kInt32, 7), secret(kInt32, -2))), 1);
    EXPECT_EQ(reveal(div(be_, secret(kInt8, -128), secret(kInt8, 3))), -42);
}

TEST_F(DivisionTest, SignedMinByMinusOneWraps) {
    EXPECT_EQ(reveal(div(be_, secret(kInt8, -128), secret(kInt8, -1))), -128);
    EXPECT_EQ(reveal(rem(be_, secret(kInt8, -128), secret(kInt8, -1))), 0);
    EXPECT_EQ(reveal(div(be_, secret(kInt64, min_value(kInt64)), secret(kInt64, -1))),
              min_value(kInt64));
}

TEST_F(DivisionTest, WordDivisionByZeroThrows) {
    EXPECT_THROW(div(be_, secret(kUint64, 10), secret(kUint64, 0)), DivisionByZero);
    EXPECT_THROW(rem(be_, secret(kInt16, 10), secret(kInt16, 0)), DivisionByZero);
    EXPECT_THROW(div(be_, secret(kUint8, 10), pub(kUint8, 0)), DivisionByZero);
}

// ============================================================================
// 128-bit
// ============================================================================

TEST_F(DivisionTest, Uint128LargeDividendExact) {
    const mpz_class x = pow2(127) + mpz_class("0x1234567890abcdef1234567890abcdef");
    const mpz_class y("18446744073709551557");
    EXPECT_EQ(reveal(div(be_, secret(kUint128, x), secret(kUint128, y))), tdiv_q(x, y));
    EXPECT_EQ(reveal(rem(be_, secret(kUint128, x), pub(kUint128, y))), tdiv_r(x, y));
}

TEST_F(DivisionTest, Int128MatchesReference) {
    for (int i = 0; i < 16; ++i) {
        const mpz_class x = sample_mixed(kInt128);
        mpz_class y = sample_mixed(kInt128);
        if (y == 0) {
            y = -5;
        }
        EXPECT_EQ(reveal(div(be_, secret(kInt128, x), secret(kInt128, y))),
                  wrap_to(kInt128, tdiv_q(x, y))) << x << " / " << y;
        EXPECT_EQ(reveal(rem(be_, secret(kInt128, x), secret(kInt128, y))), tdiv_r(x, y))
            << x << " % " << y;
    }
}

TEST_F(DivisionTest, Uint128RevealPathZeroDivisorYieldsZero) {
    WideValue a = secret(kUint128, pow2(100) + 17);
    WideValue z = secret(kUint128, 0);
    EXPECT_EQ(reveal(div(be_, a, z)), 0);
    EXPECT_EQ(reveal(rem(be_, a, z)), 0);
}

TEST_F(DivisionTest, Uint128SingleLimbOperandsUseWordPrimitive) {
    WideValue a = set_public(be_, kUint128, 1000);
    WideValue b = set_public(be_, kUint128, 7);
    be_.reset_stats();
    EXPECT_EQ(reveal(div(be_, a, b)), 142);
    EXPECT_EQ(be_.stats().count(WordOp::Div), 1u);

    WideValue z = set_public(be_, kUint128, 0);
    EXPECT_THROW(div(be_, a, z), DivisionByZero);
}

TEST_F(DivisionTest, RevealPathDecryptsOperands) {
    WideValue a = secret(kUint128, pow2(90));
    WideValue b = secret(kUint128, pow2(70));
    be_.reset_stats();
    WideValue q = div(be_, a, b);
    EXPECT_GT(be_.stats().decrypt, 0u);
    EXPECT_EQ(reveal(q), pow2(20));
}

TEST_F(DivisionTest, RevealDivRemDirect) {
    const mpz_class x = pow2(120) + 99;
    const mpz_class y = pow2(65) + 3;
    DivRem qr = reveal_divrem(be_, secret(kUint128, x), secret(kUint128, y));
    EXPECT_EQ(reveal(qr.quotient), tdiv_q(x, y));
    EXPECT_EQ(reveal(qr.remainder), tdiv_r(x, y));
}

// ============================================================================
// 256-bit
// ============================================================================

TEST_F(DivisionTest, Uint256UsesLowHalves) {
    const mpz_class x = pow2(200) + pow2(100) + 12345;
    const mpz_class y = pow2(64) + 1;
    const mpz_class xl = x % pow2(128);
    EXPECT_EQ(reveal(div(be_, secret(kUint256, x), secret(kUint256, y))), tdiv_q(xl, y));
    EXPECT_EQ(reveal(rem(be_, secret(kUint256, x), secret(kUint256, y))), tdiv_r(xl, y));
}

TEST_F(DivisionTest, Uint256SmallOperandsExact) {
    const mpz_class x("123456789012345678901234567890");
    EXPECT_EQ(reveal(div(be_, secret(kUint256, x), secret(kUint256, 1000))), x / 1000);
    EXPECT_EQ(reveal(rem(be_, secret(kUint256, x), pub(kUint256, 1000))), x % 1000);
}

TEST_F(DivisionTest, Uint256HighHalfOfResultIsZero) {
    // Divisor 1 would give the full dividend; only the low half survives
    const mpz_class x = pow2(255) + pow2(130) + 5;
    EXPECT_EQ(reveal(div(be_, secret(kUint256, x), secret(kUint256, 1))), 5);
}

TEST_F(DivisionTest, Int256SmallOperands) {
    EXPECT_EQ(reveal(div(be_, secret(kInt256, -1000001), secret(kInt256, 1000))), -1000);
    EXPECT_EQ(reveal(rem(be_, secret(kInt256, -1000001), secret(kInt256, 1000))), -1);
}

TEST_F(DivisionTest, Uint256ZeroDivisorYieldsZero) {
    WideValue a = secret(kUint256, pow2(100) + 1);
    EXPECT_EQ(reveal(div(be_, a, secret(kUint256, 0))), 0);
    EXPECT_EQ(reveal(rem(be_, a, secret(kUint256, 0))), 0);
}

TEST_F(DivisionTest, Wide256ZeroDivisorYieldsZeroForEveryOperandSource) {
    // Tight magnitude bounds must not route 256-bit division to the word primitive
    for (const IntType& type : {kUint256, kInt256}) {
        const std::vector<Operand> dividends = {secret(type, 5), set_public(be_, type, 5), pub(type, 5)};
        const std::vector<Operand> divisors = {secret(type, 0), set_public(be_, type, 0), pub(type, 0)};
        for (const Operand& a : dividends) {
            for (const Operand& b : divisors) {
                EXPECT_EQ(reveal(div(be_, a, b)), 0) << type.name();
                EXPECT_EQ(reveal(rem(be_, a, b)), 0) << type.name();
            }
        }
    }
}

TEST_F(DivisionTest, Wide256NeverUsesWordDivision) {
    WideValue a = set_public(be_, kUint256, 1000);
    WideValue b = set_public(be_, kUint256, 7);
    be_.reset_stats();
    WideValue q = div(be_, a, b);
    EXPECT_EQ(be_.stats().count(WordOp::Div), 0u);
    EXPECT_GT(be_.stats().decrypt, 0u);
    EXPECT_EQ(reveal(q), 142);
}
