/**
 * @file test_checked.cpp
 * @brief Overflow-checked add/sub/mul under both policies
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

class CheckedTest : public mpcint_test::BackendTest {
protected:
    void expect_flagged(const CheckedResult& r, IntType type, const mpz_class& exact,
                        const char* what) {
        EXPECT_EQ(reveal(r.value), wrap_to(type, exact)) << type.name() << " " << what;
        EXPECT_EQ(reveal(r.overflow), !in_range(type, exact)) << type.name() << " " << what;
    }
};

// ============================================================================
// Fixed Examples
// ============================================================================

TEST_F(CheckedTest, Uint8AddOverflowBit) {
    CheckedResult r = checked_add_with_overflow_bit(be_, secret(kUint8, 200), secret(kUint8, 100));
    EXPECT_EQ(reveal(r.value), 44);
    EXPECT_TRUE(reveal(r.overflow));

    CheckedResult ok = checked_add_with_overflow_bit(be_, secret(kUint8, 200), secret(kUint8, 55));
    EXPECT_EQ(reveal(ok.value), 255);
    EXPECT_FALSE(reveal(ok.overflow));
}

TEST_F(CheckedTest, Uint8SubBorrow) {
    CheckedResult r = checked_sub_with_overflow_bit(be_, secret(kUint8, 30), secret(kUint8, 100));
    EXPECT_EQ(reveal(r.value), 186);
    EXPECT_TRUE(reveal(r.overflow));
}

TEST_F(CheckedTest, HardFailThrows) {
    EXPECT_THROW(checked_add(be_, secret(kUint8, 200), secret(kUint8, 100)), ArithmeticOverflow);
    EXPECT_THROW(checked_sub(be_, secret(kUint64, 0), secret(kUint64, 1)), ArithmeticOverflow);
    EXPECT_THROW(checked_mul(be_, secret(kInt128, pow2(100)), secret(kInt128, pow2(30))),
                 ArithmeticOverflow);
    EXPECT_THROW(checked_add(be_, secret(kInt256, max_value(kInt256)), pub(kInt256, 1)),
                 ArithmeticOverflow);
}

TEST_F(CheckedTest, HardFailPassesInRange) {
    EXPECT_EQ(reveal(checked_add(be_, secret(kInt64, mpz_class("-8000000000")),
                                 secret(kInt64, 3000000000))),
              mpz_class("-5000000000"));
    EXPECT_EQ(reveal(checked_mul(be_, secret(kUint256, pow2(127)), secret(kUint256, pow2(128)))),
              pow2(255));
    EXPECT_EQ(reveal(checked_sub(be_, secret(kInt8, -100), secret(kInt8, 28))), -128);
}

TEST_F(CheckedTest, SignedMulEdges) {
    // MIN is reachable only with a negative result
    expect_flagged(checked_mul_with_overflow_bit(be_, secret(kInt8, -64), secret(kInt8, 2)),
                   kInt8, -128, "-64*2");
    expect_flagged(checked_mul_with_overflow_bit(be_, secret(kInt8, 64), secret(kInt8, 2)),
                   kInt8, 128, "64*2");
    expect_flagged(checked_mul_with_overflow_bit(be_, secret(kInt8, -128), secret(kInt8, -1)),
                   kInt8, 128, "MIN*-1");
    expect_flagged(checked_mul_with_overflow_bit(be_, secret(kInt8, -128), secret(kInt8, 1)),
                   kInt8, -128, "MIN*1");

    const mpz_class half = pow2(127);
    expect_flagged(checked_mul_with_overflow_bit(be_, secret(kInt256, -half), secret(kInt256, half)),
                   kInt256, -half * half, "-2^127*2^127");
    expect_flagged(checked_mul_with_overflow_bit(be_, secret(kInt256, half), secret(kInt256, half)),
                   kInt256, half * half, "2^127*2^127");
    expect_flagged(checked_mul_with_overflow_bit(be_, secret(kInt64, min_value(kInt64)),
                                                 secret(kInt64, -1)),
                   kInt64, -min_value(kInt64), "MIN64*-1");
}

TEST_F(CheckedTest, Int256SubMinMaxOverflows) {
    CheckedResult r = checked_sub_with_overflow_bit(be_, secret(kInt256, min_value(kInt256)),
                                                    secret(kInt256, max_value(kInt256)));
    EXPECT_EQ(reveal(r.value), 1);
    EXPECT_TRUE(reveal(r.overflow));
}

// ============================================================================
// Randomized Reference Checks
// ============================================================================

TEST_F(CheckedTest, OverflowBitMatchesRange) {
    for (const IntType& type : all_types()) {
        for (int i = 0; i < 10; ++i) {
            const mpz_class x = sample_mixed(type);
            const mpz_class y = sample_mixed(type);
            WideValue a = secret(type, x);
            WideValue b = secret(type, y);
            expect_flagged(checked_add_with_overflow_bit(be_, a, b), type, x + y, "add");
            expect_flagged(checked_sub_with_overflow_bit(be_, a, b), type, x - y, "sub");
            expect_flagged(checked_mul_with_overflow_bit(be_, a, b), type, x * y, "mul");
        }
    }
}

TEST_F(CheckedTest, PublicOperandModesAgree) {
    for (const IntType& type : all_types()) {
        const mpz_class x = sample_mixed(type);
        const mpz_class y = sample_mixed(type);
        expect_flagged(checked_mul_with_overflow_bit(be_, pub(type, x), secret(type, y)), type, x * y, "pl");
        expect_flagged(checked_mul_with_overflow_bit(be_, secret(type, x), pub(type, y)), type, x * y, "pr");
        expect_flagged(checked_add_with_overflow_bit(be_, pub(type, x), pub(type, y)), type, x + y, "pp");
        expect_flagged(checked_sub_with_overflow_bit(be_, pub(type, x), secret(type, y)), type, x - y, "pl");
    }
}

TEST_F(CheckedTest, OverflowMessageNamesType) {
    try {
        checked_add(be_, secret(kUint16, 65535), pub(kUint16, 1));
        FAIL() << "expected ArithmeticOverflow";
    } catch (const ArithmeticOverflow& e) {
        EXPECT_NE(std::string(e.what()).find("uint16"), std::string::npos);
        EXPECT_EQ(e.code(), MPCINT_ERROR_ARITHMETIC_OVERFLOW);
    }
}
