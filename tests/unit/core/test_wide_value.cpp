/**
 * @file test_wide_value.cpp
 * @brief Plaintext limb encoding, WideValue and Operand tests
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

#include "test_util.h"

using namespace mpcint;
using mpcint_test::pow2;

class WideValueTest : public mpcint_test::BackendTest {};

// ============================================================================
// Encoding
// ============================================================================

TEST_F(WideValueTest, RangeBounds) {
    EXPECT_EQ(min_value(kUint8), 0);
    EXPECT_EQ(max_value(kUint8), 255);
    EXPECT_EQ(min_value(kInt8), -128);
    EXPECT_EQ(max_value(kInt8), 127);
    EXPECT_EQ(max_value(kUint256), pow2(256) - 1);
    EXPECT_EQ(min_value(kInt128), -pow2(127));
    EXPECT_TRUE(in_range(kInt64, mpz_class("-9223372036854775808")));
    EXPECT_FALSE(in_range(kInt64, mpz_class("9223372036854775808")));
}

TEST_F(WideValueTest, WrapTo) {
    EXPECT_EQ(wrap_to(kUint8, 300), 44);
    EXPECT_EQ(wrap_to(kUint8, -70), 186);
    EXPECT_EQ(wrap_to(kInt8, 128), -128);
    EXPECT_EQ(wrap_to(kInt8, -129), 127);
    EXPECT_EQ(wrap_to(kUint256, pow2(256)), 0);
}

TEST_F(WideValueTest, EncodeLittleEndianLimbs) {
    const mpz_class v = pow2(64) * 7 + 5;
    std::vector<uint64_t> limbs = encode_limbs(kUint128, v);
    ASSERT_EQ(limbs.size(), 2u);
    EXPECT_EQ(limbs[0], 5u);
    EXPECT_EQ(limbs[1], 7u);
    EXPECT_EQ(decode_limbs(kUint128, limbs), v);
}

TEST_F(WideValueTest, EncodeNegativeAsTwosComplement) {
    std::vector<uint64_t> limbs = encode_limbs(kInt128, -1);
    EXPECT_EQ(limbs[0], ~uint64_t(0));
    EXPECT_EQ(limbs[1], ~uint64_t(0));
    EXPECT_EQ(decode_limbs(kInt128, limbs), -1);

    std::vector<uint64_t> small = encode_limbs(kInt8, -1);
    ASSERT_EQ(small.size(), 1u);
    EXPECT_EQ(small[0], 0xFFu);
    EXPECT_EQ(decode_limbs(kInt8, small), -1);
}

TEST_F(WideValueTest, EncodeOutOfRangeRejected) {
    EXPECT_THROW(encode_limbs(kUint8, 256), std::out_of_range);
    EXPECT_THROW(encode_limbs(kUint64, -1), std::out_of_range);
    EXPECT_THROW(encode_limbs(kInt256, pow2(255)), std::out_of_range);
}

TEST_F(WideValueTest, DecodeIgnoresBitsAboveWidth) {
    EXPECT_EQ(decode_limbs(kUint8, {0x1FF}), 255);
    EXPECT_EQ(decode_limbs(kInt16, {0xABCD8000}), -32768);
    EXPECT_THROW(decode_limbs(kUint128, {1}), std::invalid_argument);
}

TEST_F(WideValueTest, SignificantLimbs) {
    EXPECT_EQ(significant_limbs_of(kUint256, encode_limbs(kUint256, 5)), 1u);
    EXPECT_EQ(significant_limbs_of(kUint256, encode_limbs(kUint256, pow2(130))), 3u);
    EXPECT_EQ(significant_limbs_of(kInt256, encode_limbs(kInt256, -5)), 1u);
    EXPECT_EQ(significant_limbs_of(kInt128, encode_limbs(kInt128, pow2(63))), 2u);
    EXPECT_EQ(significant_limbs_of(kInt128, encode_limbs(kInt128, -pow2(63))), 1u);
    EXPECT_EQ(significant_limbs_of(kUint256, encode_limbs(kUint256, 0)), 1u);
}

// ============================================================================
// WideValue / Operand
// ============================================================================

TEST_F(WideValueTest, ConstructorChecksLimbCount) {
    std::vector<SecretWord> one{be_.set_public(1)};
    EXPECT_THROW(WideValue bad(kUint128, one), std::invalid_argument);
    EXPECT_THROW(WideValue bad(kUint64, one, 0), std::invalid_argument);
    EXPECT_THROW(WideValue bad(kUint64, std::vector<SecretWord>{SecretWord()}), std::invalid_argument);

    WideValue v(kUint64, one);
    EXPECT_EQ(v.limb_count(), 1u);
    EXPECT_EQ(v.significant_limbs(), 1u);
    EXPECT_EQ(v.type(), kUint64);
}

TEST_F(WideValueTest, SetPublicCarriesMagnitudeBound) {
    WideValue small = set_public(be_, kUint256, 42);
    EXPECT_EQ(small.significant_limbs(), 1u);
    EXPECT_TRUE(small.fits_in_limbs(1));

    WideValue big = set_public(be_, kUint256, pow2(200));
    EXPECT_EQ(big.significant_limbs(), 4u);
    EXPECT_EQ(reveal(big), pow2(200));
}

TEST_F(WideValueTest, ValidatedInputHasFullBound) {
    WideValue v = secret(kUint256, 3);
    EXPECT_EQ(v.significant_limbs(), 4u);
    EXPECT_EQ(reveal(v), 3);
}

TEST_F(WideValueTest, OperandModes) {
    Operand s = secret(kUint32, 7);
    Operand p = pub(kUint32, 9);

    EXPECT_FALSE(s.is_public());
    EXPECT_TRUE(p.is_public());
    EXPECT_EQ(p.public_value(), 9);
    EXPECT_THROW(s.public_value(), std::logic_error);

    EXPECT_EQ(operand_mode(s, s), OperandMode::SecretSecret);
    EXPECT_EQ(operand_mode(p, s), OperandMode::PublicLhs);
    EXPECT_EQ(operand_mode(s, p), OperandMode::PublicRhs);
    EXPECT_EQ(operand_mode(p, p), OperandMode::PublicPublic);
    EXPECT_STREQ(operand_mode_name(OperandMode::PublicRhs), "public-rhs");
}

TEST_F(WideValueTest, PlainOperandOutOfRange) {
    EXPECT_THROW(Operand::plain(kInt8, 200), std::out_of_range);
    EXPECT_THROW(Operand::plain(kUint16, -1), std::out_of_range);
}
