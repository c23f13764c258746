/**
 * @file test_word_backend.cpp
 * @brief 64-bit word primitive semantics
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include <gtest/gtest.h>
#include <limits>
#include <string>

#include "mpcint/mpcint.h"

using namespace mpcint;

namespace {
constexpr uint64_t kMax = std::numeric_limits<uint64_t>::max();
}

// ============================================================================
// eval_word_op
// ============================================================================

TEST(WordPrimitiveTest, ArithmeticWraps) {
    EXPECT_EQ(eval_word_op(WordOp::Add, kMax, 2), 1u);
    EXPECT_EQ(eval_word_op(WordOp::Sub, 1, 2), kMax);
    EXPECT_EQ(eval_word_op(WordOp::Mul, uint64_t(1) << 63, 2), 0u);
    EXPECT_EQ(eval_word_op(WordOp::Div, 100, 7), 14u);
    EXPECT_EQ(eval_word_op(WordOp::Rem, 100, 7), 2u);
}

TEST(WordPrimitiveTest, DivisionByZeroThrows) {
    EXPECT_THROW(eval_word_op(WordOp::Div, 5, 0), DivisionByZero);
    EXPECT_THROW(eval_word_op(WordOp::Rem, 5, 0), DivisionByZero);
}

TEST(WordPrimitiveTest, ShiftsSaturateAtWordWidth) {
    EXPECT_EQ(eval_word_op(WordOp::Shl, 1, 63), uint64_t(1) << 63);
    EXPECT_EQ(eval_word_op(WordOp::Shl, 1, 64), 0u);
    EXPECT_EQ(eval_word_op(WordOp::Shr, kMax, 64), 0u);
    EXPECT_EQ(eval_word_op(WordOp::Shr, kMax, 200), 0u);
    EXPECT_EQ(eval_word_op(WordOp::Shr, 0x80, 7), 1u);
}

TEST(WordPrimitiveTest, ComparisonsYieldZeroOrOne) {
    EXPECT_EQ(eval_word_op(WordOp::Eq, 3, 3), 1u);
    EXPECT_EQ(eval_word_op(WordOp::Ne, 3, 3), 0u);
    EXPECT_EQ(eval_word_op(WordOp::Lt, 2, kMax), 1u);
    EXPECT_EQ(eval_word_op(WordOp::Le, kMax, kMax), 1u);
    EXPECT_EQ(eval_word_op(WordOp::Gt, 2, kMax), 0u);
    EXPECT_EQ(eval_word_op(WordOp::Ge, 2, 3), 0u);
}

TEST(WordPrimitiveTest, Bitwise) {
    EXPECT_EQ(eval_word_op(WordOp::And, 0xF0F0, 0xFF00), 0xF000u);
    EXPECT_EQ(eval_word_op(WordOp::Or, 0xF0F0, 0xFF00), 0xFFF0u);
    EXPECT_EQ(eval_word_op(WordOp::Xor, 0xF0F0, 0xFF00), 0x0FF0u);
}

TEST(WordPrimitiveTest, OpNames) {
    EXPECT_STREQ(word_op_name(WordOp::Add), "add");
    EXPECT_STREQ(word_op_name(WordOp::Ge), "ge");
}

// ============================================================================
// WordArg
// ============================================================================

TEST(WordPrimitiveTest, WordArgKinds) {
    WordArg p = WordArg::plain(77);
    EXPECT_TRUE(p.is_public());
    EXPECT_EQ(p.value(), 77u);

    WordArg s = SecretWord(5);
    EXPECT_FALSE(s.is_public());
    EXPECT_EQ(s.word().handle(), 5u);
}
