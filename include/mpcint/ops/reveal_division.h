/**
 * @file reveal_division.h
 * @brief Reduced-privacy division: reveal operands, divide in the clear
 *
 * WARNING: this algorithm decrypts both operands through the backend,
 * computes the quotient and remainder locally and injects them back as
 * secret values. The plaintexts become visible to whoever observes the
 * backend's decryptions. It is the path div()/rem() take for 128-bit
 * operands that do not fit in one limb, and for the low halves of 256-bit
 * operands.
 *
 * Unlike the 64-bit primitive, a zero divisor does not fail: quotient and
 * remainder are both 0.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef MPCINT_OPS_REVEAL_DIVISION_H
#define MPCINT_OPS_REVEAL_DIVISION_H

#include "mpcint/core/wide_value.h"
#include "mpcint/core/word_backend.h"

namespace mpcint {

/**
 * @brief Quotient and remainder pair
 */
struct DivRem {
    WideValue quotient;
    WideValue remainder;
};

/**
 * @brief Truncating division of two revealed operands
 *
 * Operands are promoted as for div(); signed operands divide toward zero.
 */
DivRem reveal_divrem(WordBackend& be, const Operand& a, const Operand& b);

} // namespace mpcint

#endif // MPCINT_OPS_REVEAL_DIVISION_H
