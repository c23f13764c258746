/**
 * @file checked.h
 * @brief Overflow-checked arithmetic
 *
 * Each operation computes the wrapped result plus a secret overflow flag,
 * set exactly when the mathematical result lies outside the range of the
 * operand type. Two policies:
 *
 * - checked_add / checked_sub / checked_mul reveal the flag and throw
 *   ArithmeticOverflow when it is set
 * - ..._with_overflow_bit never fail and hand the flag to the caller
 *
 * The LHS/RHS public variants are obtained by passing Operand::plain on
 * that side; numeric semantics do not change.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef MPCINT_OPS_CHECKED_H
#define MPCINT_OPS_CHECKED_H

#include "mpcint/core/wide_value.h"
#include "mpcint/core/word_backend.h"

namespace mpcint {

/**
 * @brief Wrapped result and its secret overflow flag
 */
struct CheckedResult {
    WideValue value;
    SecretBool overflow;
};

// ============================================================================
// Hard-Fail Policy
// ============================================================================

/** @throws ArithmeticOverflow if a + b is not representable */
WideValue checked_add(WordBackend& be, const Operand& a, const Operand& b);

/** @throws ArithmeticOverflow if a - b is not representable */
WideValue checked_sub(WordBackend& be, const Operand& a, const Operand& b);

/** @throws ArithmeticOverflow if a * b is not representable */
WideValue checked_mul(WordBackend& be, const Operand& a, const Operand& b);

// ============================================================================
// Flag-Returning Policy
// ============================================================================

CheckedResult checked_add_with_overflow_bit(WordBackend& be, const Operand& a, const Operand& b);

CheckedResult checked_sub_with_overflow_bit(WordBackend& be, const Operand& a, const Operand& b);

CheckedResult checked_mul_with_overflow_bit(WordBackend& be, const Operand& a, const Operand& b);

} // namespace mpcint

#endif // MPCINT_OPS_CHECKED_H
