/**
 * @file arith.h
 * @brief Wrapping arithmetic on fixed-width secret integers
 *
 * Every result equals the exact result reduced modulo 2^width. Either
 * operand may be a public constant (Operand::plain); operands of the same
 * signedness but different widths are promoted to the wider width.
 *
 * Division is width dependent:
 * - width <= 64: one backend div/rem; a zero divisor raises DivisionByZero
 * - width 128: the 64-bit primitive when both operands provably fit in one
 *   limb, otherwise the reduced-privacy path of reveal_division.h, which
 *   returns 0 for a zero divisor
 * - width 256: the 128-bit routine on the low halves; the high half of the
 *   result is always zero
 *
 * Signed division truncates toward zero; the remainder takes the sign of
 * the dividend and MIN / -1 wraps to MIN.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef MPCINT_OPS_ARITH_H
#define MPCINT_OPS_ARITH_H

#include "mpcint/core/wide_value.h"
#include "mpcint/core/word_backend.h"

namespace mpcint {

// ============================================================================
// Ring Operations
// ============================================================================

/** @brief a + b mod 2^width */
WideValue add(WordBackend& be, const Operand& a, const Operand& b);

/** @brief a - b mod 2^width */
WideValue sub(WordBackend& be, const Operand& a, const Operand& b);

/**
 * @brief a * b mod 2^width
 *
 * The privacy variants secret x secret, public x secret and secret x public
 * are selected by passing Operand::plain on the revealed side.
 */
WideValue mul(WordBackend& be, const Operand& a, const Operand& b);

/** @brief Two's complement negation (negate(MIN) == MIN) */
WideValue negate(WordBackend& be, const Operand& a);

/**
 * @brief Absolute value of a signed integer (abs(MIN) == MIN)
 * @note Unsigned operands are returned unchanged.
 */
WideValue abs(WordBackend& be, const Operand& a);

// ============================================================================
// Division
// ============================================================================

/**
 * @brief Quotient a / b
 * @throws DivisionByZero for a zero divisor on the <= 64-bit path
 */
WideValue div(WordBackend& be, const Operand& a, const Operand& b);

/**
 * @brief Remainder a % b
 * @throws DivisionByZero for a zero divisor on the <= 64-bit path
 */
WideValue rem(WordBackend& be, const Operand& a, const Operand& b);

// ============================================================================
// Conversion
// ============================================================================

/**
 * @brief Convert to another width
 *
 * Widening zero-extends unsigned and sign-extends signed sources;
 * narrowing keeps the low bits (mod 2^width of the target).
 */
WideValue resize(WordBackend& be, const Operand& a, IntType target);

} // namespace mpcint

#endif // MPCINT_OPS_ARITH_H
