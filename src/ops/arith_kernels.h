/**
 * @file arith_kernels.h
 * @brief Width-aware add/sub/mul/divide kernels over promoted limb views
 *
 * Shared by the unchecked and the overflow-checked entry points.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#ifndef MPCINT_OPS_ARITH_KERNELS_H
#define MPCINT_OPS_ARITH_KERNELS_H

#include "limb_ops.h"

#include <utility>

namespace mpcint {
namespace detail {

/**
 * @brief Wrapped sum
 * @param carry_out Unsigned carry out of the top bit when non-null
 */
Limbs add_kernel(WordBackend& be, const LimbView& a, const LimbView& b, WordArg* carry_out);

/**
 * @brief Wrapped difference (unsigned borrow chain, signed a + (-b))
 * @param borrow_out Unsigned borrow out of the top bit when non-null
 */
Limbs sub_kernel(WordBackend& be, const LimbView& a, const LimbView& b, WordArg* borrow_out);

/**
 * @brief Wrapped product of the bit patterns
 * @param high Receives the bits above the width when non-null
 */
Limbs mul_kernel(WordBackend& be, const LimbView& a, const LimbView& b, Limbs* high);

/** @brief Magnitude bound of a wrapped sum */
size_t sum_bound(const LimbView& a, const LimbView& b);

/** @brief Magnitude bound of a wrapped product */
size_t product_bound(const LimbView& a, const LimbView& b);

/**
 * @brief Unsigned quotient and remainder, dispatched on width
 *
 * - one limb: backend div/rem, a zero divisor raises DivisionByZero
 * - 128 bits: 64-bit primitive when both operands fit one limb,
 *   otherwise reveal_divrem_limbs()
 * - 256 bits: reveal_divrem_limbs() on the low 128-bit halves; high half zero
 */
std::pair<Limbs, Limbs> udivrem(WordBackend& be, const LimbView& a, const LimbView& b,
                                bool want_quotient, bool want_remainder);

/**
 * @brief Truncating quotient and remainder for either signedness
 */
std::pair<Limbs, Limbs> divrem(WordBackend& be, const LimbView& a, const LimbView& b,
                               bool want_quotient, bool want_remainder);

/**
 * @brief Reduced-privacy unsigned division: reveal, divide, re-inject
 *
 * A zero divisor yields quotient 0 and remainder 0.
 */
std::pair<Limbs, Limbs> reveal_divrem_limbs(WordBackend& be, IntType type,
                                            const Limbs& a, const Limbs& b);

} // namespace detail
} // namespace mpcint

#endif // MPCINT_OPS_ARITH_KERNELS_H
