/**
 * @file limb_ops.h
 * @brief Internal limb-vector composition shared by all operation units
 *
 * Limb vectors are little-endian sequences of WordArg, so a limb may be a
 * secret handle or a public word. apply() evaluates public-public calls
 * locally and resolves algebraic identities (x + 0, x & 0, x < x, ...)
 * without a backend call. Those decisions depend only on public data, so
 * the backend call sequence of an operation is a function of the operand
 * types, bounds and public constants, never of secret contents.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#ifndef MPCINT_OPS_LIMB_OPS_H
#define MPCINT_OPS_LIMB_OPS_H

#include "mpcint/core/wide_value.h"
#include "mpcint/core/word_backend.h"

#include <utility>
#include <vector>

namespace mpcint {
namespace detail {

using Limbs = std::vector<WordArg>;

/**
 * @brief Operand after type promotion: limbs plus public magnitude bound
 */
struct LimbView {
    IntType type;
    Limbs limbs;
    size_t significant;
    bool is_public;
};

/** @brief Mask of the low bits of a word (bits >= 64 gives all ones) */
inline uint64_t low_mask(size_t bits) noexcept {
    return bits >= 64 ? ~uint64_t(0) : ((uint64_t(1) << bits) - 1);
}

// ============================================================================
// Word Level
// ============================================================================

/** @brief One primitive, folded when public data decides the result */
WordArg apply(WordBackend& be, WordOp op, const WordArg& a, const WordArg& b);

/** @brief cond ? a : b on words; cond holds 0 or 1 */
WordArg select_word(WordBackend& be, const WordArg& cond, const WordArg& a, const WordArg& b);

/** @brief Secret handle for a word argument (injects public words) */
SecretWord materialize(WordBackend& be, const WordArg& arg);

inline WordArg bool_and(WordBackend& be, const WordArg& a, const WordArg& b) {
    return apply(be, WordOp::And, a, b);
}
inline WordArg bool_or(WordBackend& be, const WordArg& a, const WordArg& b) {
    return apply(be, WordOp::Or, a, b);
}
inline WordArg bool_xor(WordBackend& be, const WordArg& a, const WordArg& b) {
    return apply(be, WordOp::Xor, a, b);
}
inline WordArg bool_not(WordBackend& be, const WordArg& a) {
    return apply(be, WordOp::Xor, a, WordArg::plain(1));
}

// ============================================================================
// Views and Results
// ============================================================================

/** @brief Limb view of an operand in its own type */
LimbView view_of(const Operand& op);

/**
 * @brief Bring two operands to a common type
 *
 * Equal signedness is required; the narrower operand is extended to the
 * wider width.
 *
 * @throws std::invalid_argument on mixed signedness
 */
std::pair<LimbView, LimbView> promote(WordBackend& be, const Operand& a, const Operand& b);

/**
 * @brief Materialize limbs into a WideValue
 * @param bound Caller-known magnitude bound; unsigned results are further
 *              tightened by public zero limbs at the top
 */
WideValue finish(WordBackend& be, IntType type, const Limbs& limbs, size_t bound);

/** @brief finish() with no caller-known bound */
WideValue finish(WordBackend& be, IntType type, const Limbs& limbs);

// ============================================================================
// Limb Algorithms
// ============================================================================

/** @brief Clear bits above a sub-64 width (no-op for wide types) */
WordArg normalize(WordBackend& be, IntType type, const WordArg& word);

/** @brief Sign bit (0/1) of a value sign-extended from its low k limbs */
WordArg sign_bit(WordBackend& be, IntType type, const Limbs& limbs, size_t k);

/** @brief 0 or all-ones word from a 0/1 sign bit */
WordArg sign_fill(WordBackend& be, const WordArg& sign);

/**
 * @brief Ripple-carry addition, least significant limb first
 * @param carry_out Receives the carry out of the top limb when non-null
 */
Limbs add_limbs(WordBackend& be, const Limbs& a, const Limbs& b,
                const WordArg& carry_in, WordArg* carry_out);

/**
 * @brief Ripple-borrow subtraction, least significant limb first
 * @param borrow_out Receives the borrow out of the top limb when non-null
 */
Limbs sub_limbs(WordBackend& be, const Limbs& a, const Limbs& b, WordArg* borrow_out);

/** @brief Two's complement negation: bitwise not, plus one, wrapped */
Limbs negate_limbs(WordBackend& be, IntType type, const Limbs& a);

/** @brief Limb-wise oblivious selection */
Limbs select_limbs(WordBackend& be, const WordArg& cond, const Limbs& a, const Limbs& b);

/**
 * @brief Schoolbook product truncated to out_limbs limbs
 *
 * Limbs are split into 32-bit digits so each word product is exact;
 * partial products are accumulated with add_limbs.
 */
Limbs mul_limbs(WordBackend& be, const Limbs& a, const Limbs& b, size_t out_limbs);

/** @brief Change width: zero/sign extension or truncation mod 2^width */
Limbs convert_limbs(WordBackend& be, const Limbs& limbs, IntType from, IntType to);

/** @brief Magnitude of a signed view, as an unsigned view of equal width */
LimbView magnitude(WordBackend& be, const LimbView& v, WordArg* sign_out);

// ============================================================================
// Comparison Kernels
// ============================================================================

/** @brief AND of limb-wise equality over the low k limbs */
WordArg eq_limbs(WordBackend& be, const Limbs& a, const Limbs& b, size_t k);

/** @brief OR of limb-wise inequality over the low k limbs */
WordArg ne_limbs(WordBackend& be, const Limbs& a, const Limbs& b, size_t k);

/** @brief Unsigned a < b (or a <= b) over the low k limbs */
WordArg ult_limbs(WordBackend& be, const Limbs& a, const Limbs& b, size_t k, bool or_equal);

/** @brief Signed/unsigned a < b (or <=) of two promoted views */
WordArg less_than(WordBackend& be, const LimbView& a, const LimbView& b, bool or_equal);

/** @brief Number of low limbs a comparison of a and b must examine */
inline size_t compare_span(const LimbView& a, const LimbView& b) noexcept {
    return a.significant > b.significant ? a.significant : b.significant;
}

} // namespace detail
} // namespace mpcint

#endif // MPCINT_OPS_LIMB_OPS_H
