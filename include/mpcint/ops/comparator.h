/**
 * @file comparator.h
 * @brief Comparisons of fixed-width secret integers
 *
 * eq/ne fold limb-wise equality with AND/OR. Ordering compares limbs from
 * the most significant one down; signed ordering first compares the sign
 * bits and falls back to the unsigned comparison when they agree. Limbs
 * above both operands' magnitude bounds are skipped.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef MPCINT_OPS_COMPARATOR_H
#define MPCINT_OPS_COMPARATOR_H

#include "mpcint/core/wide_value.h"
#include "mpcint/core/word_backend.h"

namespace mpcint {

SecretBool eq(WordBackend& be, const Operand& a, const Operand& b);
SecretBool ne(WordBackend& be, const Operand& a, const Operand& b);
SecretBool lt(WordBackend& be, const Operand& a, const Operand& b);
SecretBool le(WordBackend& be, const Operand& a, const Operand& b);
SecretBool gt(WordBackend& be, const Operand& a, const Operand& b);
SecretBool ge(WordBackend& be, const Operand& a, const Operand& b);

/** @brief select(le(a, b), a, b) */
WideValue min(WordBackend& be, const Operand& a, const Operand& b);

/** @brief select(ge(a, b), a, b) */
WideValue max(WordBackend& be, const Operand& a, const Operand& b);

} // namespace mpcint

#endif // MPCINT_OPS_COMPARATOR_H
