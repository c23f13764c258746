/**
 * @file select.cpp
 * @brief Oblivious selection and secret boolean logic
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include "mpcint/ops/boolean.h"
#include "mpcint/ops/select.h"

#include "limb_ops.h"

#include <algorithm>

namespace mpcint {

namespace {

SecretBool combine(WordBackend& be, WordOp op, const SecretBool& a, const SecretBool& b) {
    return SecretBool(detail::materialize(be, detail::apply(be, op, a.word(), b.word())));
}

} // namespace

// ============================================================================
// Select
// ============================================================================

WideValue select(WordBackend& be, const SecretBool& cond, const Operand& a, const Operand& b) {
    auto ab = detail::promote(be, a, b);
    detail::Limbs r = detail::select_limbs(be, WordArg(cond.word()), ab.first.limbs, ab.second.limbs);
    const size_t bound = std::max(ab.first.significant, ab.second.significant);
    return detail::finish(be, ab.first.type, r, bound);
}

SecretBool select(WordBackend& be, const SecretBool& cond, const SecretBool& a, const SecretBool& b) {
    WordArg r = detail::select_word(be, WordArg(cond.word()), a.word(), b.word());
    return SecretBool(detail::materialize(be, r));
}

// ============================================================================
// Boolean Logic
// ============================================================================

SecretBool bool_and(WordBackend& be, const SecretBool& a, const SecretBool& b) {
    return combine(be, WordOp::And, a, b);
}

SecretBool bool_or(WordBackend& be, const SecretBool& a, const SecretBool& b) {
    return combine(be, WordOp::Or, a, b);
}

SecretBool bool_xor(WordBackend& be, const SecretBool& a, const SecretBool& b) {
    return combine(be, WordOp::Xor, a, b);
}

SecretBool bool_not(WordBackend& be, const SecretBool& a) {
    return SecretBool(detail::materialize(be, detail::bool_not(be, a.word())));
}

SecretBool bool_eq(WordBackend& be, const SecretBool& a, const SecretBool& b) {
    return combine(be, WordOp::Eq, a, b);
}

SecretBool bool_ne(WordBackend& be, const SecretBool& a, const SecretBool& b) {
    return combine(be, WordOp::Ne, a, b);
}

} // namespace mpcint
