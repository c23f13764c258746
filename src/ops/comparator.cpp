/**
 * @file comparator.cpp
 * @brief Comparisons of fixed-width secret integers
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include "mpcint/ops/comparator.h"

#include "limb_ops.h"

namespace mpcint {

using detail::LimbView;
using detail::Limbs;

namespace {

SecretBool to_bool(WordBackend& be, const WordArg& w) {
    return SecretBool(detail::materialize(be, w));
}

WideValue pick(WordBackend& be, const WordArg& cond, const LimbView& a, const LimbView& b) {
    Limbs r = detail::select_limbs(be, cond, a.limbs, b.limbs);
    return detail::finish(be, a.type, r, detail::compare_span(a, b));
}

} // namespace

SecretBool eq(WordBackend& be, const Operand& a, const Operand& b) {
    auto ab = detail::promote(be, a, b);
    const size_t k = detail::compare_span(ab.first, ab.second);
    return to_bool(be, detail::eq_limbs(be, ab.first.limbs, ab.second.limbs, k));
}

SecretBool ne(WordBackend& be, const Operand& a, const Operand& b) {
    auto ab = detail::promote(be, a, b);
    const size_t k = detail::compare_span(ab.first, ab.second);
    return to_bool(be, detail::ne_limbs(be, ab.first.limbs, ab.second.limbs, k));
}

SecretBool lt(WordBackend& be, const Operand& a, const Operand& b) {
    auto ab = detail::promote(be, a, b);
    return to_bool(be, detail::less_than(be, ab.first, ab.second, false));
}

SecretBool le(WordBackend& be, const Operand& a, const Operand& b) {
    auto ab = detail::promote(be, a, b);
    return to_bool(be, detail::less_than(be, ab.first, ab.second, true));
}

SecretBool gt(WordBackend& be, const Operand& a, const Operand& b) {
    auto ab = detail::promote(be, a, b);
    return to_bool(be, detail::less_than(be, ab.second, ab.first, false));
}

SecretBool ge(WordBackend& be, const Operand& a, const Operand& b) {
    auto ab = detail::promote(be, a, b);
    return to_bool(be, detail::less_than(be, ab.second, ab.first, true));
}

WideValue min(WordBackend& be, const Operand& a, const Operand& b) {
    auto ab = detail::promote(be, a, b);
    WordArg a_first = detail::less_than(be, ab.first, ab.second, true);
    return pick(be, a_first, ab.first, ab.second);
}

WideValue max(WordBackend& be, const Operand& a, const Operand& b) {
    auto ab = detail::promote(be, a, b);
    WordArg a_first = detail::less_than(be, ab.second, ab.first, true);
    return pick(be, a_first, ab.first, ab.second);
}

} // namespace mpcint
