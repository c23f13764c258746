/**
 * @file checked.cpp
 * @brief Overflow-checked arithmetic
 *
 * Overflow conditions:
 * - unsigned add/sub: carry or borrow out of the top bit
 * - unsigned mul: any bit of the double-width product above the width
 * - signed add: sign(a) == sign(b) && sign(r) != sign(a)
 * - signed sub: sign(a) != sign(b) && sign(r) != sign(a)
 * - signed mul: |a|*|b| exceeds MAX, or MIN's magnitude with a positive sign
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include "mpcint/ops/checked.h"
#include "mpcint/core/error.h"

#include "arith_kernels.h"

namespace mpcint {

using detail::LimbView;
using detail::Limbs;
using detail::apply;

namespace {

struct Flagged {
    IntType type;
    Limbs value;
    size_t bound;
    WordArg overflow;
};

WordArg top_sign(WordBackend& be, const LimbView& v) {
    return detail::sign_bit(be, v.type, v.limbs, v.limbs.size());
}

Flagged add_flagged(WordBackend& be, const Operand& a, const Operand& b) {
    auto ab = detail::promote(be, a, b);
    const LimbView& va = ab.first;
    const LimbView& vb = ab.second;

    if (!va.type.is_signed) {
        WordArg carry = WordArg::plain(0);
        Limbs r = detail::add_kernel(be, va, vb, &carry);
        return Flagged{va.type, r, detail::sum_bound(va, vb), carry};
    }

    Limbs r = detail::add_kernel(be, va, vb, nullptr);
    WordArg sa = top_sign(be, va);
    WordArg sb = top_sign(be, vb);
    WordArg sr = detail::sign_bit(be, va.type, r, r.size());
    WordArg same_sign = detail::bool_not(be, detail::bool_xor(be, sa, sb));
    WordArg flipped = detail::bool_xor(be, sr, sa);
    return Flagged{va.type, r, r.size(), detail::bool_and(be, same_sign, flipped)};
}

Flagged sub_flagged(WordBackend& be, const Operand& a, const Operand& b) {
    auto ab = detail::promote(be, a, b);
    const LimbView& va = ab.first;
    const LimbView& vb = ab.second;

    if (!va.type.is_signed) {
        WordArg borrow = WordArg::plain(0);
        Limbs r = detail::sub_kernel(be, va, vb, &borrow);
        return Flagged{va.type, r, r.size(), borrow};
    }

    Limbs r = detail::sub_kernel(be, va, vb, nullptr);
    WordArg sa = top_sign(be, va);
    WordArg sb = top_sign(be, vb);
    WordArg sr = detail::sign_bit(be, va.type, r, r.size());
    WordArg differ = detail::bool_xor(be, sa, sb);
    WordArg flipped = detail::bool_xor(be, sr, sa);
    return Flagged{va.type, r, r.size(), detail::bool_and(be, differ, flipped)};
}

Flagged mul_flagged(WordBackend& be, const Operand& a, const Operand& b) {
    auto ab = detail::promote(be, a, b);
    const LimbView& va = ab.first;
    const LimbView& vb = ab.second;
    const IntType type = va.type;
    const size_t n = va.limbs.size();
    const Limbs zeros(n, WordArg::plain(0));

    if (!type.is_signed) {
        Limbs high;
        Limbs r = detail::mul_kernel(be, va, vb, &high);
        WordArg overflow = detail::ne_limbs(be, high, Limbs(high.size(), WordArg::plain(0)), high.size());
        return Flagged{type, r, detail::product_bound(va, vb), overflow};
    }

    WordArg sa = WordArg::plain(0);
    WordArg sb = WordArg::plain(0);
    const LimbView ma = detail::magnitude(be, va, &sa);
    const LimbView mb = detail::magnitude(be, vb, &sb);
    WordArg negative = detail::bool_xor(be, sa, sb);

    Limbs lo;
    WordArg overflow = WordArg::plain(0);
    if (type.bits() < MPCINT_LIMB_BITS) {
        // Magnitudes are at most 2^(w-1), so the word product is exact
        WordArg p = apply(be, WordOp::Mul, ma.limbs[0], mb.limbs[0]);
        const uint64_t max_positive = detail::low_mask(type.bits() - 1);
        WordArg limit = apply(be, WordOp::Add, WordArg::plain(max_positive), negative);
        overflow = apply(be, WordOp::Gt, p, limit);
        lo = Limbs{detail::normalize(be, type, p)};
    } else {
        Limbs high;
        lo = detail::mul_kernel(be, ma, mb, &high);
        WordArg high_set = detail::ne_limbs(be, high, zeros, n);

        // Low half above MAX is fine only as MIN's magnitude with a negative sign
        Limbs min_pattern(n, WordArg::plain(0));
        min_pattern[n - 1] = WordArg::plain(uint64_t(1) << 63);
        WordArg top = apply(be, WordOp::Shr, lo[n - 1], WordArg::plain(63));
        WordArg is_min = detail::eq_limbs(be, lo, min_pattern, n);
        WordArg allowed = detail::bool_and(be, negative, is_min);
        overflow = detail::bool_or(be, high_set,
                                   detail::bool_and(be, top, detail::bool_not(be, allowed)));
    }

    Limbs r = detail::select_limbs(be, negative, detail::negate_limbs(be, type, lo), lo);
    return Flagged{type, r, n, overflow};
}

CheckedResult to_result(WordBackend& be, const Flagged& f) {
    WideValue value = detail::finish(be, f.type, f.value, f.bound);
    return CheckedResult{value, SecretBool(detail::materialize(be, f.overflow))};
}

WideValue enforce(WordBackend& be, const Flagged& f, const char* op) {
    const uint64_t flag = f.overflow.is_public() ? f.overflow.value() : be.decrypt(f.overflow.word());
    if (flag != 0) {
        throw ArithmeticOverflow(std::string(op) + " overflows " + f.type.name());
    }
    return detail::finish(be, f.type, f.value, f.bound);
}

} // namespace

// ============================================================================
// Hard-Fail Policy
// ============================================================================

WideValue checked_add(WordBackend& be, const Operand& a, const Operand& b) {
    return enforce(be, add_flagged(be, a, b), "checked add");
}

WideValue checked_sub(WordBackend& be, const Operand& a, const Operand& b) {
    return enforce(be, sub_flagged(be, a, b), "checked sub");
}

WideValue checked_mul(WordBackend& be, const Operand& a, const Operand& b) {
    return enforce(be, mul_flagged(be, a, b), "checked mul");
}

// ============================================================================
// Flag-Returning Policy
// ============================================================================

CheckedResult checked_add_with_overflow_bit(WordBackend& be, const Operand& a, const Operand& b) {
    return to_result(be, add_flagged(be, a, b));
}

CheckedResult checked_sub_with_overflow_bit(WordBackend& be, const Operand& a, const Operand& b) {
    return to_result(be, sub_flagged(be, a, b));
}

CheckedResult checked_mul_with_overflow_bit(WordBackend& be, const Operand& a, const Operand& b) {
    return to_result(be, mul_flagged(be, a, b));
}

} // namespace mpcint
