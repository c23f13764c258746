/**
 * @file arith.cpp
 * @brief Wrapping arithmetic composed from 64-bit word primitives
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include "mpcint/ops/arith.h"

#include "arith_kernels.h"

#include <algorithm>

namespace mpcint {

namespace detail {

namespace {

LimbView one_limb_view(const LimbView& v) {
    return LimbView{kUint64, Limbs{v.limbs[0]}, 1, v.is_public};
}

Limbs low_half(const LimbView& v) {
    return Limbs{v.limbs[0], v.limbs[1]};
}

} // namespace

// ============================================================================
// Kernels
// ============================================================================

size_t sum_bound(const LimbView& a, const LimbView& b) {
    return std::min(a.limbs.size(), std::max(a.significant, b.significant) + 1);
}

size_t product_bound(const LimbView& a, const LimbView& b) {
    if (a.type.is_signed) {
        return a.limbs.size();
    }
    return std::min(a.limbs.size(), a.significant + b.significant);
}

Limbs add_kernel(WordBackend& be, const LimbView& a, const LimbView& b, WordArg* carry_out) {
    const size_t bits = a.type.bits();
    if (bits < MPCINT_LIMB_BITS) {
        // Masked operands: the w-bit carry is bit w of the word sum
        WordArg s = apply(be, WordOp::Add, a.limbs[0], b.limbs[0]);
        if (carry_out != nullptr) {
            *carry_out = apply(be, WordOp::Shr, s, WordArg::plain(bits));
        }
        return Limbs{normalize(be, a.type, s)};
    }
    return add_limbs(be, a.limbs, b.limbs, WordArg::plain(0), carry_out);
}

Limbs sub_kernel(WordBackend& be, const LimbView& a, const LimbView& b, WordArg* borrow_out) {
    if (a.type.is_signed) {
        LimbView neg{b.type, negate_limbs(be, b.type, b.limbs), b.limbs.size(), b.is_public};
        return add_kernel(be, a, neg, nullptr);
    }

    if (a.type.bits() < MPCINT_LIMB_BITS) {
        if (borrow_out != nullptr) {
            *borrow_out = apply(be, WordOp::Lt, a.limbs[0], b.limbs[0]);
        }
        WordArg d = apply(be, WordOp::Sub, a.limbs[0], b.limbs[0]);
        return Limbs{normalize(be, a.type, d)};
    }
    return sub_limbs(be, a.limbs, b.limbs, borrow_out);
}

Limbs mul_kernel(WordBackend& be, const LimbView& a, const LimbView& b, Limbs* high) {
    const size_t bits = a.type.bits();
    if (bits < MPCINT_LIMB_BITS) {
        // Operands below 2^32: the word product is exact
        WordArg p = apply(be, WordOp::Mul, a.limbs[0], b.limbs[0]);
        if (high != nullptr) {
            *high = Limbs{apply(be, WordOp::Shr, p, WordArg::plain(bits))};
        }
        return Limbs{normalize(be, a.type, p)};
    }

    const size_t n = a.limbs.size();
    if (high == nullptr) {
        if (n == 1) {
            return Limbs{apply(be, WordOp::Mul, a.limbs[0], b.limbs[0])};
        }
        return mul_limbs(be, a.limbs, b.limbs, n);
    }
    Limbs full = mul_limbs(be, a.limbs, b.limbs, 2 * n);
    *high = Limbs(full.begin() + static_cast<std::ptrdiff_t>(n), full.end());
    full.erase(full.begin() + static_cast<std::ptrdiff_t>(n), full.end());
    return full;
}

std::pair<Limbs, Limbs> udivrem(WordBackend& be, const LimbView& a, const LimbView& b,
                                bool want_quotient, bool want_remainder) {
    const size_t n = a.limbs.size();

    if (n == 1) {
        Limbs q{WordArg::plain(0)};
        Limbs r{WordArg::plain(0)};
        if (want_quotient) {
            q[0] = apply(be, WordOp::Div, a.limbs[0], b.limbs[0]);
        }
        if (want_remainder) {
            r[0] = apply(be, WordOp::Rem, a.limbs[0], b.limbs[0]);
        }
        return {std::move(q), std::move(r)};
    }

    if (n == 2) {
        if (a.significant <= 1 && b.significant <= 1) {
            auto qr = udivrem(be, one_limb_view(a), one_limb_view(b), want_quotient, want_remainder);
            qr.first.resize(2, WordArg::plain(0));
            qr.second.resize(2, WordArg::plain(0));
            return qr;
        }
        return reveal_divrem_limbs(be, a.type, a.limbs, b.limbs);
    }

    // 256 bits: low halves through the reveal kernel, high half of the result zero
    auto qr = reveal_divrem_limbs(be, kUint128, low_half(a), low_half(b));
    qr.first.resize(n, WordArg::plain(0));
    qr.second.resize(n, WordArg::plain(0));
    return qr;
}

std::pair<Limbs, Limbs> divrem(WordBackend& be, const LimbView& a, const LimbView& b,
                               bool want_quotient, bool want_remainder) {
    if (!a.type.is_signed) {
        return udivrem(be, a, b, want_quotient, want_remainder);
    }

    WordArg sa = WordArg::plain(0);
    WordArg sb = WordArg::plain(0);
    const LimbView ma = magnitude(be, a, &sa);
    const LimbView mb = magnitude(be, b, &sb);
    auto qr = udivrem(be, ma, mb, want_quotient, want_remainder);

    Limbs q = qr.first;
    Limbs r = qr.second;
    if (want_quotient) {
        WordArg negative = apply(be, WordOp::Xor, sa, sb);
        q = select_limbs(be, negative, negate_limbs(be, a.type, q), q);
    }
    if (want_remainder) {
        r = select_limbs(be, sa, negate_limbs(be, a.type, r), r);
    }
    return {std::move(q), std::move(r)};
}

} // namespace detail

using detail::LimbView;
using detail::Limbs;

// ============================================================================
// Ring Operations
// ============================================================================

WideValue add(WordBackend& be, const Operand& a, const Operand& b) {
    auto ab = detail::promote(be, a, b);
    Limbs r = detail::add_kernel(be, ab.first, ab.second, nullptr);
    return detail::finish(be, ab.first.type, r, detail::sum_bound(ab.first, ab.second));
}

WideValue sub(WordBackend& be, const Operand& a, const Operand& b) {
    auto ab = detail::promote(be, a, b);
    Limbs r = detail::sub_kernel(be, ab.first, ab.second, nullptr);
    return detail::finish(be, ab.first.type, r);
}

WideValue mul(WordBackend& be, const Operand& a, const Operand& b) {
    auto ab = detail::promote(be, a, b);
    Limbs r = detail::mul_kernel(be, ab.first, ab.second, nullptr);
    return detail::finish(be, ab.first.type, r, detail::product_bound(ab.first, ab.second));
}

WideValue negate(WordBackend& be, const Operand& a) {
    LimbView v = detail::view_of(a);
    Limbs r = detail::negate_limbs(be, v.type, v.limbs);
    const size_t bound = v.type.is_signed ? v.significant + 1 : v.limbs.size();
    return detail::finish(be, v.type, r, bound);
}

WideValue abs(WordBackend& be, const Operand& a) {
    LimbView v = detail::view_of(a);
    if (!v.type.is_signed) {
        return detail::finish(be, v.type, v.limbs, v.significant);
    }
    LimbView m = detail::magnitude(be, v, nullptr);
    return detail::finish(be, v.type, m.limbs, v.significant + 1);
}

// ============================================================================
// Division
// ============================================================================

WideValue div(WordBackend& be, const Operand& a, const Operand& b) {
    auto ab = detail::promote(be, a, b);
    auto qr = detail::divrem(be, ab.first, ab.second, true, false);
    const size_t bound = ab.first.type.is_signed ? ab.first.limbs.size() : ab.first.significant;
    return detail::finish(be, ab.first.type, qr.first, bound);
}

WideValue rem(WordBackend& be, const Operand& a, const Operand& b) {
    auto ab = detail::promote(be, a, b);
    auto qr = detail::divrem(be, ab.first, ab.second, false, true);
    const size_t bound = ab.first.type.is_signed
        ? ab.first.limbs.size()
        : std::min(ab.first.significant, ab.second.significant);
    return detail::finish(be, ab.first.type, qr.second, bound);
}

// ============================================================================
// Conversion
// ============================================================================

WideValue resize(WordBackend& be, const Operand& a, IntType target) {
    LimbView v = detail::view_of(a);
    Limbs r = detail::convert_limbs(be, v.limbs, v.type, target);

    const bool widening = target.bits() >= v.type.bits();
    const size_t bound = (widening && target.is_signed == v.type.is_signed)
        ? v.significant
        : target.limbs();
    return detail::finish(be, target, r, bound);
}

} // namespace mpcint
