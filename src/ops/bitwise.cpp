/**
 * @file bitwise.cpp
 * @brief Bitwise logic and shifts on fixed-width secret integers
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include "mpcint/ops/bitwise.h"

#include "limb_ops.h"

#include <algorithm>
#include <stdexcept>

namespace mpcint {

using detail::LimbView;
using detail::Limbs;
using detail::apply;

namespace {

WideValue limbwise(WordBackend& be, WordOp op, const Operand& a, const Operand& b) {
    auto ab = detail::promote(be, a, b);
    const LimbView& va = ab.first;
    const LimbView& vb = ab.second;

    Limbs r;
    r.reserve(va.limbs.size());
    for (size_t i = 0; i < va.limbs.size(); ++i) {
        r.push_back(apply(be, op, va.limbs[i], vb.limbs[i]));
    }
    return detail::finish(be, va.type, r, std::max(va.significant, vb.significant));
}

void check_amount(int64_t amount) {
    if (amount < 0) {
        throw std::invalid_argument("Shift amount must be non-negative");
    }
}

} // namespace

// ============================================================================
// Logic
// ============================================================================

WideValue bit_and(WordBackend& be, const Operand& a, const Operand& b) {
    return limbwise(be, WordOp::And, a, b);
}

WideValue bit_or(WordBackend& be, const Operand& a, const Operand& b) {
    return limbwise(be, WordOp::Or, a, b);
}

WideValue bit_xor(WordBackend& be, const Operand& a, const Operand& b) {
    return limbwise(be, WordOp::Xor, a, b);
}

// ============================================================================
// Shifts
// ============================================================================

WideValue shl(WordBackend& be, const Operand& a, int64_t amount) {
    check_amount(amount);
    const LimbView v = detail::view_of(a);
    const size_t bits = v.type.bits();
    const size_t n = v.limbs.size();
    Limbs r(n, WordArg::plain(0));

    if (static_cast<uint64_t>(amount) >= bits) {
        return detail::finish(be, v.type, r);
    }

    const size_t shift = static_cast<size_t>(amount);
    if (bits < MPCINT_LIMB_BITS) {
        r[0] = detail::normalize(be, v.type, apply(be, WordOp::Shl, v.limbs[0], WordArg::plain(shift)));
        return detail::finish(be, v.type, r);
    }

    const size_t q = shift / MPCINT_LIMB_BITS;
    const size_t s = shift % MPCINT_LIMB_BITS;
    for (size_t i = q; i < n; ++i) {
        WordArg part = apply(be, WordOp::Shl, v.limbs[i - q], WordArg::plain(s));
        if (s != 0 && i > q) {
            // Bits spilling over from the limb below
            WordArg spill = apply(be, WordOp::Shr, v.limbs[i - q - 1], WordArg::plain(MPCINT_LIMB_BITS - s));
            part = apply(be, WordOp::Or, part, spill);
        }
        r[i] = part;
    }

    const size_t bound = v.type.is_signed ? n : std::min(n, v.significant + q + 1);
    return detail::finish(be, v.type, r, bound);
}

WideValue shr(WordBackend& be, const Operand& a, int64_t amount) {
    check_amount(amount);
    const LimbView v = detail::view_of(a);
    const size_t bits = v.type.bits();
    const size_t n = v.limbs.size();

    WordArg fill = WordArg::plain(0);
    if (v.type.is_signed) {
        fill = detail::sign_fill(be, detail::sign_bit(be, v.type, v.limbs, n));
    }

    if (bits < MPCINT_LIMB_BITS) {
        const uint64_t mask = detail::low_mask(bits);
        if (static_cast<uint64_t>(amount) >= bits) {
            return detail::finish(be, v.type, Limbs{apply(be, WordOp::And, fill, WordArg::plain(mask))});
        }
        const size_t shift = static_cast<size_t>(amount);
        WordArg r = apply(be, WordOp::Shr, v.limbs[0], WordArg::plain(shift));
        if (v.type.is_signed) {
            const uint64_t vacated = mask & ~detail::low_mask(bits - shift);
            r = apply(be, WordOp::Or, r, apply(be, WordOp::And, fill, WordArg::plain(vacated)));
        }
        return detail::finish(be, v.type, Limbs{r});
    }

    if (static_cast<uint64_t>(amount) >= bits) {
        return detail::finish(be, v.type, Limbs(n, fill));
    }

    const size_t shift = static_cast<size_t>(amount);
    const size_t q = shift / MPCINT_LIMB_BITS;
    const size_t s = shift % MPCINT_LIMB_BITS;
    auto source = [&](size_t j) { return j < n ? v.limbs[j] : fill; };

    Limbs r(n, fill);
    for (size_t i = 0; i + q < n; ++i) {
        WordArg part = apply(be, WordOp::Shr, source(i + q), WordArg::plain(s));
        if (s != 0) {
            WordArg spill = apply(be, WordOp::Shl, source(i + q + 1), WordArg::plain(MPCINT_LIMB_BITS - s));
            part = apply(be, WordOp::Or, part, spill);
        }
        r[i] = part;
    }
    return detail::finish(be, v.type, r);
}

} // namespace mpcint
