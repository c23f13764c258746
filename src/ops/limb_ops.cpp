/**
 * @file limb_ops.cpp
 * @brief Internal limb-vector composition shared by all operation units
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include "limb_ops.h"

#include <algorithm>
#include <stdexcept>

namespace mpcint {
namespace detail {

namespace {

constexpr uint64_t kAllOnes = ~uint64_t(0);
constexpr uint64_t kLowHalf = 0xFFFFFFFFULL;

inline bool is_const(const WordArg& x, uint64_t v) noexcept {
    return x.is_public() && x.value() == v;
}

inline bool same_word(const WordArg& a, const WordArg& b) noexcept {
    return !a.is_public() && !b.is_public() && a.word() == b.word();
}

void check_sizes(const Limbs& a, const Limbs& b) {
    if (a.size() != b.size() || a.empty()) {
        throw std::invalid_argument("Limb vectors differ in length");
    }
}

} // namespace

// ============================================================================
// Word Level
// ============================================================================

WordArg apply(WordBackend& be, WordOp op, const WordArg& a, const WordArg& b) {
    if (a.is_public() && b.is_public()) {
        return WordArg::plain(eval_word_op(op, a.value(), b.value()));
    }

    const bool same = same_word(a, b);
    switch (op) {
        case WordOp::Add:
            if (is_const(a, 0)) return b;
            if (is_const(b, 0)) return a;
            break;
        case WordOp::Sub:
            if (is_const(b, 0)) return a;
            if (same) return WordArg::plain(0);
            break;
        case WordOp::Mul:
            if (is_const(a, 0) || is_const(b, 0)) return WordArg::plain(0);
            if (is_const(a, 1)) return b;
            if (is_const(b, 1)) return a;
            break;
        case WordOp::And:
            if (is_const(a, 0) || is_const(b, 0)) return WordArg::plain(0);
            if (is_const(a, kAllOnes)) return b;
            if (is_const(b, kAllOnes)) return a;
            if (same) return a;
            break;
        case WordOp::Or:
            if (is_const(a, 0)) return b;
            if (is_const(b, 0)) return a;
            if (is_const(a, kAllOnes) || is_const(b, kAllOnes)) return WordArg::plain(kAllOnes);
            if (same) return a;
            break;
        case WordOp::Xor:
            if (is_const(a, 0)) return b;
            if (is_const(b, 0)) return a;
            if (same) return WordArg::plain(0);
            break;
        case WordOp::Shl:
        case WordOp::Shr:
            if (is_const(b, 0)) return a;
            if (is_const(a, 0)) return WordArg::plain(0);
            if (b.is_public() && b.value() >= 64) return WordArg::plain(0);
            break;
        case WordOp::Eq:
            if (same) return WordArg::plain(1);
            break;
        case WordOp::Ne:
            if (same) return WordArg::plain(0);
            break;
        case WordOp::Lt:
            if (same || is_const(b, 0) || is_const(a, kAllOnes)) return WordArg::plain(0);
            break;
        case WordOp::Le:
            if (same || is_const(a, 0) || is_const(b, kAllOnes)) return WordArg::plain(1);
            break;
        case WordOp::Gt:
            if (same || is_const(a, 0) || is_const(b, kAllOnes)) return WordArg::plain(0);
            break;
        case WordOp::Ge:
            if (same || is_const(b, 0) || is_const(a, kAllOnes)) return WordArg::plain(1);
            break;
        case WordOp::Div:
        case WordOp::Rem:
            break;
    }
    return WordArg(be.binary(op, a, b));
}

WordArg select_word(WordBackend& be, const WordArg& cond, const WordArg& a, const WordArg& b) {
    if (cond.is_public()) {
        return cond.value() ? a : b;
    }
    if (same_word(a, b) || (a.is_public() && b.is_public() && a.value() == b.value())) {
        return a;
    }
    if (is_const(a, 1) && is_const(b, 0)) {
        return cond;
    }
    return WordArg(be.mux(cond.word(), a, b));
}

SecretWord materialize(WordBackend& be, const WordArg& arg) {
    if (arg.is_public()) {
        return be.set_public(arg.value());
    }
    return arg.word();
}

// ============================================================================
// Views and Results
// ============================================================================

LimbView view_of(const Operand& op) {
    return LimbView{op.type(), op.limbs(), op.significant_limbs(), op.is_public()};
}

std::pair<LimbView, LimbView> promote(WordBackend& be, const Operand& a, const Operand& b) {
    const IntType ta = a.type();
    const IntType tb = b.type();
    if (ta.is_signed != tb.is_signed) {
        throw std::invalid_argument("Operands mix signedness: " + ta.name() + " and " + tb.name());
    }

    LimbView va = view_of(a);
    LimbView vb = view_of(b);
    if (ta.bits() < tb.bits()) {
        va.limbs = convert_limbs(be, va.limbs, ta, tb);
        va.type = tb;
    } else if (tb.bits() < ta.bits()) {
        vb.limbs = convert_limbs(be, vb.limbs, tb, ta);
        vb.type = ta;
    }
    return {std::move(va), std::move(vb)};
}

WideValue finish(WordBackend& be, IntType type, const Limbs& limbs, size_t bound) {
    if (limbs.size() != type.limbs()) {
        throw std::logic_error("Result limb count does not match " + type.name());
    }

    bound = std::max<size_t>(1, std::min(bound, limbs.size()));
    const bool all_public = std::all_of(limbs.begin(), limbs.end(),
                                        [](const WordArg& w) { return w.is_public(); });
    if (all_public) {
        std::vector<uint64_t> words;
        words.reserve(limbs.size());
        for (const WordArg& w : limbs) {
            words.push_back(w.value());
        }
        bound = significant_limbs_of(type, words);
    } else if (!type.is_signed) {
        while (bound > 1 && is_const(limbs[bound - 1], 0)) {
            --bound;
        }
    }

    std::vector<SecretWord> words;
    words.reserve(limbs.size());
    for (const WordArg& w : limbs) {
        words.push_back(materialize(be, w));
    }
    return WideValue(type, std::move(words), bound);
}

WideValue finish(WordBackend& be, IntType type, const Limbs& limbs) {
    return finish(be, type, limbs, limbs.size());
}

// ============================================================================
// Limb Algorithms
// ============================================================================

WordArg normalize(WordBackend& be, IntType type, const WordArg& word) {
    if (type.bits() >= MPCINT_LIMB_BITS) {
        return word;
    }
    return apply(be, WordOp::And, word, WordArg::plain(low_mask(type.bits())));
}

WordArg sign_bit(WordBackend& be, IntType type, const Limbs& limbs, size_t k) {
    if (type.bits() < MPCINT_LIMB_BITS) {
        return apply(be, WordOp::Shr, limbs[0], WordArg::plain(type.bits() - 1));
    }
    return apply(be, WordOp::Shr, limbs.at(k - 1), WordArg::plain(63));
}

WordArg sign_fill(WordBackend& be, const WordArg& sign) {
    return apply(be, WordOp::Sub, WordArg::plain(0), sign);
}

Limbs add_limbs(WordBackend& be, const Limbs& a, const Limbs& b,
                const WordArg& carry_in, WordArg* carry_out) {
    check_sizes(a, b);
    const size_t n = a.size();
    Limbs r(n, WordArg::plain(0));
    WordArg carry = carry_in;

    for (size_t i = 0; i < n; ++i) {
        WordArg s = apply(be, WordOp::Add, a[i], b[i]);
        if (i + 1 == n && carry_out == nullptr) {
            r[i] = apply(be, WordOp::Add, s, carry);
            break;
        }
        // The two carries are mutually exclusive
        WordArg c1 = apply(be, WordOp::Lt, s, a[i]);
        WordArg s2 = apply(be, WordOp::Add, s, carry);
        WordArg c2 = apply(be, WordOp::Lt, s2, s);
        carry = apply(be, WordOp::Or, c1, c2);
        r[i] = s2;
    }

    if (carry_out != nullptr) {
        *carry_out = carry;
    }
    return r;
}

Limbs sub_limbs(WordBackend& be, const Limbs& a, const Limbs& b, WordArg* borrow_out) {
    check_sizes(a, b);
    const size_t n = a.size();
    Limbs r(n, WordArg::plain(0));
    WordArg borrow = WordArg::plain(0);

    for (size_t i = 0; i < n; ++i) {
        WordArg d = apply(be, WordOp::Sub, a[i], b[i]);
        if (i + 1 == n && borrow_out == nullptr) {
            r[i] = apply(be, WordOp::Sub, d, borrow);
            break;
        }
        WordArg b1 = apply(be, WordOp::Lt, a[i], b[i]);
        WordArg d2 = apply(be, WordOp::Sub, d, borrow);
        WordArg b2 = apply(be, WordOp::Lt, d, borrow);
        borrow = apply(be, WordOp::Or, b1, b2);
        r[i] = d2;
    }

    if (borrow_out != nullptr) {
        *borrow_out = borrow;
    }
    return r;
}

Limbs negate_limbs(WordBackend& be, IntType type, const Limbs& a) {
    const uint64_t ones = type.bits() < MPCINT_LIMB_BITS ? low_mask(type.bits()) : kAllOnes;
    Limbs inverted;
    inverted.reserve(a.size());
    for (const WordArg& w : a) {
        inverted.push_back(apply(be, WordOp::Xor, w, WordArg::plain(ones)));
    }

    Limbs zero(a.size(), WordArg::plain(0));
    Limbs r = add_limbs(be, inverted, zero, WordArg::plain(1), nullptr);
    r[0] = normalize(be, type, r[0]);
    return r;
}

Limbs select_limbs(WordBackend& be, const WordArg& cond, const Limbs& a, const Limbs& b) {
    check_sizes(a, b);
    Limbs r;
    r.reserve(a.size());
    for (size_t i = 0; i < a.size(); ++i) {
        r.push_back(select_word(be, cond, a[i], b[i]));
    }
    return r;
}

Limbs mul_limbs(WordBackend& be, const Limbs& a, const Limbs& b, size_t out_limbs) {
    auto split = [&be](const Limbs& x) {
        Limbs digits;
        digits.reserve(x.size() * 2);
        for (const WordArg& w : x) {
            digits.push_back(apply(be, WordOp::And, w, WordArg::plain(kLowHalf)));
            digits.push_back(apply(be, WordOp::Shr, w, WordArg::plain(32)));
        }
        return digits;
    };

    const Limbs da = split(a);
    const Limbs db = split(b);
    const size_t out_digits = out_limbs * 2;
    Limbs acc(out_limbs, WordArg::plain(0));

    for (size_t i = 0; i < da.size() && i < out_digits; ++i) {
        for (size_t j = 0; j < db.size() && i + j < out_digits; ++j) {
            WordArg p = apply(be, WordOp::Mul, da[i], db[j]);
            if (is_const(p, 0)) {
                continue;
            }

            const size_t pos = i + j;
            const size_t m = pos / 2;
            Limbs part(out_limbs, WordArg::plain(0));
            if (pos % 2 == 0) {
                part[m] = p;
            } else {
                // Digit offset 32 straddles limbs m and m+1
                part[m] = apply(be, WordOp::Shl, p, WordArg::plain(32));
                if (m + 1 < out_limbs) {
                    part[m + 1] = apply(be, WordOp::Shr, p, WordArg::plain(32));
                }
            }
            acc = add_limbs(be, acc, part, WordArg::plain(0), nullptr);
        }
    }
    return acc;
}

Limbs convert_limbs(WordBackend& be, const Limbs& limbs, IntType from, IntType to) {
    const size_t from_bits = from.bits();
    const size_t to_bits = to.bits();

    if (to_bits <= from_bits) {
        Limbs r(limbs.begin(), limbs.begin() + static_cast<std::ptrdiff_t>(to.limbs()));
        if (to_bits < from_bits && to_bits < MPCINT_LIMB_BITS) {
            r[0] = apply(be, WordOp::And, r[0], WordArg::plain(low_mask(to_bits)));
        }
        return r;
    }

    Limbs r = limbs;
    if (!from.is_signed) {
        r.resize(to.limbs(), WordArg::plain(0));
        return r;
    }

    const WordArg fill = sign_fill(be, sign_bit(be, from, limbs, limbs.size()));
    if (from_bits < MPCINT_LIMB_BITS) {
        const uint64_t ext = low_mask(std::min<size_t>(to_bits, MPCINT_LIMB_BITS)) & ~low_mask(from_bits);
        r[0] = apply(be, WordOp::Or, r[0], apply(be, WordOp::And, fill, WordArg::plain(ext)));
    }
    r.resize(to.limbs(), fill);
    return r;
}

LimbView magnitude(WordBackend& be, const LimbView& v, WordArg* sign_out) {
    const size_t k = v.significant;
    const WordArg sign = sign_bit(be, v.type, v.limbs, k);

    // Negation mod 2^(64k) is the low k limbs of the full negation
    Limbs low(v.limbs.begin(), v.limbs.begin() + static_cast<std::ptrdiff_t>(k));
    Limbs neg = negate_limbs(be, v.type, low);
    Limbs mag = select_limbs(be, sign, neg, low);
    mag.resize(v.limbs.size(), WordArg::plain(0));

    if (sign_out != nullptr) {
        *sign_out = sign;
    }
    return LimbView{IntType{v.type.width, false}, std::move(mag), k, v.is_public};
}

// ============================================================================
// Comparison Kernels
// ============================================================================

WordArg eq_limbs(WordBackend& be, const Limbs& a, const Limbs& b, size_t k) {
    WordArg r = apply(be, WordOp::Eq, a.at(0), b.at(0));
    for (size_t i = 1; i < k; ++i) {
        r = apply(be, WordOp::And, r, apply(be, WordOp::Eq, a[i], b[i]));
    }
    return r;
}

WordArg ne_limbs(WordBackend& be, const Limbs& a, const Limbs& b, size_t k) {
    WordArg r = apply(be, WordOp::Ne, a.at(0), b.at(0));
    for (size_t i = 1; i < k; ++i) {
        r = apply(be, WordOp::Or, r, apply(be, WordOp::Ne, a[i], b[i]));
    }
    return r;
}

WordArg ult_limbs(WordBackend& be, const Limbs& a, const Limbs& b, size_t k, bool or_equal) {
    WordArg r = apply(be, or_equal ? WordOp::Le : WordOp::Lt, a.at(0), b.at(0));
    for (size_t i = 1; i < k; ++i) {
        WordArg lt = apply(be, WordOp::Lt, a[i], b[i]);
        WordArg eq = apply(be, WordOp::Eq, a[i], b[i]);
        r = apply(be, WordOp::Or, lt, apply(be, WordOp::And, eq, r));
    }
    return r;
}

WordArg less_than(WordBackend& be, const LimbView& a, const LimbView& b, bool or_equal) {
    const size_t k = compare_span(a, b);
    WordArg u = ult_limbs(be, a.limbs, b.limbs, k, or_equal);
    if (!a.type.is_signed) {
        return u;
    }

    // Differing signs decide the order; otherwise the patterns compare unsigned
    WordArg sa = sign_bit(be, a.type, a.limbs, k);
    WordArg sb = sign_bit(be, b.type, b.limbs, k);
    WordArg differ = apply(be, WordOp::Xor, sa, sb);
    return select_word(be, differ, sa, u);
}

} // namespace detail
} // namespace mpcint
