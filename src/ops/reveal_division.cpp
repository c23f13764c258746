/**
 * @file reveal_division.cpp
 * @brief Reduced-privacy division: reveal operands, divide in the clear
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include "mpcint/ops/reveal_division.h"
#include "mpcint/core/log.h"

#include "arith_kernels.h"

namespace mpcint {

namespace detail {

namespace {

mpz_class reveal_limbs(WordBackend& be, IntType type, const Limbs& limbs) {
    std::vector<uint64_t> words;
    words.reserve(limbs.size());
    for (const WordArg& w : limbs) {
        words.push_back(w.is_public() ? w.value() : be.decrypt(w.word()));
    }
    return decode_limbs(type, words);
}

Limbs inject(WordBackend& be, IntType type, const mpz_class& value) {
    Limbs r;
    for (uint64_t w : encode_limbs(type, value)) {
        r.push_back(WordArg(be.set_public(w)));
    }
    return r;
}

} // namespace

std::pair<Limbs, Limbs> reveal_divrem_limbs(WordBackend& be, IntType type,
                                            const Limbs& a, const Limbs& b) {
    logger()->warn("reduced-privacy division: revealing {} operands", type.name());

    const mpz_class x = reveal_limbs(be, type, a);
    const mpz_class y = reveal_limbs(be, type, b);

    mpz_class q = 0;
    mpz_class r = 0;
    if (y != 0) {
        mpz_tdiv_qr(q.get_mpz_t(), r.get_mpz_t(), x.get_mpz_t(), y.get_mpz_t());
    }
    return {inject(be, type, wrap_to(type, q)), inject(be, type, wrap_to(type, r))};
}

} // namespace detail

DivRem reveal_divrem(WordBackend& be, const Operand& a, const Operand& b) {
    auto ab = detail::promote(be, a, b);
    const IntType type = ab.first.type;
    auto qr = detail::reveal_divrem_limbs(be, type, ab.first.limbs, ab.second.limbs);
    return DivRem{detail::finish(be, type, qr.first), detail::finish(be, type, qr.second)};
}

} // namespace mpcint
