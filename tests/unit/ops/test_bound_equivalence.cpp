/**
 * @file test_bound_equivalence.cpp
 * @brief Results do not depend on how an operand was produced
 *
 * The same plaintext enters as a validated input (full magnitude bound),
 * through set_public (tight bound) or as a public constant. Every pairing
 * must agree with the GMP reference for every type.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include <gtest/gtest.h>
#include <string>
#include <utility>

#include "test_util.h"

using namespace mpcint;
using mpcint_test::all_types;
using mpcint_test::pow2;
using mpcint_test::tdiv_q;
using mpcint_test::tdiv_r;

namespace {

const char* const kSourceNames[] = {"validated", "set_public", "plain"};

/** @brief Quotient and remainder as the composed division defines them */
std::pair<mpz_class, mpz_class> reference_divrem(IntType type, const mpz_class& a, const mpz_class& b) {
    if (type.bits() <= 128) {
        return {wrap_to(type, tdiv_q(a, b)), wrap_to(type, tdiv_r(a, b))};
    }
    // 256 bits: magnitudes truncated to their low 128 bits
    const mpz_class ma = mpz_class(a < 0 ? mpz_class(-a) : a) % pow2(128);
    const mpz_class mb = mpz_class(b < 0 ? mpz_class(-b) : b) % pow2(128);
    if (mb == 0) {
        return {0, 0};
    }
    mpz_class q = ma / mb;
    mpz_class r = ma % mb;
    if ((a < 0) != (b < 0)) {
        q = -q;
    }
    if (a < 0) {
        r = -r;
    }
    return {wrap_to(type, q), wrap_to(type, r)};
}

} // namespace

class BoundEquivalenceTest : public mpcint_test::BackendTest {
protected:
    /** @brief Operand carrying v, produced one of three ways */
    Operand make(IntType type, const mpz_class& v, int source) {
        switch (source) {
            case 0: return secret(type, v);
            case 1: return set_public(be_, type, v);
            default: return pub(type, v);
        }
    }

    mpz_class nonzero_sample(IntType type) {
        mpz_class v = sample_mixed(type);
        return v == 0 ? mpz_class(1) : v;
    }
};

// ============================================================================
// All Operations, All Provenances
// ============================================================================

TEST_F(BoundEquivalenceTest, EveryProvenanceMatchesReference) {
    const int pairs = 6;
    for (const IntType& type : all_types()) {
        for (int n = 0; n < pairs; ++n) {
            const mpz_class x = sample_mixed(type);
            const mpz_class y = nonzero_sample(type);
            const unsigned long s = mpz_class(rng_.get_z_range(type.bits())).get_ui();
            const auto qr = reference_divrem(type, x, y);

            for (int sa = 0; sa < 3; ++sa) {
                for (int sb = 0; sb < 3; ++sb) {
                    const Operand a = make(type, x, sa);
                    const Operand b = make(type, y, sb);
                    SCOPED_TRACE(std::string(type.name()) + " " + kSourceNames[sa] + "/" +
                                 kSourceNames[sb] + " x=" + x.get_str() + " y=" + y.get_str());

                    EXPECT_EQ(reveal(add(be_, a, b)), wrap_to(type, x + y));
                    EXPECT_EQ(reveal(sub(be_, a, b)), wrap_to(type, x - y));
                    EXPECT_EQ(reveal(mul(be_, a, b)), wrap_to(type, x * y));
                    EXPECT_EQ(reveal(div(be_, a, b)), qr.first);
                    EXPECT_EQ(reveal(rem(be_, a, b)), qr.second);

                    EXPECT_EQ(reveal(lt(be_, a, b)), x < y);
                    EXPECT_EQ(reveal(eq(be_, a, b)), x == y);
                    EXPECT_EQ(reveal(ge(be_, b, a)), y >= x);

                    CheckedResult c = checked_add_with_overflow_bit(be_, a, b);
                    EXPECT_EQ(reveal(c.value), wrap_to(type, x + y));
                    EXPECT_EQ(reveal(c.overflow), !in_range(type, x + y));

                    CheckedResult m = checked_mul_with_overflow_bit(be_, a, b);
                    EXPECT_EQ(reveal(m.value), wrap_to(type, x * y));
                    EXPECT_EQ(reveal(m.overflow), !in_range(type, x * y));
                }

                const Operand a = make(type, x, sa);
                EXPECT_EQ(reveal(shl(be_, a, static_cast<int64_t>(s))), wrap_to(type, x * pow2(s)))
                    << type.name() << " " << kSourceNames[sa] << " shl " << s;
                EXPECT_EQ(reveal(shr(be_, a, static_cast<int64_t>(s))), mpz_class(x >> s))
                    << type.name() << " " << kSourceNames[sa] << " shr " << s;
            }
        }
    }
}

// ============================================================================
// 128-bit Division Regimes
// ============================================================================

TEST_F(BoundEquivalenceTest, Uint128WideDividendNarrowDivisor) {
    for (int i = 0; i < 40; ++i) {
        const mpz_class x = pow2(64) + mpz_class(rng_.get_z_bits(127));
        mpz_class y = rng_.get_z_bits(64);
        if (y == 0) {
            y = 3;
        }
        for (int sa = 0; sa < 3; ++sa) {
            for (int sb = 0; sb < 3; ++sb) {
                const Operand a = make(kUint128, x, sa);
                const Operand b = make(kUint128, y, sb);
                EXPECT_EQ(reveal(div(be_, a, b)), tdiv_q(x, y)) << x << " / " << y;
                EXPECT_EQ(reveal(rem(be_, a, b)), tdiv_r(x, y)) << x << " % " << y;
            }
        }
    }
}

TEST_F(BoundEquivalenceTest, Int128WideDividendNarrowDivisor) {
    for (int i = 0; i < 40; ++i) {
        mpz_class x = pow2(64) + mpz_class(rng_.get_z_bits(126));
        mpz_class y = mpz_class(rng_.get_z_bits(62)) + 1;
        if (i % 2 == 0) {
            x = -x;
        }
        if (i % 3 == 0) {
            y = -y;
        }
        for (int sa = 0; sa < 3; ++sa) {
            const Operand a = make(kInt128, x, sa);
            const Operand b = make(kInt128, y, (sa + i) % 3);
            EXPECT_EQ(reveal(div(be_, a, b)), tdiv_q(x, y)) << x << " / " << y;
            EXPECT_EQ(reveal(rem(be_, a, b)), tdiv_r(x, y)) << x << " % " << y;
        }
    }
}
