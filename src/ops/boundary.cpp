/**
 * @file boundary.cpp
 * @brief Conversions between secret values and their external forms
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include "mpcint/ops/boundary.h"
#include "mpcint/core/error.h"
#include "mpcint/core/log.h"

#include "limb_ops.h"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace mpcint {

namespace {

void check_limb_count(IntType type, size_t count) {
    if (count != type.limbs()) {
        throw std::invalid_argument("Expected " + std::to_string(type.limbs()) + " limbs for " +
                                    type.name() + ", got " + std::to_string(count));
    }
}

WideValue from_words(WordBackend& be, IntType type, std::vector<SecretWord> words, size_t bound) {
    if (type.bits() < MPCINT_LIMB_BITS) {
        // Keep bits above the width clear
        words[0] = detail::materialize(be, detail::normalize(be, type, words[0]));
    }
    return WideValue(type, std::move(words), bound);
}

} // namespace

// ============================================================================
// Integers
// ============================================================================

WideValue validate_ciphertext(WordBackend& be, const WideInputProof& proof) {
    check_limb_count(proof.type, proof.limbs.size());

    std::vector<SecretWord> words;
    words.reserve(proof.limbs.size());
    for (size_t i = 0; i < proof.limbs.size(); ++i) {
        try {
            words.push_back(be.validate_ciphertext(proof.limbs[i]));
        } catch (const InvalidProof& e) {
            logger()->warn("input {} rejected at limb {}: {}", proof.type.name(), i, e.what());
            throw;
        }
    }
    return from_words(be, proof.type, std::move(words), proof.type.limbs());
}

WideValue set_public(WordBackend& be, IntType type, const mpz_class& value) {
    const std::vector<uint64_t> limbs = encode_limbs(type, value);
    std::vector<SecretWord> words;
    words.reserve(limbs.size());
    for (uint64_t w : limbs) {
        words.push_back(be.set_public(w));
    }
    return WideValue(type, std::move(words), significant_limbs_of(type, limbs));
}

mpz_class decrypt(WordBackend& be, const WideValue& value) {
    std::vector<uint64_t> limbs;
    limbs.reserve(value.limb_count());
    for (const SecretWord& w : value.limbs()) {
        limbs.push_back(be.decrypt(w));
    }
    return decode_limbs(value.type(), limbs);
}

WideValue random(WordBackend& be, IntType type) {
    std::vector<SecretWord> words;
    words.reserve(type.limbs());
    const unsigned limb_bits = type.bits() < MPCINT_LIMB_BITS
        ? static_cast<unsigned>(type.bits())
        : MPCINT_LIMB_BITS;
    for (size_t i = 0; i < type.limbs(); ++i) {
        words.push_back(be.random(limb_bits));
    }
    return WideValue(type, std::move(words));
}

WideValue random_bounded(WordBackend& be, IntType type, unsigned bits) {
    if (bits == 0 || bits > type.bits()) {
        throw std::invalid_argument("Random bit count must be in [1, " + std::to_string(type.bits()) +
                                    "] for " + type.name());
    }

    std::vector<SecretWord> words;
    words.reserve(type.limbs());
    for (size_t i = 0; i < type.limbs(); ++i) {
        const size_t low = i * MPCINT_LIMB_BITS;
        if (bits >= low + MPCINT_LIMB_BITS) {
            words.push_back(be.random(MPCINT_LIMB_BITS));
        } else if (bits > low) {
            words.push_back(be.random(static_cast<unsigned>(bits - low)));
        } else {
            words.push_back(be.set_public(0));
        }
    }

    // Non-negative: signed values also need the bit above the top random bit
    const size_t extra = type.is_signed ? 1 : 0;
    const size_t bound = (bits + extra + MPCINT_LIMB_BITS - 1) / MPCINT_LIMB_BITS;
    return WideValue(type, std::move(words), std::min(bound, type.limbs()));
}

WideCiphertext offboard(WordBackend& be, const WideValue& value) {
    WideCiphertext ct{value.type(), {}};
    ct.limbs.reserve(value.limb_count());
    for (const SecretWord& w : value.limbs()) {
        ct.limbs.push_back(be.offboard(w));
    }
    return ct;
}

WideValue onboard(WordBackend& be, const WideCiphertext& ct) {
    check_limb_count(ct.type, ct.limbs.size());
    std::vector<SecretWord> words;
    words.reserve(ct.limbs.size());
    for (const Ciphertext& c : ct.limbs) {
        words.push_back(be.onboard(c));
    }
    return from_words(be, ct.type, std::move(words), ct.type.limbs());
}

WideUserCiphertext offboard_to_user(WordBackend& be, const WideValue& value, const UserKey& key) {
    WideUserCiphertext ct{value.type(), {}};
    ct.limbs.reserve(value.limb_count());
    for (const SecretWord& w : value.limbs()) {
        ct.limbs.push_back(be.offboard_to_user(w, key));
    }
    return ct;
}

CombinedCiphertext offboard_combined(WordBackend& be, const WideValue& value, const UserKey& key) {
    return CombinedCiphertext{offboard(be, value), offboard_to_user(be, value, key)};
}

// ============================================================================
// Booleans
// ============================================================================

SecretBool validate_bool(WordBackend& be, const InputProof& proof) {
    SecretWord word;
    try {
        word = be.validate_ciphertext(proof);
    } catch (const InvalidProof& e) {
        logger()->warn("boolean input rejected: {}", e.what());
        throw;
    }
    return SecretBool(detail::materialize(be, detail::apply(be, WordOp::Ne, word, WordArg::plain(0))));
}

SecretBool set_public(WordBackend& be, bool value) {
    return SecretBool(be.set_public(value ? 1 : 0));
}

bool decrypt(WordBackend& be, const SecretBool& value) {
    return be.decrypt(value.word()) != 0;
}

Ciphertext offboard(WordBackend& be, const SecretBool& value) {
    return be.offboard(value.word());
}

SecretBool onboard_bool(WordBackend& be, const Ciphertext& ct) {
    return SecretBool(be.onboard(ct));
}

UserCiphertext offboard_to_user(WordBackend& be, const SecretBool& value, const UserKey& key) {
    return be.offboard_to_user(value.word(), key);
}

} // namespace mpcint
