/**
 * @file wide_value.cpp
 * @brief WideValue, Operand and plaintext limb encoding
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include "mpcint/core/wide_value.h"

#include <stdexcept>
#include <utility>

namespace mpcint {

namespace {

mpz_class pow2(size_t bits) {
    mpz_class r;
    mpz_ui_pow_ui(r.get_mpz_t(), 2, static_cast<unsigned long>(bits));
    return r;
}

} // namespace

// ============================================================================
// WideValue
// ============================================================================

WideValue::WideValue(IntType type, std::vector<SecretWord> limbs)
    : WideValue(type, std::move(limbs), type.limbs())
{
}

WideValue::WideValue(IntType type, std::vector<SecretWord> limbs, size_t significant_limbs)
    : type_(type)
    , limbs_(std::move(limbs))
    , significant_(significant_limbs)
{
    if (limbs_.size() != type_.limbs()) {
        throw std::invalid_argument("Limb count does not match width of " + type_.name());
    }
    if (significant_ == 0 || significant_ > limbs_.size()) {
        throw std::invalid_argument("Magnitude bound outside [1, limb count]");
    }
    for (const SecretWord& w : limbs_) {
        if (!w.valid()) {
            throw std::invalid_argument("WideValue limb holds an invalid handle");
        }
    }
}

// ============================================================================
// Operand
// ============================================================================

Operand::Operand(const WideValue& value)
    : type_(value.type())
    , significant_(value.significant_limbs())
    , is_public_(false)
{
    limbs_.reserve(value.limb_count());
    for (size_t i = 0; i < value.limb_count(); ++i) {
        // Unsigned limbs above the bound are provably zero
        if (!value.is_signed() && i >= significant_) {
            limbs_.push_back(WordArg::plain(0));
        } else {
            limbs_.push_back(WordArg(value.limb(i)));
        }
    }
}

Operand::Operand(IntType type, std::vector<WordArg> limbs, size_t significant,
                 bool is_public, mpz_class value)
    : type_(type)
    , limbs_(std::move(limbs))
    , significant_(significant)
    , is_public_(is_public)
    , value_(std::move(value))
{
}

Operand Operand::plain(IntType type, const mpz_class& value) {
    std::vector<uint64_t> words = encode_limbs(type, value);
    std::vector<WordArg> limbs;
    limbs.reserve(words.size());
    for (uint64_t w : words) {
        limbs.push_back(WordArg::plain(w));
    }
    return Operand(type, std::move(limbs), significant_limbs_of(type, words), true, value);
}

const mpz_class& Operand::public_value() const {
    if (!is_public_) {
        throw std::logic_error("Operand is secret");
    }
    return value_;
}

OperandMode operand_mode(const Operand& a, const Operand& b) noexcept {
    if (a.is_public() && b.is_public()) {
        return OperandMode::PublicPublic;
    }
    if (a.is_public()) {
        return OperandMode::PublicLhs;
    }
    if (b.is_public()) {
        return OperandMode::PublicRhs;
    }
    return OperandMode::SecretSecret;
}

const char* operand_mode_name(OperandMode mode) noexcept {
    switch (mode) {
        case OperandMode::SecretSecret: return "secret-secret";
        case OperandMode::PublicLhs:    return "public-lhs";
        case OperandMode::PublicRhs:    return "public-rhs";
        case OperandMode::PublicPublic: return "public-public";
    }
    return "unknown";
}

// ============================================================================
// Plaintext Encoding
// ============================================================================

mpz_class min_value(IntType type) {
    if (!type.is_signed) {
        return mpz_class(0);
    }
    return -pow2(type.bits() - 1);
}

mpz_class max_value(IntType type) {
    if (!type.is_signed) {
        return pow2(type.bits()) - 1;
    }
    return pow2(type.bits() - 1) - 1;
}

bool in_range(IntType type, const mpz_class& value) {
    return value >= min_value(type) && value <= max_value(type);
}

mpz_class wrap_to(IntType type, const mpz_class& value) {
    const mpz_class modulus = pow2(type.bits());
    mpz_class r;
    mpz_fdiv_r(r.get_mpz_t(), value.get_mpz_t(), modulus.get_mpz_t());
    if (type.is_signed && r > max_value(type)) {
        r -= modulus;
    }
    return r;
}

std::vector<uint64_t> encode_limbs(IntType type, const mpz_class& value) {
    if (!in_range(type, value)) {
        throw std::out_of_range("Value not representable as " + type.name());
    }

    mpz_class pattern = value;
    if (pattern < 0) {
        pattern += pow2(type.bits());
    }

    std::vector<uint64_t> limbs(type.limbs(), 0);
    size_t count = 0;
    // Least significant word first, native byte order within a word
    mpz_export(limbs.data(), &count, -1, sizeof(uint64_t), 0, 0, pattern.get_mpz_t());
    return limbs;
}

mpz_class decode_limbs(IntType type, const std::vector<uint64_t>& limbs) {
    if (limbs.size() != type.limbs()) {
        throw std::invalid_argument("Limb count does not match width of " + type.name());
    }

    std::vector<uint64_t> words = limbs;
    if (type.bits() < MPCINT_LIMB_BITS) {
        words[0] &= (uint64_t(1) << type.bits()) - 1;
    }

    mpz_class r;
    mpz_import(r.get_mpz_t(), words.size(), -1, sizeof(uint64_t), 0, 0, words.data());
    if (type.is_signed && r > max_value(type)) {
        r -= pow2(type.bits());
    }
    return r;
}

size_t significant_limbs_of(IntType type, const std::vector<uint64_t>& limbs) {
    size_t k = limbs.size();
    if (!type.is_signed) {
        while (k > 1 && limbs[k - 1] == 0) {
            --k;
        }
        return k;
    }
    // Signed: drop top limbs that merely repeat the sign of the limb below
    while (k > 1) {
        const uint64_t fill = (limbs[k - 2] >> 63) ? ~uint64_t(0) : 0;
        if (limbs[k - 1] != fill) {
            break;
        }
        --k;
    }
    return k;
}

} // namespace mpcint
