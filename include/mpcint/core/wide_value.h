/**
 * @file wide_value.h
 * @brief Fixed-width secret integers as little-endian 64-bit limb vectors
 *
 * A WideValue of width w holds ceil(w/64) SecretWords, limb 0 least
 * significant. Widths below 64 occupy one limb whose bits above w are kept
 * zero by every operation, so the stored word is the w-bit two's
 * complement pattern of the value.
 *
 * Each value also carries a public magnitude bound, significant_limbs():
 * every limb at or above that index is known, from the value's public
 * provenance alone, to be the extension of the limbs below it (zero for
 * unsigned types, the sign fill of limb significant_limbs()-1 for signed
 * types). Composed operations use the bound to skip provably redundant
 * limb work; results never depend on it.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef MPCINT_CORE_WIDE_VALUE_H
#define MPCINT_CORE_WIDE_VALUE_H

#include "mpcint/core/types.h"
#include "mpcint/core/word_backend.h"

#include <gmpxx.h>

#include <cstdint>
#include <vector>

namespace mpcint {

// ============================================================================
// WideValue
// ============================================================================

/**
 * @brief Immutable fixed-width secret integer
 */
class WideValue {
public:
    /**
     * @brief Construct from limbs with no magnitude bound
     * @throws std::invalid_argument if limbs.size() != type.limbs()
     */
    WideValue(IntType type, std::vector<SecretWord> limbs);

    /**
     * @brief Construct from limbs with a public magnitude bound
     * @param significant_limbs Bound in [1, type.limbs()]
     */
    WideValue(IntType type, std::vector<SecretWord> limbs, size_t significant_limbs);

    IntType type() const noexcept { return type_; }
    Width width() const noexcept { return type_.width; }
    size_t bits() const noexcept { return type_.bits(); }
    bool is_signed() const noexcept { return type_.is_signed; }

    size_t limb_count() const noexcept { return limbs_.size(); }
    const SecretWord& limb(size_t i) const { return limbs_.at(i); }
    const std::vector<SecretWord>& limbs() const noexcept { return limbs_; }

    /** @brief Public bound on the number of limbs carrying information */
    size_t significant_limbs() const noexcept { return significant_; }

    /** @brief True when the value provably fits in n limbs */
    bool fits_in_limbs(size_t n) const noexcept { return significant_ <= n; }

private:
    IntType type_;
    std::vector<SecretWord> limbs_;
    size_t significant_;
};

/**
 * @brief Secret boolean: a word holding 0 or 1
 */
class SecretBool {
public:
    explicit SecretBool(const SecretWord& word) noexcept : word_(word) {}

    const SecretWord& word() const noexcept { return word_; }

private:
    SecretWord word_;
};

// ============================================================================
// Operand (calling convention)
// ============================================================================

/**
 * @brief Calling convention of a binary operation
 */
enum class OperandMode : uint8_t {
    SecretSecret = 0,   ///< both operands private
    PublicLhs,          ///< left operand revealed as a public constant
    PublicRhs,          ///< right operand revealed as a public constant
    PublicPublic        ///< both public; evaluated locally, result injected
};

/**
 * @brief Tagged operand: a secret WideValue or a public constant of a type
 *
 * Resolved at the call site: passing a WideValue selects the private
 * convention, Operand::plain(...) the public one. Public limbs reach the
 * backend as public word arguments and change only the call shape.
 */
class Operand {
public:
    /** @brief Private operand */
    Operand(const WideValue& value);  // NOLINT: implicit by intent

    /**
     * @brief Public constant operand
     * @throws std::out_of_range if value is not representable in type
     */
    static Operand plain(IntType type, const mpz_class& value);

    bool is_public() const noexcept { return is_public_; }
    IntType type() const noexcept { return type_; }
    size_t limb_count() const noexcept { return limbs_.size(); }
    size_t significant_limbs() const noexcept { return significant_; }

    /** @brief Limb i as a word argument */
    const WordArg& limb(size_t i) const { return limbs_.at(i); }
    const std::vector<WordArg>& limbs() const noexcept { return limbs_; }

    /** @brief Plaintext of a public operand */
    const mpz_class& public_value() const;

private:
    Operand(IntType type, std::vector<WordArg> limbs, size_t significant,
            bool is_public, mpz_class value);

    IntType type_;
    std::vector<WordArg> limbs_;
    size_t significant_;
    bool is_public_;
    mpz_class value_;
};

/** @brief Calling convention of the pair (a, b) */
OperandMode operand_mode(const Operand& a, const Operand& b) noexcept;

/** @brief Name of a calling convention ("secret-secret", ...) */
const char* operand_mode_name(OperandMode mode) noexcept;

// ============================================================================
// Plaintext Encoding
// ============================================================================

/** @brief Smallest representable value of a type */
mpz_class min_value(IntType type);

/** @brief Largest representable value of a type */
mpz_class max_value(IntType type);

/** @brief True if value is representable in type */
bool in_range(IntType type, const mpz_class& value);

/** @brief value reduced modulo 2^width and read back as type */
mpz_class wrap_to(IntType type, const mpz_class& value);

/**
 * @brief Two's complement limbs of a plaintext
 * @throws std::out_of_range if value is not representable in type
 */
std::vector<uint64_t> encode_limbs(IntType type, const mpz_class& value);

/**
 * @brief Plaintext of little-endian limbs read as type
 * @note Bits of limb 0 above a sub-64 width are ignored.
 */
mpz_class decode_limbs(IntType type, const std::vector<uint64_t>& limbs);

/**
 * @brief Exact magnitude bound of known limbs (see WideValue)
 */
size_t significant_limbs_of(IntType type, const std::vector<uint64_t>& limbs);

} // namespace mpcint

#endif // MPCINT_CORE_WIDE_VALUE_H
