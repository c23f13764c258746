/**
 * @file boundary.h
 * @brief Conversions between secret values and their external forms
 *
 * Plaintexts are GMP integers. Durable and recipient ciphertexts of a
 * WideValue are per-limb sequences tagged with the integer type.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef MPCINT_OPS_BOUNDARY_H
#define MPCINT_OPS_BOUNDARY_H

#include "mpcint/core/types.h"
#include "mpcint/core/wide_value.h"
#include "mpcint/core/word_backend.h"

#include <gmpxx.h>

#include <vector>

namespace mpcint {

// ============================================================================
// External Forms
// ============================================================================

/** @brief Durable network-key form of a WideValue */
struct WideCiphertext {
    IntType type;
    std::vector<Ciphertext> limbs;
};

/** @brief Recipient-key form of a WideValue */
struct WideUserCiphertext {
    IntType type;
    std::vector<UserCiphertext> limbs;
};

/** @brief Externally supplied input: one proof per limb */
struct WideInputProof {
    IntType type;
    std::vector<InputProof> limbs;
};

/** @brief Network and recipient forms produced together */
struct CombinedCiphertext {
    WideCiphertext network;
    WideUserCiphertext user;
};

// ============================================================================
// Integers
// ============================================================================

/**
 * @brief Validate every limb of an input
 * @throws InvalidProof if any limb fails; no value is produced
 * @throws std::invalid_argument if the limb count does not match the type
 */
WideValue validate_ciphertext(WordBackend& be, const WideInputProof& proof);

/**
 * @brief Inject a plaintext
 * @throws std::out_of_range if value is not representable in type
 */
WideValue set_public(WordBackend& be, IntType type, const mpz_class& value);

/** @brief Reveal a value, read as its type */
mpz_class decrypt(WordBackend& be, const WideValue& value);

/** @brief Uniform over all values of a type */
WideValue random(WordBackend& be, IntType type);

/**
 * @brief Uniform over [0, 2^bits), upper limbs zero
 * @throws std::invalid_argument unless 1 <= bits <= width
 */
WideValue random_bounded(WordBackend& be, IntType type, unsigned bits);

WideCiphertext offboard(WordBackend& be, const WideValue& value);

/**
 * @brief Working form of a durable ciphertext
 * @throws std::invalid_argument if the limb count does not match the type
 */
WideValue onboard(WordBackend& be, const WideCiphertext& ct);

/** @brief Key-switch every limb to a recipient; the value is unchanged */
WideUserCiphertext offboard_to_user(WordBackend& be, const WideValue& value, const UserKey& key);

/** @brief offboard() and offboard_to_user() in one call */
CombinedCiphertext offboard_combined(WordBackend& be, const WideValue& value, const UserKey& key);

// ============================================================================
// Booleans
// ============================================================================

/**
 * @brief Validate a boolean input; any nonzero word reads as true
 * @throws InvalidProof if the proof fails
 */
SecretBool validate_bool(WordBackend& be, const InputProof& proof);

SecretBool set_public(WordBackend& be, bool value);
bool decrypt(WordBackend& be, const SecretBool& value);
Ciphertext offboard(WordBackend& be, const SecretBool& value);
SecretBool onboard_bool(WordBackend& be, const Ciphertext& ct);
UserCiphertext offboard_to_user(WordBackend& be, const SecretBool& value, const UserKey& key);

} // namespace mpcint

#endif // MPCINT_OPS_BOUNDARY_H
