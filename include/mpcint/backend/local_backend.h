/**
 * @file local_backend.h
 * @brief Single-process reference implementation of WordBackend
 *
 * Holds every secret word in a local handle table, so it provides no
 * secrecy between parties. A slot is freed when the last SecretWord
 * referring to it is destroyed. It reproduces the observable contract of a
 * networked backend:
 * - Ciphertext: AES-128 block of (word, nonce) under the network key
 * - UserCiphertext: the same block under the recipient's key
 * - InputProof: ciphertext plus HMAC-SHA256 under the input signing key
 *
 * Every call is counted per primitive so callers can inspect the cost of
 * composed operations. A fault budget turns the N+1-th primitive call
 * into a BackendError.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef MPCINT_BACKEND_LOCAL_BACKEND_H
#define MPCINT_BACKEND_LOCAL_BACKEND_H

#include "mpcint/core/types.h"
#include "mpcint/core/word_backend.h"
#include "mpcint/ops/boundary.h"

#include <gmpxx.h>

#include <array>
#include <cstdint>
#include <memory>
#include <mutex>
#include <random>
#include <unordered_map>

namespace mpcint {
namespace backend {

/**
 * @brief Keys and behaviour switches of a LocalWordBackend
 */
struct LocalBackendConfig {
    NetworkKey network_key{};
    SigningKey signing_key{};

    /// Draw random words and nonces from a seeded generator instead of RAND_bytes
    bool deterministic = false;
    uint64_t seed = 0;

    /// Primitive calls allowed before BackendError is raised; negative disables
    int64_t fault_budget = -1;

    /**
     * @brief Configuration with fresh random keys
     * @throws BackendError if the system RNG fails
     */
    static LocalBackendConfig generate();

    /** @brief Fixed keys derived from a seed, deterministic randomness */
    static LocalBackendConfig from_seed(uint64_t seed);
};

/**
 * @brief Call counters of a backend
 */
struct BackendStats {
    std::array<uint64_t, kWordOpCount> binary{};
    uint64_t mux = 0;
    uint64_t decrypt = 0;
    uint64_t set_public = 0;
    uint64_t random = 0;
    uint64_t validate = 0;
    uint64_t offboard = 0;
    uint64_t onboard = 0;
    uint64_t offboard_to_user = 0;

    uint64_t count(WordOp op) const noexcept { return binary[static_cast<size_t>(op)]; }

    /** @brief Binary primitives plus mux */
    uint64_t primitives() const noexcept;

    /** @brief Every backend call */
    uint64_t total() const noexcept;
};

/**
 * @brief In-process word backend
 */
class LocalWordBackend : public WordBackend {
public:
    explicit LocalWordBackend(const LocalBackendConfig& config);
    LocalWordBackend();
    ~LocalWordBackend() override = default;

    LocalWordBackend(const LocalWordBackend&) = delete;
    LocalWordBackend& operator=(const LocalWordBackend&) = delete;

    // WordBackend
    SecretWord binary(WordOp op, const WordArg& a, const WordArg& b) override;
    SecretWord mux(const SecretWord& cond, const WordArg& a, const WordArg& b) override;
    uint64_t decrypt(const SecretWord& word) override;
    SecretWord set_public(uint64_t value) override;
    SecretWord random(unsigned bits) override;
    SecretWord validate_ciphertext(const InputProof& proof) override;
    Ciphertext offboard(const SecretWord& word) override;
    SecretWord onboard(const Ciphertext& ct) override;
    UserCiphertext offboard_to_user(const SecretWord& word, const UserKey& key) override;

    /** @brief Snapshot of the call counters */
    BackendStats stats() const;

    void reset_stats();

    /** @brief Number of words currently held in the handle table */
    size_t live_words() const;

    /** @brief Replace the fault budget (negative disables injection) */
    void set_fault_budget(int64_t budget);

    const LocalBackendConfig& config() const noexcept { return config_; }

private:
    struct WordTable {
        std::mutex mutex;
        std::unordered_map<uint64_t, uint64_t> words;
    };

    uint64_t load(const WordArg& arg) const;
    SecretWord store(uint64_t value);
    uint64_t next_random();
    void charge_primitive();

    LocalBackendConfig config_;
    mutable std::mutex mutex_;
    std::shared_ptr<WordTable> table_;
    uint64_t next_handle_ = 1;
    BackendStats stats_;
    std::mt19937_64 rng_;
};

// ============================================================================
// Client Helpers
// ============================================================================

/**
 * @brief Encrypt and sign one word as an input for a backend
 */
InputProof encrypt_input_word(const LocalBackendConfig& config, uint64_t value);

/**
 * @brief Encrypt and sign a plaintext of a type, one proof per limb
 * @throws std::out_of_range if value is not representable in type
 */
WideInputProof encrypt_input(const LocalBackendConfig& config, IntType type, const mpz_class& value);

/** @brief Recipient-side decryption of one word */
uint64_t decrypt_user_word(const UserCiphertext& ct, const UserKey& key);

/** @brief Recipient-side decryption of a value */
mpz_class decrypt_user(const WideUserCiphertext& ct, const UserKey& key);

} // namespace backend
} // namespace mpcint

#endif // MPCINT_BACKEND_LOCAL_BACKEND_H
