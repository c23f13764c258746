/**
 * @file local_backend.cpp
 * @brief Single-process reference implementation of WordBackend
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include "mpcint/backend/local_backend.h"
#include "mpcint/core/error.h"
#include "mpcint/core/log.h"

#include <openssl/core_names.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/params.h>
#include <openssl/rand.h>

#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>

namespace mpcint {
namespace backend {

namespace {

using Block = ByteArray<16>;
using Tag = ByteArray<32>;

// ============================================================================
// Byte Helpers
// ============================================================================

void store_le64(uint8_t* out, uint64_t v) {
    for (size_t i = 0; i < 8; ++i) {
        out[i] = static_cast<uint8_t>(v >> (8 * i));
    }
}

uint64_t load_le64(const uint8_t* in) {
    uint64_t v = 0;
    for (size_t i = 0; i < 8; ++i) {
        v |= static_cast<uint64_t>(in[i]) << (8 * i);
    }
    return v;
}

void system_random(uint8_t* buf, size_t len) {
    if (RAND_bytes(buf, static_cast<int>(len)) != 1) {
        throw BackendError("RAND_bytes failure");
    }
}

// ============================================================================
// OpenSSL Primitives
// ============================================================================

/**
 * @brief One AES-128 block, no padding
 */
Block aes_block(const ByteArray<16>& key, const Block& in, bool encrypt) {
    std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)> ctx(
        EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
    if (!ctx) {
        throw BackendError("EVP_CIPHER_CTX_new failure");
    }
    if (EVP_CipherInit_ex(ctx.get(), EVP_aes_128_ecb(), nullptr, key.data(), nullptr,
                          encrypt ? 1 : 0) != 1) {
        throw BackendError("EVP_CipherInit_ex failure");
    }
    EVP_CIPHER_CTX_set_padding(ctx.get(), 0);

    Block out{};
    int len = 0;
    if (EVP_CipherUpdate(ctx.get(), out.data(), &len, in.data(), static_cast<int>(in.size())) != 1 ||
        len != static_cast<int>(in.size())) {
        throw BackendError("EVP_CipherUpdate failure");
    }
    int tail = 0;
    if (EVP_CipherFinal_ex(ctx.get(), out.data() + len, &tail) != 1) {
        throw BackendError("EVP_CipherFinal_ex failure");
    }
    return out;
}

/**
 * @brief HMAC-SHA256 through the OpenSSL 3 EVP_MAC API
 */
Tag hmac_sha256(const SigningKey& key, const uint8_t* data, size_t len) {
    std::unique_ptr<EVP_MAC, decltype(&EVP_MAC_free)> mac_impl(
        EVP_MAC_fetch(nullptr, "HMAC", nullptr), EVP_MAC_free);
    if (!mac_impl) {
        throw BackendError("EVP_MAC_fetch(HMAC) failure");
    }
    std::unique_ptr<EVP_MAC_CTX, decltype(&EVP_MAC_CTX_free)> ctx(
        EVP_MAC_CTX_new(mac_impl.get()), EVP_MAC_CTX_free);
    if (!ctx) {
        throw BackendError("EVP_MAC_CTX_new failure");
    }

    OSSL_PARAM params[] = {
        OSSL_PARAM_construct_utf8_string(OSSL_MAC_PARAM_DIGEST, const_cast<char*>("SHA256"), 0),
        OSSL_PARAM_construct_end()
    };

    Tag tag{};
    size_t tag_len = 0;
    if (EVP_MAC_init(ctx.get(), key.data(), key.size(), params) != 1 ||
        EVP_MAC_update(ctx.get(), data, len) != 1 ||
        EVP_MAC_final(ctx.get(), tag.data(), &tag_len, tag.size()) != 1 ||
        tag_len != tag.size()) {
        throw BackendError("HMAC-SHA256 failure");
    }
    return tag;
}

Block seal(const ByteArray<16>& key, uint64_t value, uint64_t nonce) {
    Block plain{};
    store_le64(plain.data(), value);
    store_le64(plain.data() + 8, nonce);
    return aes_block(key, plain, true);
}

uint64_t unseal(const ByteArray<16>& key, const Block& sealed) {
    const Block plain = aes_block(key, sealed, false);
    return load_le64(plain.data());
}

} // namespace

// ============================================================================
// LocalBackendConfig / BackendStats
// ============================================================================

LocalBackendConfig LocalBackendConfig::generate() {
    LocalBackendConfig config;
    system_random(config.network_key.data(), config.network_key.size());
    system_random(config.signing_key.data(), config.signing_key.size());
    return config;
}

LocalBackendConfig LocalBackendConfig::from_seed(uint64_t seed) {
    LocalBackendConfig config;
    std::mt19937_64 gen(seed ^ 0x6d7063696e74ULL);
    for (auto& b : config.network_key) {
        b = static_cast<uint8_t>(gen());
    }
    for (auto& b : config.signing_key) {
        b = static_cast<uint8_t>(gen());
    }
    config.deterministic = true;
    config.seed = seed;
    return config;
}

uint64_t BackendStats::primitives() const noexcept {
    uint64_t n = mux;
    for (uint64_t c : binary) {
        n += c;
    }
    return n;
}

uint64_t BackendStats::total() const noexcept {
    return primitives() + decrypt + set_public + random + validate +
           offboard + onboard + offboard_to_user;
}

// ============================================================================
// LocalWordBackend
// ============================================================================

LocalWordBackend::LocalWordBackend(const LocalBackendConfig& config)
    : config_(config)
    , table_(std::make_shared<WordTable>())
    , rng_(config.seed)
{
    logger()->debug("local word backend created (deterministic={}, fault_budget={})",
                    config_.deterministic, config_.fault_budget);
}

LocalWordBackend::LocalWordBackend()
    : LocalWordBackend(LocalBackendConfig::generate())
{
}

uint64_t LocalWordBackend::load(const WordArg& arg) const {
    if (arg.is_public()) {
        return arg.value();
    }
    const uint64_t handle = arg.word().handle();
    {
        std::lock_guard<std::mutex> lock(table_->mutex);
        auto it = table_->words.find(handle);
        if (it != table_->words.end()) {
            return it->second;
        }
    }
    logger()->error("unknown secret word handle {}", handle);
    throw BackendError("Unknown secret word handle " + std::to_string(handle));
}

SecretWord LocalWordBackend::store(uint64_t value) {
    const uint64_t handle = next_handle_++;
    {
        std::lock_guard<std::mutex> lock(table_->mutex);
        table_->words.emplace(handle, value);
    }

    // The lease outliving the backend finds the table gone and does nothing
    std::weak_ptr<WordTable> table = table_;
    std::shared_ptr<void> lease(nullptr, [table, handle](void*) {
        if (std::shared_ptr<WordTable> t = table.lock()) {
            std::lock_guard<std::mutex> lock(t->mutex);
            t->words.erase(handle);
        }
    });
    return SecretWord(handle, std::move(lease));
}

uint64_t LocalWordBackend::next_random() {
    if (config_.deterministic) {
        return rng_();
    }
    uint8_t buf[8];
    system_random(buf, sizeof(buf));
    return load_le64(buf);
}

void LocalWordBackend::charge_primitive() {
    if (config_.fault_budget < 0) {
        return;
    }
    if (config_.fault_budget == 0) {
        logger()->error("injected backend failure");
        throw BackendError("Injected backend failure");
    }
    --config_.fault_budget;
}

SecretWord LocalWordBackend::binary(WordOp op, const WordArg& a, const WordArg& b) {
    std::lock_guard<std::mutex> lock(mutex_);
    charge_primitive();
    ++stats_.binary[static_cast<size_t>(op)];
    return store(eval_word_op(op, load(a), load(b)));
}

SecretWord LocalWordBackend::mux(const SecretWord& cond, const WordArg& a, const WordArg& b) {
    std::lock_guard<std::mutex> lock(mutex_);
    charge_primitive();
    ++stats_.mux;
    const uint64_t c = load(WordArg(cond));
    const uint64_t x = load(a);
    const uint64_t y = load(b);
    return store(c != 0 ? x : y);
}

uint64_t LocalWordBackend::decrypt(const SecretWord& word) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.decrypt;
    return load(WordArg(word));
}

SecretWord LocalWordBackend::set_public(uint64_t value) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.set_public;
    return store(value);
}

SecretWord LocalWordBackend::random(unsigned bits) {
    if (bits == 0 || bits > MPCINT_LIMB_BITS) {
        throw std::invalid_argument("Random word bit count must be in [1, 64]");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.random;
    uint64_t v = next_random();
    if (bits < MPCINT_LIMB_BITS) {
        v &= (uint64_t(1) << bits) - 1;
    }
    return store(v);
}

SecretWord LocalWordBackend::validate_ciphertext(const InputProof& proof) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.validate;
    const Tag expected = hmac_sha256(config_.signing_key, proof.ciphertext.bytes.data(),
                                     proof.ciphertext.bytes.size());
    if (CRYPTO_memcmp(expected.data(), proof.signature.data(), expected.size()) != 0) {
        throw InvalidProof("Input proof signature does not verify");
    }
    return store(unseal(config_.network_key, proof.ciphertext.bytes));
}

Ciphertext LocalWordBackend::offboard(const SecretWord& word) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.offboard;
    Ciphertext ct;
    ct.bytes = seal(config_.network_key, load(WordArg(word)), next_random());
    return ct;
}

SecretWord LocalWordBackend::onboard(const Ciphertext& ct) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.onboard;
    return store(unseal(config_.network_key, ct.bytes));
}

UserCiphertext LocalWordBackend::offboard_to_user(const SecretWord& word, const UserKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.offboard_to_user;
    UserCiphertext ct;
    ct.bytes = seal(key, load(WordArg(word)), next_random());
    return ct;
}

BackendStats LocalWordBackend::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

void LocalWordBackend::reset_stats() {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_ = BackendStats{};
}

size_t LocalWordBackend::live_words() const {
    std::lock_guard<std::mutex> lock(table_->mutex);
    return table_->words.size();
}

void LocalWordBackend::set_fault_budget(int64_t budget) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.fault_budget = budget;
}

// ============================================================================
// Client Helpers
// ============================================================================

InputProof encrypt_input_word(const LocalBackendConfig& config, uint64_t value) {
    uint8_t nonce[8];
    system_random(nonce, sizeof(nonce));

    InputProof proof;
    proof.ciphertext.bytes = seal(config.network_key, value, load_le64(nonce));
    proof.signature = hmac_sha256(config.signing_key, proof.ciphertext.bytes.data(),
                                  proof.ciphertext.bytes.size());
    return proof;
}

WideInputProof encrypt_input(const LocalBackendConfig& config, IntType type, const mpz_class& value) {
    WideInputProof proof{type, {}};
    for (uint64_t w : encode_limbs(type, value)) {
        proof.limbs.push_back(encrypt_input_word(config, w));
    }
    return proof;
}

uint64_t decrypt_user_word(const UserCiphertext& ct, const UserKey& key) {
    return unseal(key, ct.bytes);
}

mpz_class decrypt_user(const WideUserCiphertext& ct, const UserKey& key) {
    std::vector<uint64_t> words;
    words.reserve(ct.limbs.size());
    for (const UserCiphertext& c : ct.limbs) {
        words.push_back(decrypt_user_word(c, key));
    }
    return decode_limbs(ct.type, words);
}

} // namespace backend
} // namespace mpcint
