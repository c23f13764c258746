/**
 * @file word_backend.h
 * @brief 64-bit secret word backend interface
 *
 * The only dependency of the arithmetic layer. A backend evaluates one
 * primitive on 64-bit secret words per call; every wide operation in
 * mpcint is an ordered sequence of these calls.
 *
 * Word semantics expected from every implementation:
 * - add/sub/mul wrap modulo 2^64
 * - div/rem are unsigned; a zero divisor raises DivisionByZero
 * - shl/shr are logical; an amount >= 64 yields 0
 * - eq/ne/lt/le/gt/ge are unsigned and yield a word holding 0 or 1
 * - mux(cond, a, b) yields a when cond is 1 and b when cond is 0
 *
 * Either operand of a binary primitive may be passed as a public
 * constant (WordArg::plain); this changes the shape and cost of the
 * call, never its result.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef MPCINT_CORE_WORD_BACKEND_H
#define MPCINT_CORE_WORD_BACKEND_H

#include "mpcint/core/types.h"

#include <cstdint>

namespace mpcint {

/**
 * @brief Binary word primitives
 */
enum class WordOp : uint8_t {
    Add = 0,
    Sub,
    Mul,
    Div,
    Rem,
    And,
    Or,
    Xor,
    Shl,
    Shr,
    Eq,
    Ne,
    Lt,
    Le,
    Gt,
    Ge
};

constexpr size_t kWordOpCount = 16;

/** @brief Lower-case primitive name ("add", "lt", ...) */
const char* word_op_name(WordOp op) noexcept;

/**
 * @brief Evaluate a primitive on two public words
 *
 * Reference semantics of the word primitives; used for constant folding
 * and by backends that hold plaintext words.
 *
 * @throws DivisionByZero for Div/Rem with b == 0
 */
uint64_t eval_word_op(WordOp op, uint64_t a, uint64_t b);

/**
 * @brief One operand of a word primitive: a secret handle or a public word
 */
class WordArg {
public:
    /** @brief Secret operand */
    WordArg(const SecretWord& word) noexcept  // NOLINT: implicit by intent
        : word_(word), value_(0), is_public_(false) {}

    /** @brief Public constant operand */
    static WordArg plain(uint64_t value) noexcept {
        WordArg arg;
        arg.value_ = value;
        arg.is_public_ = true;
        return arg;
    }

    bool is_public() const noexcept { return is_public_; }

    /** @brief Secret handle (only meaningful when !is_public()) */
    const SecretWord& word() const noexcept { return word_; }

    /** @brief Public value (only meaningful when is_public()) */
    uint64_t value() const noexcept { return value_; }

private:
    WordArg() noexcept : word_(), value_(0), is_public_(true) {}

    SecretWord word_;
    uint64_t value_;
    bool is_public_;
};

/**
 * @brief Secure multi-party computation backend over 64-bit secret words
 *
 * Implementations must be callable from several threads at once:
 * independent limb operations may be issued concurrently.
 */
class WordBackend {
public:
    virtual ~WordBackend() = default;

    // ========================================================================
    // Primitives
    // ========================================================================

    /**
     * @brief Evaluate one binary primitive
     * @note At least one operand is secret; the composer folds
     *       public-public calls locally.
     */
    virtual SecretWord binary(WordOp op, const WordArg& a, const WordArg& b) = 0;

    /**
     * @brief Oblivious selection: cond ? a : b
     */
    virtual SecretWord mux(const SecretWord& cond, const WordArg& a, const WordArg& b) = 0;

    // ========================================================================
    // Boundary
    // ========================================================================

    /** @brief Reveal a word */
    virtual uint64_t decrypt(const SecretWord& word) = 0;

    /** @brief Inject a public word */
    virtual SecretWord set_public(uint64_t value) = 0;

    /** @brief Uniform word in [0, 2^bits), 1 <= bits <= 64 */
    virtual SecretWord random(unsigned bits) = 0;

    /**
     * @brief Check an input proof and adopt its word
     * @throws InvalidProof when the proof does not verify
     */
    virtual SecretWord validate_ciphertext(const InputProof& proof) = 0;

    /** @brief Durable network-key form of a word */
    virtual Ciphertext offboard(const SecretWord& word) = 0;

    /** @brief Working form of a durable ciphertext */
    virtual SecretWord onboard(const Ciphertext& ct) = 0;

    /** @brief Key-switch a word to a recipient key */
    virtual UserCiphertext offboard_to_user(const SecretWord& word, const UserKey& key) = 0;

    // ========================================================================
    // Named Primitives
    // ========================================================================

    SecretWord add(const WordArg& a, const WordArg& b) { return binary(WordOp::Add, a, b); }
    SecretWord sub(const WordArg& a, const WordArg& b) { return binary(WordOp::Sub, a, b); }
    SecretWord mul(const WordArg& a, const WordArg& b) { return binary(WordOp::Mul, a, b); }
    SecretWord div(const WordArg& a, const WordArg& b) { return binary(WordOp::Div, a, b); }
    SecretWord rem(const WordArg& a, const WordArg& b) { return binary(WordOp::Rem, a, b); }
    SecretWord bit_and(const WordArg& a, const WordArg& b) { return binary(WordOp::And, a, b); }
    SecretWord bit_or(const WordArg& a, const WordArg& b) { return binary(WordOp::Or, a, b); }
    SecretWord bit_xor(const WordArg& a, const WordArg& b) { return binary(WordOp::Xor, a, b); }
    SecretWord shl(const WordArg& a, const WordArg& b) { return binary(WordOp::Shl, a, b); }
    SecretWord shr(const WordArg& a, const WordArg& b) { return binary(WordOp::Shr, a, b); }
    SecretWord eq(const WordArg& a, const WordArg& b) { return binary(WordOp::Eq, a, b); }
    SecretWord ne(const WordArg& a, const WordArg& b) { return binary(WordOp::Ne, a, b); }
    SecretWord lt(const WordArg& a, const WordArg& b) { return binary(WordOp::Lt, a, b); }
    SecretWord le(const WordArg& a, const WordArg& b) { return binary(WordOp::Le, a, b); }
    SecretWord gt(const WordArg& a, const WordArg& b) { return binary(WordOp::Gt, a, b); }
    SecretWord ge(const WordArg& a, const WordArg& b) { return binary(WordOp::Ge, a, b); }
};

} // namespace mpcint

#endif // MPCINT_CORE_WORD_BACKEND_H
