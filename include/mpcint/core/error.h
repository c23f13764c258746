/**
 * @file error.h
 * @brief Exception hierarchy for mpcint operations
 *
 * Every failure of a composed operation surfaces as one of these; the
 * error code mirrors the C-level mpcint_error_t so callers crossing an
 * ABI boundary can translate without string matching.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef MPCINT_CORE_ERROR_H
#define MPCINT_CORE_ERROR_H

#include "mpcint/core/common.h"

#include <stdexcept>
#include <string>

namespace mpcint {

/**
 * @brief Base class of all mpcint failures
 */
class MpcError : public std::runtime_error {
public:
    MpcError(mpcint_error_t code, const std::string& what)
        : std::runtime_error(what), code_(code) {}

    mpcint_error_t code() const noexcept { return code_; }

private:
    mpcint_error_t code_;
};

/**
 * @brief Ciphertext or proof rejected at ingest; no value is produced
 */
class InvalidProof : public MpcError {
public:
    explicit InvalidProof(const std::string& what)
        : MpcError(MPCINT_ERROR_INVALID_PROOF, what) {}
};

/**
 * @brief Secret zero divisor on the exact 64-bit division path
 */
class DivisionByZero : public MpcError {
public:
    explicit DivisionByZero(const std::string& what)
        : MpcError(MPCINT_ERROR_DIVISION_BY_ZERO, what) {}
};

/**
 * @brief Raised only by the hard-fail checked operations
 */
class ArithmeticOverflow : public MpcError {
public:
    explicit ArithmeticOverflow(const std::string& what)
        : MpcError(MPCINT_ERROR_ARITHMETIC_OVERFLOW, what) {}
};

/**
 * @brief Opaque failure inside the word backend
 */
class BackendError : public MpcError {
public:
    explicit BackendError(const std::string& what)
        : MpcError(MPCINT_ERROR_BACKEND, what) {}
};

} // namespace mpcint

#endif // MPCINT_CORE_ERROR_H
