/**
 * @file types.h
 * @brief Type definitions for mpcint library
 *
 * Word-level handles and durable forms exchanged with the word backend,
 * plus the integer type descriptor shared by every layer.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#ifndef MPCINT_CORE_TYPES_H
#define MPCINT_CORE_TYPES_H

#include <stdint.h>
#include <stddef.h>

#include "mpcint/core/common.h"

#include <array>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace mpcint {

// Byte vector
using ByteVec = std::vector<uint8_t>;

// Byte array templates
template<size_t N>
using ByteArray = std::array<uint8_t, N>;

// Key material
using NetworkKey = ByteArray<16>;   // AES-128 collective key
using UserKey = ByteArray<16>;      // AES-128 recipient key
using SigningKey = ByteArray<32>;   // HMAC-SHA256 input-proof key

// ============================================================================
// Word-Level Handles
// ============================================================================

/**
 * @brief Opaque handle to one 64-bit secret value held by the backend
 *
 * Never locally inspectable. Handle 0 is the invalid handle.
 *
 * Copies share one lease on the backend's storage slot; the backend may
 * reclaim the slot once the last copy is destroyed. A handle built without
 * a lease is never reclaimed.
 */
class SecretWord {
public:
    SecretWord() noexcept : handle_(0) {}
    explicit SecretWord(uint64_t handle) noexcept : handle_(handle) {}
    SecretWord(uint64_t handle, std::shared_ptr<void> lease) noexcept
        : handle_(handle), lease_(std::move(lease)) {}

    uint64_t handle() const noexcept { return handle_; }
    bool valid() const noexcept { return handle_ != 0; }

    bool operator==(const SecretWord& other) const noexcept { return handle_ == other.handle_; }
    bool operator!=(const SecretWord& other) const noexcept { return handle_ != other.handle_; }

private:
    uint64_t handle_;
    std::shared_ptr<void> lease_;
};

/**
 * @brief Durable encrypted word under the collective network key
 */
struct Ciphertext {
    ByteArray<16> bytes{};

    bool operator==(const Ciphertext& other) const noexcept { return bytes == other.bytes; }
    bool operator!=(const Ciphertext& other) const noexcept { return bytes != other.bytes; }
};

/**
 * @brief Word re-encrypted ("key-switched") to a single recipient key
 */
struct UserCiphertext {
    ByteArray<16> bytes{};

    bool operator==(const UserCiphertext& other) const noexcept { return bytes == other.bytes; }
};

/**
 * @brief Externally supplied encrypted word plus its correctness proof
 */
struct InputProof {
    Ciphertext ciphertext;
    ByteArray<32> signature{};
};

// ============================================================================
// Integer Type Descriptor
// ============================================================================

/**
 * @brief Supported fixed widths
 */
enum class Width : uint16_t {
    W8 = 8,
    W16 = 16,
    W32 = 32,
    W64 = 64,
    W128 = 128,
    W256 = 256
};

/**
 * @brief Width plus signedness of a fixed-width integer type
 *
 * Signedness belongs to the type, never to the value: the same limbs are
 * read as two's complement by signed operations and as magnitude by
 * unsigned ones.
 */
struct IntType {
    Width width;
    bool is_signed;

    constexpr size_t bits() const noexcept { return static_cast<size_t>(width); }
    constexpr size_t limbs() const noexcept { return (bits() + MPCINT_LIMB_BITS - 1) / MPCINT_LIMB_BITS; }

    constexpr bool operator==(const IntType& other) const noexcept {
        return width == other.width && is_signed == other.is_signed;
    }
    constexpr bool operator!=(const IntType& other) const noexcept { return !(*this == other); }

    /** @brief Name such as "uint128" or "int8" */
    std::string name() const;
};

constexpr IntType kUint8{Width::W8, false};
constexpr IntType kUint16{Width::W16, false};
constexpr IntType kUint32{Width::W32, false};
constexpr IntType kUint64{Width::W64, false};
constexpr IntType kUint128{Width::W128, false};
constexpr IntType kUint256{Width::W256, false};

constexpr IntType kInt8{Width::W8, true};
constexpr IntType kInt16{Width::W16, true};
constexpr IntType kInt32{Width::W32, true};
constexpr IntType kInt64{Width::W64, true};
constexpr IntType kInt128{Width::W128, true};
constexpr IntType kInt256{Width::W256, true};

/** @brief Number of 64-bit limbs used by a width */
constexpr size_t limb_count(Width w) noexcept {
    return (static_cast<size_t>(w) + MPCINT_LIMB_BITS - 1) / MPCINT_LIMB_BITS;
}

/**
 * @brief Parse a type name ("uint8" ... "int256")
 * @throws std::invalid_argument on unknown names
 */
IntType parse_int_type(const std::string& name);

} // namespace mpcint

#endif // MPCINT_CORE_TYPES_H
