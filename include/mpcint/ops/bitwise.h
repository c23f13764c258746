/**
 * @file bitwise.h
 * @brief Bitwise logic and shifts on fixed-width secret integers
 *
 * and/or/xor work limb by limb. Shift amounts are public: bits cross limb
 * boundaries, shl and unsigned shr yield 0 once the amount reaches the
 * width, and signed shr is arithmetic (0 or -1 once the amount reaches
 * the width).
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef MPCINT_OPS_BITWISE_H
#define MPCINT_OPS_BITWISE_H

#include "mpcint/core/wide_value.h"
#include "mpcint/core/word_backend.h"

#include <cstdint>

namespace mpcint {

WideValue bit_and(WordBackend& be, const Operand& a, const Operand& b);
WideValue bit_or(WordBackend& be, const Operand& a, const Operand& b);
WideValue bit_xor(WordBackend& be, const Operand& a, const Operand& b);

/**
 * @brief Left shift by a public amount
 * @throws std::invalid_argument if amount is negative
 */
WideValue shl(WordBackend& be, const Operand& a, int64_t amount);

/**
 * @brief Right shift by a public amount (logical or arithmetic by type)
 * @throws std::invalid_argument if amount is negative
 */
WideValue shr(WordBackend& be, const Operand& a, int64_t amount);

} // namespace mpcint

#endif // MPCINT_OPS_BITWISE_H
