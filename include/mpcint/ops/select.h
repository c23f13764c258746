/**
 * @file select.h
 * @brief Oblivious selection between two values
 *
 * select(cond, a, b) yields a when cond is true and b otherwise. The
 * backend calls issued depend only on the operand types, bounds and public
 * constants, never on cond.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef MPCINT_OPS_SELECT_H
#define MPCINT_OPS_SELECT_H

#include "mpcint/core/wide_value.h"
#include "mpcint/core/word_backend.h"

namespace mpcint {

/** @brief Limb-wise mux of two integers (promoted to a common width) */
WideValue select(WordBackend& be, const SecretBool& cond, const Operand& a, const Operand& b);

/** @brief Mux of two secret booleans */
SecretBool select(WordBackend& be, const SecretBool& cond, const SecretBool& a, const SecretBool& b);

} // namespace mpcint

#endif // MPCINT_OPS_SELECT_H
