/**
 * @file boolean.h
 * @brief Logic on secret booleans
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef MPCINT_OPS_BOOLEAN_H
#define MPCINT_OPS_BOOLEAN_H

#include "mpcint/core/wide_value.h"
#include "mpcint/core/word_backend.h"

namespace mpcint {

SecretBool bool_and(WordBackend& be, const SecretBool& a, const SecretBool& b);
SecretBool bool_or(WordBackend& be, const SecretBool& a, const SecretBool& b);
SecretBool bool_xor(WordBackend& be, const SecretBool& a, const SecretBool& b);
SecretBool bool_not(WordBackend& be, const SecretBool& a);
SecretBool bool_eq(WordBackend& be, const SecretBool& a, const SecretBool& b);
SecretBool bool_ne(WordBackend& be, const SecretBool& a, const SecretBool& b);

} // namespace mpcint

#endif // MPCINT_OPS_BOOLEAN_H
