/**
 * @file mpcint.h
 * @brief mpcint - Fixed-width secret integers over a 64-bit MPC word backend
 *
 * Unified header for the public API.
 *
 * Architecture:
 * - WordBackend: injected capability evaluating 64-bit secret word primitives
 * - WideValue: 8..256-bit signed/unsigned integers as little-endian limbs
 * - Operand: secret value or public constant at each call site
 *
 * Modules:
 * - Arithmetic: add, sub, mul, div, rem, negate, abs, resize
 * - Checked: checked_add/sub/mul, ..._with_overflow_bit
 * - Comparator: eq, ne, lt, le, gt, ge, min, max
 * - Bitwise: bit_and, bit_or, bit_xor, shl, shr
 * - Select / Boolean: select, bool_and, bool_or, bool_xor, bool_not
 * - Boundary: validate_ciphertext, set_public, decrypt, random, onboard,
 *   offboard, offboard_to_user, offboard_combined
 * - Backend: LocalWordBackend reference implementation
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef MPCINT_H
#define MPCINT_H

#include "mpcint/version.h"

// ============================================================================
// Core
// ============================================================================

#include "mpcint/core/common.h"
#include "mpcint/core/error.h"
#include "mpcint/core/log.h"
#include "mpcint/core/types.h"
#include "mpcint/core/wide_value.h"
#include "mpcint/core/word_backend.h"

// ============================================================================
// Operations
// ============================================================================

#include "mpcint/ops/arith.h"
#include "mpcint/ops/bitwise.h"
#include "mpcint/ops/boolean.h"
#include "mpcint/ops/boundary.h"
#include "mpcint/ops/checked.h"
#include "mpcint/ops/comparator.h"
#include "mpcint/ops/reveal_division.h"
#include "mpcint/ops/select.h"

// ============================================================================
// Backends
// ============================================================================

#include "mpcint/backend/local_backend.h"

#endif // MPCINT_H
