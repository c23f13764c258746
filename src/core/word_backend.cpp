/**
 * @file word_backend.cpp
 * @brief Reference semantics of the 64-bit word primitives
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include "mpcint/core/word_backend.h"
#include "mpcint/core/error.h"

namespace mpcint {

const char* word_op_name(WordOp op) noexcept {
    switch (op) {
        case WordOp::Add: return "add";
        case WordOp::Sub: return "sub";
        case WordOp::Mul: return "mul";
        case WordOp::Div: return "div";
        case WordOp::Rem: return "rem";
        case WordOp::And: return "and";
        case WordOp::Or:  return "or";
        case WordOp::Xor: return "xor";
        case WordOp::Shl: return "shl";
        case WordOp::Shr: return "shr";
        case WordOp::Eq:  return "eq";
        case WordOp::Ne:  return "ne";
        case WordOp::Lt:  return "lt";
        case WordOp::Le:  return "le";
        case WordOp::Gt:  return "gt";
        case WordOp::Ge:  return "ge";
    }
    return "unknown";
}

uint64_t eval_word_op(WordOp op, uint64_t a, uint64_t b) {
    switch (op) {
        case WordOp::Add: return a + b;
        case WordOp::Sub: return a - b;
        case WordOp::Mul: return a * b;
        case WordOp::Div:
            if (b == 0) {
                throw DivisionByZero("64-bit division by zero");
            }
            return a / b;
        case WordOp::Rem:
            if (b == 0) {
                throw DivisionByZero("64-bit remainder by zero");
            }
            return a % b;
        case WordOp::And: return a & b;
        case WordOp::Or:  return a | b;
        case WordOp::Xor: return a ^ b;
        case WordOp::Shl: return b >= 64 ? 0 : a << b;
        case WordOp::Shr: return b >= 64 ? 0 : a >> b;
        case WordOp::Eq:  return a == b ? 1 : 0;
        case WordOp::Ne:  return a != b ? 1 : 0;
        case WordOp::Lt:  return a < b ? 1 : 0;
        case WordOp::Le:  return a <= b ? 1 : 0;
        case WordOp::Gt:  return a > b ? 1 : 0;
        case WordOp::Ge:  return a >= b ? 1 : 0;
    }
    throw std::invalid_argument("Unknown word primitive");
}

} // namespace mpcint
