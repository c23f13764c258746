/**
 * @file types.cpp
 * @brief Integer type names
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include "mpcint/core/types.h"

#include <stdexcept>

namespace mpcint {

std::string IntType::name() const {
    return (is_signed ? "int" : "uint") + std::to_string(bits());
}

IntType parse_int_type(const std::string& name) {
    static const IntType kAll[] = {
        kUint8, kUint16, kUint32, kUint64, kUint128, kUint256,
        kInt8, kInt16, kInt32, kInt64, kInt128, kInt256
    };
    for (const IntType& type : kAll) {
        if (type.name() == name) {
            return type;
        }
    }
    throw std::invalid_argument("Unknown integer type: " + name);
}

} // namespace mpcint
