/**
 * @file cli_utils.h
 * @brief Common utility functions for mpcint CLI commands
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#ifndef MPCINT_CLI_UTILS_H
#define MPCINT_CLI_UTILS_H

#include "mpcint/backend/local_backend.h"

#include <gmpxx.h>

#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace mpcint {
namespace cli {

/**
 * @brief Parse a decimal (or 0x-prefixed hex) plaintext, optionally negative
 */
inline mpz_class parse_plaintext(const std::string& text) {
    std::string digits = text;
    bool negative = false;
    if (!digits.empty() && digits[0] == '-') {
        negative = true;
        digits = digits.substr(1);
    }
    int base = 10;
    if (digits.size() > 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
        base = 16;
        digits = digits.substr(2);
    }

    mpz_class value;
    if (digits.empty() || value.set_str(digits, base) != 0) {
        throw std::invalid_argument("Not an integer: " + text);
    }
    return negative ? mpz_class(-value) : value;
}

/**
 * @brief Convert bytes to hex string
 */
inline std::string bytes_to_hex(const unsigned char* data, size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<unsigned int>(data[i]);
    }
    return oss.str();
}

/**
 * @brief Print backend call counters, non-zero primitives only
 */
inline void print_stats(const backend::BackendStats& stats) {
    std::cout << "Backend calls: " << stats.total()
              << " (primitives " << stats.primitives() << ")\n";
    for (size_t i = 0; i < kWordOpCount; ++i) {
        if (stats.binary[i] != 0) {
            std::cout << "  " << std::left << std::setw(12) << word_op_name(static_cast<WordOp>(i))
                      << stats.binary[i] << "\n";
        }
    }
    if (stats.mux != 0) {
        std::cout << "  " << std::left << std::setw(12) << "mux" << stats.mux << "\n";
    }
    if (stats.set_public != 0) {
        std::cout << "  " << std::left << std::setw(12) << "set_public" << stats.set_public << "\n";
    }
    if (stats.decrypt != 0) {
        std::cout << "  " << std::left << std::setw(12) << "decrypt" << stats.decrypt << "\n";
    }
}

} // namespace cli
} // namespace mpcint

#endif // MPCINT_CLI_UTILS_H
