/**
 * @file export.cpp
 * @brief Library export functions
 * 
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include "mpcint/core/common.h"
#include "mpcint/version.h"

extern "C" {

const char* mpcint_version(void) {
    return MPCINT_VERSION_STRING;
}

const char* mpcint_platform(void) {
    return MPCINT_PLATFORM_NAME;
}

const char* mpcint_error_string(mpcint_error_t error) {
    switch (error) {
        case MPCINT_SUCCESS:
            return "Success";
        case MPCINT_ERROR_INVALID_PARAM:
            return "Invalid parameter";
        case MPCINT_ERROR_INVALID_PROOF:
            return "Invalid input proof";
        case MPCINT_ERROR_DIVISION_BY_ZERO:
            return "Division by zero";
        case MPCINT_ERROR_ARITHMETIC_OVERFLOW:
            return "Arithmetic overflow";
        case MPCINT_ERROR_BACKEND:
            return "Word backend failure";
        case MPCINT_ERROR_DECRYPTION_FAILED:
            return "Decryption failed";
        case MPCINT_ERROR_INTERNAL:
            return "Internal error";
        default:
            return "Unknown error";
    }
}

} // extern "C"
