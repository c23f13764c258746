/**
 * @file common.h
 * @brief Common definitions and utility macros for mpcint library
 * 
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#ifndef MPCINT_CORE_COMMON_H
#define MPCINT_CORE_COMMON_H

#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

// ============================================================================
// Platform detection
// ============================================================================
#if defined(_WIN32) || defined(_WIN64)
    #define MPCINT_PLATFORM_WINDOWS 1
    #define MPCINT_PLATFORM_NAME "Windows"
#elif defined(__linux__)
    #define MPCINT_PLATFORM_LINUX 1
    #define MPCINT_PLATFORM_NAME "Linux"
#elif defined(__APPLE__)
    #define MPCINT_PLATFORM_MACOS 1
    #define MPCINT_PLATFORM_NAME "macOS"
#else
    #define MPCINT_PLATFORM_UNKNOWN 1
    #define MPCINT_PLATFORM_NAME "Unknown"
#endif

// ============================================================================
// Export/Import macros for shared library
// ============================================================================
#ifdef MPCINT_PLATFORM_WINDOWS
    #ifdef MPCINT_SHARED_LIBRARY
        #ifdef MPCINT_BUILDING
            #define MPCINT_API __declspec(dllexport)
        #else
            #define MPCINT_API __declspec(dllimport)
        #endif
    #else
        #define MPCINT_API
    #endif
#else
    #ifdef MPCINT_SHARED_LIBRARY
        #define MPCINT_API __attribute__((visibility("default")))
    #else
        #define MPCINT_API
    #endif
#endif

// ============================================================================
// Error codes
// ============================================================================
typedef enum {
    MPCINT_SUCCESS = 0,
    MPCINT_ERROR_INVALID_PARAM = -1,
    MPCINT_ERROR_INVALID_PROOF = -2,        // Input ciphertext failed validation
    MPCINT_ERROR_DIVISION_BY_ZERO = -3,     // 64-bit primitive division by zero
    MPCINT_ERROR_ARITHMETIC_OVERFLOW = -4,  // Hard-fail checked operation
    MPCINT_ERROR_BACKEND = -5,              // Opaque word backend failure
    MPCINT_ERROR_DECRYPTION_FAILED = -6,
    MPCINT_ERROR_INTERNAL = -10
} mpcint_error_t;

// Limb geometry
#define MPCINT_LIMB_BITS   64
#define MPCINT_MAX_BITS    256
#define MPCINT_MAX_LIMBS   (MPCINT_MAX_BITS / MPCINT_LIMB_BITS)

// Utility macros
#define MPCINT_ARRAY_SIZE(arr) (sizeof(arr) / sizeof((arr)[0]))
#define MPCINT_MIN(a, b) ((a) < (b) ? (a) : (b))
#define MPCINT_MAX(a, b) ((a) > (b) ? (a) : (b))

/**
 * @brief Get error message for error code
 * @param error Error code
 * @return Human-readable error message
 */
MPCINT_API const char* mpcint_error_string(mpcint_error_t error);

/**
 * @brief Library version string
 */
MPCINT_API const char* mpcint_version(void);

/**
 * @brief Platform name the library was built for
 */
MPCINT_API const char* mpcint_platform(void);

#ifdef __cplusplus
}
#endif

#endif // MPCINT_CORE_COMMON_H
