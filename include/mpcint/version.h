/**
 * @file version.h
 * @brief Unified Version Information for mpcint Library
 *
 * This is the SINGLE SOURCE OF TRUTH for all version information.
 * All other files should include this header and use these macros.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef MPCINT_VERSION_H
#define MPCINT_VERSION_H

/**
 * @defgroup Version Library Version Information
 * @{
 */

/** Major version number (API breaking changes) */
#define MPCINT_VERSION_MAJOR 1

/** Minor version number (new features, backward compatible) */
#define MPCINT_VERSION_MINOR 2

/** Patch version number (bug fixes) */
#define MPCINT_VERSION_PATCH 0

/** Full version string "major.minor.patch" */
#define MPCINT_VERSION_STRING "1.2.0"

/** Version as single integer: (major * 10000 + minor * 100 + patch) */
#define MPCINT_VERSION_NUMBER ((MPCINT_VERSION_MAJOR * 10000) + \
                               (MPCINT_VERSION_MINOR * 100) + \
                               MPCINT_VERSION_PATCH)

/** Library name */
#define MPCINT_LIBRARY_NAME "mpcint"

/** Full library description */
#define MPCINT_DESCRIPTION "Fixed-width secret integers over a 64-bit MPC word backend"

/** Build type identifier */
#ifdef NDEBUG
#define MPCINT_BUILD_TYPE "Release"
#else
#define MPCINT_BUILD_TYPE "Debug"
#endif

/**
 * @brief Check if library version is at least the specified version
 */
#define MPCINT_VERSION_AT_LEAST(major, minor, patch) \
    (MPCINT_VERSION_NUMBER >= ((major) * 10000 + (minor) * 100 + (patch)))

/** @} */

#endif /* MPCINT_VERSION_H */
