/**
 * @file version.h
 * @brief Unified Version Information for zkv Library
 *
 * This is the SINGLE SOURCE OF TRUTH for all version information.
 * All other files should include this header and use these macros.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef ZKV_VERSION_H
#define ZKV_VERSION_H

/**
 * @defgroup Version Library Version Information
 * @{
 */

/** Major version number (API breaking changes) */
#define ZKV_VERSION_MAJOR 1

/** Minor version number (new features, backward compatible) */
#define ZKV_VERSION_MINOR 0

/** Patch version number (bug fixes) */
#define ZKV_VERSION_PATCH 0

/** Full version string "major.minor.patch" */
#define ZKV_VERSION_STRING "1.0.0"

/** Version as single integer: (major * 10000 + minor * 100 + patch) */
#define ZKV_VERSION_NUMBER ((ZKV_VERSION_MAJOR * 10000) + \
                            (ZKV_VERSION_MINOR * 100) + \
                            ZKV_VERSION_PATCH)

/** Release date in YYYY-MM-DD format */
#define ZKV_RELEASE_DATE "2026-10-19"

/** Library name */
#define ZKV_LIBRARY_NAME "zkv"

/** Full library description */
#define ZKV_DESCRIPTION "BN254 Pairing and Groth16 Verification Engine"

/** Build type identifier */
#ifdef NDEBUG
#define ZKV_BUILD_TYPE "Release"
#else
#define ZKV_BUILD_TYPE "Debug"
#endif

/**
 * @brief Check if library version is at least the specified version
 */
#define ZKV_VERSION_AT_LEAST(major, minor, patch) \
    (ZKV_VERSION_NUMBER >= ((major) * 10000 + (minor) * 100 + (patch)))

/** @} */

#endif /* ZKV_VERSION_H */
