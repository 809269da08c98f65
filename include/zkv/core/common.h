/**
 * @file common.h
 * @brief Common definitions and utility macros for the zkv library
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#ifndef ZKV_CORE_COMMON_H
#define ZKV_CORE_COMMON_H

#include <stdint.h>
#include <stddef.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

// ============================================================================
// Platform detection
// ============================================================================
#if defined(_WIN32) || defined(_WIN64)
    #define ZKV_PLATFORM_WINDOWS 1
    #define ZKV_PLATFORM_NAME "Windows"
#elif defined(__linux__)
    #define ZKV_PLATFORM_LINUX 1
    #define ZKV_PLATFORM_NAME "Linux"
#elif defined(__APPLE__)
    #define ZKV_PLATFORM_MACOS 1
    #define ZKV_PLATFORM_NAME "macOS"
#else
    #define ZKV_PLATFORM_UNKNOWN 1
    #define ZKV_PLATFORM_NAME "Unknown"
#endif

// ============================================================================
// Export/Import macros for shared library
// ============================================================================
#ifdef ZKV_PLATFORM_WINDOWS
    #ifdef ZKV_SHARED_LIBRARY
        #ifdef ZKV_BUILDING
            #define ZKV_API __declspec(dllexport)
        #else
            #define ZKV_API __declspec(dllimport)
        #endif
    #else
        #define ZKV_API
    #endif
#else
    #ifdef ZKV_SHARED_LIBRARY
        #define ZKV_API __attribute__((visibility("default")))
    #else
        #define ZKV_API
    #endif
#endif

// ============================================================================
// Error codes
// ============================================================================
typedef enum {
    ZKV_SUCCESS = 0,
    ZKV_ERROR_INVALID_PARAM = -1,
    ZKV_ERROR_NOT_INITIALIZED = -3,
    ZKV_ERROR_INVALID_ENCODING = -4,    // Non-canonical field element or bad length
    ZKV_ERROR_INVALID_POINT = -5,       // Off-curve or outside the prime-order subgroup
    ZKV_ERROR_INTERNAL = -10,
    ZKV_ERROR_RANDOM_FAILED = -12       // CSPRNG failure
} zkv_error_t;

// Encoded sizes (big-endian coordinates)
#define ZKV_FIELD_SIZE       32
#define ZKV_G1_SIZE          64
#define ZKV_G2_SIZE          128
#define ZKV_GT_SIZE          384
#define ZKV_PROOF_SIZE       256

/**
 * @brief Get error message for error code
 * @param error Error code
 * @return Human-readable error message
 */
ZKV_API const char* zkv_error_string(zkv_error_t error);

/**
 * @brief Secure memory zeroing
 * @param ptr Pointer to memory
 * @param size Size of memory to zero
 */
ZKV_API void zkv_secure_zero(void* ptr, size_t size);

/**
 * @brief Fill buffer from the operating system CSPRNG
 * @return ZKV_SUCCESS, or ZKV_ERROR_RANDOM_FAILED when the source is unavailable
 */
ZKV_API zkv_error_t zkv_random_bytes(uint8_t* buffer, size_t len);

#ifdef __cplusplus
}
#endif

#endif // ZKV_CORE_COMMON_H
