/**
 * @file export.cpp
 * @brief Library-wide C helpers: error strings, memory wiping, CSPRNG
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include "zkv/core/common.h"

#include <cerrno>
#include <cstring>

#ifdef ZKV_PLATFORM_WINDOWS
    #include <windows.h>
    #include <bcrypt.h>
    #pragma comment(lib, "bcrypt.lib")
#else
    #include <fcntl.h>
    #include <unistd.h>
#endif

extern "C" {

const char* zkv_error_string(zkv_error_t error) {
    switch (error) {
        case ZKV_SUCCESS:
            return "Success";
        case ZKV_ERROR_INVALID_PARAM:
            return "Invalid parameter";
        case ZKV_ERROR_NOT_INITIALIZED:
            return "Pairing engine not initialized";
        case ZKV_ERROR_INVALID_ENCODING:
            return "Invalid encoding";
        case ZKV_ERROR_INVALID_POINT:
            return "Invalid curve point";
        case ZKV_ERROR_INTERNAL:
            return "Internal error";
        case ZKV_ERROR_RANDOM_FAILED:
            return "Random number generation failed";
        default:
            return "Unknown error";
    }
}

void zkv_secure_zero(void* ptr, size_t size) {
    if (ptr && size > 0) {
        volatile unsigned char* p = static_cast<volatile unsigned char*>(ptr);
        while (size--) {
            *p++ = 0;
        }
    }
}

zkv_error_t zkv_random_bytes(uint8_t* buffer, size_t len) {
    if (!buffer || len == 0) {
        return ZKV_ERROR_INVALID_PARAM;
    }

#ifdef ZKV_PLATFORM_WINDOWS
    NTSTATUS status = BCryptGenRandom(NULL, buffer, static_cast<ULONG>(len),
                                      BCRYPT_USE_SYSTEM_PREFERRED_RNG);
    if (!BCRYPT_SUCCESS(status)) {
        return ZKV_ERROR_RANDOM_FAILED;
    }
#else
    int fd = open("/dev/urandom", O_RDONLY);
    if (fd < 0) {
        return ZKV_ERROR_RANDOM_FAILED;
    }

    size_t done = 0;
    while (done < len) {
        ssize_t n = read(fd, buffer + done, len - done);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            close(fd);
            zkv_secure_zero(buffer, len);
            return ZKV_ERROR_RANDOM_FAILED;
        }
        done += static_cast<size_t>(n);
    }
    close(fd);
#endif

    return ZKV_SUCCESS;
}

} // extern "C"
