/**
 * @file common.h
 * @brief Common definitions and utility macros for accelbn library
 * 
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#ifndef ACCELBN_CORE_COMMON_H
#define ACCELBN_CORE_COMMON_H

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
    #define ACCELBN_PLATFORM_WINDOWS 1
    #define ACCELBN_PLATFORM_NAME "Windows"
#elif defined(__ANDROID__)
    #define ACCELBN_PLATFORM_ANDROID 1
    #define ACCELBN_PLATFORM_NAME "Android"
#elif defined(__linux__)
    #define ACCELBN_PLATFORM_LINUX 1
    #define ACCELBN_PLATFORM_NAME "Linux"
#elif defined(__APPLE__)
    #define ACCELBN_PLATFORM_MACOS 1
    #define ACCELBN_PLATFORM_NAME "macOS"
#elif defined(__FreeBSD_kernel__) && defined(__GLIBC__)
    #define ACCELBN_PLATFORM_KFREEBSD 1
    #define ACCELBN_PLATFORM_NAME "GNU/kFreeBSD"
#elif defined(__FreeBSD__)
    #define ACCELBN_PLATFORM_FREEBSD 1
    #define ACCELBN_PLATFORM_NAME "FreeBSD"
#elif defined(__NetBSD__)
    #define ACCELBN_PLATFORM_NETBSD 1
    #define ACCELBN_PLATFORM_NAME "NetBSD"
#elif defined(__OpenBSD__)
    #define ACCELBN_PLATFORM_OPENBSD 1
    #define ACCELBN_PLATFORM_NAME "OpenBSD"
#elif defined(__sun)
    #define ACCELBN_PLATFORM_SOLARIS 1
    #define ACCELBN_PLATFORM_NAME "Solaris"
#elif defined(__OS2__)
    #define ACCELBN_PLATFORM_OS2 1
    #define ACCELBN_PLATFORM_NAME "OS/2"
#else
    #define ACCELBN_PLATFORM_UNKNOWN 1
    #define ACCELBN_PLATFORM_NAME "Unknown"
#endif

// ============================================================================
// Architecture detection
// ============================================================================
#if defined(__x86_64__) || defined(_M_X64) || defined(__i386__) || defined(_M_IX86)
    #define ACCELBN_ARCH_X86 1
#elif defined(__aarch64__) || defined(_M_ARM64) || defined(__arm__) || defined(_M_ARM)
    #define ACCELBN_ARCH_ARM 1
#elif defined(__powerpc__) || defined(__powerpc64__) || defined(__ppc__) || defined(__PPC__)
    #define ACCELBN_ARCH_PPC 1
#else
    #define ACCELBN_ARCH_OTHER 1
#endif

// ============================================================================
// Export/Import macros for shared library
// ============================================================================
#ifdef ACCELBN_PLATFORM_WINDOWS
    #ifdef ACCELBN_SHARED_LIBRARY
        #ifdef ACCELBN_BUILDING
            #define ACCELBN_API __declspec(dllexport)
        #else
            #define ACCELBN_API __declspec(dllimport)
        #endif
    #else
        #define ACCELBN_API
    #endif
#else
    #ifdef ACCELBN_SHARED_LIBRARY
        #define ACCELBN_API __attribute__((visibility("default")))
    #else
        #define ACCELBN_API
    #endif
#endif

// ============================================================================
// Error codes
// ============================================================================
typedef enum {
    ACCELBN_SUCCESS = 0,
    ACCELBN_ERROR_INTERNAL = -10         // Runtime initialization failed
} accelbn_error_t;

/**
 * @brief Get error message for error code
 * @param error Error code
 * @return Human-readable error message
 */
ACCELBN_API const char* accelbn_error_string(accelbn_error_t error);

#ifdef __cplusplus
}
#endif

#endif // ACCELBN_CORE_COMMON_H
