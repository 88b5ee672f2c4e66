/**
 * @file common.h
 * @brief Common definitions, error codes and size constants for trustledger
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef TRUSTLEDGER_CORE_COMMON_H
#define TRUSTLEDGER_CORE_COMMON_H

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
    #define TRUSTLEDGER_PLATFORM_WINDOWS 1
    #define TRUSTLEDGER_PLATFORM_NAME "Windows"
#elif defined(__linux__)
    #define TRUSTLEDGER_PLATFORM_LINUX 1
    #define TRUSTLEDGER_PLATFORM_NAME "Linux"
#elif defined(__APPLE__)
    #define TRUSTLEDGER_PLATFORM_MACOS 1
    #define TRUSTLEDGER_PLATFORM_NAME "macOS"
#else
    #define TRUSTLEDGER_PLATFORM_UNKNOWN 1
    #define TRUSTLEDGER_PLATFORM_NAME "Unknown"
#endif

// ============================================================================
// Export/Import macros for shared library
// ============================================================================
#ifdef TRUSTLEDGER_PLATFORM_WINDOWS
    #ifdef TRUSTLEDGER_SHARED_LIBRARY
        #ifdef TRUSTLEDGER_BUILDING
            #define TRUSTLEDGER_API __declspec(dllexport)
        #else
            #define TRUSTLEDGER_API __declspec(dllimport)
        #endif
    #else
        #define TRUSTLEDGER_API
    #endif
#else
    #ifdef TRUSTLEDGER_SHARED_LIBRARY
        #define TRUSTLEDGER_API __attribute__((visibility("default")))
    #else
        #define TRUSTLEDGER_API
    #endif
#endif

// ============================================================================
// Error codes
// ============================================================================
typedef enum {
    TRUSTLEDGER_SUCCESS = 0,
    TRUSTLEDGER_ERROR_INVALID_PARAM = -1,
    TRUSTLEDGER_ERROR_INVALID_ADDRESS = -2,       // reserved all-zero principal
    TRUSTLEDGER_ERROR_EMPTY_PROOF = -3,
    TRUSTLEDGER_ERROR_INVALID_PROOF = -4,         // binding or verification failed
    TRUSTLEDGER_ERROR_CAPACITY_EXCEEDED = -5,     // history cap reached
    TRUSTLEDGER_ERROR_INDEX_OUT_OF_BOUNDS = -6,
    TRUSTLEDGER_ERROR_INVALID_RANGE = -7,         // start >= end
    TRUSTLEDGER_ERROR_RANGE_OUT_OF_BOUNDS = -8,   // end beyond history length
    TRUSTLEDGER_ERROR_BATCH_SIZE_INVALID = -9,
    TRUSTLEDGER_ERROR_REMOTE_SERVICE_UNAVAILABLE = -10,
    TRUSTLEDGER_ERROR_CAPABILITY_DENIED = -11,
    TRUSTLEDGER_ERROR_BUFFER_TOO_SMALL = -12,
    TRUSTLEDGER_ERROR_INTERNAL = -13
} trustledger_error_t;

// Sizes of the opaque identifiers
#define TRUSTLEDGER_PRINCIPAL_SIZE      20
#define TRUSTLEDGER_HANDLE_SIZE         32
#define TRUSTLEDGER_STATS_WORD_SIZE     32

// Handle trailer layout: [0..30) digest, [30] value type, [31] version
#define TRUSTLEDGER_HANDLE_DIGEST_SIZE  30
#define TRUSTLEDGER_HANDLE_VERSION      0x01

// Session and sealing sizes
#define TRUSTLEDGER_X25519_KEY_SIZE     32
#define TRUSTLEDGER_ED25519_PUBKEY_SIZE 32
#define TRUSTLEDGER_ED25519_SIG_SIZE    64
#define TRUSTLEDGER_SEAL_NONCE_SIZE     12
#define TRUSTLEDGER_SEAL_TAG_SIZE       16

// Utility macros
#define TRUSTLEDGER_ARRAY_SIZE(arr) (sizeof(arr) / sizeof((arr)[0]))

/**
 * @brief Get error message for error code
 * @param error Error code
 * @return Human-readable error message
 */
TRUSTLEDGER_API const char* trustledger_error_string(trustledger_error_t error);

#ifdef __cplusplus
}
#endif

#endif // TRUSTLEDGER_CORE_COMMON_H
