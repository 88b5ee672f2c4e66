/**
 * @file trustledger_api.h
 * @brief C API of the trustledger library
 *
 * Stable C entry points for hosts that do not link C++ directly: version
 * information, error strings, and the cached statistics word.
 *
 * Functions return trustledger_error_t and never throw.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef TRUSTLEDGER_API_H
#define TRUSTLEDGER_API_H

#include "trustledger/core/common.h"
#include "trustledger/version.h"

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Library version string "major.minor.patch"
 */
TRUSTLEDGER_API const char* trustledger_version(void);

/**
 * @brief Build platform name
 */
TRUSTLEDGER_API const char* trustledger_platform(void);

/**
 * @brief Decoded cached statistics
 */
typedef struct {
    uint32_t event_count;
    uint32_t last_activity;   /* low 32 bits of the timestamp */
    int has_data;             /* 0 or 1 */
} trustledger_stats_t;

/**
 * @brief Pack statistics into the 32-byte big-endian word
 * @param out     Output buffer
 * @param out_len Must be at least TRUSTLEDGER_STATS_WORD_SIZE
 */
TRUSTLEDGER_API trustledger_error_t trustledger_stats_pack(const trustledger_stats_t* stats,
                                                           uint8_t* out, size_t out_len);

/**
 * @brief Decode a 32-byte big-endian statistics word
 * @return TRUSTLEDGER_ERROR_INVALID_PARAM if len is wrong or reserved bits are set
 */
TRUSTLEDGER_API trustledger_error_t trustledger_stats_unpack(const uint8_t* word, size_t len,
                                                             trustledger_stats_t* stats);

#ifdef __cplusplus
}
#endif

#endif // TRUSTLEDGER_API_H
